// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/key_deriver.h>
#include <wallet/address.h>
#include <wallet/hd_derivation.h>
#include <crypto/ed25519.h>
#include <crypto/keccak.h>
#include <crypto/secp256k1.h>
#include <crypto/sha256.h>
#include <util/base58.h>
#include <util/bech32.h>
#include <util/logging.h>
#include <util/strencodings.h>

WalletError CKeyDeriver::DerivePrivateKey(const CKeyingMaterial& seed, Chain chain,
                                          uint32_t account_index,
                                          CKeyingMaterial& private_key) const {
    const ChainInfo& info = GetChainInfo(chain);
    if (info.curve != GetCurve()) {
        return WalletError::UNSUPPORTED_CHAIN;
    }

    CHDKeyPath path;
    if (!GetDerivationPath(chain, account_index, path)) {
        return WalletError::INVALID_ARGUMENT;
    }

    CHDExtendedKey master;
    if (!DeriveMaster(seed.data_ptr(), seed.size(), info.curve, master)) {
        LogPrintWallet(ERROR, "Master key derivation failed for %s", info.name);
        return WalletError::INVALID_ARGUMENT;
    }

    CHDExtendedKey derived;
    if (!DerivePath(master, path, derived)) {
        LogPrintWallet(ERROR, "Derivation failed at %s", path.ToString().c_str());
        return WalletError::INVALID_ARGUMENT;
    }

    private_key.assign(derived.key, sizeof(derived.key));
    return WalletError::OK;
}

WalletError CSecp256k1Deriver::DerivePublicKey(const CKeyingMaterial& private_key, Chain chain,
                                               std::vector<uint8_t>& public_key) const {
    if (private_key.size() != secp256k1::PRIVKEY_SIZE) {
        return WalletError::INVALID_ARGUMENT;
    }

    ChainFamily family = GetChainInfo(chain).family;
    if (family != ChainFamily::EVM && family != ChainFamily::BITCOIN) {
        return WalletError::UNSUPPORTED_CHAIN;
    }

    bool compressed = (family == ChainFamily::BITCOIN);
    if (!secp256k1::GetPublicKey(private_key.data_ptr(), compressed, public_key)) {
        return WalletError::INVALID_ARGUMENT;
    }
    return WalletError::OK;
}

WalletError CSecp256k1Deriver::DeriveAddress(const std::vector<uint8_t>& public_key, Chain chain,
                                             std::string& address) const {
    switch (GetChainInfo(chain).family) {
    case ChainFamily::EVM: {
        if (public_key.size() != secp256k1::UNCOMPRESSED_PUBKEY_SIZE || public_key[0] != 0x04) {
            return WalletError::INVALID_ARGUMENT;
        }
        uint8_t hash[32];
        Keccak256(public_key.data() + 1, public_key.size() - 1, hash);
        address = EncodeEvmAddress(std::vector<uint8_t>(hash + 12, hash + 32));
        return WalletError::OK;
    }
    case ChainFamily::BITCOIN: {
        if (public_key.size() != secp256k1::COMPRESSED_PUBKEY_SIZE) {
            return WalletError::INVALID_ARGUMENT;
        }
        std::string encoded = bech32::EncodeSegwitAddress("bc", 0, Hash160(public_key));
        if (encoded.empty()) {
            return WalletError::INVALID_ARGUMENT;
        }
        address = encoded;
        return WalletError::OK;
    }
    default:
        return WalletError::UNSUPPORTED_CHAIN;
    }
}

WalletError CEd25519Deriver::DerivePublicKey(const CKeyingMaterial& private_key, Chain chain,
                                             std::vector<uint8_t>& public_key) const {
    if (GetChainInfo(chain).curve != HDCurve::ED25519) {
        return WalletError::UNSUPPORTED_CHAIN;
    }
    if (private_key.size() != ed25519::SEED_SIZE) {
        return WalletError::INVALID_ARGUMENT;
    }

    std::vector<uint8_t> pub(ed25519::PUBKEY_SIZE);
    if (!ed25519::GetPublicKey(private_key.data_ptr(), pub.data())) {
        return WalletError::INVALID_ARGUMENT;
    }
    public_key.swap(pub);
    return WalletError::OK;
}

WalletError CEd25519Deriver::DeriveAddress(const std::vector<uint8_t>& public_key, Chain chain,
                                           std::string& address) const {
    if (public_key.size() != ed25519::PUBKEY_SIZE) {
        return WalletError::INVALID_ARGUMENT;
    }

    switch (GetChainInfo(chain).family) {
    case ChainFamily::SOLANA:
        address = EncodeBase58(public_key);
        return WalletError::OK;
    case ChainFamily::TON:
        // Raw form: workchain 0, account id = SHA-256(pubkey)
        address = "0:" + HexStr(SHA256(public_key));
        return WalletError::OK;
    default:
        return WalletError::UNSUPPORTED_CHAIN;
    }
}

const CKeyDeriver& GetKeyDeriver(Chain chain) {
    static const CSecp256k1Deriver secp256k1_deriver;
    static const CEd25519Deriver ed25519_deriver;

    if (GetChainInfo(chain).curve == HDCurve::SECP256K1) {
        return secp256k1_deriver;
    }
    return ed25519_deriver;
}

WalletError DeriveChainAccount(const CKeyingMaterial& seed, Chain chain, uint32_t account_index,
                               CChainAccount& account) {
    const CKeyDeriver& deriver = GetKeyDeriver(chain);

    CHDKeyPath path;
    if (!GetDerivationPath(chain, account_index, path)) {
        return WalletError::INVALID_ARGUMENT;
    }

    CKeyingMaterial private_key;
    WalletError err = deriver.DerivePrivateKey(seed, chain, account_index, private_key);
    if (err != WalletError::OK) {
        return err;
    }

    std::vector<uint8_t> public_key;
    err = deriver.DerivePublicKey(private_key, chain, public_key);
    private_key.Wipe();
    if (err != WalletError::OK) {
        return err;
    }

    CChainAccount result;
    err = deriver.DeriveAddress(public_key, chain, result.address);
    if (err != WalletError::OK) {
        return err;
    }
    result.public_key = HexStr(public_key);
    result.path = path.ToString();

    account = result;
    return WalletError::OK;
}
