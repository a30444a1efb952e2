// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/signer.h>
#include <wallet/address.h>
#include <wallet/rlp.h>
#include <crypto/ed25519.h>
#include <crypto/keccak.h>
#include <crypto/secp256k1.h>
#include <util/logging.h>

#include <openssl/bn.h>

#include <limits>

namespace {

std::vector<uint8_t> StripLeadingZeros(const uint8_t* data, size_t len) {
    size_t i = 0;
    while (i < len && data[i] == 0) {
        i++;
    }
    return std::vector<uint8_t>(data + i, data + len);
}

// Fields shared by the signing preimage and the signed transaction
bool EncodeEvmFields(const TxParams& tx, std::vector<std::vector<uint8_t>>& fields,
                     std::string& error) {
    std::vector<uint8_t> to;
    if (!tx.to.empty() && !DecodeEvmAddress(tx.to, to, error)) {
        return false;
    }

    std::vector<uint8_t> value;
    if (!tx.value.empty() && !ParseDecimalAmount(tx.value, value)) {
        error = "value must be a non-negative decimal integer below 2^256";
        return false;
    }

    if (tx.to.empty() && tx.data.empty()) {
        error = "contract creation requires data";
        return false;
    }

    fields.clear();
    fields.push_back(rlp::EncodeUint(tx.nonce));
    fields.push_back(rlp::EncodeUint(tx.gas_price));
    fields.push_back(rlp::EncodeUint(tx.gas_limit));
    fields.push_back(rlp::EncodeBytes(to));
    fields.push_back(rlp::EncodeBytes(value));
    fields.push_back(rlp::EncodeBytes(tx.data));
    return true;
}

} // namespace

bool ParseDecimalAmount(const std::string& value, std::vector<uint8_t>& out) {
    if (value.empty() || value.size() > 78) {
        return false;
    }
    for (char c : value) {
        if (c < '0' || c > '9') {
            return false;
        }
    }

    BIGNUM* bn = nullptr;
    if (BN_dec2bn(&bn, value.c_str()) != static_cast<int>(value.size()) || bn == nullptr) {
        BN_free(bn);
        return false;
    }

    bool ok = BN_num_bytes(bn) <= 32;
    if (ok) {
        std::vector<uint8_t> buf(static_cast<size_t>(BN_num_bytes(bn)));
        if (!buf.empty()) {
            BN_bn2bin(bn, buf.data());
        }
        out.swap(buf);
    }
    BN_free(bn);
    return ok;
}

// ============================================================================
// CEvmSigner
// ============================================================================

bool CEvmSigner::SigningHash(Chain chain, const TxParams& tx, uint8_t hash[32],
                             uint64_t& chain_id, std::string& error) {
    const ChainInfo& info = GetChainInfo(chain);
    if (info.family != ChainFamily::EVM) {
        error = "not an EVM chain";
        return false;
    }

    chain_id = (tx.chain_id != 0) ? tx.chain_id : info.default_chain_id;
    // v = chain_id * 2 + 36 at most
    if (chain_id > (std::numeric_limits<uint64_t>::max() - 36) / 2) {
        error = "chain_id out of range";
        return false;
    }

    std::vector<std::vector<uint8_t>> fields;
    if (!EncodeEvmFields(tx, fields, error)) {
        return false;
    }
    fields.push_back(rlp::EncodeUint(chain_id));
    fields.push_back(rlp::EncodeUint(0));
    fields.push_back(rlp::EncodeUint(0));

    std::vector<uint8_t> preimage = rlp::EncodeList(fields);
    Keccak256(preimage.data(), preimage.size(), hash);
    return true;
}

WalletError CEvmSigner::Sign(Chain chain, const CKeyingMaterial& private_key, const TxParams& tx,
                             std::vector<uint8_t>& signed_bytes, std::string& error) const {
    if (GetChainInfo(chain).family != ChainFamily::EVM) {
        return WalletError::UNSUPPORTED_CHAIN;
    }
    if (private_key.size() != secp256k1::PRIVKEY_SIZE) {
        error = "invalid private key length";
        return WalletError::INVALID_ARGUMENT;
    }

    uint8_t hash[32];
    uint64_t chain_id = 0;
    if (!SigningHash(chain, tx, hash, chain_id, error)) {
        return WalletError::INVALID_ARGUMENT;
    }

    secp256k1::Signature sig;
    if (!secp256k1::Sign(private_key.data_ptr(), hash, sig)) {
        error = "ECDSA signing failed";
        return WalletError::INVALID_ARGUMENT;
    }

    std::vector<std::vector<uint8_t>> fields;
    if (!EncodeEvmFields(tx, fields, error)) {
        return WalletError::INVALID_ARGUMENT;
    }
    uint64_t v = chain_id * 2 + 35 + static_cast<uint64_t>(sig.recid & 1);
    fields.push_back(rlp::EncodeUint(v));
    fields.push_back(rlp::EncodeBytes(StripLeadingZeros(sig.r, sizeof(sig.r))));
    fields.push_back(rlp::EncodeBytes(StripLeadingZeros(sig.s, sizeof(sig.s))));

    signed_bytes = rlp::EncodeList(fields);
    LogPrintSigning(DEBUG, "Signed %s transaction (chain id %llu, nonce %llu)",
                    ChainToString(chain).c_str(),
                    static_cast<unsigned long long>(chain_id),
                    static_cast<unsigned long long>(tx.nonce));
    return WalletError::OK;
}

// ============================================================================
// CBitcoinSigner
// ============================================================================

WalletError CBitcoinSigner::Sign(Chain chain, const CKeyingMaterial& private_key, const TxParams& tx,
                                 std::vector<uint8_t>& signed_bytes, std::string& error) const {
    if (GetChainInfo(chain).family != ChainFamily::BITCOIN) {
        return WalletError::UNSUPPORTED_CHAIN;
    }
    if (private_key.size() != secp256k1::PRIVKEY_SIZE) {
        error = "invalid private key length";
        return WalletError::INVALID_ARGUMENT;
    }
    if (tx.payload.size() != 32) {
        error = "payload must be a 32-byte sighash";
        return WalletError::INVALID_ARGUMENT;
    }

    secp256k1::Signature sig;
    std::vector<uint8_t> der;
    if (!secp256k1::Sign(private_key.data_ptr(), tx.payload.data(), sig) ||
        !secp256k1::EncodeDER(sig, der)) {
        error = "ECDSA signing failed";
        return WalletError::INVALID_ARGUMENT;
    }

    signed_bytes.swap(der);
    LogPrintSigning(DEBUG, "Signed BTC sighash");
    return WalletError::OK;
}

// ============================================================================
// CEd25519Signer
// ============================================================================

WalletError CEd25519Signer::Sign(Chain chain, const CKeyingMaterial& private_key, const TxParams& tx,
                                 std::vector<uint8_t>& signed_bytes, std::string& error) const {
    if (GetChainInfo(chain).curve != HDCurve::ED25519) {
        return WalletError::UNSUPPORTED_CHAIN;
    }
    if (private_key.size() != ed25519::SEED_SIZE) {
        error = "invalid private key length";
        return WalletError::INVALID_ARGUMENT;
    }
    if (tx.payload.empty()) {
        error = "payload must not be empty";
        return WalletError::INVALID_ARGUMENT;
    }

    std::vector<uint8_t> sig(ed25519::SIGNATURE_SIZE);
    if (!ed25519::Sign(private_key.data_ptr(), tx.payload.data(), tx.payload.size(), sig.data())) {
        error = "Ed25519 signing failed";
        return WalletError::INVALID_ARGUMENT;
    }

    signed_bytes.swap(sig);
    LogPrintSigning(DEBUG, "Signed %s message (%u bytes)", ChainToString(chain).c_str(),
                    static_cast<unsigned>(tx.payload.size()));
    return WalletError::OK;
}
