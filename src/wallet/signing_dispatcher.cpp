// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/signing_dispatcher.h>
#include <util/logging.h>

namespace {

const CEvmSigner g_evm_signer;
const CBitcoinSigner g_bitcoin_signer;
const CEd25519Signer g_ed25519_signer;

const ChainCapability CAPABILITY_TABLE[] = {
    {Chain::ETH,     &GetKeyDeriver(Chain::ETH),     &g_evm_signer},
    {Chain::BSC,     &GetKeyDeriver(Chain::BSC),     &g_evm_signer},
    {Chain::POLYGON, &GetKeyDeriver(Chain::POLYGON), &g_evm_signer},
    {Chain::BTC,     &GetKeyDeriver(Chain::BTC),     &g_bitcoin_signer},
    {Chain::SOL,     &GetKeyDeriver(Chain::SOL),     &g_ed25519_signer},
    {Chain::TON,     &GetKeyDeriver(Chain::TON),     &g_ed25519_signer},
};

} // namespace

const ChainCapability* GetChainCapability(Chain chain) {
    for (const ChainCapability& cap : CAPABILITY_TABLE) {
        if (cap.chain == chain) {
            return &cap;
        }
    }
    return nullptr;
}

WalletError CSigningDispatcher::SignTransaction(Chain chain, const TxParams& tx,
                                                std::vector<uint8_t>& signed_bytes,
                                                std::string& error) {
    // Locked wins over an unknown chain
    if (!session.IsUnlocked()) {
        error = GetWalletErrorMessage(WalletError::WALLET_LOCKED);
        LogPrintSigning(WARN, "Signing request rejected: wallet locked");
        return WalletError::WALLET_LOCKED;
    }

    const ChainCapability* cap = GetChainCapability(chain);
    if (cap == nullptr) {
        error = "no signer registered for chain";
        return WalletError::UNSUPPORTED_CHAIN;
    }

    uint32_t account_index = nAccountIndex;
    WalletError result = session.WithMasterKey(true,
        [&](const std::string& wallet_id, const CKeyingMaterial& seed) {
            CKeyingMaterial private_key;
            WalletError err = cap->deriver->DerivePrivateKey(seed, chain, account_index, private_key);
            if (err != WalletError::OK) {
                error = "key derivation failed";
                return err;
            }

            err = cap->signer->Sign(chain, private_key, tx, signed_bytes, error);
            private_key.Wipe();

            if (err == WalletError::OK) {
                LogPrintSigning(INFO, "Wallet %s signed a %s transaction",
                                wallet_id.c_str(), ChainToString(chain).c_str());
            }
            return err;
        });

    if (result == WalletError::WALLET_LOCKED) {
        error = GetWalletErrorMessage(result);
        LogPrintSigning(WARN, "Signing request for %s rejected: wallet locked",
                        ChainToString(chain).c_str());
    }
    return result;
}

WalletError CSigningDispatcher::SignTransaction(const std::string& chain_name, const TxParams& tx,
                                                std::vector<uint8_t>& signed_bytes,
                                                std::string& error) {
    if (!session.IsUnlocked()) {
        error = GetWalletErrorMessage(WalletError::WALLET_LOCKED);
        LogPrintSigning(WARN, "Signing request for %s rejected: wallet locked", chain_name.c_str());
        return WalletError::WALLET_LOCKED;
    }

    Chain chain;
    if (!ParseChain(chain_name, chain)) {
        error = "unsupported chain: " + chain_name;
        return WalletError::UNSUPPORTED_CHAIN;
    }
    return SignTransaction(chain, tx, signed_bytes, error);
}
