// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_SIGNING_DISPATCHER_H
#define POLYVAULT_WALLET_SIGNING_DISPATCHER_H

#include <wallet/chains.h>
#include <wallet/key_deriver.h>
#include <wallet/session_manager.h>
#include <wallet/signer.h>

#include <string>
#include <vector>

/**
 * Deriver and signer registered for a chain
 */
struct ChainCapability {
    Chain chain;
    const CKeyDeriver* deriver;
    const CChainSigner* signer;
};

/**
 * Capability table lookup
 *
 * @return nullptr if no capability is registered for the chain
 */
const ChainCapability* GetChainCapability(Chain chain);

/**
 * CSigningDispatcher
 *
 * Routes a signing request to the chain's signer:
 *   1. reject with WALLET_LOCKED when no live session exists
 *   2. refresh the session
 *   3. derive the chain key from the session seed into a wiping buffer
 *   4. sign
 * The derived key is wiped before SignTransaction returns.
 */
class CSigningDispatcher {
private:
    CSessionManager& session;
    uint32_t nAccountIndex;

public:
    explicit CSigningDispatcher(CSessionManager& session_in, uint32_t account_index = 0)
        : session(session_in), nAccountIndex(account_index) {}

    WalletError SignTransaction(Chain chain, const TxParams& tx, std::vector<uint8_t>& signed_bytes,
                                std::string& error);

    /**
     * Name-based entry point; unknown names yield UNSUPPORTED_CHAIN
     */
    WalletError SignTransaction(const std::string& chain_name, const TxParams& tx,
                                std::vector<uint8_t>& signed_bytes, std::string& error);
};

#endif // POLYVAULT_WALLET_SIGNING_DISPATCHER_H
