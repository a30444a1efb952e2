// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_CHAINS_H
#define POLYVAULT_WALLET_CHAINS_H

#include <wallet/hd_derivation.h>

#include <stdint.h>
#include <string>
#include <vector>

/**
 * Supported chains (closed set)
 */
enum class Chain {
    ETH,
    BSC,
    POLYGON,
    BTC,
    SOL,
    TON,
};

/**
 * Key and address scheme shared by a group of chains
 */
enum class ChainFamily {
    EVM,        // secp256k1, Keccak address, EIP-155 signing
    BITCOIN,    // secp256k1, P2WPKH bech32 address, DER signing
    SOLANA,     // ed25519, Base58 address
    TON,        // ed25519, raw "0:" address
};

/**
 * Static per-chain parameters
 */
struct ChainInfo {
    Chain chain;
    const char* name;
    ChainFamily family;
    HDCurve curve;
    const char* path;            // account level is index 2
    uint64_t default_chain_id;   // EIP-155 id, 0 for non-EVM chains
};

const ChainInfo& GetChainInfo(Chain chain);

/**
 * All chains in name order (the order used for wallet id hashing)
 */
const std::vector<Chain>& AllChains();

std::string ChainToString(Chain chain);

/**
 * Parse a chain name (case-insensitive)
 *
 * @return false if the name is not a supported chain
 */
bool ParseChain(const std::string& name, Chain& chain);

/**
 * Derivation path with the account level replaced by account_index
 */
bool GetDerivationPath(Chain chain, uint32_t account_index, CHDKeyPath& path);

#endif // POLYVAULT_WALLET_CHAINS_H
