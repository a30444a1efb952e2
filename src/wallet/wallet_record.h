// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_WALLET_RECORD_H
#define POLYVAULT_WALLET_WALLET_RECORD_H

#include <wallet/vault.h>
#include <wallet/wallet_errors.h>

#include <cstdint>
#include <map>
#include <string>

// Current on-disk record layout
static const uint32_t WALLET_RECORD_VERSION = 2;

// Storage key prefix: "wallet_" + id
static const char* const WALLET_KEY_PREFIX = "wallet_";

/**
 * Persisted wallet (public data plus the encrypted mnemonic)
 *
 * Maps are keyed by chain name ("ETH", "BTC", ...). std::map keeps them in
 * name order, which is also the order used for the wallet id.
 */
struct CWalletRecord {
    std::string id;
    std::string name;
    CEncryptedMnemonic encrypted_mnemonic;
    std::map<std::string, std::string> addresses;
    std::map<std::string, std::string> public_keys;       // hex
    std::map<std::string, std::string> derivation_paths;
    int64_t created_at;                                   // Unix time, milliseconds
    uint32_t version;

    CWalletRecord() : created_at(0), version(WALLET_RECORD_VERSION) {}

    /**
     * Serialize to compact JSON text
     */
    std::string ToJSON() const;

    /**
     * Parse a record, upgrading version 1 layouts in memory
     *
     * Version 1 records carry no public_keys or derivation_paths: paths are
     * filled from the fixed chain table, public keys stay empty, and the
     * record reports version 2. Versions above 2 are rejected.
     *
     * @param text JSON document
     * @param record Output
     * @param error Parse failure detail
     * @return OK or STORAGE_FAILURE
     */
    static WalletError FromJSON(const std::string& text, CWalletRecord& record, std::string& error);
};

/**
 * First 16 hex characters of SHA-256 over "CHAIN:address" pairs in chain
 * name order, concatenated without separators
 */
std::string ComputeWalletId(const std::map<std::string, std::string>& addresses);

/**
 * Storage key for a wallet id
 */
std::string WalletStorageKey(const std::string& id);

/**
 * Current Unix time in milliseconds
 */
int64_t GetTimeMillis();

#endif // POLYVAULT_WALLET_WALLET_RECORD_H
