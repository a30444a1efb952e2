// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_WALLET_ERRORS_H
#define POLYVAULT_WALLET_WALLET_ERRORS_H

#include <string>

/**
 * Result codes for wallet operations
 *
 * Every public wallet operation returns one of these; results travel
 * through out-parameters. DECRYPTION_FAILED deliberately covers both a wrong
 * password and a corrupted vault.
 */
enum class WalletError {
    OK,
    INVALID_MNEMONIC,      // Malformed phrase, unknown word or bad checksum
    ENCRYPTION_FAILED,     // Vault could not encrypt (RNG or cipher failure)
    DECRYPTION_FAILED,     // Wrong password or tampered/corrupted vault
    WALLET_LOCKED,         // No valid unlock session
    WALLET_NOT_FOUND,      // Unknown wallet id
    UNSUPPORTED_CHAIN,     // No signer/deriver registered for the chain
    STORAGE_FAILURE,       // Key-value store read/write or record parse failure
    INVALID_ARGUMENT,      // Bad transaction parameters or empty name
    WEAK_PASSWORD,         // Password rejected by the passphrase policy
    SESSION_ACTIVE         // Another wallet is unlocked; lock() first
};

/**
 * Get a user-facing message for a result code
 */
std::string GetWalletErrorMessage(WalletError error);

/**
 * Stable identifier (e.g. "DECRYPTION_FAILED") for logs
 */
const char* WalletErrorName(WalletError error);

#endif // POLYVAULT_WALLET_WALLET_ERRORS_H
