// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_VAULT_H
#define POLYVAULT_WALLET_VAULT_H

#include <wallet/crypter.h>
#include <wallet/wallet_errors.h>

#include <cstdint>
#include <string>

static const char* const VAULT_ALGORITHM_AES256GCM = "AES-256-GCM";

/**
 * Encrypted mnemonic as persisted in a wallet record
 *
 * Binary fields are Base64 text. The iteration count travels with the
 * ciphertext so that records written with an older default stay readable.
 */
struct CEncryptedMnemonic {
    std::string ciphertext;   // AES-256-GCM output with 16-byte tag appended
    std::string salt;         // 32 bytes
    std::string nonce;        // 12 bytes
    std::string algorithm;    // "AES-256-GCM"
    uint32_t iterations;      // PBKDF2-HMAC-SHA256 rounds

    CEncryptedMnemonic() : algorithm(VAULT_ALGORITHM_AES256GCM), iterations(0) {}

    bool operator==(const CEncryptedMnemonic& other) const {
        return ciphertext == other.ciphertext && salt == other.salt &&
               nonce == other.nonce && algorithm == other.algorithm &&
               iterations == other.iterations;
    }
};

/**
 * CMnemonicVault
 *
 * Password-based at-rest encryption of a mnemonic:
 *   key = PBKDF2-HMAC-SHA256(password, salt, iterations)  (32 bytes)
 *   ct  = AES-256-GCM(key, nonce, mnemonic) || tag
 *
 * Salt and nonce are drawn fresh for every Encrypt call. The derived key is
 * held in CKeyingMaterial and wiped before either call returns.
 *
 * Decrypt reports every failure (wrong password, flipped bit, bad Base64,
 * unknown algorithm) as WalletError::DECRYPTION_FAILED.
 *
 * Thread Safety: stateless apart from the iteration count; safe to share.
 */
class CMnemonicVault {
private:
    unsigned int nIterations;

    struct UncheckedIterations {};
    CMnemonicVault(unsigned int iterations, UncheckedIterations);

public:
    /** Counts below WALLET_CRYPTO_PBKDF2_ROUNDS are raised to it */
    explicit CMnemonicVault(unsigned int iterations = WALLET_CRYPTO_PBKDF2_ROUNDS);

    /**
     * Build a vault that encrypts with exactly @p iterations rounds, below
     * the production floor. Unit tests only.
     */
    static CMnemonicVault WeakForTesting(unsigned int iterations);

    /**
     * Encrypt a mnemonic
     *
     * @param mnemonic Plaintext phrase (not modified, never padded or truncated)
     * @param password Wallet password (must not be empty)
     * @param out Encrypted record
     * @return OK or ENCRYPTION_FAILED
     */
    WalletError Encrypt(const std::string& mnemonic, const std::string& password,
                        CEncryptedMnemonic& out) const;

    /**
     * Decrypt a mnemonic using the stored salt, nonce and iteration count
     *
     * @param encrypted Encrypted record
     * @param password Wallet password
     * @param mnemonic Output plaintext phrase (secure buffer)
     * @return OK or DECRYPTION_FAILED
     */
    WalletError Decrypt(const CEncryptedMnemonic& encrypted, const std::string& password,
                        CKeyingMaterial& mnemonic) const;

    unsigned int GetIterations() const { return nIterations; }
};

#endif // POLYVAULT_WALLET_VAULT_H
