// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_CRYPTER_H
#define POLYVAULT_WALLET_CRYPTER_H

#include <vector>
#include <cstdint>
#include <string>
#include <cstring>

#include <util/secure_allocator.h>

/**
 * Wallet Encryption using AES-256-GCM
 *
 * - PBKDF2-HMAC-SHA256 turns the wallet password into a 256-bit key
 * - AES-256-GCM encrypts and authenticates in one pass; the 16-byte tag is
 *   appended to the ciphertext
 * - Salts and nonces come from OpenSSL's CSPRNG (RAND_bytes)
 * - Keys live in CKeyingMaterial and are wiped when they go out of scope
 */

/**
 * Secure memory wiping - prevents compiler optimization
 *
 * @param ptr Pointer to memory to wipe
 * @param len Length of memory to wipe in bytes
 */
inline void memory_cleanse(void* ptr, size_t len) {
    secure_memory_cleanse(ptr, len);
}

/**
 * CKeyingMaterial
 *
 * Move-only container for secret bytes (seeds, derived keys, decrypted
 * mnemonics). Backed by SecureAllocator, so pages are locked while alive
 * and zeroed on release. Copying is disabled to keep a single owner.
 */
class CKeyingMaterial {
private:
    std::vector<uint8_t, SecureAllocator<uint8_t>> data;

public:
    CKeyingMaterial() = default;
    explicit CKeyingMaterial(size_t size) : data(size, 0) {}
    CKeyingMaterial(const uint8_t* begin, size_t len) : data(begin, begin + len) {}

    ~CKeyingMaterial() {
        Wipe();
    }

    CKeyingMaterial(const CKeyingMaterial&) = delete;
    CKeyingMaterial& operator=(const CKeyingMaterial&) = delete;

    CKeyingMaterial(CKeyingMaterial&& other) noexcept : data(std::move(other.data)) {}

    CKeyingMaterial& operator=(CKeyingMaterial&& other) noexcept {
        if (this != &other) {
            Wipe();
            data = std::move(other.data);
        }
        return *this;
    }

    uint8_t* data_ptr() { return data.data(); }
    const uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    void resize(size_t new_size) { data.resize(new_size); }

    void assign(const uint8_t* begin, size_t len) {
        Wipe();
        data.assign(begin, begin + len);
    }

    // Overwrite with zeros and release
    void Wipe() {
        if (!data.empty()) {
            memory_cleanse(data.data(), data.size());
        }
        data.clear();
    }

    // Contents as a std::string (for a decrypted mnemonic). The caller owns
    // the copy and must wipe it.
    std::string ToString() const {
        return std::string(reinterpret_cast<const char*>(data.data()), data.size());
    }
};

/**
 * Key Derivation Constants
 */
static const unsigned int WALLET_CRYPTO_KEY_SIZE = 32;     // AES-256 key size
static const unsigned int WALLET_CRYPTO_SALT_SIZE = 32;    // PBKDF2 salt
static const unsigned int WALLET_CRYPTO_NONCE_SIZE = 12;   // GCM nonce
static const unsigned int WALLET_CRYPTO_TAG_SIZE = 16;     // GCM authentication tag
// OWASP 2023 guidance for PBKDF2-HMAC-SHA256
static const unsigned int WALLET_CRYPTO_PBKDF2_ROUNDS = 600000;

/**
 * CCrypter
 *
 * AES-256-GCM with a caller-supplied key and nonce. A nonce must never be
 * reused with the same key; CMnemonicVault draws a fresh salt (and so a
 * fresh key) and a fresh nonce for every encryption.
 *
 * Thread Safety: Not thread-safe. Create separate instances per thread.
 *
 * Usage:
 *   CKeyingMaterial key;
 *   DeriveKey(password, salt, rounds, key);
 *   CCrypter crypter;
 *   if (!crypter.SetKey(key, nonce)) { error }
 *   crypter.Encrypt(plaintext, ciphertext);   // ciphertext || tag
 *   crypter.Decrypt(ciphertext, plaintext);   // false on tag mismatch
 */
class CCrypter {
private:
    CKeyingMaterial vchKey;
    std::vector<uint8_t> vchNonce;
    bool fKeySet;

public:
    CCrypter() : vchKey(WALLET_CRYPTO_KEY_SIZE), vchNonce(WALLET_CRYPTO_NONCE_SIZE, 0), fKeySet(false) {}

    /**
     * Set encryption key and nonce
     *
     * @param key AES-256 key (must be 32 bytes)
     * @param nonce GCM nonce (must be 12 bytes)
     * @return false if key/nonce are the wrong size
     */
    bool SetKey(const CKeyingMaterial& key, const std::vector<uint8_t>& nonce);

    /**
     * Encrypt and authenticate
     *
     * @param plaintext Input data (may not be empty)
     * @param ciphertext Output: encrypted bytes followed by the 16-byte tag
     * @return true on success, false on any cipher failure
     */
    bool Encrypt(const CKeyingMaterial& plaintext, std::vector<uint8_t>& ciphertext) const;

    /**
     * Verify and decrypt
     *
     * @param ciphertext Encrypted bytes followed by the 16-byte tag
     * @param plaintext Output (only written when the tag verifies)
     * @return false on tag mismatch or malformed input
     */
    bool Decrypt(const std::vector<uint8_t>& ciphertext, CKeyingMaterial& plaintext) const;

    bool IsKeySet() const { return fKeySet; }

    // Wipe key and forget the nonce
    void Clear();
};

/**
 * Derive an AES-256 key from a password with PBKDF2-HMAC-SHA256
 *
 * @param passphrase Wallet password (UTF-8)
 * @param salt Random salt (must be WALLET_CRYPTO_SALT_SIZE bytes)
 * @param rounds Number of PBKDF2 iterations
 * @param keyOut Output key (32 bytes)
 * @return false on bad parameters or an OpenSSL failure
 */
bool DeriveKey(const std::string& passphrase,
               const std::vector<uint8_t>& salt,
               unsigned int rounds,
               CKeyingMaterial& keyOut);

/**
 * Fill a buffer from OpenSSL's CSPRNG
 *
 * @return false if the RNG is not seeded or failed
 */
bool GetStrongRandBytes(uint8_t* buf, size_t len);

/**
 * Generate random salt for PBKDF2 (WALLET_CRYPTO_SALT_SIZE bytes)
 */
bool GenerateSalt(std::vector<uint8_t>& salt);

/**
 * Generate random GCM nonce (WALLET_CRYPTO_NONCE_SIZE bytes)
 */
bool GenerateNonce(std::vector<uint8_t>& nonce);

#endif // POLYVAULT_WALLET_CRYPTER_H
