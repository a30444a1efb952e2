// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/crypter.h>
#include <crypto/pbkdf2.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

// ============================================================================
// CCrypter Implementation
// ============================================================================

bool CCrypter::SetKey(const CKeyingMaterial& key, const std::vector<uint8_t>& nonce) {
    if (key.size() != WALLET_CRYPTO_KEY_SIZE) return false;
    if (nonce.size() != WALLET_CRYPTO_NONCE_SIZE) return false;

    vchKey.assign(key.data_ptr(), key.size());
    vchNonce = nonce;
    fKeySet = true;

    return true;
}

void CCrypter::Clear() {
    vchKey.Wipe();
    vchKey.resize(WALLET_CRYPTO_KEY_SIZE);
    std::fill(vchNonce.begin(), vchNonce.end(), 0);
    fKeySet = false;
}

bool CCrypter::Encrypt(const CKeyingMaterial& plaintext, std::vector<uint8_t>& ciphertext) const {
    if (!fKeySet) return false;
    if (plaintext.empty()) return false;
    if (plaintext.size() > static_cast<size_t>(std::numeric_limits<int>::max())) return false;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return false;
    }

    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(vchNonce.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx, nullptr, nullptr, vchKey.data_ptr(), vchNonce.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }

    // GCM is a stream mode: output length equals input length
    std::vector<uint8_t> out(plaintext.size() + WALLET_CRYPTO_TAG_SIZE);
    int len = 0;
    int total = 0;

    if (EVP_EncryptUpdate(ctx, out.data(), &len,
                          plaintext.data_ptr(), static_cast<int>(plaintext.size())) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }
    total = len;

    if (EVP_EncryptFinal_ex(ctx, out.data() + total, &len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }
    total += len;

    if (static_cast<size_t>(total) != plaintext.size()) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, WALLET_CRYPTO_TAG_SIZE,
                            out.data() + total) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }

    EVP_CIPHER_CTX_free(ctx);
    ciphertext.swap(out);
    return true;
}

bool CCrypter::Decrypt(const std::vector<uint8_t>& ciphertext, CKeyingMaterial& plaintext) const {
    if (!fKeySet) return false;
    if (ciphertext.size() <= WALLET_CRYPTO_TAG_SIZE) return false;
    if (ciphertext.size() > static_cast<size_t>(std::numeric_limits<int>::max())) return false;

    const size_t body_len = ciphertext.size() - WALLET_CRYPTO_TAG_SIZE;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return false;
    }

    if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(vchNonce.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx, nullptr, nullptr, vchKey.data_ptr(), vchNonce.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }

    CKeyingMaterial out(body_len);
    int len = 0;
    int total = 0;

    if (EVP_DecryptUpdate(ctx, out.data_ptr(), &len,
                          ciphertext.data(), static_cast<int>(body_len)) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }
    total = len;

    // The tag must be set before Final; EVP_CIPHER_CTX_ctrl takes a non-const pointer
    std::vector<uint8_t> tag(ciphertext.end() - WALLET_CRYPTO_TAG_SIZE, ciphertext.end());
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, WALLET_CRYPTO_TAG_SIZE, tag.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }

    // Tag verification happens here; out (wiped on destruction) is discarded on failure
    if (EVP_DecryptFinal_ex(ctx, out.data_ptr() + total, &len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }
    total += len;
    EVP_CIPHER_CTX_free(ctx);

    if (static_cast<size_t>(total) != body_len) {
        return false;
    }

    plaintext = std::move(out);
    return true;
}

// ============================================================================
// Key Derivation (PBKDF2-HMAC-SHA256)
// ============================================================================

bool DeriveKey(const std::string& passphrase,
               const std::vector<uint8_t>& salt,
               unsigned int rounds,
               CKeyingMaterial& keyOut) {
    if (passphrase.empty()) return false;
    if (salt.size() != WALLET_CRYPTO_SALT_SIZE) return false;
    if (rounds == 0) return false;

    CKeyingMaterial key(WALLET_CRYPTO_KEY_SIZE);
    try {
        PBKDF2_HMAC_SHA256(reinterpret_cast<const uint8_t*>(passphrase.data()),
                           passphrase.size(),
                           salt.data(), salt.size(),
                           rounds,
                           key.data_ptr(), key.size());
    } catch (const std::exception&) {
        return false;
    }

    keyOut = std::move(key);
    return true;
}

// ============================================================================
// Random Number Generation
// ============================================================================

bool GetStrongRandBytes(uint8_t* buf, size_t len) {
    if (buf == nullptr || len == 0) return false;
    if (len > static_cast<size_t>(std::numeric_limits<int>::max())) return false;

    return RAND_bytes(buf, static_cast<int>(len)) == 1;
}

bool GenerateSalt(std::vector<uint8_t>& salt) {
    salt.resize(WALLET_CRYPTO_SALT_SIZE);
    return GetStrongRandBytes(salt.data(), salt.size());
}

bool GenerateNonce(std::vector<uint8_t>& nonce) {
    nonce.resize(WALLET_CRYPTO_NONCE_SIZE);
    return GetStrongRandBytes(nonce.data(), nonce.size());
}
