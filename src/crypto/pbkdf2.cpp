// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <crypto/pbkdf2.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

static void PBKDF2(const EVP_MD* md, const char* name,
                   const uint8_t* password, size_t password_len,
                   const uint8_t* salt, size_t salt_len,
                   uint32_t iterations,
                   uint8_t* output, size_t output_len) {
    if (password == nullptr && password_len > 0) {
        throw std::invalid_argument(std::string(name) + ": password is NULL but password_len > 0");
    }
    if (salt == nullptr && salt_len > 0) {
        throw std::invalid_argument(std::string(name) + ": salt is NULL but salt_len > 0");
    }
    if (output == nullptr || output_len == 0) {
        throw std::invalid_argument(std::string(name) + ": output buffer is empty");
    }
    if (iterations == 0 || iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(std::string(name) + ": iteration count out of range");
    }
    if (password_len > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        salt_len > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        output_len > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(std::string(name) + ": buffer too large");
    }

    static const uint8_t empty = 0;
    int ok = PKCS5_PBKDF2_HMAC(reinterpret_cast<const char*>(password != nullptr ? password : &empty),
                               static_cast<int>(password_len),
                               salt != nullptr ? salt : &empty, static_cast<int>(salt_len),
                               static_cast<int>(iterations), md,
                               static_cast<int>(output_len), output);
    if (ok != 1) {
        OPENSSL_cleanse(output, output_len);
        throw std::runtime_error(std::string(name) + ": PKCS5_PBKDF2_HMAC failed");
    }
}

void PBKDF2_HMAC_SHA256(const uint8_t* password, size_t password_len,
                        const uint8_t* salt, size_t salt_len,
                        uint32_t iterations,
                        uint8_t* output, size_t output_len) {
    PBKDF2(EVP_sha256(), "PBKDF2_HMAC_SHA256", password, password_len,
           salt, salt_len, iterations, output, output_len);
}

void PBKDF2_HMAC_SHA512(const uint8_t* password, size_t password_len,
                        const uint8_t* salt, size_t salt_len,
                        uint32_t iterations,
                        uint8_t* output, size_t output_len) {
    PBKDF2(EVP_sha512(), "PBKDF2_HMAC_SHA512", password, password_len,
           salt, salt_len, iterations, output, output_len);
}

void BIP39_MnemonicToSeed(const std::string& mnemonic_phrase,
                          const std::string& passphrase,
                          uint8_t seed_output[64]) {
    const std::string SALT_PREFIX = "mnemonic";
    const uint32_t BIP39_ITERATIONS = 2048;

    std::vector<uint8_t> salt(SALT_PREFIX.begin(), SALT_PREFIX.end());
    salt.insert(salt.end(), passphrase.begin(), passphrase.end());

    PBKDF2_HMAC_SHA512(reinterpret_cast<const uint8_t*>(mnemonic_phrase.data()),
                       mnemonic_phrase.size(),
                       salt.data(), salt.size(),
                       BIP39_ITERATIONS,
                       seed_output, 64);

    OPENSSL_cleanse(salt.data(), salt.size());
}
