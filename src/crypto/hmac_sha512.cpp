// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <crypto/hmac_sha512.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>
#include <string>

static void HMACDigest(const EVP_MD* md, const char* name, unsigned int expected_len,
                       const uint8_t* key, size_t key_len,
                       const uint8_t* data, size_t data_len,
                       uint8_t* output) {
    if (key == nullptr && key_len > 0) {
        throw std::invalid_argument(std::string(name) + ": key is NULL but key_len > 0");
    }
    if (data == nullptr && data_len > 0) {
        throw std::invalid_argument(std::string(name) + ": data is NULL but data_len > 0");
    }
    if (output == nullptr) {
        throw std::invalid_argument(std::string(name) + ": output buffer is NULL");
    }

    static const uint8_t empty = 0;
    unsigned int out_len = 0;
    if (HMAC(md, key != nullptr ? key : &empty, static_cast<int>(key_len),
             data != nullptr ? data : &empty, data_len, output, &out_len) == nullptr ||
        out_len != expected_len) {
        throw std::runtime_error(std::string(name) + ": HMAC computation failed");
    }
}

void HMAC_SHA512(const uint8_t* key, size_t key_len,
                 const uint8_t* data, size_t data_len,
                 uint8_t output[64]) {
    HMACDigest(EVP_sha512(), "HMAC_SHA512", 64, key, key_len, data, data_len, output);
}

void HMAC_SHA256(const uint8_t* key, size_t key_len,
                 const uint8_t* data, size_t data_len,
                 uint8_t output[32]) {
    HMACDigest(EVP_sha256(), "HMAC_SHA256", 32, key, key_len, data, data_len, output);
}
