// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <crypto/sha256.h>
#include <openssl/evp.h>
#include <stdexcept>
#include <string>

namespace {

void EVPDigest(const EVP_MD* md, const char* name,
               const uint8_t* data, size_t len, uint8_t* hash) {
    if (data == nullptr && len > 0) {
        throw std::invalid_argument(std::string(name) + ": data is NULL but len > 0");
    }
    if (hash == nullptr) {
        throw std::invalid_argument(std::string(name) + ": hash output buffer is NULL");
    }
    if (md == nullptr) {
        throw std::runtime_error(std::string(name) + ": digest not available in this OpenSSL build");
    }

    static const uint8_t empty = 0;
    unsigned int out_len = 0;
    if (EVP_Digest(data != nullptr ? data : &empty, len, hash, &out_len, md, nullptr) != 1) {
        throw std::runtime_error(std::string(name) + ": EVP_Digest failed");
    }
}

} // namespace

void SHA256(const uint8_t* data, size_t len, uint8_t hash[32]) {
    EVPDigest(EVP_sha256(), "SHA256", data, len, hash);
}

void SHA512(const uint8_t* data, size_t len, uint8_t hash[64]) {
    EVPDigest(EVP_sha512(), "SHA512", data, len, hash);
}

void RIPEMD160(const uint8_t* data, size_t len, uint8_t hash[20]) {
    EVPDigest(EVP_ripemd160(), "RIPEMD160", data, len, hash);
}

void Hash160(const uint8_t* data, size_t len, uint8_t hash[20]) {
    uint8_t sha[32];
    SHA256(data, len, sha);
    RIPEMD160(sha, sizeof(sha), hash);
}
