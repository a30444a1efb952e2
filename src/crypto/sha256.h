// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_CRYPTO_SHA256_H
#define POLYVAULT_CRYPTO_SHA256_H

#include <stdint.h>
#include <stdlib.h>
#include <vector>

/**
 * One-shot SHA-2 / RIPEMD-160 digests backed by OpenSSL EVP
 *
 * All functions throw std::invalid_argument on NULL buffers and
 * std::runtime_error if the OpenSSL digest fails.
 */

/**
 * Compute SHA-256 hash of data
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 */
void SHA256(const uint8_t* data, size_t len, uint8_t hash[32]);

/**
 * Compute SHA-512 hash of data
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 64-byte hash
 */
void SHA512(const uint8_t* data, size_t len, uint8_t hash[64]);

/**
 * Compute RIPEMD-160 hash of data
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 20-byte hash
 */
void RIPEMD160(const uint8_t* data, size_t len, uint8_t hash[20]);

/**
 * Bitcoin Hash160: RIPEMD-160(SHA-256(data))
 */
void Hash160(const uint8_t* data, size_t len, uint8_t hash[20]);

inline std::vector<uint8_t> SHA256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash(32);
    SHA256(data.data(), data.size(), hash.data());
    return hash;
}

inline std::vector<uint8_t> Hash160(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash(20);
    Hash160(data.data(), data.size(), hash.data());
    return hash;
}

#endif // POLYVAULT_CRYPTO_SHA256_H
