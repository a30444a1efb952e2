// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_CRYPTO_KECCAK_H
#define POLYVAULT_CRYPTO_KECCAK_H

#include <stdint.h>
#include <stdlib.h>
#include <vector>

/**
 * Keccak-256 (original Keccak padding, as used by Ethereum)
 *
 * This is NOT FIPS 202 SHA3-256: the domain separation byte is 0x01
 * instead of 0x06, so the two produce different digests for the same
 * input. EVM addresses and transaction hashes require this variant.
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 */
void Keccak256(const uint8_t* data, size_t len, uint8_t hash[32]);

inline std::vector<uint8_t> Keccak256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash(32);
    Keccak256(data.data(), data.size(), hash.data());
    return hash;
}

#endif // POLYVAULT_CRYPTO_KECCAK_H
