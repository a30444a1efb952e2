// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_CRYPTO_HMAC_SHA512_H
#define POLYVAULT_CRYPTO_HMAC_SHA512_H

#include <stdint.h>
#include <stdlib.h>
#include <vector>

/**
 * HMAC-SHA512 (RFC 2104 / RFC 4231)
 *
 * The PRF for BIP-32 and SLIP-10 key derivation:
 *   I = HMAC-SHA512(Key = chain code, Data = ...)
 *   IL = I[0:32] (key material), IR = I[32:64] (child chain code)
 *
 * @param key Secret key
 * @param key_len Length of key in bytes
 * @param data Message to authenticate
 * @param data_len Length of message in bytes
 * @param output Output buffer for 64-byte HMAC
 */
void HMAC_SHA512(const uint8_t* key, size_t key_len,
                 const uint8_t* data, size_t data_len,
                 uint8_t output[64]);

/**
 * HMAC-SHA256 (used for RFC 6979 deterministic ECDSA nonces)
 */
void HMAC_SHA256(const uint8_t* key, size_t key_len,
                 const uint8_t* data, size_t data_len,
                 uint8_t output[32]);

inline void HMAC_SHA512(const std::vector<uint8_t>& key,
                        const std::vector<uint8_t>& data,
                        uint8_t output[64]) {
    HMAC_SHA512(key.data(), key.size(), data.data(), data.size(), output);
}

#endif // POLYVAULT_CRYPTO_HMAC_SHA512_H
