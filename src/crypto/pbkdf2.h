// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_CRYPTO_PBKDF2_H
#define POLYVAULT_CRYPTO_PBKDF2_H

#include <stdint.h>
#include <stdlib.h>
#include <string>

/**
 * PBKDF2 (RFC 8018) over OpenSSL's PKCS5_PBKDF2_HMAC
 *
 *   DK = T1 || T2 || ... ,  Ti = U1 ^ U2 ^ ... ^ Uc
 *   U1 = HMAC(Password, Salt || INT_32_BE(i)),  Uj = HMAC(Password, Uj-1)
 *
 * Two instantiations are used:
 *   - HMAC-SHA256 for the wallet vault key (password -> AES-256 key)
 *   - HMAC-SHA512 for BIP-39 (mnemonic -> 64-byte seed)
 *
 * Both throw std::invalid_argument on bad parameters (zero iterations,
 * NULL buffers) and std::runtime_error if OpenSSL fails.
 */

/**
 * Compute PBKDF2-HMAC-SHA256
 *
 * @param password Password bytes
 * @param password_len Length of password in bytes
 * @param salt Salt bytes
 * @param salt_len Length of salt in bytes
 * @param iterations Number of iterations (c) - must be > 0
 * @param output Output buffer for derived key
 * @param output_len Desired output length in bytes
 */
void PBKDF2_HMAC_SHA256(const uint8_t* password, size_t password_len,
                        const uint8_t* salt, size_t salt_len,
                        uint32_t iterations,
                        uint8_t* output, size_t output_len);

/**
 * Compute PBKDF2-HMAC-SHA512
 */
void PBKDF2_HMAC_SHA512(const uint8_t* password, size_t password_len,
                        const uint8_t* salt, size_t salt_len,
                        uint32_t iterations,
                        uint8_t* output, size_t output_len);

/**
 * BIP-39 mnemonic -> seed
 *
 * Standard BIP-39 parameters:
 * - PBKDF2-HMAC-SHA512, 2048 iterations
 * - Salt: "mnemonic" + passphrase (UTF-8)
 * - 64-byte output
 *
 * @param mnemonic_phrase Normalized mnemonic (single-space separated)
 * @param passphrase Optional BIP-39 passphrase (empty for none)
 * @param seed_output Output buffer for 64-byte seed
 */
void BIP39_MnemonicToSeed(const std::string& mnemonic_phrase,
                          const std::string& passphrase,
                          uint8_t seed_output[64]);

#endif // POLYVAULT_CRYPTO_PBKDF2_H
