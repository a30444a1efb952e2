// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_CRYPTO_ED25519_H
#define POLYVAULT_CRYPTO_ED25519_H

#include <stdint.h>
#include <stdlib.h>

/**
 * Ed25519 (RFC 8032) through OpenSSL's EVP_PKEY_ED25519
 *
 * Keys are the raw 32-byte seed form produced by SLIP-10 derivation.
 * Functions return false on bad input or an OpenSSL failure.
 */
namespace ed25519 {

static const size_t SEED_SIZE = 32;
static const size_t PUBKEY_SIZE = 32;
static const size_t SIGNATURE_SIZE = 64;

bool GetPublicKey(const uint8_t seed[32], uint8_t pubkey[32]);

bool Sign(const uint8_t seed[32], const uint8_t* msg, size_t msg_len, uint8_t sig[64]);

bool Verify(const uint8_t pubkey[32], const uint8_t* msg, size_t msg_len, const uint8_t sig[64]);

} // namespace ed25519

#endif // POLYVAULT_CRYPTO_ED25519_H
