// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_CRYPTO_SECP256K1_H
#define POLYVAULT_CRYPTO_SECP256K1_H

#include <stdint.h>
#include <stdlib.h>
#include <vector>

/**
 * secp256k1 key and ECDSA operations on top of OpenSSL's BIGNUM / EC_POINT
 *
 * Used for the EVM and Bitcoin chains. Signing is deterministic (RFC 6979
 * with HMAC-SHA256) and always produces low-S signatures together with the
 * public key recovery id needed for Ethereum's v value.
 *
 * All functions return false on invalid input or an OpenSSL failure; none
 * of them throw.
 */
namespace secp256k1 {

static const size_t PRIVKEY_SIZE = 32;
static const size_t COMPRESSED_PUBKEY_SIZE = 33;
static const size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

/**
 * Compact ECDSA signature with recovery id (0..3)
 */
struct Signature {
    uint8_t r[32];
    uint8_t s[32];
    int recid;
};

/**
 * Check 0 < key < n
 */
bool IsValidPrivateKey(const uint8_t key[32]);

/**
 * Compute key*G
 *
 * @param key 32-byte private key
 * @param compressed true for 33-byte SEC1 compressed, false for 65-byte uncompressed
 * @param pubkey Output encoded point
 */
bool GetPublicKey(const uint8_t key[32], bool compressed, std::vector<uint8_t>& pubkey);

/**
 * out = (key + tweak) mod n  (BIP-32 private child derivation)
 *
 * @return false if tweak >= n or the result is zero
 */
bool PrivateKeyTweakAdd(const uint8_t key[32], const uint8_t tweak[32], uint8_t out[32]);

/**
 * Sign a 32-byte message hash (RFC 6979 nonce, low-S)
 */
bool Sign(const uint8_t key[32], const uint8_t hash[32], Signature& sig);

/**
 * Verify a signature against an encoded public key (compressed or not)
 */
bool Verify(const std::vector<uint8_t>& pubkey, const uint8_t hash[32], const Signature& sig);

/**
 * Recover the signer's public key from a signature and its recovery id
 */
bool RecoverPublicKey(const uint8_t hash[32], const Signature& sig, bool compressed,
                      std::vector<uint8_t>& pubkey);

/**
 * DER-encode (r, s) as used in Bitcoin script signatures
 */
bool EncodeDER(const Signature& sig, std::vector<uint8_t>& der);

} // namespace secp256k1

#endif // POLYVAULT_CRYPTO_SECP256K1_H
