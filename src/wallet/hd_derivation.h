// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_HD_DERIVATION_H
#define POLYVAULT_WALLET_HD_DERIVATION_H

#include <stdint.h>
#include <stdlib.h>
#include <string>
#include <vector>

/**
 * Hierarchical deterministic key derivation
 *
 * Two schemes share one extended-key type:
 *   SECP256K1  BIP-32, master HMAC key "Bitcoin seed", hardened and normal children
 *   ED25519    SLIP-10, master HMAC key "ed25519 seed", hardened children only
 *
 * Path syntax: m / a / b' / c ...  where ' (or h/H) marks a hardened index.
 */

// Hardened index threshold
#define HD_HARDENED_BIT 0x80000000

#define HD_MASTER_KEY_SECP256K1 "Bitcoin seed"
#define HD_MASTER_KEY_ED25519 "ed25519 seed"

enum class HDCurve {
    SECP256K1,
    ED25519,
};

/**
 * CHDExtendedKey - private key plus chain code and tree metadata
 */
class CHDExtendedKey {
public:
    uint8_t key[32];           // secp256k1 scalar or ed25519 seed
    uint8_t chaincode[32];
    uint32_t depth;            // 0 = master
    uint32_t fingerprint;      // first 4 bytes of Hash160(parent public key)
    uint32_t child_index;
    HDCurve curve;

    CHDExtendedKey();
    ~CHDExtendedKey();

    CHDExtendedKey(const CHDExtendedKey& other);
    CHDExtendedKey& operator=(const CHDExtendedKey& other);

    /**
     * Wipe sensitive data from memory
     */
    void Wipe();

    bool IsMaster() const { return depth == 0; }

    /**
     * Public key in the 33-byte form used for fingerprints
     *
     * SECP256K1: SEC1 compressed point. ED25519: 0x00 || 32-byte key.
     */
    bool GetPublicKey(std::vector<uint8_t>& pubkey) const;

    /**
     * Fingerprint of this key (used as the child's parent fingerprint)
     *
     * @return 0 if the public key cannot be computed
     */
    uint32_t GetFingerprint() const;
};

/**
 * CHDKeyPath - parsed derivation path
 */
class CHDKeyPath {
public:
    std::vector<uint32_t> indices;  // with hardened bit where applicable

    CHDKeyPath() {}

    /**
     * Parse a path string such as "m/44'/60'/0'/0/0"
     *
     * @return false on syntax error or an index >= 2^31
     */
    bool Parse(const std::string& path);

    std::string ToString() const;

    /**
     * True if every level is hardened (required for ED25519)
     */
    bool IsFullyHardened() const;

    static bool IsHardened(uint32_t index) { return index >= HD_HARDENED_BIT; }

    bool operator==(const CHDKeyPath& other) const {
        return indices == other.indices;
    }

    bool operator<(const CHDKeyPath& other) const {
        return indices < other.indices;
    }
};

/**
 * Derive the master extended key from a BIP-39 seed
 *
 * @param seed Seed bytes (16 to 64 bytes)
 * @param seed_len Seed length
 * @param curve Derivation scheme
 * @param master_key Output master key
 * @return false on bad length or (SECP256K1) an invalid master scalar
 */
bool DeriveMaster(const uint8_t* seed, size_t seed_len, HDCurve curve, CHDExtendedKey& master_key);

/**
 * Derive one child level
 *
 * SECP256K1:
 *   hardened  I = HMAC-SHA512(c, 0x00 || k || index)
 *   normal    I = HMAC-SHA512(c, serP(K) || index)
 *   child k = (IL + k) mod n, rejected if IL >= n or the result is zero
 * ED25519 (hardened only):
 *   I = HMAC-SHA512(c, 0x00 || k || index), child k = IL
 *
 * @return false on a rejected index or key
 */
bool DeriveChild(const CHDExtendedKey& parent, uint32_t index, CHDExtendedKey& child);

bool DerivePath(const CHDExtendedKey& master, const CHDKeyPath& path, CHDExtendedKey& derived);

bool DerivePath(const CHDExtendedKey& master, const std::string& path, CHDExtendedKey& derived);

#endif // POLYVAULT_WALLET_HD_DERIVATION_H
