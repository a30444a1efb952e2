// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_UTIL_BASE58_H
#define POLYVAULT_UTIL_BASE58_H

#include <cstdint>
#include <string>
#include <vector>

/**
 * Plain Base58 in the Bitcoin alphabet, no checksum. Solana account
 * addresses are the Base58 text of the 32-byte Ed25519 public key.
 *
 * Each leading zero byte becomes a leading '1' and back.
 */
std::string EncodeBase58(const std::vector<uint8_t>& data);

/** Fails on characters outside the alphabet and on input over 1024 chars */
bool DecodeBase58(const std::string& str, std::vector<uint8_t>& data);

#endif // POLYVAULT_UTIL_BASE58_H
