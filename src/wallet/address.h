// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_ADDRESS_H
#define POLYVAULT_WALLET_ADDRESS_H

#include <wallet/chains.h>

#include <stdint.h>
#include <string>
#include <vector>

/**
 * EIP-55 mixed-case checksum encoding of a 20-byte EVM address
 */
std::string EncodeEvmAddress(const std::vector<uint8_t>& address20);

/**
 * Parse "0x" + 40 hex digits into 20 bytes
 *
 * All-lowercase and all-uppercase forms are accepted as-is; a mixed-case
 * string must match its EIP-55 checksum.
 */
bool DecodeEvmAddress(const std::string& address, std::vector<uint8_t>& address20,
                      std::string& error);

/**
 * Syntactic validation of a destination address for a chain
 *
 * @param error Human-readable reason on failure
 */
bool ValidateAddress(Chain chain, const std::string& address, std::string& error);

#endif // POLYVAULT_WALLET_ADDRESS_H
