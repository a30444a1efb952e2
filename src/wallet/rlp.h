// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_RLP_H
#define POLYVAULT_WALLET_RLP_H

#include <stddef.h>
#include <stdint.h>
#include <vector>

/**
 * Recursive Length Prefix encoding (Ethereum yellow paper, appendix B)
 *
 * Items are encoded one at a time and concatenated into a list; integers
 * are big-endian with no leading zero bytes (zero is the empty string).
 */
namespace rlp {

std::vector<uint8_t> EncodeBytes(const std::vector<uint8_t>& data);

std::vector<uint8_t> EncodeUint(uint64_t value);

/**
 * Wrap already-encoded items in a list header
 */
std::vector<uint8_t> EncodeList(const std::vector<std::vector<uint8_t>>& items);

/**
 * Minimal big-endian representation of an integer
 */
std::vector<uint8_t> MinimalBigEndian(uint64_t value);

} // namespace rlp

#endif // POLYVAULT_WALLET_RLP_H
