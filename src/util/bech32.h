// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_UTIL_BECH32_H
#define POLYVAULT_UTIL_BECH32_H

#include <string>
#include <vector>
#include <cstdint>

/**
 * Bech32 (BIP-173) encoding for native SegWit v0 addresses
 */
namespace bech32 {

/**
 * Encode a human-readable part and 5-bit values as a Bech32 string
 * (lowercase, with the 6-character checksum appended)
 */
std::string Encode(const std::string& hrp, const std::vector<uint8_t>& values);

/**
 * Decode a Bech32 string
 *
 * @param str Input string (must not mix case)
 * @param hrp Output human-readable part
 * @param values Output 5-bit values without checksum
 * @return true if the checksum verified
 */
bool Decode(const std::string& str, std::string& hrp, std::vector<uint8_t>& values);

/**
 * Regroup bits (e.g. 8-bit bytes into 5-bit groups)
 */
bool ConvertBits(const std::vector<uint8_t>& in, int frombits, int tobits,
                 bool pad, std::vector<uint8_t>& out);

/**
 * Encode a SegWit address: hrp + witness version + program
 */
std::string EncodeSegwitAddress(const std::string& hrp, int witver,
                                const std::vector<uint8_t>& program);

} // namespace bech32

#endif // POLYVAULT_UTIL_BECH32_H
