// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_UTIL_STRENCODINGS_H
#define POLYVAULT_UTIL_STRENCODINGS_H

#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <cstdint>

inline std::string strprintf(const char* format, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    return std::string(buffer);
}

/**
 * Hex and Base64 encoding utilities
 *
 * Used for the persisted wallet record (Base64 vault fields, hex public keys)
 * and for transaction parameters handed in by callers.
 */

/**
 * Convert byte array to lowercase hexadecimal string
 */
std::string HexStr(const uint8_t* data, size_t len);

/**
 * Convert vector of bytes to lowercase hexadecimal string
 */
std::string HexStr(const std::vector<uint8_t>& vch);

/**
 * Parse hexadecimal string to bytes
 *
 * An optional "0x"/"0X" prefix is accepted. Returns an empty vector on
 * malformed input (odd length or non-hex characters).
 */
std::vector<uint8_t> ParseHex(const std::string& str);

/**
 * Check if string is valid hexadecimal (even length, hex digits only)
 */
bool IsHex(const std::string& str);

/**
 * Convert single hex character to its numeric value
 */
inline int8_t HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * Encode bytes as standard (RFC 4648) padded Base64
 */
std::string EncodeBase64(const uint8_t* data, size_t len);
std::string EncodeBase64(const std::vector<uint8_t>& vch);

/**
 * Decode standard padded Base64
 *
 * @param str Base64 text (length must be a multiple of 4)
 * @param out Decoded bytes
 * @return false on any malformed input
 */
bool DecodeBase64(const std::string& str, std::vector<uint8_t>& out);

/**
 * Strip leading and trailing whitespace
 */
std::string TrimString(const std::string& str);

/**
 * ASCII lowercase copy
 */
std::string ToLower(const std::string& str);

#endif // POLYVAULT_UTIL_STRENCODINGS_H
