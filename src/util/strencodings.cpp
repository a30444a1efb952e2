// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <util/strencodings.h>
#include <algorithm>
#include <cctype>

static const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string HexStr(const uint8_t* data, size_t len) {
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(hexmap[(data[i] >> 4) & 0x0F]);  // High nibble
        result.push_back(hexmap[data[i] & 0x0F]);         // Low nibble
    }

    return result;
}

std::string HexStr(const std::vector<uint8_t>& vch) {
    return HexStr(vch.data(), vch.size());
}

std::vector<uint8_t> ParseHex(const std::string& str) {
    std::string body = str;
    if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
        body = body.substr(2);
    }

    if (!IsHex(body)) {
        return std::vector<uint8_t>();
    }

    std::vector<uint8_t> result;
    result.reserve(body.size() / 2);

    for (size_t i = 0; i < body.size(); i += 2) {
        int8_t high = HexDigit(body[i]);
        int8_t low = HexDigit(body[i + 1]);
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

bool IsHex(const std::string& str) {
    if (str.size() % 2 != 0) {
        return false;
    }

    for (char c : str) {
        if (HexDigit(c) < 0) {
            return false;
        }
    }

    return true;
}

std::string EncodeBase64(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= len) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(BASE64_CHARS[(n >> 18) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 12) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 6) & 0x3F]);
        out.push_back(BASE64_CHARS[n & 0x3F]);
        i += 3;
    }

    size_t rem = len - i;
    if (rem == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out.push_back(BASE64_CHARS[(n >> 18) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rem == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(BASE64_CHARS[(n >> 18) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 12) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::string EncodeBase64(const std::vector<uint8_t>& vch) {
    return EncodeBase64(vch.data(), vch.size());
}

static int DecodeBase64Char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

bool DecodeBase64(const std::string& str, std::vector<uint8_t>& out) {
    out.clear();
    if (str.size() % 4 != 0) {
        return false;
    }

    out.reserve(str.size() / 4 * 3);

    for (size_t i = 0; i < str.size(); i += 4) {
        bool last = (i + 4 == str.size());
        int v[4];
        size_t padding = 0;

        for (size_t j = 0; j < 4; ++j) {
            char c = str[i + j];
            if (c == '=') {
                // Padding is only legal in the final two positions of the last quad
                if (!last || j < 2) {
                    out.clear();
                    return false;
                }
                v[j] = 0;
                padding++;
            } else {
                if (padding > 0) {
                    out.clear();
                    return false;
                }
                v[j] = DecodeBase64Char(c);
                if (v[j] < 0) {
                    out.clear();
                    return false;
                }
            }
        }

        uint32_t n = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) |
                     (uint32_t(v[2]) << 6) | uint32_t(v[3]);
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<uint8_t>(n & 0xFF));
    }

    return true;
}

std::string TrimString(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ToLower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
