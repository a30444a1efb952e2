// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <util/bech32.h>

namespace bech32 {

namespace {

const char* CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

uint32_t PolyMod(const std::vector<uint8_t>& v) {
    uint32_t chk = 1;
    for (uint8_t value : v) {
        uint8_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ value;
        if (top & 1) chk ^= 0x3b6a57b2;
        if (top & 2) chk ^= 0x26508e6d;
        if (top & 4) chk ^= 0x1ea119fa;
        if (top & 8) chk ^= 0x3d4233dd;
        if (top & 16) chk ^= 0x2a1462b3;
    }
    return chk;
}

std::vector<uint8_t> ExpandHRP(const std::string& hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) >> 5);
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) & 0x1f);
    }
    return ret;
}

std::vector<uint8_t> CreateChecksum(const std::string& hrp, const std::vector<uint8_t>& values) {
    std::vector<uint8_t> enc = ExpandHRP(hrp);
    enc.insert(enc.end(), values.begin(), values.end());
    enc.resize(enc.size() + 6);
    uint32_t mod = PolyMod(enc) ^ 1;
    std::vector<uint8_t> ret(6);
    for (size_t i = 0; i < 6; ++i) {
        ret[i] = (mod >> (5 * (5 - i))) & 31;
    }
    return ret;
}

} // namespace

std::string Encode(const std::string& hrp, const std::vector<uint8_t>& values) {
    std::vector<uint8_t> checksum = CreateChecksum(hrp, values);
    std::string ret = hrp + '1';
    ret.reserve(ret.size() + values.size() + checksum.size());
    for (uint8_t v : values) {
        ret += CHARSET[v];
    }
    for (uint8_t v : checksum) {
        ret += CHARSET[v];
    }
    return ret;
}

bool Decode(const std::string& str, std::string& hrp, std::vector<uint8_t>& values) {
    bool lower = false, upper = false;
    for (char c : str) {
        if (c < 33 || c > 126) return false;
        if (c >= 'a' && c <= 'z') lower = true;
        if (c >= 'A' && c <= 'Z') upper = true;
    }
    if (lower && upper) return false;

    size_t pos = str.rfind('1');
    if (pos == std::string::npos || pos == 0 || pos + 7 > str.size() || str.size() > 90) {
        return false;
    }

    values.clear();
    for (size_t i = pos + 1; i < str.size(); ++i) {
        char c = str[i];
        if (c >= 'A' && c <= 'Z') c = c - 'A' + 'a';
        int rev = -1;
        for (int j = 0; j < 32; ++j) {
            if (CHARSET[j] == c) {
                rev = j;
                break;
            }
        }
        if (rev == -1) return false;
        values.push_back(static_cast<uint8_t>(rev));
    }

    hrp.clear();
    for (size_t i = 0; i < pos; ++i) {
        char c = str[i];
        if (c >= 'A' && c <= 'Z') c = c - 'A' + 'a';
        hrp += c;
    }

    std::vector<uint8_t> check = ExpandHRP(hrp);
    check.insert(check.end(), values.begin(), values.end());
    if (PolyMod(check) != 1) return false;

    values.resize(values.size() - 6);
    return true;
}

bool ConvertBits(const std::vector<uint8_t>& in, int frombits, int tobits,
                 bool pad, std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << tobits) - 1;
    const uint32_t max_acc = (1u << (frombits + tobits - 1)) - 1;

    for (uint8_t value : in) {
        if ((value >> frombits) != 0) return false;
        acc = ((acc << frombits) | value) & max_acc;
        bits += frombits;
        while (bits >= tobits) {
            bits -= tobits;
            out.push_back((acc >> bits) & maxv);
        }
    }

    if (pad) {
        if (bits) out.push_back((acc << (tobits - bits)) & maxv);
    } else if (bits >= frombits || ((acc << (tobits - bits)) & maxv)) {
        return false;
    }
    return true;
}

std::string EncodeSegwitAddress(const std::string& hrp, int witver,
                                const std::vector<uint8_t>& program) {
    std::vector<uint8_t> values;
    values.push_back(static_cast<uint8_t>(witver));
    if (!ConvertBits(program, 8, 5, true, values)) {
        return "";
    }
    return Encode(hrp, values);
}

} // namespace bech32
