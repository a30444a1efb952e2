// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <util/base58.h>

#include <array>

namespace {

const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
const size_t BASE58_MAX_DECODE = 1024;

const std::array<int8_t, 256>& DigitTable() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t;
        t.fill(-1);
        for (int8_t i = 0; i < 58; i++) {
            t[static_cast<uint8_t>(BASE58_ALPHABET[i])] = i;
        }
        return t;
    }();
    return table;
}

} // namespace

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        zeros++;
    }

    // Long division of the big-endian number by 58, least significant digit first
    std::vector<uint8_t> num(data.begin() + zeros, data.end());
    std::string digits;
    size_t head = 0;
    while (head < num.size()) {
        unsigned int rem = 0;
        for (size_t i = head; i < num.size(); i++) {
            unsigned int acc = (rem << 8) | num[i];
            num[i] = static_cast<uint8_t>(acc / 58);
            rem = acc % 58;
        }
        digits.push_back(BASE58_ALPHABET[rem]);
        while (head < num.size() && num[head] == 0) {
            head++;
        }
    }

    std::string out(zeros, BASE58_ALPHABET[0]);
    out.append(digits.rbegin(), digits.rend());
    return out;
}

bool DecodeBase58(const std::string& str, std::vector<uint8_t>& data) {
    if (str.size() > BASE58_MAX_DECODE) {
        return false;
    }

    const std::array<int8_t, 256>& table = DigitTable();
    size_t ones = 0;
    while (ones < str.size() && str[ones] == BASE58_ALPHABET[0]) {
        ones++;
    }

    // Little-endian accumulator: value = value * 58 + digit
    std::vector<uint8_t> value;
    for (size_t i = ones; i < str.size(); i++) {
        int8_t digit = table[static_cast<uint8_t>(str[i])];
        if (digit < 0) {
            return false;
        }
        unsigned int carry = static_cast<unsigned int>(digit);
        for (uint8_t& byte : value) {
            carry += 58u * byte;
            byte = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        for (; carry != 0; carry >>= 8) {
            value.push_back(static_cast<uint8_t>(carry & 0xff));
        }
    }

    data.assign(ones, 0);
    data.insert(data.end(), value.rbegin(), value.rend());
    return true;
}
