// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/rlp.h>

#include <cstddef>

namespace rlp {

namespace {

// Short form: offset + len; long form: offset + 55 + len(len) || len
std::vector<uint8_t> EncodeLength(size_t len, uint8_t offset) {
    std::vector<uint8_t> out;
    if (len <= 55) {
        out.push_back(static_cast<uint8_t>(offset + len));
        return out;
    }
    std::vector<uint8_t> len_bytes = MinimalBigEndian(static_cast<uint64_t>(len));
    out.push_back(static_cast<uint8_t>(offset + 55 + len_bytes.size()));
    out.insert(out.end(), len_bytes.begin(), len_bytes.end());
    return out;
}

} // namespace

std::vector<uint8_t> MinimalBigEndian(uint64_t value) {
    std::vector<uint8_t> out;
    while (value > 0) {
        out.insert(out.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    }
    return out;
}

std::vector<uint8_t> EncodeBytes(const std::vector<uint8_t>& data) {
    // A single byte below 0x80 is its own encoding
    if (data.size() == 1 && data[0] < 0x80) {
        return data;
    }
    std::vector<uint8_t> out = EncodeLength(data.size(), 0x80);
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

std::vector<uint8_t> EncodeUint(uint64_t value) {
    return EncodeBytes(MinimalBigEndian(value));
}

std::vector<uint8_t> EncodeList(const std::vector<std::vector<uint8_t>>& items) {
    size_t payload_len = 0;
    for (const auto& item : items) {
        payload_len += item.size();
    }
    std::vector<uint8_t> out = EncodeLength(payload_len, 0xC0);
    out.reserve(out.size() + payload_len);
    for (const auto& item : items) {
        out.insert(out.end(), item.begin(), item.end());
    }
    return out;
}

} // namespace rlp
