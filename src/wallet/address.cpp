// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/address.h>
#include <crypto/keccak.h>
#include <util/base58.h>
#include <util/bech32.h>
#include <util/strencodings.h>

namespace {

// Keccak-256 of the lowercase hex digits (no 0x prefix)
std::string ChecksumNibbles(const std::string& lower_hex) {
    uint8_t hash[32];
    Keccak256(reinterpret_cast<const uint8_t*>(lower_hex.data()), lower_hex.size(), hash);
    return HexStr(hash, sizeof(hash));
}

bool IsLowerHexString(const std::string& str) {
    for (char c : str) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string EncodeEvmAddress(const std::vector<uint8_t>& address20) {
    std::string lower = HexStr(address20);
    std::string checksum = ChecksumNibbles(lower);

    std::string result = "0x";
    for (size_t i = 0; i < lower.size(); i++) {
        char c = lower[i];
        if (c >= 'a' && c <= 'f' && HexDigit(checksum[i]) >= 8) {
            c = static_cast<char>(c - 'a' + 'A');
        }
        result += c;
    }
    return result;
}

bool DecodeEvmAddress(const std::string& address, std::vector<uint8_t>& address20,
                      std::string& error) {
    if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
        error = "EVM address must be 0x followed by 40 hex digits";
        return false;
    }

    std::string digits = address.substr(2);
    std::string lower = ToLower(digits);
    if (!IsLowerHexString(lower)) {
        error = "EVM address contains non-hex characters";
        return false;
    }

    std::string upper = lower;
    for (char& c : upper) {
        if (c >= 'a' && c <= 'f') {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }

    if (digits != lower && digits != upper) {
        std::string checksum = ChecksumNibbles(lower);
        for (size_t i = 0; i < digits.size(); i++) {
            char c = digits[i];
            bool want_upper = HexDigit(checksum[i]) >= 8;
            if ((c >= 'a' && c <= 'f' && want_upper) || (c >= 'A' && c <= 'F' && !want_upper)) {
                error = strprintf("EVM address checksum mismatch at position %u",
                                  static_cast<unsigned>(i));
                return false;
            }
        }
    }

    address20 = ParseHex(lower);
    return address20.size() == 20;
}

bool ValidateAddress(Chain chain, const std::string& address, std::string& error) {
    switch (GetChainInfo(chain).family) {
    case ChainFamily::EVM: {
        std::vector<uint8_t> raw;
        return DecodeEvmAddress(address, raw, error);
    }
    case ChainFamily::BITCOIN: {
        std::string hrp;
        std::vector<uint8_t> values;
        if (!bech32::Decode(address, hrp, values) || hrp != "bc" || values.empty()) {
            error = "Bitcoin address must be a bech32 bc1 address";
            return false;
        }
        std::vector<uint8_t> program;
        std::vector<uint8_t> data(values.begin() + 1, values.end());
        if (values[0] != 0 || !bech32::ConvertBits(data, 5, 8, false, program) ||
            (program.size() != 20 && program.size() != 32)) {
            error = "Unsupported or malformed witness program";
            return false;
        }
        return true;
    }
    case ChainFamily::SOLANA: {
        std::vector<uint8_t> raw;
        if (!DecodeBase58(address, raw) || raw.size() != 32) {
            error = "Solana address must be Base58 of 32 bytes";
            return false;
        }
        return true;
    }
    case ChainFamily::TON: {
        if (address.size() != 66 || address.compare(0, 2, "0:") != 0 ||
            !IsLowerHexString(ToLower(address.substr(2)))) {
            error = "TON address must be 0: followed by 64 hex digits";
            return false;
        }
        return true;
    }
    }
    error = "Unsupported chain";
    return false;
}
