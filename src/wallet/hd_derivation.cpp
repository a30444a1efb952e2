// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/hd_derivation.h>
#include <wallet/crypter.h>
#include <crypto/ed25519.h>
#include <crypto/hmac_sha512.h>
#include <crypto/secp256k1.h>
#include <crypto/sha256.h>

#include <cstring>
#include <sstream>
#include <stdexcept>

// ============================================================================
// CHDExtendedKey Implementation
// ============================================================================

CHDExtendedKey::CHDExtendedKey()
    : depth(0), fingerprint(0), child_index(0), curve(HDCurve::SECP256K1) {
    std::memset(key, 0, 32);
    std::memset(chaincode, 0, 32);
}

CHDExtendedKey::~CHDExtendedKey() {
    Wipe();
}

CHDExtendedKey::CHDExtendedKey(const CHDExtendedKey& other)
    : depth(other.depth), fingerprint(other.fingerprint),
      child_index(other.child_index), curve(other.curve) {
    std::memcpy(key, other.key, 32);
    std::memcpy(chaincode, other.chaincode, 32);
}

CHDExtendedKey& CHDExtendedKey::operator=(const CHDExtendedKey& other) {
    if (this != &other) {
        std::memcpy(key, other.key, 32);
        std::memcpy(chaincode, other.chaincode, 32);
        depth = other.depth;
        fingerprint = other.fingerprint;
        child_index = other.child_index;
        curve = other.curve;
    }
    return *this;
}

void CHDExtendedKey::Wipe() {
    memory_cleanse(key, 32);
    memory_cleanse(chaincode, 32);
    depth = 0;
    fingerprint = 0;
    child_index = 0;
}

bool CHDExtendedKey::GetPublicKey(std::vector<uint8_t>& pubkey) const {
    if (curve == HDCurve::SECP256K1) {
        return secp256k1::GetPublicKey(key, true, pubkey);
    }

    uint8_t raw[ed25519::PUBKEY_SIZE];
    if (!ed25519::GetPublicKey(key, raw)) {
        return false;
    }
    pubkey.assign(1, 0x00);
    pubkey.insert(pubkey.end(), raw, raw + sizeof(raw));
    return true;
}

uint32_t CHDExtendedKey::GetFingerprint() const {
    std::vector<uint8_t> pubkey;
    if (!GetPublicKey(pubkey)) {
        return 0;
    }

    uint8_t hash[20];
    Hash160(pubkey.data(), pubkey.size(), hash);

    return (static_cast<uint32_t>(hash[0]) << 24) |
           (static_cast<uint32_t>(hash[1]) << 16) |
           (static_cast<uint32_t>(hash[2]) << 8) |
           static_cast<uint32_t>(hash[3]);
}

// ============================================================================
// CHDKeyPath Implementation
// ============================================================================

bool CHDKeyPath::Parse(const std::string& path) {
    indices.clear();

    // Must be "m" or "m/..."
    if (path.empty() || path[0] != 'm') {
        return false;
    }

    size_t pos = 1;
    if (pos == path.length()) {
        return true;
    }
    if (path[pos] != '/') {
        return false;
    }
    pos++;

    while (true) {
        size_t slash_pos = path.find('/', pos);
        if (slash_pos == std::string::npos) {
            slash_pos = path.length();
        }

        std::string level_str = path.substr(pos, slash_pos - pos);
        if (level_str.empty()) {
            indices.clear();
            return false;
        }

        bool hardened = false;
        char last = level_str.back();
        if (last == '\'' || last == 'h' || last == 'H') {
            hardened = true;
            level_str.pop_back();
        }

        // Digits only, no sign or whitespace; 10 digits is enough for 2^31
        if (level_str.empty() || level_str.length() > 10) {
            indices.clear();
            return false;
        }
        uint64_t val = 0;
        for (char c : level_str) {
            if (c < '0' || c > '9') {
                indices.clear();
                return false;
            }
            val = val * 10 + static_cast<uint64_t>(c - '0');
        }
        if (val >= HD_HARDENED_BIT) {
            indices.clear();
            return false;
        }

        uint32_t index = static_cast<uint32_t>(val);
        if (hardened) {
            index |= HD_HARDENED_BIT;
        }
        indices.push_back(index);

        if (slash_pos == path.length()) {
            break;
        }
        pos = slash_pos + 1;
    }

    return true;
}

std::string CHDKeyPath::ToString() const {
    std::ostringstream oss;
    oss << "m";

    for (uint32_t index : indices) {
        oss << "/" << (index & ~HD_HARDENED_BIT);
        if (IsHardened(index)) {
            oss << "'";
        }
    }

    return oss.str();
}

bool CHDKeyPath::IsFullyHardened() const {
    for (uint32_t index : indices) {
        if (!IsHardened(index)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// HD Derivation Functions
// ============================================================================

bool DeriveMaster(const uint8_t* seed, size_t seed_len, HDCurve curve, CHDExtendedKey& master_key) {
    if (seed == nullptr || seed_len < 16 || seed_len > 64) {
        return false;
    }

    const char* hmac_key = (curve == HDCurve::SECP256K1) ? HD_MASTER_KEY_SECP256K1
                                                         : HD_MASTER_KEY_ED25519;
    uint8_t output[64];
    try {
        HMAC_SHA512(reinterpret_cast<const uint8_t*>(hmac_key), std::strlen(hmac_key),
                    seed, seed_len, output);
    } catch (const std::exception&) {
        return false;
    }

    // IL = key, IR = chain code
    if (curve == HDCurve::SECP256K1 && !secp256k1::IsValidPrivateKey(output)) {
        memory_cleanse(output, sizeof(output));
        return false;
    }

    std::memcpy(master_key.key, output, 32);
    std::memcpy(master_key.chaincode, output + 32, 32);
    master_key.depth = 0;
    master_key.fingerprint = 0;
    master_key.child_index = 0;
    master_key.curve = curve;

    memory_cleanse(output, sizeof(output));
    return true;
}

bool DeriveChild(const CHDExtendedKey& parent, uint32_t index, CHDExtendedKey& child) {
    bool hardened = CHDKeyPath::IsHardened(index);
    if (parent.curve == HDCurve::ED25519 && !hardened) {
        return false;
    }

    // 0x00 || key || index  or  compressed pubkey || index; both 37 bytes
    uint8_t data[37];
    if (hardened) {
        data[0] = 0x00;
        std::memcpy(data + 1, parent.key, 32);
    } else {
        std::vector<uint8_t> pubkey;
        if (!secp256k1::GetPublicKey(parent.key, true, pubkey) ||
            pubkey.size() != secp256k1::COMPRESSED_PUBKEY_SIZE) {
            return false;
        }
        std::memcpy(data, pubkey.data(), 33);
    }
    data[33] = (index >> 24) & 0xFF;
    data[34] = (index >> 16) & 0xFF;
    data[35] = (index >> 8) & 0xFF;
    data[36] = index & 0xFF;

    uint8_t output[64];
    try {
        HMAC_SHA512(parent.chaincode, 32, data, sizeof(data), output);
    } catch (const std::exception&) {
        memory_cleanse(data, sizeof(data));
        return false;
    }
    memory_cleanse(data, sizeof(data));

    uint8_t child_key[32];
    bool ok = true;
    if (parent.curve == HDCurve::SECP256K1) {
        ok = secp256k1::PrivateKeyTweakAdd(parent.key, output, child_key);
    } else {
        std::memcpy(child_key, output, 32);
    }

    if (ok) {
        uint32_t parent_fingerprint = parent.GetFingerprint();
        std::memcpy(child.key, child_key, 32);
        std::memcpy(child.chaincode, output + 32, 32);
        child.depth = parent.depth + 1;
        child.fingerprint = parent_fingerprint;
        child.child_index = index;
        child.curve = parent.curve;
    }

    memory_cleanse(child_key, sizeof(child_key));
    memory_cleanse(output, sizeof(output));
    return ok;
}

bool DerivePath(const CHDExtendedKey& master, const CHDKeyPath& path, CHDExtendedKey& derived) {
    if (master.curve == HDCurve::ED25519 && !path.IsFullyHardened()) {
        return false;
    }

    CHDExtendedKey current = master;
    for (uint32_t index : path.indices) {
        CHDExtendedKey child;
        if (!DeriveChild(current, index, child)) {
            return false;
        }
        current = child;
    }

    derived = current;
    return true;
}

bool DerivePath(const CHDExtendedKey& master, const std::string& path, CHDExtendedKey& derived) {
    CHDKeyPath parsed_path;
    if (!parsed_path.Parse(path)) {
        return false;
    }
    return DerivePath(master, parsed_path, derived);
}
