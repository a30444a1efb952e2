// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/wallet_record.h>
#include <wallet/chains.h>
#include <crypto/sha256.h>
#include <util/json_util.h>
#include <util/strencodings.h>

#include <chrono>

std::string ComputeWalletId(const std::map<std::string, std::string>& addresses) {
    std::string preimage;
    for (const auto& entry : addresses) {
        preimage += entry.first + ":" + entry.second;
    }

    uint8_t hash[32];
    SHA256(reinterpret_cast<const uint8_t*>(preimage.data()), preimage.size(), hash);
    return HexStr(hash, sizeof(hash)).substr(0, 16);
}

std::string WalletStorageKey(const std::string& id) {
    return std::string(WALLET_KEY_PREFIX) + id;
}

int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string CWalletRecord::ToJSON() const {
    json doc;
    doc["id"] = id;
    doc["name"] = name;
    doc["encrypted_mnemonic"] = {
        {"ciphertext", encrypted_mnemonic.ciphertext},
        {"salt", encrypted_mnemonic.salt},
        {"nonce", encrypted_mnemonic.nonce},
        {"algorithm", encrypted_mnemonic.algorithm},
        {"iterations", encrypted_mnemonic.iterations},
    };
    doc["addresses"] = addresses;
    doc["public_keys"] = public_keys;
    doc["derivation_paths"] = derivation_paths;
    doc["created_at"] = created_at;
    doc["version"] = version;
    return doc.dump();
}

WalletError CWalletRecord::FromJSON(const std::string& text, CWalletRecord& record,
                                    std::string& error) {
    CWalletRecord result;
    try {
        json doc = json::parse(text);
        if (!doc.is_object()) {
            error = "wallet record is not a JSON object";
            return WalletError::STORAGE_FAILURE;
        }

        result.version = JSONUtil::GetRequiredUInt32(doc, "version", 1);
        if (result.version > WALLET_RECORD_VERSION) {
            error = strprintf("wallet record version %u is newer than supported version %u",
                              result.version, WALLET_RECORD_VERSION);
            return WalletError::STORAGE_FAILURE;
        }

        result.id = JSONUtil::GetRequiredString(doc, "id");
        result.name = JSONUtil::GetRequiredString(doc, "name");
        result.created_at = JSONUtil::GetRequiredInt64(doc, "created_at", 0);

        const json& enc = JSONUtil::GetRequiredObject(doc, "encrypted_mnemonic");
        result.encrypted_mnemonic.ciphertext = JSONUtil::GetRequiredString(enc, "ciphertext");
        result.encrypted_mnemonic.salt = JSONUtil::GetRequiredString(enc, "salt");
        result.encrypted_mnemonic.nonce = JSONUtil::GetRequiredString(enc, "nonce");
        result.encrypted_mnemonic.algorithm = JSONUtil::GetRequiredString(enc, "algorithm");
        result.encrypted_mnemonic.iterations = JSONUtil::GetRequiredUInt32(enc, "iterations", 1);

        result.addresses = JSONUtil::GetStringMap(doc, "addresses", true);

        bool current = (result.version == WALLET_RECORD_VERSION);
        result.public_keys = JSONUtil::GetStringMap(doc, "public_keys", current);
        result.derivation_paths = JSONUtil::GetStringMap(doc, "derivation_paths", current);
    } catch (const std::exception& e) {
        error = e.what();
        return WalletError::STORAGE_FAILURE;
    }

    if (result.version < WALLET_RECORD_VERSION) {
        // Version 1: fill paths for the chains the record has addresses for
        for (const auto& entry : result.addresses) {
            Chain chain;
            if (ParseChain(entry.first, chain) && !result.derivation_paths.count(entry.first)) {
                result.derivation_paths[entry.first] = GetChainInfo(chain).path;
            }
        }
        result.version = WALLET_RECORD_VERSION;
    }

    record = result;
    return WalletError::OK;
}
