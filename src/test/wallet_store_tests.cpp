// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

/**
 * Wallet Store Tests
 *
 * Record identity, JSON layout and versioning, and the key-value
 * persistence layer over CMemoryStorage.
 */

#include <boost/test/unit_test.hpp>

#include <wallet/wallet_record.h>
#include <wallet/wallet_store.h>
#include <util/json_util.h>

#include <string>
#include <vector>

namespace {

CWalletRecord MakeRecord(const std::string& name, const std::string& eth_address) {
    CWalletRecord record;
    record.name = name;
    record.addresses["ETH"] = eth_address;
    record.addresses["BTC"] = "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu";
    record.public_keys["ETH"] = "04aa";
    record.public_keys["BTC"] = "02bb";
    record.derivation_paths["ETH"] = "m/44'/60'/0'/0/0";
    record.derivation_paths["BTC"] = "m/84'/0'/0'/0/0";
    record.encrypted_mnemonic.ciphertext = "Y2lwaGVydGV4dA==";
    record.encrypted_mnemonic.salt = "c2FsdA==";
    record.encrypted_mnemonic.nonce = "bm9uY2U=";
    record.encrypted_mnemonic.iterations = 600000;
    record.created_at = 1700000000000;
    record.id = ComputeWalletId(record.addresses);
    return record;
}

const char* const V1_RECORD = R"({
    "id": "0123456789abcdef",
    "name": "legacy",
    "encrypted_mnemonic": {
        "ciphertext": "Y2lwaGVydGV4dA==",
        "salt": "c2FsdA==",
        "nonce": "bm9uY2U=",
        "algorithm": "AES-256-GCM",
        "iterations": 100000
    },
    "addresses": {"ETH": "0x9858EfFD232B4033E47d90003D41EC34EcaEda94", "SOL": "11111111111111111111111111111111"},
    "created_at": 1600000000000,
    "version": 1
})";

} // namespace

BOOST_AUTO_TEST_SUITE(wallet_store_tests)

/**
 * Test Suite 1: Wallet record
 */
BOOST_AUTO_TEST_SUITE(wallet_record_tests)

BOOST_AUTO_TEST_CASE(wallet_id_format) {
    std::map<std::string, std::string> addresses;
    addresses["ETH"] = "0xabc";
    std::string id = ComputeWalletId(addresses);
    BOOST_CHECK_EQUAL(id.size(), 16u);
    BOOST_CHECK(id.find_first_not_of("0123456789abcdef") == std::string::npos);
    BOOST_CHECK_EQUAL(WalletStorageKey(id), "wallet_" + id);
}

BOOST_AUTO_TEST_CASE(wallet_id_ignores_insertion_order) {
    std::map<std::string, std::string> a, b;
    a["ETH"] = "0x01";
    a["BTC"] = "bc1q";
    a["SOL"] = "So1";
    b["SOL"] = "So1";
    b["ETH"] = "0x01";
    b["BTC"] = "bc1q";
    BOOST_CHECK_EQUAL(ComputeWalletId(a), ComputeWalletId(b));

    b["ETH"] = "0x02";
    BOOST_CHECK(ComputeWalletId(a) != ComputeWalletId(b));
}

BOOST_AUTO_TEST_CASE(json_round_trip) {
    CWalletRecord record = MakeRecord("main", "0x9858EfFD232B4033E47d90003D41EC34EcaEda94");

    CWalletRecord parsed;
    std::string error;
    BOOST_REQUIRE(CWalletRecord::FromJSON(record.ToJSON(), parsed, error) == WalletError::OK);
    BOOST_CHECK_EQUAL(parsed.id, record.id);
    BOOST_CHECK_EQUAL(parsed.name, "main");
    BOOST_CHECK(parsed.encrypted_mnemonic == record.encrypted_mnemonic);
    BOOST_CHECK(parsed.addresses == record.addresses);
    BOOST_CHECK(parsed.public_keys == record.public_keys);
    BOOST_CHECK(parsed.derivation_paths == record.derivation_paths);
    BOOST_CHECK_EQUAL(parsed.created_at, record.created_at);
    BOOST_CHECK_EQUAL(parsed.version, WALLET_RECORD_VERSION);
}

BOOST_AUTO_TEST_CASE(json_field_names) {
    CWalletRecord record = MakeRecord("main", "0x01");
    json doc = json::parse(record.ToJSON());
    BOOST_CHECK(doc.contains("encrypted_mnemonic"));
    BOOST_CHECK(doc["encrypted_mnemonic"].contains("ciphertext"));
    BOOST_CHECK_EQUAL(doc["encrypted_mnemonic"]["algorithm"].get<std::string>(), "AES-256-GCM");
    BOOST_CHECK_EQUAL(doc["version"].get<uint32_t>(), 2u);
    BOOST_CHECK(doc["derivation_paths"].is_object());
}

BOOST_AUTO_TEST_CASE(version1_migration) {
    CWalletRecord record;
    std::string error;
    BOOST_REQUIRE(CWalletRecord::FromJSON(V1_RECORD, record, error) == WalletError::OK);
    BOOST_CHECK_EQUAL(record.version, WALLET_RECORD_VERSION);
    BOOST_CHECK_EQUAL(record.name, "legacy");
    BOOST_CHECK_EQUAL(record.encrypted_mnemonic.iterations, 100000u);
    BOOST_CHECK(record.public_keys.empty());
    BOOST_CHECK_EQUAL(record.derivation_paths.size(), 2u);
    BOOST_CHECK_EQUAL(record.derivation_paths["ETH"], "m/44'/60'/0'/0/0");
    BOOST_CHECK_EQUAL(record.derivation_paths["SOL"], "m/44'/501'/0'/0'");
}

BOOST_AUTO_TEST_CASE(reject_future_version) {
    json doc = json::parse(MakeRecord("main", "0x01").ToJSON());
    doc["version"] = 3;

    CWalletRecord record;
    std::string error;
    BOOST_CHECK(CWalletRecord::FromJSON(doc.dump(), record, error) == WalletError::STORAGE_FAILURE);
    BOOST_CHECK(!error.empty());
}

BOOST_AUTO_TEST_CASE(reject_malformed_records) {
    CWalletRecord record;
    std::string error;
    BOOST_CHECK(CWalletRecord::FromJSON("not json", record, error) == WalletError::STORAGE_FAILURE);
    BOOST_CHECK(CWalletRecord::FromJSON("[1, 2]", record, error) == WalletError::STORAGE_FAILURE);

    json doc = json::parse(MakeRecord("main", "0x01").ToJSON());
    doc.erase("public_keys");
    BOOST_CHECK(CWalletRecord::FromJSON(doc.dump(), record, error) == WalletError::STORAGE_FAILURE);

    doc = json::parse(MakeRecord("main", "0x01").ToJSON());
    doc["encrypted_mnemonic"].erase("salt");
    BOOST_CHECK(CWalletRecord::FromJSON(doc.dump(), record, error) == WalletError::STORAGE_FAILURE);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 2: Key-value persistence
 */
BOOST_AUTO_TEST_SUITE(wallet_persistence_tests)

BOOST_AUTO_TEST_CASE(memory_storage_basics) {
    CMemoryStorage storage;
    std::string value;
    BOOST_CHECK(storage.Get("wallet_x", value) == DBErrorType::NOT_FOUND);
    BOOST_CHECK(storage.Set("wallet_x", "1") == DBErrorType::OK);
    BOOST_CHECK(storage.Set("other", "2") == DBErrorType::OK);
    BOOST_CHECK(storage.Get("wallet_x", value) == DBErrorType::OK);
    BOOST_CHECK_EQUAL(value, "1");

    std::vector<std::string> keys;
    BOOST_CHECK(storage.ListKeys("wallet_", keys) == DBErrorType::OK);
    BOOST_REQUIRE_EQUAL(keys.size(), 1u);
    BOOST_CHECK_EQUAL(keys[0], "wallet_x");

    BOOST_CHECK(storage.Erase("wallet_x") == DBErrorType::OK);
    BOOST_CHECK(storage.Erase("wallet_x") == DBErrorType::OK);
    BOOST_CHECK_EQUAL(storage.Size(), 1u);
}

BOOST_AUTO_TEST_CASE(save_and_load) {
    CMemoryStorage storage;
    CWalletStore store(storage);
    CWalletRecord record = MakeRecord("main", "0x01");

    BOOST_REQUIRE(store.Save(record) == WalletError::OK);
    BOOST_CHECK(store.Exists(record.id));

    std::string raw;
    BOOST_CHECK(storage.Get("wallet_" + record.id, raw) == DBErrorType::OK);

    CWalletRecord loaded;
    BOOST_REQUIRE(store.Load(record.id, loaded) == WalletError::OK);
    BOOST_CHECK_EQUAL(loaded.name, "main");
    BOOST_CHECK(loaded.encrypted_mnemonic == record.encrypted_mnemonic);
}

BOOST_AUTO_TEST_CASE(save_overwrites) {
    CMemoryStorage storage;
    CWalletStore store(storage);
    CWalletRecord record = MakeRecord("main", "0x01");
    BOOST_REQUIRE(store.Save(record) == WalletError::OK);

    record.name = "renamed";
    BOOST_REQUIRE(store.Save(record) == WalletError::OK);

    CWalletRecord loaded;
    BOOST_REQUIRE(store.Load(record.id, loaded) == WalletError::OK);
    BOOST_CHECK_EQUAL(loaded.name, "renamed");
    BOOST_CHECK_EQUAL(storage.Size(), 1u);
}

BOOST_AUTO_TEST_CASE(missing_wallet) {
    CMemoryStorage storage;
    CWalletStore store(storage);
    CWalletRecord record;
    BOOST_CHECK(store.Load("ffffffffffffffff", record) == WalletError::WALLET_NOT_FOUND);
    BOOST_CHECK(store.Load("", record) == WalletError::WALLET_NOT_FOUND);
    BOOST_CHECK(store.Delete("ffffffffffffffff") == WalletError::WALLET_NOT_FOUND);
    BOOST_CHECK(!store.Exists("ffffffffffffffff"));

    CWalletRecord unnamed;
    BOOST_CHECK(store.Save(unnamed) == WalletError::INVALID_ARGUMENT);
}

BOOST_AUTO_TEST_CASE(list_and_delete) {
    CMemoryStorage storage;
    CWalletStore store(storage);
    CWalletRecord first = MakeRecord("first", "0x01");
    CWalletRecord second = MakeRecord("second", "0x02");
    BOOST_REQUIRE(store.Save(first) == WalletError::OK);
    BOOST_REQUIRE(store.Save(second) == WalletError::OK);
    BOOST_REQUIRE(storage.Set("unrelated", "x") == DBErrorType::OK);

    std::vector<CWalletRecord> records;
    BOOST_REQUIRE(store.List(records) == WalletError::OK);
    BOOST_REQUIRE_EQUAL(records.size(), 2u);
    BOOST_CHECK(records[0].id < records[1].id);

    BOOST_CHECK(store.Delete(first.id) == WalletError::OK);
    BOOST_REQUIRE(store.List(records) == WalletError::OK);
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].name, "second");
}

BOOST_AUTO_TEST_CASE(corrupt_record_is_storage_failure) {
    CMemoryStorage storage;
    CWalletStore store(storage);
    BOOST_REQUIRE(storage.Set("wallet_0011223344556677", "{broken") == DBErrorType::OK);

    CWalletRecord record;
    BOOST_CHECK(store.Load("0011223344556677", record) == WalletError::STORAGE_FAILURE);

    std::vector<CWalletRecord> records;
    BOOST_CHECK(store.List(records) == WalletError::STORAGE_FAILURE);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
