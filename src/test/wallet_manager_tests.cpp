// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

/**
 * Wallet Manager Tests
 *
 * End-to-end lifecycle over in-memory storage and a manual clock:
 * create, recover, unlock, sign, lock, and record maintenance.
 */

#include <boost/test/unit_test.hpp>

#include <wallet/mnemonic.h>
#include <wallet/wallet_manager.h>
#include <util/config.h>

#include <future>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

const std::string PASSWORD = "CorrectHorseBatteryStaple!";
const std::string OTHER_PASSWORD = "Quantum-Walrus-Orbit-42";

const std::string ABANDON_ABOUT =
    "abandon abandon abandon abandon abandon abandon "
    "abandon abandon abandon abandon abandon about";
const std::string LEGAL_WINNER =
    "legal winner thank year wave sausage worth useful legal winner thank yellow";

// Keeps the vault fast; needs weak_kdf_for_testing to get past the floor
const unsigned int TEST_ROUNDS = 1000;

size_t CountWords(const std::string& mnemonic) {
    std::istringstream iss(mnemonic);
    std::string word;
    size_t count = 0;
    while (iss >> word) {
        count++;
    }
    return count;
}

WalletOptions TestOptions(bool replace_session = false) {
    WalletOptions options;
    options.pbkdf2_iterations = TEST_ROUNDS;
    options.weak_kdf_for_testing = true;
    options.replace_session = replace_session;
    return options;
}

TxParams TransferTx() {
    TxParams tx;
    tx.nonce = 1;
    tx.gas_price = 1000000000ULL;
    tx.gas_limit = 21000;
    tx.to = "0x3535353535353535353535353535353535353535";
    tx.value = "1";
    return tx;
}

struct ManagerSetup {
    CMemoryStorage storage;
    std::shared_ptr<CManualClock> clock;
    CSessionManager session;
    CWalletManager manager;

    explicit ManagerSetup(const WalletOptions& options = TestOptions())
        : clock(std::make_shared<CManualClock>(0)),
          session(clock, options.session_timeout),
          manager(storage, session, options) {}

    CWalletRecord Recover(const std::string& mnemonic, const std::string& name) {
        CWalletRecord record;
        std::string error;
        BOOST_REQUIRE_MESSAGE(manager.RecoverWallet(mnemonic, name, PASSWORD, record, error) == WalletError::OK,
                              error);
        return record;
    }
};

struct ReplacingManagerSetup : public ManagerSetup {
    ReplacingManagerSetup() : ManagerSetup(TestOptions(true)) {}
};

} // namespace

BOOST_AUTO_TEST_SUITE(wallet_manager_tests)

/**
 * Test Suite 1: Lifecycle
 */
BOOST_FIXTURE_TEST_SUITE(lifecycle_tests, ManagerSetup)

BOOST_AUTO_TEST_CASE(create_wallet_end_to_end) {
    std::string mnemonic, error;
    CWalletRecord record;
    BOOST_REQUIRE(manager.CreateWallet("main", PASSWORD, mnemonic, record, error) == WalletError::OK);

    BOOST_CHECK_EQUAL(CountWords(mnemonic), 24u);
    BOOST_CHECK(CMnemonic::Validate(mnemonic));

    BOOST_CHECK_EQUAL(record.id.size(), 16u);
    BOOST_CHECK_EQUAL(record.id, ComputeWalletId(record.addresses));
    BOOST_CHECK_EQUAL(record.name, "main");
    BOOST_CHECK_EQUAL(record.addresses.size(), AllChains().size());
    BOOST_CHECK_EQUAL(record.addresses["ETH"].substr(0, 2), "0x");
    BOOST_CHECK_EQUAL(record.addresses["BTC"].substr(0, 4), "bc1q");
    BOOST_CHECK(!record.addresses["SOL"].empty());
    BOOST_CHECK_EQUAL(record.addresses["TON"].substr(0, 2), "0:");
    BOOST_CHECK_EQUAL(record.derivation_paths["BTC"], "m/84'/0'/0'/0/0");
    BOOST_CHECK_EQUAL(record.encrypted_mnemonic.iterations, TEST_ROUNDS);
    BOOST_CHECK(record.created_at > 0);

    // New wallets start unlocked
    BOOST_CHECK(manager.IsUnlocked());
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), record.id);
    BOOST_CHECK_EQUAL(manager.GetRemainingSeconds(), DEFAULT_SESSION_TIMEOUT);

    // The stored record holds no plaintext phrase
    std::string raw;
    BOOST_REQUIRE(storage.Get(WalletStorageKey(record.id), raw) == DBErrorType::OK);
    BOOST_CHECK(raw.find(mnemonic) == std::string::npos);

    CWalletRecord stored;
    BOOST_REQUIRE(manager.GetWallet(record.id, stored) == WalletError::OK);
    BOOST_CHECK(stored.addresses == record.addresses);
}

BOOST_AUTO_TEST_CASE(recover_known_mnemonic) {
    CWalletRecord record = Recover(ABANDON_ABOUT, "restored");
    BOOST_CHECK_EQUAL(record.addresses["ETH"], "0x9858EfFD232B4033E47d90003D41EC34EcaEda94");
    BOOST_CHECK_EQUAL(record.addresses["BSC"], record.addresses["ETH"]);
    BOOST_CHECK_EQUAL(record.addresses["BTC"], "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), record.id);
}

BOOST_AUTO_TEST_CASE(recover_normalizes_input) {
    CWalletRecord clean = Recover(ABANDON_ABOUT, "a");
    manager.Lock();
    CWalletRecord messy = Recover("  ABANDON abandon abandon abandon abandon abandon\n"
                                  "abandon abandon abandon abandon abandon About ", "b");
    BOOST_CHECK_EQUAL(clean.id, messy.id);

    // Same id: the second recovery replaced the first record
    std::vector<CWalletSummary> wallets;
    BOOST_REQUIRE(manager.ListWallets(wallets) == WalletError::OK);
    BOOST_REQUIRE_EQUAL(wallets.size(), 1u);
    BOOST_CHECK_EQUAL(wallets[0].name, "b");
}

BOOST_AUTO_TEST_CASE(recover_rejects_bad_input) {
    CWalletRecord record;
    std::string error;

    BOOST_CHECK(manager.RecoverWallet("abandon abandon abandon", "x", PASSWORD, record, error) ==
                WalletError::INVALID_MNEMONIC);
    // Mnemonic is checked before the password
    BOOST_CHECK(manager.RecoverWallet("abandon abandon abandon abandon abandon abandon "
                                      "abandon abandon abandon abandon abandon abandon",
                                      "x", "weak", record, error) == WalletError::INVALID_MNEMONIC);

    BOOST_CHECK(manager.RecoverWallet(ABANDON_ABOUT, "x", "short", record, error) ==
                WalletError::WEAK_PASSWORD);
    BOOST_CHECK(manager.RecoverWallet(ABANDON_ABOUT, "x", "password12345", record, error) ==
                WalletError::WEAK_PASSWORD);
    BOOST_CHECK(manager.RecoverWallet(ABANDON_ABOUT, "", PASSWORD, record, error) ==
                WalletError::INVALID_ARGUMENT);

    std::vector<CWalletSummary> wallets;
    BOOST_REQUIRE(manager.ListWallets(wallets) == WalletError::OK);
    BOOST_CHECK(wallets.empty());
    BOOST_CHECK(!manager.IsUnlocked());
}

BOOST_AUTO_TEST_CASE(create_rejects_bad_input) {
    std::string mnemonic, error;
    CWalletRecord record;
    BOOST_CHECK(manager.CreateWallet("", PASSWORD, mnemonic, record, error) == WalletError::INVALID_ARGUMENT);
    BOOST_CHECK(manager.CreateWallet("main", "abc", mnemonic, record, error) == WalletError::WEAK_PASSWORD);
    BOOST_CHECK(!error.empty());
    BOOST_CHECK(mnemonic.empty());
    BOOST_CHECK_EQUAL(storage.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(lock_and_unlock) {
    CWalletRecord record = Recover(ABANDON_ABOUT, "main");
    manager.Lock();
    BOOST_CHECK(!manager.IsUnlocked());
    BOOST_CHECK_EQUAL(manager.GetRemainingSeconds(), 0);

    std::string error;
    BOOST_CHECK(manager.Unlock(record.id, "Wrong-Password-123", error) == WalletError::DECRYPTION_FAILED);
    BOOST_CHECK(!manager.IsUnlocked());

    BOOST_CHECK(manager.Unlock("ffffffffffffffff", PASSWORD, error) == WalletError::WALLET_NOT_FOUND);

    BOOST_REQUIRE(manager.Unlock(record.id, PASSWORD, error) == WalletError::OK);
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), record.id);

    // Re-unlocking the active wallet restarts its session
    clock->Advance(300);
    BOOST_REQUIRE(manager.Unlock(record.id, PASSWORD, error) == WalletError::OK);
    BOOST_CHECK_EQUAL(manager.GetRemainingSeconds(), DEFAULT_SESSION_TIMEOUT);
}

BOOST_AUTO_TEST_CASE(unlock_async) {
    CWalletRecord record = Recover(ABANDON_ABOUT, "main");
    manager.Lock();

    std::future<WalletError> bad = manager.UnlockAsync(record.id, "Wrong-Password-123");
    BOOST_CHECK(bad.get() == WalletError::DECRYPTION_FAILED);

    std::future<WalletError> good = manager.UnlockAsync(record.id, PASSWORD);
    BOOST_CHECK(good.get() == WalletError::OK);
    BOOST_CHECK(manager.IsUnlocked());
}

BOOST_AUTO_TEST_CASE(sign_and_lock) {
    Recover(ABANDON_ABOUT, "main");

    std::vector<uint8_t> signed_tx;
    std::string error;
    BOOST_REQUIRE(manager.SignTransaction(Chain::ETH, TransferTx(), signed_tx, error) == WalletError::OK);
    BOOST_CHECK(!signed_tx.empty());
    BOOST_CHECK(manager.SignTransaction("ETH", TransferTx(), signed_tx, error) == WalletError::OK);
    BOOST_CHECK(manager.SignTransaction("XRP", TransferTx(), signed_tx, error) == WalletError::UNSUPPORTED_CHAIN);

    manager.Lock();
    signed_tx.clear();
    BOOST_CHECK(manager.SignTransaction(Chain::ETH, TransferTx(), signed_tx, error) == WalletError::WALLET_LOCKED);
    BOOST_CHECK(signed_tx.empty());
}

BOOST_AUTO_TEST_CASE(session_expires_without_activity) {
    Recover(ABANDON_ABOUT, "main");

    std::vector<uint8_t> signed_tx;
    std::string error;
    clock->Advance(14 * 60);
    BOOST_REQUIRE(manager.SignTransaction(Chain::POLYGON, TransferTx(), signed_tx, error) == WalletError::OK);

    clock->Advance(14 * 60);
    BOOST_CHECK(manager.IsUnlocked());

    clock->Advance(60);
    BOOST_CHECK(!manager.IsUnlocked());
    BOOST_CHECK(manager.SignTransaction(Chain::ETH, TransferTx(), signed_tx, error) == WalletError::WALLET_LOCKED);
}

BOOST_AUTO_TEST_CASE(second_wallet_requires_lock) {
    CWalletRecord first = Recover(ABANDON_ABOUT, "first");

    CWalletRecord record;
    std::string mnemonic, error;
    BOOST_CHECK(manager.RecoverWallet(LEGAL_WINNER, "second", PASSWORD, record, error) ==
                WalletError::SESSION_ACTIVE);
    BOOST_CHECK(manager.CreateWallet("second", PASSWORD, mnemonic, record, error) ==
                WalletError::SESSION_ACTIVE);
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), first.id);

    manager.Lock();
    CWalletRecord second = Recover(LEGAL_WINNER, "second");
    BOOST_CHECK(first.id != second.id);

    BOOST_CHECK(manager.Unlock(first.id, PASSWORD, error) == WalletError::SESSION_ACTIVE);
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), second.id);

    // Expired sessions do not block
    clock->Advance(DEFAULT_SESSION_TIMEOUT);
    BOOST_CHECK(manager.Unlock(first.id, PASSWORD, error) == WalletError::OK);
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), first.id);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 2: Session replacement
 */
BOOST_FIXTURE_TEST_SUITE(replace_session_tests, ReplacingManagerSetup)

BOOST_AUTO_TEST_CASE(replace_active_session) {
    CWalletRecord first = Recover(ABANDON_ABOUT, "first");
    CWalletRecord second = Recover(LEGAL_WINNER, "second");
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), second.id);

    std::string error;
    BOOST_REQUIRE(manager.Unlock(first.id, PASSWORD, error) == WalletError::OK);
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), first.id);

    // A failed unlock keeps the previous session
    BOOST_CHECK(manager.Unlock(second.id, "Wrong-Password-123", error) == WalletError::DECRYPTION_FAILED);
    BOOST_CHECK(manager.IsUnlocked());
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), first.id);

    std::vector<uint8_t> signature;
    BOOST_CHECK(manager.SignTransaction(Chain::ETH, TransferTx(), signature, error) == WalletError::OK);
}

BOOST_AUTO_TEST_CASE(failed_recover_keeps_session) {
    CWalletRecord first = Recover(ABANDON_ABOUT, "first");

    CWalletRecord record;
    std::string error;
    BOOST_CHECK(manager.RecoverWallet(LEGAL_WINNER, "second", "weak", record, error) ==
                WalletError::WEAK_PASSWORD);
    BOOST_CHECK(manager.RecoverWallet("abandon abandon about", "second", PASSWORD, record, error) ==
                WalletError::INVALID_MNEMONIC);
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), first.id);

    std::string mnemonic;
    BOOST_CHECK(manager.CreateWallet("third", "weak", mnemonic, record, error) == WalletError::WEAK_PASSWORD);
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), first.id);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 3: Record maintenance
 */
BOOST_FIXTURE_TEST_SUITE(maintenance_tests, ManagerSetup)

BOOST_AUTO_TEST_CASE(list_wallets) {
    CWalletRecord first = Recover(ABANDON_ABOUT, "first");
    manager.Lock();
    CWalletRecord second = Recover(LEGAL_WINNER, "second");

    std::vector<CWalletSummary> wallets;
    BOOST_REQUIRE(manager.ListWallets(wallets) == WalletError::OK);
    BOOST_REQUIRE_EQUAL(wallets.size(), 2u);
    BOOST_CHECK(wallets[0].id < wallets[1].id);
    for (const CWalletSummary& summary : wallets) {
        BOOST_CHECK(summary.id == first.id || summary.id == second.id);
        BOOST_CHECK(summary.created_at > 0);
    }
}

BOOST_AUTO_TEST_CASE(rename_wallet) {
    CWalletRecord record = Recover(ABANDON_ABOUT, "old name");

    std::string error;
    BOOST_REQUIRE(manager.RenameWallet(record.id, "new name", error) == WalletError::OK);
    BOOST_CHECK(manager.RenameWallet(record.id, "", error) == WalletError::INVALID_ARGUMENT);
    BOOST_CHECK(manager.RenameWallet("ffffffffffffffff", "x", error) == WalletError::WALLET_NOT_FOUND);

    CWalletRecord stored;
    BOOST_REQUIRE(manager.GetWallet(record.id, stored) == WalletError::OK);
    BOOST_CHECK_EQUAL(stored.name, "new name");
    BOOST_CHECK(stored.encrypted_mnemonic == record.encrypted_mnemonic);
}

BOOST_AUTO_TEST_CASE(change_password) {
    CWalletRecord record = Recover(ABANDON_ABOUT, "main");

    std::string error;
    BOOST_CHECK(manager.ChangePassword(record.id, "Wrong-Password-123", OTHER_PASSWORD, error) ==
                WalletError::DECRYPTION_FAILED);
    BOOST_CHECK(manager.ChangePassword(record.id, PASSWORD, "weak", error) == WalletError::WEAK_PASSWORD);
    BOOST_CHECK(manager.ChangePassword("ffffffffffffffff", PASSWORD, OTHER_PASSWORD, error) ==
                WalletError::WALLET_NOT_FOUND);

    BOOST_REQUIRE(manager.ChangePassword(record.id, PASSWORD, OTHER_PASSWORD, error) == WalletError::OK);
    // Session is untouched
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), record.id);

    CWalletRecord stored;
    BOOST_REQUIRE(manager.GetWallet(record.id, stored) == WalletError::OK);
    BOOST_CHECK(stored.encrypted_mnemonic.salt != record.encrypted_mnemonic.salt);

    manager.Lock();
    BOOST_CHECK(manager.Unlock(record.id, PASSWORD, error) == WalletError::DECRYPTION_FAILED);
    BOOST_CHECK(manager.Unlock(record.id, OTHER_PASSWORD, error) == WalletError::OK);
}

BOOST_AUTO_TEST_CASE(delete_wallet) {
    CWalletRecord record = Recover(ABANDON_ABOUT, "main");
    BOOST_REQUIRE(manager.IsUnlocked());

    BOOST_REQUIRE(manager.DeleteWallet(record.id) == WalletError::OK);
    BOOST_CHECK(!manager.IsUnlocked());
    BOOST_CHECK(manager.DeleteWallet(record.id) == WalletError::WALLET_NOT_FOUND);

    std::string error;
    BOOST_CHECK(manager.Unlock(record.id, PASSWORD, error) == WalletError::WALLET_NOT_FOUND);
    CWalletRecord stored;
    BOOST_CHECK(manager.GetWallet(record.id, stored) == WalletError::WALLET_NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(delete_other_wallet_keeps_session) {
    CWalletRecord first = Recover(ABANDON_ABOUT, "first");
    manager.Lock();
    CWalletRecord second = Recover(LEGAL_WINNER, "second");

    BOOST_REQUIRE(manager.DeleteWallet(first.id) == WalletError::OK);
    BOOST_CHECK_EQUAL(manager.GetActiveWalletId(), second.id);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 4: Options
 */
BOOST_AUTO_TEST_SUITE(wallet_options_tests)

BOOST_AUTO_TEST_CASE(defaults) {
    CConfigParser config;
    WalletOptions options;
    std::string error;
    BOOST_REQUIRE(LoadWalletOptions(config, options, error));
    BOOST_CHECK_EQUAL(options.pbkdf2_iterations, 600000u);
    BOOST_CHECK_EQUAL(options.session_timeout, 900);
    BOOST_CHECK(!options.replace_session);
    BOOST_CHECK_EQUAL(options.min_password_length, 12u);
    BOOST_CHECK_EQUAL(options.log_level, "info");
    BOOST_CHECK(options.print_to_console);
    BOOST_CHECK(!options.datadir.empty());
}

BOOST_AUTO_TEST_CASE(configured_values) {
    CConfigParser config;
    config.Set("pbkdf2iterations", "800000");
    config.Set("sessiontimeout", "120");
    config.Set("replacesession", "1");
    config.Set("minpasswordlength", "16");
    config.Set("loglevel", "debug");
    config.Set("datadir", "/tmp/polyvault-test");

    WalletOptions options;
    std::string error;
    BOOST_REQUIRE(LoadWalletOptions(config, options, error));
    BOOST_CHECK_EQUAL(options.pbkdf2_iterations, 800000u);
    BOOST_CHECK_EQUAL(options.session_timeout, 120);
    BOOST_CHECK(options.replace_session);
    BOOST_CHECK_EQUAL(options.min_password_length, 16u);
    BOOST_CHECK_EQUAL(options.log_level, "debug");
    BOOST_CHECK_EQUAL(options.datadir, "/tmp/polyvault-test");
}

BOOST_AUTO_TEST_CASE(low_iterations_are_raised) {
    CConfigParser config;
    config.Set("pbkdf2iterations", "1000");

    WalletOptions options;
    std::string error;
    BOOST_REQUIRE(LoadWalletOptions(config, options, error));
    BOOST_CHECK_EQUAL(options.pbkdf2_iterations, MIN_CONFIG_PBKDF2_ITERATIONS);
}

BOOST_AUTO_TEST_CASE(manager_enforces_iteration_floor) {
    WalletOptions options;
    options.pbkdf2_iterations = 1;

    CMemoryStorage storage;
    CSessionManager session(std::make_shared<CManualClock>(0), options.session_timeout);
    CWalletManager manager(storage, session, options);

    CWalletRecord record;
    std::string error;
    BOOST_REQUIRE(manager.RecoverWallet(ABANDON_ABOUT, "main", PASSWORD, record, error) == WalletError::OK);
    BOOST_CHECK_EQUAL(record.encrypted_mnemonic.iterations, WALLET_CRYPTO_PBKDF2_ROUNDS);
}

BOOST_AUTO_TEST_CASE(invalid_values_are_errors) {
    WalletOptions options;
    std::string error;

    CConfigParser timeout;
    timeout.Set("sessiontimeout", "0");
    BOOST_CHECK(!LoadWalletOptions(timeout, options, error));
    BOOST_CHECK(!error.empty());

    CConfigParser length;
    length.Set("minpasswordlength", "0");
    BOOST_CHECK(!LoadWalletOptions(length, options, error));

    CConfigParser level;
    level.Set("loglevel", "verbose");
    BOOST_CHECK(!LoadWalletOptions(level, options, error));

    CConfigParser iterations;
    iterations.Set("pbkdf2iterations", "5000000000");
    BOOST_CHECK(!LoadWalletOptions(iterations, options, error));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
