// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_WALLET_MANAGER_H
#define POLYVAULT_WALLET_WALLET_MANAGER_H

#include <wallet/chains.h>
#include <wallet/passphrase_validator.h>
#include <wallet/session_manager.h>
#include <wallet/signer.h>
#include <wallet/signing_dispatcher.h>
#include <wallet/vault.h>
#include <wallet/wallet_errors.h>
#include <wallet/wallet_record.h>
#include <wallet/wallet_store.h>

#include <future>
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

class CConfigParser;

/** Lowest PBKDF2 iteration count accepted from configuration */
static const unsigned int MIN_CONFIG_PBKDF2_ITERATIONS = WALLET_CRYPTO_PBKDF2_ROUNDS;

/**
 * Wallet settings, collected from polyvault.conf and POLYVAULT_* overrides
 */
struct WalletOptions {
    std::string datadir;
    unsigned int pbkdf2_iterations;
    int64_t session_timeout;           // seconds
    bool replace_session;              // replacesession=1
    size_t min_password_length;
    std::string log_level;
    std::string log_file;
    bool print_to_console;
    bool weak_kdf_for_testing;         // unit tests only: skip the PBKDF2 floor

    WalletOptions()
        : pbkdf2_iterations(WALLET_CRYPTO_PBKDF2_ROUNDS),
          session_timeout(DEFAULT_SESSION_TIMEOUT),
          replace_session(false),
          min_password_length(PassphraseValidator::DEFAULT_MIN_LENGTH),
          log_level("info"),
          print_to_console(true),
          weak_kdf_for_testing(false) {}
};

/**
 * Fill options from a loaded config parser
 *
 * pbkdf2iterations below MIN_CONFIG_PBKDF2_ITERATIONS is raised to the
 * minimum with a warning. A non-positive sessiontimeout is an error.
 *
 * @return false with error set if a value is unusable
 */
bool LoadWalletOptions(const CConfigParser& config, WalletOptions& options, std::string& error);

/**
 * Summary row returned by ListWallets
 */
struct CWalletSummary {
    std::string id;
    std::string name;
    int64_t created_at;

    CWalletSummary() : created_at(0) {}
};

/**
 * Wallet Manager
 *
 * Orchestrates the wallet lifecycle on top of the storage, vault, key
 * derivation and session layers:
 *
 *   CreateWallet / RecoverWallet  mnemonic -> addresses -> vault -> store -> session
 *   Unlock                        store -> vault -> seed -> session
 *   SignTransaction               session -> deriver -> signer
 *
 * Only one session exists at a time. While a different wallet is unlocked,
 * Unlock, CreateWallet and RecoverWallet return SESSION_ACTIVE unless
 * replace_session is set, and the check runs before any key stretching.
 * In replace mode a failed call leaves the previous session active.
 *
 * Lifecycle and storage entry points are serialized on cs_manager so the
 * session check and session start of one unlock can not interleave with
 * another. Signing only takes the session lock.
 */
class CWalletManager {
private:
    mutable std::mutex cs_manager;

    WalletOptions options;
    CWalletStore store;
    CSessionManager& session;
    CMnemonicVault vault;
    PassphraseValidator validator;
    CSigningDispatcher dispatcher;

    WalletError CheckSessionAvailableUnlocked(const std::string& wallet_id, std::string& error);
    WalletError CheckPasswordUnlocked(const std::string& password, std::string& error) const;

    /**
     * Derive every chain account from the mnemonic, encrypt it, persist the
     * record and start a session for it
     */
    WalletError ImportMnemonicUnlocked(const std::string& mnemonic, const std::string& name,
                                       const std::string& password, CWalletRecord& record,
                                       std::string& error);

public:
    CWalletManager(CKeyValueStorage& storage, CSessionManager& session_in,
                   const WalletOptions& options_in);

    CWalletManager(const CWalletManager&) = delete;
    CWalletManager& operator=(const CWalletManager&) = delete;

    /**
     * Create a wallet from a fresh 24-word mnemonic and unlock it
     *
     * @param name Display name (non-empty)
     * @param password Vault password, checked against the passphrase policy
     * @param mnemonic_out The generated phrase, shown to the user once
     * @param record Output stored record
     */
    WalletError CreateWallet(const std::string& name, const std::string& password,
                             std::string& mnemonic_out, CWalletRecord& record,
                             std::string& error);

    /**
     * Recover a wallet from an existing phrase and unlock it
     *
     * The phrase is normalized and validated before any derivation. An
     * existing record with the same id is replaced.
     */
    WalletError RecoverWallet(const std::string& mnemonic, const std::string& name,
                              const std::string& password, CWalletRecord& record,
                              std::string& error);

    /**
     * Decrypt a stored wallet and start a session for it
     */
    WalletError Unlock(const std::string& wallet_id, const std::string& password,
                       std::string& error);

    /**
     * Run Unlock on a worker thread
     *
     * The manager must outlive the returned future.
     */
    std::future<WalletError> UnlockAsync(const std::string& wallet_id, const std::string& password);

    void Lock();
    bool IsUnlocked();
    std::string GetActiveWalletId();
    int64_t GetRemainingSeconds();

    WalletError SignTransaction(Chain chain, const TxParams& tx,
                                std::vector<uint8_t>& signed_bytes, std::string& error);
    WalletError SignTransaction(const std::string& chain_name, const TxParams& tx,
                                std::vector<uint8_t>& signed_bytes, std::string& error);

    WalletError ListWallets(std::vector<CWalletSummary>& wallets);
    WalletError GetWallet(const std::string& wallet_id, CWalletRecord& record);
    WalletError RenameWallet(const std::string& wallet_id, const std::string& name,
                             std::string& error);

    /**
     * Remove a stored wallet; its session is locked if it was active
     */
    WalletError DeleteWallet(const std::string& wallet_id);

    /**
     * Re-encrypt a wallet's mnemonic under a new password
     *
     * Fresh salt and nonce are generated. The session is left untouched.
     */
    WalletError ChangePassword(const std::string& wallet_id, const std::string& old_password,
                               const std::string& new_password, std::string& error);

    const WalletOptions& GetOptions() const { return options; }
};

#endif // POLYVAULT_WALLET_WALLET_MANAGER_H
