// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/wallet_manager.h>
#include <wallet/key_deriver.h>
#include <wallet/mnemonic.h>
#include <util/config.h>
#include <util/logging.h>

#include <limits>

bool LoadWalletOptions(const CConfigParser& config, WalletOptions& options, std::string& error) {
    options.datadir = config.GetString("datadir", GetDefaultDataDir());

    int64_t iterations = config.GetInt64("pbkdf2iterations", WALLET_CRYPTO_PBKDF2_ROUNDS);
    if (iterations > std::numeric_limits<uint32_t>::max()) {
        error = "pbkdf2iterations is out of range";
        return false;
    }
    if (iterations < static_cast<int64_t>(MIN_CONFIG_PBKDF2_ITERATIONS)) {
        LogPrintf(CONFIG, WARN, "Config: pbkdf2iterations=%lld is below the minimum, using %u",
                  static_cast<long long>(iterations), MIN_CONFIG_PBKDF2_ITERATIONS);
        iterations = MIN_CONFIG_PBKDF2_ITERATIONS;
    }
    options.pbkdf2_iterations = static_cast<unsigned int>(iterations);

    options.session_timeout = config.GetInt64("sessiontimeout", DEFAULT_SESSION_TIMEOUT);
    if (options.session_timeout <= 0) {
        error = "sessiontimeout must be a positive number of seconds";
        return false;
    }

    options.replace_session = config.GetBool("replacesession", false);

    int64_t min_length = config.GetInt64("minpasswordlength",
                                         static_cast<int64_t>(PassphraseValidator::DEFAULT_MIN_LENGTH));
    if (min_length < 1 || min_length > 1024) {
        error = "minpasswordlength must be between 1 and 1024";
        return false;
    }
    options.min_password_length = static_cast<size_t>(min_length);

    options.log_level = config.GetString("loglevel", "info");
    LogLevel level;
    if (!CLoggingConfig::ParseLogLevel(options.log_level, level)) {
        error = "unknown loglevel: " + options.log_level;
        return false;
    }
    options.log_file = config.GetString("logfile", "");
    options.print_to_console = config.GetBool("printtoconsole", true);

    LogPrintf(CONFIG, DEBUG, "Config: iterations=%u timeout=%llds replacesession=%d",
              options.pbkdf2_iterations, static_cast<long long>(options.session_timeout),
              options.replace_session ? 1 : 0);
    return true;
}

CWalletManager::CWalletManager(CKeyValueStorage& storage, CSessionManager& session_in,
                               const WalletOptions& options_in)
    : options(options_in),
      store(storage),
      session(session_in),
      vault(options_in.weak_kdf_for_testing
                ? CMnemonicVault::WeakForTesting(options_in.pbkdf2_iterations)
                : CMnemonicVault(options_in.pbkdf2_iterations)),
      validator(options_in.min_password_length),
      dispatcher(session_in) {
}

WalletError CWalletManager::CheckSessionAvailableUnlocked(const std::string& wallet_id,
                                                          std::string& error) {
    std::string active = session.GetActiveWalletId();
    if (active.empty() || (!wallet_id.empty() && active == wallet_id)) {
        return WalletError::OK;
    }

    // CSessionManager::Start swaps the old session out only once the new seed exists
    if (options.replace_session) {
        LogPrintSession(DEBUG, "Session for wallet %s will be replaced on success", active.c_str());
        return WalletError::OK;
    }

    error = "wallet " + active + " is unlocked; lock it first";
    return WalletError::SESSION_ACTIVE;
}

WalletError CWalletManager::CheckPasswordUnlocked(const std::string& password,
                                                  std::string& error) const {
    PassphraseValidationResult result = validator.Validate(password);
    if (!result.is_valid) {
        error = result.error_message;
        return WalletError::WEAK_PASSWORD;
    }
    for (const std::string& warning : result.warnings) {
        LogPrintWallet(DEBUG, "Password accepted with warning: %s", warning.c_str());
    }
    return WalletError::OK;
}

WalletError CWalletManager::ImportMnemonicUnlocked(const std::string& mnemonic,
                                                   const std::string& name,
                                                   const std::string& password,
                                                   CWalletRecord& record,
                                                   std::string& error) {
    CKeyingMaterial seed;
    if (!CMnemonic::ToSeed(mnemonic, "", seed)) {
        error = GetWalletErrorMessage(WalletError::INVALID_MNEMONIC);
        return WalletError::INVALID_MNEMONIC;
    }

    CWalletRecord out;
    out.name = name;
    out.created_at = GetTimeMillis();
    out.version = WALLET_RECORD_VERSION;

    for (Chain chain : AllChains()) {
        CChainAccount account;
        WalletError err = DeriveChainAccount(seed, chain, 0, account);
        if (err != WalletError::OK) {
            error = "key derivation failed for " + ChainToString(chain);
            return err;
        }
        const std::string chain_name = ChainToString(chain);
        out.addresses[chain_name] = account.address;
        out.public_keys[chain_name] = account.public_key;
        out.derivation_paths[chain_name] = account.path;
    }
    out.id = ComputeWalletId(out.addresses);

    WalletError err = vault.Encrypt(mnemonic, password, out.encrypted_mnemonic);
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        return err;
    }

    if (store.Exists(out.id)) {
        LogPrintWallet(INFO, "Replacing stored record for wallet %s", out.id.c_str());
    }

    err = store.Save(out);
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        return err;
    }

    session.Start(out.id, std::move(seed));
    record = out;
    return WalletError::OK;
}

WalletError CWalletManager::CreateWallet(const std::string& name, const std::string& password,
                                         std::string& mnemonic_out, CWalletRecord& record,
                                         std::string& error) {
    std::lock_guard<std::mutex> lock(cs_manager);

    if (name.empty()) {
        error = "wallet name must not be empty";
        return WalletError::INVALID_ARGUMENT;
    }

    WalletError err = CheckSessionAvailableUnlocked("", error);
    if (err != WalletError::OK) {
        return err;
    }

    err = CheckPasswordUnlocked(password, error);
    if (err != WalletError::OK) {
        return err;
    }

    std::string mnemonic;
    if (!CMnemonic::Generate(CMnemonic::DEFAULT_ENTROPY_BITS, mnemonic)) {
        error = "failed to generate mnemonic";
        return WalletError::ENCRYPTION_FAILED;
    }

    err = ImportMnemonicUnlocked(mnemonic, name, password, record, error);
    if (err != WalletError::OK) {
        memory_cleanse(&mnemonic[0], mnemonic.size());
        LogPrintWallet(ERROR, "Wallet creation failed: %s", WalletErrorName(err));
        return err;
    }

    mnemonic_out = std::move(mnemonic);
    LogPrintWallet(INFO, "Created wallet %s", record.id.c_str());
    return WalletError::OK;
}

WalletError CWalletManager::RecoverWallet(const std::string& mnemonic, const std::string& name,
                                          const std::string& password, CWalletRecord& record,
                                          std::string& error) {
    std::lock_guard<std::mutex> lock(cs_manager);

    std::string normalized = CMnemonic::Normalize(mnemonic);
    if (!CMnemonic::Validate(normalized)) {
        memory_cleanse(&normalized[0], normalized.size());
        error = GetWalletErrorMessage(WalletError::INVALID_MNEMONIC);
        return WalletError::INVALID_MNEMONIC;
    }

    WalletError err = WalletError::OK;
    if (name.empty()) {
        error = "wallet name must not be empty";
        err = WalletError::INVALID_ARGUMENT;
    }
    if (err == WalletError::OK) {
        err = CheckSessionAvailableUnlocked("", error);
    }
    if (err == WalletError::OK) {
        err = CheckPasswordUnlocked(password, error);
    }
    if (err == WalletError::OK) {
        err = ImportMnemonicUnlocked(normalized, name, password, record, error);
    }

    memory_cleanse(&normalized[0], normalized.size());

    if (err != WalletError::OK) {
        LogPrintWallet(WARN, "Wallet recovery failed: %s", WalletErrorName(err));
        return err;
    }

    LogPrintWallet(INFO, "Recovered wallet %s", record.id.c_str());
    return WalletError::OK;
}

WalletError CWalletManager::Unlock(const std::string& wallet_id, const std::string& password,
                                   std::string& error) {
    std::lock_guard<std::mutex> lock(cs_manager);

    WalletError err = CheckSessionAvailableUnlocked(wallet_id, error);
    if (err != WalletError::OK) {
        return err;
    }

    CWalletRecord record;
    err = store.Load(wallet_id, record);
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        return err;
    }

    CKeyingMaterial mnemonic;
    err = vault.Decrypt(record.encrypted_mnemonic, password, mnemonic);
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        LogPrintSession(WARN, "Unlock failed for wallet %s", wallet_id.c_str());
        return err;
    }

    std::string phrase = mnemonic.ToString();
    mnemonic.Wipe();

    CKeyingMaterial seed;
    bool ok = CMnemonic::ToSeed(phrase, "", seed);
    memory_cleanse(&phrase[0], phrase.size());
    if (!ok) {
        error = GetWalletErrorMessage(WalletError::INVALID_MNEMONIC);
        LogPrintSession(ERROR, "Wallet %s decrypted to an invalid mnemonic", wallet_id.c_str());
        return WalletError::INVALID_MNEMONIC;
    }

    session.Start(wallet_id, std::move(seed));
    LogPrintSession(INFO, "Unlocked wallet %s for %llds", wallet_id.c_str(),
                    static_cast<long long>(session.GetTimeout()));
    return WalletError::OK;
}

std::future<WalletError> CWalletManager::UnlockAsync(const std::string& wallet_id,
                                                     const std::string& password) {
    return std::async(std::launch::async, [this, wallet_id, password]() mutable {
        std::string error;
        WalletError result = Unlock(wallet_id, password, error);
        memory_cleanse(&password[0], password.size());
        return result;
    });
}

void CWalletManager::Lock() {
    session.Lock();
}

bool CWalletManager::IsUnlocked() {
    return session.IsUnlocked();
}

std::string CWalletManager::GetActiveWalletId() {
    return session.GetActiveWalletId();
}

int64_t CWalletManager::GetRemainingSeconds() {
    return session.GetRemainingSeconds();
}

WalletError CWalletManager::SignTransaction(Chain chain, const TxParams& tx,
                                            std::vector<uint8_t>& signed_bytes,
                                            std::string& error) {
    return dispatcher.SignTransaction(chain, tx, signed_bytes, error);
}

WalletError CWalletManager::SignTransaction(const std::string& chain_name, const TxParams& tx,
                                            std::vector<uint8_t>& signed_bytes,
                                            std::string& error) {
    return dispatcher.SignTransaction(chain_name, tx, signed_bytes, error);
}

WalletError CWalletManager::ListWallets(std::vector<CWalletSummary>& wallets) {
    std::lock_guard<std::mutex> lock(cs_manager);

    std::vector<CWalletRecord> records;
    WalletError err = store.List(records);
    if (err != WalletError::OK) {
        return err;
    }

    wallets.clear();
    for (const CWalletRecord& record : records) {
        CWalletSummary summary;
        summary.id = record.id;
        summary.name = record.name;
        summary.created_at = record.created_at;
        wallets.push_back(summary);
    }
    return WalletError::OK;
}

WalletError CWalletManager::GetWallet(const std::string& wallet_id, CWalletRecord& record) {
    std::lock_guard<std::mutex> lock(cs_manager);
    return store.Load(wallet_id, record);
}

WalletError CWalletManager::RenameWallet(const std::string& wallet_id, const std::string& name,
                                         std::string& error) {
    std::lock_guard<std::mutex> lock(cs_manager);

    if (name.empty()) {
        error = "wallet name must not be empty";
        return WalletError::INVALID_ARGUMENT;
    }

    CWalletRecord record;
    WalletError err = store.Load(wallet_id, record);
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        return err;
    }

    record.name = name;
    err = store.Save(record);
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        return err;
    }

    LogPrintWallet(INFO, "Renamed wallet %s", wallet_id.c_str());
    return WalletError::OK;
}

WalletError CWalletManager::DeleteWallet(const std::string& wallet_id) {
    std::lock_guard<std::mutex> lock(cs_manager);

    WalletError err = store.Delete(wallet_id);
    if (err != WalletError::OK) {
        return err;
    }

    session.LockWallet(wallet_id);
    LogPrintWallet(INFO, "Deleted wallet %s", wallet_id.c_str());
    return WalletError::OK;
}

WalletError CWalletManager::ChangePassword(const std::string& wallet_id,
                                           const std::string& old_password,
                                           const std::string& new_password,
                                           std::string& error) {
    std::lock_guard<std::mutex> lock(cs_manager);

    WalletError err = CheckPasswordUnlocked(new_password, error);
    if (err != WalletError::OK) {
        return err;
    }

    CWalletRecord record;
    err = store.Load(wallet_id, record);
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        return err;
    }

    CKeyingMaterial mnemonic;
    err = vault.Decrypt(record.encrypted_mnemonic, old_password, mnemonic);
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        return err;
    }

    std::string phrase = mnemonic.ToString();
    mnemonic.Wipe();

    CEncryptedMnemonic reencrypted;
    err = vault.Encrypt(phrase, new_password, reencrypted);
    memory_cleanse(&phrase[0], phrase.size());
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        return err;
    }

    record.encrypted_mnemonic = reencrypted;
    err = store.Save(record);
    if (err != WalletError::OK) {
        error = GetWalletErrorMessage(err);
        return err;
    }

    LogPrintWallet(INFO, "Changed password for wallet %s", wallet_id.c_str());
    return WalletError::OK;
}
