// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_WALLET_STORE_H
#define POLYVAULT_WALLET_WALLET_STORE_H

#include <db/db_errors.h>
#include <wallet/wallet_errors.h>
#include <wallet/wallet_record.h>

#include <leveldb/db.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * Key-value storage backend
 *
 * Get reports DBErrorType::NOT_FOUND for an absent key; Erase of an absent
 * key succeeds.
 */
class CKeyValueStorage {
public:
    virtual ~CKeyValueStorage() {}

    virtual DBErrorType Get(const std::string& key, std::string& value) const = 0;
    virtual DBErrorType Set(const std::string& key, const std::string& value) = 0;
    virtual DBErrorType Erase(const std::string& key) = 0;

    /**
     * All keys starting with prefix, in byte order
     */
    virtual DBErrorType ListKeys(const std::string& prefix, std::vector<std::string>& keys) const = 0;
};

/**
 * LevelDB-backed storage with synchronous writes
 *
 * Thread-safe: Protected by internal mutex.
 */
class CLevelDBStorage : public CKeyValueStorage {
private:
    std::unique_ptr<leveldb::DB> m_db;
    mutable std::mutex m_mutex;
    std::string m_path;

public:
    CLevelDBStorage() {}
    ~CLevelDBStorage();

    CLevelDBStorage(const CLevelDBStorage&) = delete;
    CLevelDBStorage& operator=(const CLevelDBStorage&) = delete;

    /**
     * Open (creating if missing) the database directory
     *
     * @param path Directory path for database files
     * @param error Description on failure
     */
    bool Open(const std::string& path, std::string& error);

    void Close();

    bool IsOpen() const;

    DBErrorType Get(const std::string& key, std::string& value) const override;
    DBErrorType Set(const std::string& key, const std::string& value) override;
    DBErrorType Erase(const std::string& key) override;
    DBErrorType ListKeys(const std::string& prefix, std::vector<std::string>& keys) const override;
};

/**
 * Volatile storage for tests and dry runs
 */
class CMemoryStorage : public CKeyValueStorage {
private:
    std::map<std::string, std::string> m_data;
    mutable std::mutex m_mutex;

public:
    DBErrorType Get(const std::string& key, std::string& value) const override;
    DBErrorType Set(const std::string& key, const std::string& value) override;
    DBErrorType Erase(const std::string& key) override;
    DBErrorType ListKeys(const std::string& prefix, std::vector<std::string>& keys) const override;

    size_t Size() const;
};

/**
 * CWalletStore - wallet records on top of a key-value backend
 *
 * Records live under "wallet_{id}" as JSON text.
 */
class CWalletStore {
private:
    CKeyValueStorage& storage;

public:
    explicit CWalletStore(CKeyValueStorage& storage_in) : storage(storage_in) {}

    WalletError Save(const CWalletRecord& record);

    /**
     * @return OK, WALLET_NOT_FOUND, or STORAGE_FAILURE (I/O or parse error)
     */
    WalletError Load(const std::string& id, CWalletRecord& record);

    WalletError Delete(const std::string& id);

    bool Exists(const std::string& id);

    /**
     * Load every stored record (ordered by id)
     */
    WalletError List(std::vector<CWalletRecord>& records);
};

#endif // POLYVAULT_WALLET_WALLET_STORE_H
