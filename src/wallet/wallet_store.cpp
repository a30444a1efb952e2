// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/wallet_store.h>
#include <util/logging.h>

// ============================================================================
// CLevelDBStorage
// ============================================================================

CLevelDBStorage::~CLevelDBStorage() {
    Close();
}

bool CLevelDBStorage::Open(const std::string& path, std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        return true;  // Already open
    }

    leveldb::Options options;
    options.create_if_missing = true;
    options.paranoid_checks = true;
    options.max_open_files = 64;

    leveldb::DB* db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &db);
    if (!status.ok()) {
        error = GetDBErrorMessage(status, ClassifyDBError(status));
        LogPrintStorage(ERROR, "Failed to open wallet database %s: %s", path.c_str(), error.c_str());
        return false;
    }

    m_db.reset(db);
    m_path = path;
    LogPrintStorage(INFO, "Wallet database opened: %s", path.c_str());
    return true;
}

void CLevelDBStorage::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_db) {
        m_db.reset();
        LogPrintStorage(INFO, "Wallet database closed: %s", m_path.c_str());
    }
}

bool CLevelDBStorage::IsOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db != nullptr;
}

DBErrorType CLevelDBStorage::Get(const std::string& key, std::string& value) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        return DBErrorType::NOT_OPEN;
    }

    leveldb::ReadOptions options;
    options.verify_checksums = true;
    leveldb::Status status = m_db->Get(options, key, &value);

    DBErrorType result = ClassifyDBError(status);
    if (result != DBErrorType::OK && result != DBErrorType::NOT_FOUND) {
        LogPrintStorage(ERROR, "Read of %s failed: %s", key.c_str(),
                        GetDBErrorMessage(status, result).c_str());
    }
    return result;
}

DBErrorType CLevelDBStorage::Set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        return DBErrorType::NOT_OPEN;
    }

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = m_db->Put(options, key, value);

    DBErrorType result = ClassifyDBError(status);
    if (result != DBErrorType::OK) {
        LogPrintStorage(ERROR, "Write of %s failed: %s", key.c_str(),
                        GetDBErrorMessage(status, result).c_str());
    }
    return result;
}

DBErrorType CLevelDBStorage::Erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        return DBErrorType::NOT_OPEN;
    }

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = m_db->Delete(options, key);

    DBErrorType result = ClassifyDBError(status);
    if (result != DBErrorType::OK) {
        LogPrintStorage(ERROR, "Erase of %s failed: %s", key.c_str(),
                        GetDBErrorMessage(status, result).c_str());
    }
    return result;
}

DBErrorType CLevelDBStorage::ListKeys(const std::string& prefix, std::vector<std::string>& keys) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        return DBErrorType::NOT_OPEN;
    }

    keys.clear();
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(prefix); it->Valid(); it->Next()) {
        leveldb::Slice key = it->key();
        if (!key.starts_with(prefix)) {
            break;
        }
        keys.push_back(key.ToString());
    }
    return ClassifyDBError(it->status());
}

// ============================================================================
// CMemoryStorage
// ============================================================================

DBErrorType CMemoryStorage::Get(const std::string& key, std::string& value) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_data.find(key);
    if (it == m_data.end()) {
        return DBErrorType::NOT_FOUND;
    }
    value = it->second;
    return DBErrorType::OK;
}

DBErrorType CMemoryStorage::Set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data[key] = value;
    return DBErrorType::OK;
}

DBErrorType CMemoryStorage::Erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data.erase(key);
    return DBErrorType::OK;
}

DBErrorType CMemoryStorage::ListKeys(const std::string& prefix, std::vector<std::string>& keys) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    keys.clear();
    for (auto it = m_data.lower_bound(prefix); it != m_data.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        keys.push_back(it->first);
    }
    return DBErrorType::OK;
}

size_t CMemoryStorage::Size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.size();
}

// ============================================================================
// CWalletStore
// ============================================================================

WalletError CWalletStore::Save(const CWalletRecord& record) {
    if (record.id.empty()) {
        return WalletError::INVALID_ARGUMENT;
    }

    DBErrorType result = storage.Set(WalletStorageKey(record.id), record.ToJSON());
    if (result != DBErrorType::OK) {
        LogPrintStorage(ERROR, "Saving wallet %s failed (%s)", record.id.c_str(),
                        DBErrorTypeName(result));
        return WalletError::STORAGE_FAILURE;
    }
    LogPrintStorage(DEBUG, "Saved wallet %s", record.id.c_str());
    return WalletError::OK;
}

WalletError CWalletStore::Load(const std::string& id, CWalletRecord& record) {
    if (id.empty()) {
        return WalletError::WALLET_NOT_FOUND;
    }

    std::string text;
    DBErrorType result = storage.Get(WalletStorageKey(id), text);
    if (result == DBErrorType::NOT_FOUND) {
        return WalletError::WALLET_NOT_FOUND;
    }
    if (result != DBErrorType::OK) {
        LogPrintStorage(ERROR, "Loading wallet %s failed (%s)", id.c_str(), DBErrorTypeName(result));
        return WalletError::STORAGE_FAILURE;
    }

    std::string error;
    WalletError err = CWalletRecord::FromJSON(text, record, error);
    if (err != WalletError::OK) {
        LogPrintStorage(ERROR, "Wallet %s has an unreadable record: %s", id.c_str(), error.c_str());
    }
    return err;
}

WalletError CWalletStore::Delete(const std::string& id) {
    std::string text;
    DBErrorType result = storage.Get(WalletStorageKey(id), text);
    if (result == DBErrorType::NOT_FOUND) {
        return WalletError::WALLET_NOT_FOUND;
    }
    if (result != DBErrorType::OK || storage.Erase(WalletStorageKey(id)) != DBErrorType::OK) {
        return WalletError::STORAGE_FAILURE;
    }
    LogPrintStorage(INFO, "Deleted wallet %s", id.c_str());
    return WalletError::OK;
}

bool CWalletStore::Exists(const std::string& id) {
    std::string text;
    return storage.Get(WalletStorageKey(id), text) == DBErrorType::OK;
}

WalletError CWalletStore::List(std::vector<CWalletRecord>& records) {
    std::vector<std::string> keys;
    if (storage.ListKeys(WALLET_KEY_PREFIX, keys) != DBErrorType::OK) {
        return WalletError::STORAGE_FAILURE;
    }

    std::vector<CWalletRecord> result;
    const size_t prefix_len = std::string(WALLET_KEY_PREFIX).size();
    for (const std::string& key : keys) {
        CWalletRecord record;
        WalletError err = Load(key.substr(prefix_len), record);
        if (err != WalletError::OK) {
            return err;
        }
        result.push_back(record);
    }

    records.swap(result);
    return WalletError::OK;
}
