// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <db/db_errors.h>

DBErrorType ClassifyDBError(const leveldb::Status& status) {
    if (status.ok()) {
        return DBErrorType::OK;
    }
    if (status.IsNotFound()) {
        return DBErrorType::NOT_FOUND;
    }
    if (status.IsCorruption()) {
        return DBErrorType::CORRUPTION;
    }
    if (status.IsIOError()) {
        return DBErrorType::IO_ERROR;
    }
    if (status.IsInvalidArgument()) {
        return DBErrorType::INVALID_ARGUMENT;
    }
    if (status.IsNotSupportedError()) {
        return DBErrorType::NOT_SUPPORTED;
    }
    return DBErrorType::UNKNOWN;
}

const char* DBErrorTypeName(DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK:               return "OK";
        case DBErrorType::NOT_FOUND:        return "NOT_FOUND";
        case DBErrorType::CORRUPTION:       return "CORRUPTION";
        case DBErrorType::IO_ERROR:         return "IO_ERROR";
        case DBErrorType::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case DBErrorType::NOT_SUPPORTED:    return "NOT_SUPPORTED";
        case DBErrorType::NOT_OPEN:         return "NOT_OPEN";
        case DBErrorType::UNKNOWN:          return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK:
            return "Success";
        case DBErrorType::NOT_FOUND:
            return "Key not found";
        case DBErrorType::CORRUPTION:
            return "Wallet database corruption detected: " + status.ToString();
        case DBErrorType::IO_ERROR:
            return "Wallet database I/O error: " + status.ToString() +
                   " (check disk space, permissions, and that no other process holds the database)";
        case DBErrorType::INVALID_ARGUMENT:
            return "Invalid argument: " + status.ToString();
        case DBErrorType::NOT_SUPPORTED:
            return "Operation not supported: " + status.ToString();
        case DBErrorType::NOT_OPEN:
            return "Wallet database is not open";
        case DBErrorType::UNKNOWN:
            break;
    }
    return "Unknown database error: " + status.ToString();
}
