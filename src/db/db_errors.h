// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_DB_DB_ERRORS_H
#define POLYVAULT_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * Outcome of a key-value storage call
 *
 * LevelDB statuses are folded into these; the in-memory store reports the
 * same values so callers handle both backends alike.
 */
enum class DBErrorType {
    OK,
    NOT_FOUND,             // Key absent (expected for lookups)
    CORRUPTION,            // Store contents damaged
    IO_ERROR,              // Disk full, permission denied, lock held by another process
    INVALID_ARGUMENT,
    NOT_SUPPORTED,
    NOT_OPEN,              // Storage used before Open() or after Close()
    UNKNOWN
};

/**
 * Classify a LevelDB status
 */
DBErrorType ClassifyDBError(const leveldb::Status& status);

/**
 * Short identifier for logs ("IO_ERROR")
 */
const char* DBErrorTypeName(DBErrorType error_type);

/**
 * Human-readable description including the LevelDB detail text
 */
std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type);

#endif // POLYVAULT_DB_DB_ERRORS_H
