// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_UTIL_LOGGING_H
#define POLYVAULT_UTIL_LOGGING_H

#include <atomic>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

/**
 * Polyvault logging
 *
 * Every line carries a timestamp, a level and the subsystem that wrote it:
 *
 *   2025-06-01 12:00:00 [INFO] [SESSION] Session started for wallet ...
 *
 * Lines go to the console (stderr for errors) and, once CLogger::Initialize
 * has run, to debug.log in the data directory. debug.log is rotated to
 * debug.log.1 .. debug.log.N when it outgrows LOG_ROTATE_SIZE.
 *
 * Passwords, mnemonics, seeds and private keys must never reach a log line.
 */

enum class LogCategory : uint32_t {
    WALLET,     // create/recover/delete
    VAULT,      // mnemonic encryption
    SESSION,    // unlock state
    STORAGE,    // record persistence
    SIGNING,
    CONFIG,
};

/** LVL_ prefix keeps clear of the ERROR macro some platform headers define */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

static const size_t LOG_ROTATE_SIZE = 10 * 1024 * 1024;
static const unsigned int LOG_ROTATE_KEEP = 5;

const char* LogCategoryName(LogCategory category);
const char* LogLevelName(LogLevel level);

/**
 * Process-wide log settings, written once at startup and read per line
 */
class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    void SetLogLevel(LogLevel level) { m_level.store(level); }
    LogLevel GetLogLevel() const { return m_level.load(); }
    bool WouldLog(LogLevel level) const { return level <= m_level.load(); }

    void SetConsoleLogging(bool enable) { m_console.store(enable); }
    bool IsConsoleLoggingEnabled() const { return m_console.load(); }

    /** Empty path means debug.log in the data directory */
    void SetLogFile(const std::string& path);
    std::string GetLogFilePath(const std::string& datadir) const;

    /** Accepts error, warn/warning, info and debug in any case */
    static bool ParseLogLevel(const std::string& str, LogLevel& level);

private:
    CLoggingConfig() = default;

    std::atomic<LogLevel> m_level{LogLevel::LVL_INFO};
    std::atomic<bool> m_console{true};
    std::string m_file;
    mutable std::mutex m_mutex;
};

class CLogger {
public:
    static CLogger& GetInstance();

    /** Open the log file; returns false if it can not be opened */
    bool Initialize(const std::string& datadir);
    void Shutdown();

    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...);

private:
    CLogger() = default;
    ~CLogger();

    void WriteLine(LogLevel level, const std::string& line);
    void RotateUnlocked();

    std::mutex m_mutex;
    std::string m_path;
    std::unique_ptr<std::ofstream> m_file;
    size_t m_written{0};
};

#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

#define LogPrintWallet(level, format, ...) LogPrintf(WALLET, level, format, ##__VA_ARGS__)
#define LogPrintVault(level, format, ...) LogPrintf(VAULT, level, format, ##__VA_ARGS__)
#define LogPrintSession(level, format, ...) LogPrintf(SESSION, level, format, ##__VA_ARGS__)
#define LogPrintStorage(level, format, ...) LogPrintf(STORAGE, level, format, ##__VA_ARGS__)
#define LogPrintSigning(level, format, ...) LogPrintf(SIGNING, level, format, ##__VA_ARGS__)

#endif // POLYVAULT_UTIL_LOGGING_H
