// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <util/logging.h>
#include <util/strencodings.h>

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>
#include <vector>

const char* LogCategoryName(LogCategory category) {
    switch (category) {
        case LogCategory::WALLET: return "WALLET";
        case LogCategory::VAULT: return "VAULT";
        case LogCategory::SESSION: return "SESSION";
        case LogCategory::STORAGE: return "STORAGE";
        case LogCategory::SIGNING: return "SIGNING";
        case LogCategory::CONFIG: return "CONFIG";
    }
    return "?";
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_ERROR: return "ERROR";
        case LogLevel::LVL_WARN: return "WARN";
        case LogLevel::LVL_INFO: return "INFO";
        case LogLevel::LVL_DEBUG: return "DEBUG";
    }
    return "?";
}

namespace {

std::string FormatTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm parts{};
#ifdef _WIN32
    localtime_s(&parts, &now);
#else
    localtime_r(&now, &parts);
#endif
    char buf[32];
    size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &parts);
    return std::string(buf, len);
}

std::string VFormat(const char* format, va_list args) {
    va_list sizing;
    va_copy(sizing, args);
    int needed = std::vsnprintf(nullptr, 0, format, sizing);
    va_end(sizing);
    if (needed < 0) {
        return format;
    }

    std::vector<char> buf(static_cast<size_t>(needed) + 1);
    std::vsnprintf(buf.data(), buf.size(), format, args);
    return std::string(buf.data(), static_cast<size_t>(needed));
}

// Missing source files are normal while the rotation set fills up
void MoveLogFile(const std::string& from, const std::string& to) {
    if (std::rename(from.c_str(), to.c_str()) != 0 && errno != ENOENT) {
        std::cerr << "Warning: could not rotate " << from << " to " << to
                  << ": " << std::strerror(errno) << std::endl;
    }
}

} // namespace

CLoggingConfig& CLoggingConfig::GetInstance() {
    static CLoggingConfig instance;
    return instance;
}

void CLoggingConfig::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file = path;
}

std::string CLoggingConfig::GetLogFilePath(const std::string& datadir) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_file.empty()) {
        return m_file;
    }
    return datadir.empty() ? std::string() : datadir + "/debug.log";
}

bool CLoggingConfig::ParseLogLevel(const std::string& str, LogLevel& level) {
    static const struct {
        const char* name;
        LogLevel level;
    } LEVELS[] = {
        {"error", LogLevel::LVL_ERROR},
        {"warn", LogLevel::LVL_WARN},
        {"warning", LogLevel::LVL_WARN},
        {"info", LogLevel::LVL_INFO},
        {"debug", LogLevel::LVL_DEBUG},
    };

    std::string name = ToLower(TrimString(str));
    for (const auto& entry : LEVELS) {
        if (name == entry.name) {
            level = entry.level;
            return true;
        }
    }
    return false;
}

CLogger& CLogger::GetInstance() {
    static CLogger instance;
    return instance;
}

CLogger::~CLogger() {
    Shutdown();
}

bool CLogger::Initialize(const std::string& datadir) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file) {
        return true;
    }

    m_path = CLoggingConfig::GetInstance().GetLogFilePath(datadir);
    if (m_path.empty()) {
        return true;
    }

    std::unique_ptr<std::ofstream> file(new std::ofstream(m_path, std::ios::app));
    if (!file->is_open()) {
        std::cerr << "Warning: could not open log file " << m_path << std::endl;
        m_path.clear();
        return false;
    }
    file->seekp(0, std::ios::end);
    m_written = static_cast<size_t>(file->tellp());
    m_file = std::move(file);
    return true;
}

void CLogger::Shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file) {
        m_file->flush();
        m_file.reset();
    }
    m_path.clear();
    m_written = 0;
}

void CLogger::LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...) {
    if (!CLoggingConfig::GetInstance().WouldLog(level)) {
        return;
    }

    va_list args;
    va_start(args, format);
    std::string message = VFormat(format, args);
    va_end(args);

    std::string line = FormatTimestamp() + " [" + LogLevelName(level) + "] [" +
                       LogCategoryName(category) + "] " + message;
    WriteLine(level, line);
}

void CLogger::WriteLine(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (CLoggingConfig::GetInstance().IsConsoleLoggingEnabled()) {
        (level == LogLevel::LVL_ERROR ? std::cerr : std::cout) << line << std::endl;
    }

    if (!m_file) {
        return;
    }
    if (m_written >= LOG_ROTATE_SIZE) {
        RotateUnlocked();
        if (!m_file) {
            return;
        }
    }
    *m_file << line << '\n';
    m_file->flush();
    m_written += line.size() + 1;
}

void CLogger::RotateUnlocked() {
    m_file.reset();

    std::string oldest = m_path + "." + std::to_string(LOG_ROTATE_KEEP);
    if (std::remove(oldest.c_str()) != 0 && errno != ENOENT) {
        std::cerr << "Warning: could not remove " << oldest << ": " << std::strerror(errno) << std::endl;
    }
    for (unsigned int n = LOG_ROTATE_KEEP - 1; n >= 1; n--) {
        MoveLogFile(m_path + "." + std::to_string(n), m_path + "." + std::to_string(n + 1));
    }
    MoveLogFile(m_path, m_path + ".1");

    std::unique_ptr<std::ofstream> file(new std::ofstream(m_path, std::ios::trunc));
    if (!file->is_open()) {
        std::cerr << "Warning: could not reopen log file " << m_path << std::endl;
        return;
    }
    m_file = std::move(file);
    m_written = 0;
}
