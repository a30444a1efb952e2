// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_UTIL_CONFIG_H
#define POLYVAULT_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

/**
 * polyvault.conf reader
 *
 * One key=value per line. Keys are case-insensitive. '#' and ';' start a
 * comment, [section] lines and lines without '=' are skipped, and a value
 * may be wrapped in double quotes.
 *
 * Lookup order for every getter: POLYVAULT_<KEY> environment variable,
 * then the file (or Set), then the caller's default. Unparseable numbers
 * and booleans log a warning and yield the default.
 */
class CConfigParser {
private:
    std::map<std::string, std::string> m_settings;

    std::optional<std::string> Lookup(const std::string& key) const;

public:
    /** A missing file is not an error; an unreadable one is */
    bool LoadConfigFile(const std::string& file_path);

    std::string GetString(const std::string& key, const std::string& default_value = "") const;
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /** 1/0, true/false, yes/no, on/off */
    bool GetBool(const std::string& key, bool default_value = false) const;

    void Set(const std::string& key, const std::string& value);
    size_t Size() const { return m_settings.size(); }
};

/** $HOME/.polyvault */
std::string GetDefaultDataDir();

/** <datadir>/polyvault.conf, with the default data directory when empty */
std::string GetConfigFilePath(const std::string& datadir = "");

#endif // POLYVAULT_UTIL_CONFIG_H
