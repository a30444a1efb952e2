// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

std::string EnvName(const std::string& key) {
    std::string name = "POLYVAULT_";
    for (char c : key) {
        name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

// Returns false for blank, comment-only and [section] lines
bool SplitSetting(const std::string& raw, std::string& key, std::string& value) {
    std::string line = TrimString(raw.substr(0, raw.find_first_of("#;")));
    if (line.empty() || line.front() == '[') {
        return false;
    }

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return false;
    }
    key = ToLower(TrimString(line.substr(0, eq)));
    value = TrimString(line.substr(eq + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return !key.empty();
}

// The file names the wallet directory, so only the owner should touch it
void WarnOnLoosePermissions(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return;
    }
    if (S_ISLNK(st.st_mode)) {
        LogPrintf(CONFIG, WARN, "Config file %s is a symlink", path.c_str());
    } else if (st.st_mode & (S_IRWXG | S_IRWXO)) {
        LogPrintf(CONFIG, WARN, "Config file %s is accessible by other users (mode %o), run chmod 600",
                  path.c_str(), static_cast<unsigned int>(st.st_mode & 0777));
    }
}

} // namespace

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_settings.clear();

    struct stat st;
    if (stat(file_path.c_str(), &st) != 0 && errno == ENOENT) {
        LogPrintf(CONFIG, DEBUG, "No config file at %s, using defaults", file_path.c_str());
        return true;
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        LogPrintf(CONFIG, ERROR, "Cannot read config file %s", file_path.c_str());
        return false;
    }
    WarnOnLoosePermissions(file_path);

    std::string line;
    while (std::getline(file, line)) {
        std::string key, value;
        if (SplitSetting(line, key, value)) {
            m_settings[key] = value;
        }
    }
    if (file.bad()) {
        LogPrintf(CONFIG, ERROR, "Read error in config file %s", file_path.c_str());
        return false;
    }

    LogPrintf(CONFIG, INFO, "Read %u settings from %s", static_cast<unsigned int>(m_settings.size()),
              file_path.c_str());
    return true;
}

std::optional<std::string> CConfigParser::Lookup(const std::string& key) const {
    std::string lower = ToLower(key);
    const char* env = std::getenv(EnvName(lower).c_str());
    if (env != nullptr) {
        LogPrintf(CONFIG, DEBUG, "Config: %s taken from environment", lower.c_str());
        return std::string(env);
    }

    auto it = m_settings.find(lower);
    if (it == m_settings.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    return Lookup(key).value_or(default_value);
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::optional<std::string> value = Lookup(key);
    if (!value || value->empty()) {
        return default_value;
    }

    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(value->c_str(), &end, 10);
    if (errno != 0 || end == value->c_str() || *end != '\0') {
        LogPrintf(CONFIG, WARN, "Config: %s=%s is not an integer, using %lld",
                  key.c_str(), value->c_str(), static_cast<long long>(default_value));
        return default_value;
    }
    return parsed;
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    std::optional<std::string> value = Lookup(key);
    if (!value || value->empty()) {
        return default_value;
    }

    std::string word = ToLower(*value);
    if (word == "1" || word == "true" || word == "yes" || word == "on") return true;
    if (word == "0" || word == "false" || word == "no" || word == "off") return false;

    LogPrintf(CONFIG, WARN, "Config: %s=%s is not a boolean, using %d",
              key.c_str(), value->c_str(), default_value ? 1 : 0);
    return default_value;
}

void CConfigParser::Set(const std::string& key, const std::string& value) {
    m_settings[ToLower(key)] = value;
}

std::string GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        const struct passwd* pw = getpwuid(getuid());
        home = pw != nullptr ? pw->pw_dir : nullptr;
    }
    return home != nullptr ? std::string(home) + "/.polyvault" : std::string(".polyvault");
}

std::string GetConfigFilePath(const std::string& datadir) {
    return (datadir.empty() ? GetDefaultDataDir() : datadir) + "/polyvault.conf";
}
