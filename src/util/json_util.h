// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_UTIL_JSON_UTIL_H
#define POLYVAULT_UTIL_JSON_UTIL_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

/**
 * Typed field extraction for persisted JSON documents
 *
 * Every getter throws std::runtime_error naming the offending field when it
 * is missing or has the wrong type. Callers convert that into their own
 * result code at the parsing boundary.
 */

using json = nlohmann::json;

namespace JSONUtil {

/**
 * Required object member
 */
inline const json& GetRequiredObject(const json& obj, const std::string& key) {
    if (!obj.contains(key)) {
        throw std::runtime_error("Missing required field: " + key);
    }
    if (!obj[key].is_object()) {
        throw std::runtime_error("Field '" + key + "' must be an object");
    }
    return obj[key];
}

inline std::string GetRequiredString(const json& obj, const std::string& key) {
    if (!obj.contains(key)) {
        throw std::runtime_error("Missing required field: " + key);
    }
    if (!obj[key].is_string()) {
        throw std::runtime_error("Field '" + key + "' must be a string");
    }
    return obj[key].get<std::string>();
}

inline std::string GetOptionalString(const json& obj, const std::string& key,
                                     const std::string& default_value = "") {
    if (!obj.contains(key)) {
        return default_value;
    }
    if (!obj[key].is_string()) {
        throw std::runtime_error("Field '" + key + "' must be a string");
    }
    return obj[key].get<std::string>();
}

inline int64_t GetRequiredInt64(const json& obj, const std::string& key,
                                int64_t min_val = INT64_MIN, int64_t max_val = INT64_MAX) {
    if (!obj.contains(key)) {
        throw std::runtime_error("Missing required field: " + key);
    }
    if (!obj[key].is_number_integer()) {
        throw std::runtime_error("Field '" + key + "' must be an integer");
    }

    int64_t value = obj[key].get<int64_t>();
    if (value < min_val || value > max_val) {
        throw std::runtime_error("Field '" + key + "' out of valid range [" +
                                 std::to_string(min_val) + ", " +
                                 std::to_string(max_val) + "]");
    }
    return value;
}

inline uint32_t GetRequiredUInt32(const json& obj, const std::string& key,
                                  uint32_t min_val = 0, uint32_t max_val = UINT32_MAX) {
    if (!obj.contains(key)) {
        throw std::runtime_error("Missing required field: " + key);
    }
    if (!obj[key].is_number_unsigned()) {
        throw std::runtime_error("Field '" + key + "' must be an unsigned integer");
    }

    uint64_t value = obj[key].get<uint64_t>();
    if (value < min_val || value > max_val) {
        throw std::runtime_error("Field '" + key + "' out of valid range [" +
                                 std::to_string(min_val) + ", " +
                                 std::to_string(max_val) + "]");
    }
    return static_cast<uint32_t>(value);
}

/**
 * Object of string values as a map; an absent optional field yields an empty map
 */
inline std::map<std::string, std::string> GetStringMap(const json& obj, const std::string& key,
                                                       bool required) {
    std::map<std::string, std::string> result;
    if (!obj.contains(key)) {
        if (required) {
            throw std::runtime_error("Missing required field: " + key);
        }
        return result;
    }
    if (!obj[key].is_object()) {
        throw std::runtime_error("Field '" + key + "' must be an object");
    }
    for (auto it = obj[key].begin(); it != obj[key].end(); ++it) {
        if (!it.value().is_string()) {
            throw std::runtime_error("Field '" + key + "." + it.key() + "' must be a string");
        }
        result[it.key()] = it.value().get<std::string>();
    }
    return result;
}

} // namespace JSONUtil

#endif // POLYVAULT_UTIL_JSON_UTIL_H
