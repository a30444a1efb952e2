// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

/**
 * Utility Tests
 *
 * Tests for hex/Base64/Base58/Bech32 codecs, the config parser and the
 * JSON field helpers
 */

#include <boost/test/unit_test.hpp>

#include <util/base58.h>
#include <util/bech32.h>
#include <util/config.h>
#include <util/json_util.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(util_tests)

/**
 * Test Suite 1: Hex and Base64
 */
BOOST_AUTO_TEST_SUITE(strencodings_tests)

BOOST_AUTO_TEST_CASE(hex_encode_decode) {
    std::vector<uint8_t> data = {0x00, 0x01, 0xab, 0xff};
    BOOST_CHECK_EQUAL(HexStr(data), "0001abff");
    BOOST_CHECK(ParseHex("0001abff") == data);
    BOOST_CHECK(ParseHex("0x0001ABFF") == data);
    BOOST_CHECK_EQUAL(HexStr(std::vector<uint8_t>()), "");
}

BOOST_AUTO_TEST_CASE(hex_rejects_malformed) {
    BOOST_CHECK(ParseHex("abc").empty());    // odd length
    BOOST_CHECK(ParseHex("zz").empty());
    BOOST_CHECK(IsHex("00ff"));
    BOOST_CHECK(!IsHex("0f0"));
    BOOST_CHECK(!IsHex("g0"));
}

BOOST_AUTO_TEST_CASE(base64_known_values) {
    std::string foobar = "foobar";
    std::vector<uint8_t> bytes(foobar.begin(), foobar.end());
    BOOST_CHECK_EQUAL(EncodeBase64(bytes), "Zm9vYmFy");
    BOOST_CHECK_EQUAL(EncodeBase64(bytes.data(), 1), "Zg==");
    BOOST_CHECK_EQUAL(EncodeBase64(bytes.data(), 2), "Zm8=");

    std::vector<uint8_t> decoded;
    BOOST_CHECK(DecodeBase64("Zm9vYmFy", decoded));
    BOOST_CHECK(decoded == bytes);
}

BOOST_AUTO_TEST_CASE(base64_rejects_garbage) {
    std::vector<uint8_t> decoded;
    BOOST_CHECK(!DecodeBase64("Zm9v!mFy", decoded));
    BOOST_CHECK(!DecodeBase64("Zm9", decoded));
}

BOOST_AUTO_TEST_CASE(trim_and_lower) {
    BOOST_CHECK_EQUAL(TrimString("  abandon \t\n"), "abandon");
    BOOST_CHECK_EQUAL(ToLower("AbAnDoN"), "abandon");
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 2: Base58
 */
BOOST_AUTO_TEST_SUITE(base58_tests)

BOOST_AUTO_TEST_CASE(base58_known_values) {
    std::string hello = "hello world";
    std::vector<uint8_t> bytes(hello.begin(), hello.end());
    BOOST_CHECK_EQUAL(EncodeBase58(bytes), "StV1DL6CwTryKyV");

    // Leading zero bytes map to leading '1's
    std::vector<uint8_t> zeros = {0x00, 0x00, 0x01};
    BOOST_CHECK_EQUAL(EncodeBase58(zeros), "112");
}

BOOST_AUTO_TEST_CASE(base58_decode) {
    std::vector<uint8_t> out;
    BOOST_CHECK(DecodeBase58("StV1DL6CwTryKyV", out));
    BOOST_CHECK_EQUAL(std::string(out.begin(), out.end()), "hello world");

    BOOST_CHECK(DecodeBase58("112", out));
    BOOST_CHECK(out == std::vector<uint8_t>({0x00, 0x00, 0x01}));

    // 0, O, I and l are not in the alphabet
    BOOST_CHECK(!DecodeBase58("0OIl", out));
    BOOST_CHECK(!DecodeBase58(std::string("2\0", 2), out));
    BOOST_CHECK(!DecodeBase58(std::string(1025, '2'), out));
}

BOOST_AUTO_TEST_CASE(base58_edge_lengths) {
    BOOST_CHECK_EQUAL(EncodeBase58({}), "");
    BOOST_CHECK_EQUAL(EncodeBase58({0x00}), "1");
    BOOST_CHECK_EQUAL(EncodeBase58({0x39}), "z");
    BOOST_CHECK_EQUAL(EncodeBase58({0x3a}), "21");

    std::vector<uint8_t> out = {0xff};
    BOOST_CHECK(DecodeBase58("", out));
    BOOST_CHECK(out.empty());

    std::vector<uint8_t> key(32, 0xff);
    BOOST_REQUIRE(DecodeBase58(EncodeBase58(key), out));
    BOOST_CHECK(out == key);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 3: Bech32
 */
BOOST_AUTO_TEST_SUITE(bech32_tests)

BOOST_AUTO_TEST_CASE(segwit_v0_address) {
    // BIP-173 example: P2WPKH for the generator point's compressed key
    std::vector<uint8_t> program = ParseHex("751e76e8199196d454941c45d1b3a323f1433bd6");
    BOOST_CHECK_EQUAL(bech32::EncodeSegwitAddress("bc", 0, program),
                      "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");
}

BOOST_AUTO_TEST_CASE(decode_checks_checksum) {
    std::string hrp;
    std::vector<uint8_t> values;
    BOOST_CHECK(bech32::Decode("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", hrp, values));
    BOOST_CHECK_EQUAL(hrp, "bc");
    BOOST_REQUIRE(!values.empty());
    BOOST_CHECK_EQUAL(values[0], 0);

    std::vector<uint8_t> program;
    std::vector<uint8_t> five_bit(values.begin() + 1, values.end());
    BOOST_CHECK(bech32::ConvertBits(five_bit, 5, 8, false, program));
    BOOST_CHECK_EQUAL(HexStr(program), "751e76e8199196d454941c45d1b3a323f1433bd6");

    // Last character changed
    BOOST_CHECK(!bech32::Decode("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t5", hrp, values));
    // Mixed case
    BOOST_CHECK(!bech32::Decode("bc1qW508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", hrp, values));
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 4: Config parser
 */
BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(parse_config_file) {
    std::string path = "test_polyvault_util.conf";
    {
        std::ofstream file(path);
        file << "# wallet settings\n";
        file << "SessionTimeout = 600\n";
        file << "replacesession=yes ; inline comment\n";
        file << "logfile=\"/tmp/pv debug.log\"\n";
        file << "[section]\n";
        file << "not a setting\n";
    }

    CConfigParser config;
    BOOST_REQUIRE(config.LoadConfigFile(path));
    BOOST_CHECK_EQUAL(config.Size(), 3u);
    BOOST_CHECK_EQUAL(config.GetInt64("sessiontimeout", 900), 600);
    BOOST_CHECK(config.GetBool("replacesession", false));
    BOOST_CHECK_EQUAL(config.GetString("logfile"), "/tmp/pv debug.log");
    BOOST_CHECK_EQUAL(config.GetInt64("minpasswordlength", 12), 12);

    std::remove(path.c_str());
}

BOOST_AUTO_TEST_CASE(missing_file_uses_defaults) {
    CConfigParser config;
    BOOST_CHECK(config.LoadConfigFile("does_not_exist_polyvault.conf"));
    BOOST_CHECK_EQUAL(config.GetString("pbkdf2iterations", "600000"), "600000");
}

BOOST_AUTO_TEST_CASE(invalid_values_fall_back) {
    CConfigParser config;
    config.Set("sessiontimeout", "soon");
    config.Set("replacesession", "maybe");
    BOOST_CHECK_EQUAL(config.GetInt64("sessiontimeout", 900), 900);
    BOOST_CHECK(!config.GetBool("replacesession", false));

    config.Set("pbkdf2iterations", "600000x");
    BOOST_CHECK_EQUAL(config.GetInt64("pbkdf2iterations", 1), 1);
}

BOOST_AUTO_TEST_CASE(environment_overrides_file) {
    CConfigParser config;
    config.Set("SessionTimeout", "600");
    BOOST_CHECK_EQUAL(config.GetInt64("sessiontimeout", 900), 600);

    setenv("POLYVAULT_SESSIONTIMEOUT", "42", 1);
    BOOST_CHECK_EQUAL(config.GetInt64("sessiontimeout", 900), 42);
    BOOST_CHECK_EQUAL(config.GetString("SessionTimeout"), "42");
    unsetenv("POLYVAULT_SESSIONTIMEOUT");

    BOOST_CHECK_EQUAL(config.GetInt64("sessiontimeout", 900), 600);
}

BOOST_AUTO_TEST_CASE(config_file_path) {
    BOOST_CHECK_EQUAL(GetConfigFilePath("/data/pv"), "/data/pv/polyvault.conf");
    BOOST_CHECK(!GetDefaultDataDir().empty());
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 5: Logging
 */
BOOST_AUTO_TEST_SUITE(logging_tests)

BOOST_AUTO_TEST_CASE(parse_log_level) {
    LogLevel level = LogLevel::LVL_INFO;
    BOOST_CHECK(CLoggingConfig::ParseLogLevel(" Debug ", level));
    BOOST_CHECK(level == LogLevel::LVL_DEBUG);
    BOOST_CHECK(CLoggingConfig::ParseLogLevel("warning", level));
    BOOST_CHECK(level == LogLevel::LVL_WARN);
    BOOST_CHECK(CLoggingConfig::ParseLogLevel("ERROR", level));
    BOOST_CHECK(level == LogLevel::LVL_ERROR);
    BOOST_CHECK(!CLoggingConfig::ParseLogLevel("verbose", level));
    BOOST_CHECK(level == LogLevel::LVL_ERROR);
}

BOOST_AUTO_TEST_CASE(log_file_path) {
    CLoggingConfig& config = CLoggingConfig::GetInstance();
    BOOST_CHECK_EQUAL(config.GetLogFilePath("/data/pv"), "/data/pv/debug.log");
    BOOST_CHECK_EQUAL(config.GetLogFilePath(""), "");
}

BOOST_AUTO_TEST_CASE(log_file_receives_filtered_lines) {
    std::string path = "test_polyvault_debug.log";
    std::remove(path.c_str());

    CLoggingConfig& config = CLoggingConfig::GetInstance();
    LogLevel saved = config.GetLogLevel();
    config.SetLogLevel(LogLevel::LVL_INFO);
    config.SetLogFile(path);
    BOOST_REQUIRE(CLogger::GetInstance().Initialize(""));

    LogPrintVault(INFO, "vault line %d", 7);
    LogPrintSession(DEBUG, "session detail");

    CLogger::GetInstance().Shutdown();
    config.SetLogFile("");
    config.SetLogLevel(saved);

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    BOOST_CHECK(contents.str().find("[INFO] [VAULT] vault line 7") != std::string::npos);
    BOOST_CHECK(contents.str().find("session detail") == std::string::npos);

    std::remove(path.c_str());
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 6: JSON field helpers
 */
BOOST_AUTO_TEST_SUITE(json_util_tests)

BOOST_AUTO_TEST_CASE(required_fields) {
    json obj = json::parse(R"({"name": "main", "version": 2, "addresses": {"ETH": "0xabc"}})");

    BOOST_CHECK_EQUAL(JSONUtil::GetRequiredString(obj, "name"), "main");
    BOOST_CHECK_EQUAL(JSONUtil::GetRequiredUInt32(obj, "version", 1, 2), 2u);
    BOOST_CHECK_EQUAL(JSONUtil::GetOptionalString(obj, "missing", "x"), "x");

    std::map<std::string, std::string> addresses = JSONUtil::GetStringMap(obj, "addresses", true);
    BOOST_CHECK_EQUAL(addresses.size(), 1u);
    BOOST_CHECK_EQUAL(addresses["ETH"], "0xabc");
    BOOST_CHECK(JSONUtil::GetStringMap(obj, "public_keys", false).empty());
}

BOOST_AUTO_TEST_CASE(field_errors_throw) {
    json obj = json::parse(R"({"name": 5, "version": 3, "addresses": {"ETH": 1}})");

    BOOST_CHECK_THROW(JSONUtil::GetRequiredString(obj, "name"), std::runtime_error);
    BOOST_CHECK_THROW(JSONUtil::GetRequiredString(obj, "id"), std::runtime_error);
    BOOST_CHECK_THROW(JSONUtil::GetRequiredUInt32(obj, "version", 1, 2), std::runtime_error);
    BOOST_CHECK_THROW(JSONUtil::GetStringMap(obj, "addresses", true), std::runtime_error);
    BOOST_CHECK_THROW(JSONUtil::GetStringMap(obj, "public_keys", true), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
