// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

/**
 * Key Deriver Tests
 *
 * Per-chain key and address derivation from a BIP-39 seed, and address
 * format validation.
 */

#include <boost/test/unit_test.hpp>

#include <crypto/sha256.h>
#include <wallet/address.h>
#include <wallet/crypter.h>
#include <wallet/key_deriver.h>
#include <wallet/mnemonic.h>
#include <util/base58.h>
#include <util/strencodings.h>

#include <string>
#include <vector>

namespace {

const std::string ABANDON_ABOUT =
    "abandon abandon abandon abandon abandon abandon "
    "abandon abandon abandon abandon abandon about";

struct SeedSetup {
    CKeyingMaterial seed;

    SeedSetup() {
        BOOST_REQUIRE(CMnemonic::ToSeed(ABANDON_ABOUT, "", seed));
    }
};

} // namespace

BOOST_AUTO_TEST_SUITE(key_deriver_tests)

/**
 * Test Suite 1: Known addresses for the "abandon ... about" phrase
 */
BOOST_FIXTURE_TEST_SUITE(known_address_tests, SeedSetup)

BOOST_AUTO_TEST_CASE(eth_address) {
    CChainAccount account;
    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::ETH, 0, account) == WalletError::OK);
    BOOST_CHECK_EQUAL(ToLower(account.address), ToLower("0x9858EfFD232B4033E47d90003D41EC34EcaEda94"));
    BOOST_CHECK_EQUAL(account.address, "0x9858EfFD232B4033E47d90003D41EC34EcaEda94");
    BOOST_CHECK_EQUAL(account.path, "m/44'/60'/0'/0/0");

    // Uncompressed SEC1 key
    BOOST_CHECK_EQUAL(account.public_key.size(), 130u);
    BOOST_CHECK_EQUAL(account.public_key.substr(0, 2), "04");
}

BOOST_AUTO_TEST_CASE(evm_chains_share_one_address) {
    CChainAccount eth, bsc, polygon;
    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::ETH, 0, eth) == WalletError::OK);
    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::BSC, 0, bsc) == WalletError::OK);
    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::POLYGON, 0, polygon) == WalletError::OK);

    BOOST_CHECK_EQUAL(eth.address, bsc.address);
    BOOST_CHECK_EQUAL(eth.address, polygon.address);
    BOOST_CHECK_EQUAL(eth.public_key, polygon.public_key);
}

BOOST_AUTO_TEST_CASE(btc_address) {
    CChainAccount account;
    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::BTC, 0, account) == WalletError::OK);
    BOOST_CHECK_EQUAL(account.address, "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
    BOOST_CHECK_EQUAL(account.path, "m/84'/0'/0'/0/0");

    // Compressed SEC1 key
    BOOST_CHECK_EQUAL(account.public_key.size(), 66u);
    BOOST_CHECK(account.public_key.substr(0, 2) == "02" || account.public_key.substr(0, 2) == "03");
}

BOOST_AUTO_TEST_CASE(sol_address) {
    CChainAccount account;
    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::SOL, 0, account) == WalletError::OK);
    BOOST_CHECK_EQUAL(account.path, "m/44'/501'/0'/0'");
    BOOST_CHECK_EQUAL(account.public_key.size(), 64u);

    // Address is the Base58 public key
    std::vector<uint8_t> decoded;
    BOOST_REQUIRE(DecodeBase58(account.address, decoded));
    BOOST_CHECK_EQUAL(HexStr(decoded), account.public_key);
}

BOOST_AUTO_TEST_CASE(ton_address) {
    CChainAccount account;
    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::TON, 0, account) == WalletError::OK);
    BOOST_CHECK_EQUAL(account.path, "m/44'/607'/0'/0'/0'/0'");

    std::vector<uint8_t> pub = ParseHex(account.public_key);
    BOOST_REQUIRE_EQUAL(pub.size(), 32u);
    BOOST_CHECK_EQUAL(account.address, "0:" + HexStr(SHA256(pub)));
}

BOOST_AUTO_TEST_CASE(derivation_is_deterministic) {
    CKeyingMaterial seed2;
    BOOST_REQUIRE(CMnemonic::ToSeed(ABANDON_ABOUT, "", seed2));

    for (Chain chain : AllChains()) {
        CChainAccount a, b;
        BOOST_REQUIRE(DeriveChainAccount(seed, chain, 0, a) == WalletError::OK);
        BOOST_REQUIRE(DeriveChainAccount(seed2, chain, 0, b) == WalletError::OK);
        BOOST_CHECK_EQUAL(a.address, b.address);
        BOOST_CHECK_EQUAL(a.public_key, b.public_key);
    }
}

BOOST_AUTO_TEST_CASE(account_index_changes_keys) {
    CChainAccount first, second;
    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::ETH, 0, first) == WalletError::OK);
    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::ETH, 1, second) == WalletError::OK);
    BOOST_CHECK(first.address != second.address);
    BOOST_CHECK_EQUAL(second.path, "m/44'/60'/1'/0/0");

    BOOST_REQUIRE(DeriveChainAccount(seed, Chain::SOL, 1, second) == WalletError::OK);
    BOOST_CHECK_EQUAL(second.path, "m/44'/501'/1'/0'");
}

BOOST_AUTO_TEST_CASE(three_step_interface) {
    const CKeyDeriver& deriver = GetKeyDeriver(Chain::BTC);
    BOOST_CHECK(deriver.GetCurve() == HDCurve::SECP256K1);

    CKeyingMaterial private_key;
    BOOST_REQUIRE(deriver.DerivePrivateKey(seed, Chain::BTC, 0, private_key) == WalletError::OK);
    BOOST_CHECK_EQUAL(private_key.size(), 32u);

    std::vector<uint8_t> public_key;
    BOOST_REQUIRE(deriver.DerivePublicKey(private_key, Chain::BTC, public_key) == WalletError::OK);

    std::string address;
    BOOST_REQUIRE(deriver.DeriveAddress(public_key, Chain::BTC, address) == WalletError::OK);
    BOOST_CHECK_EQUAL(address, "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
}

BOOST_AUTO_TEST_CASE(curve_mismatch_is_unsupported) {
    const CKeyDeriver& secp = GetKeyDeriver(Chain::ETH);
    const CKeyDeriver& ed = GetKeyDeriver(Chain::SOL);
    BOOST_CHECK(ed.GetCurve() == HDCurve::ED25519);

    CKeyingMaterial private_key;
    BOOST_CHECK(secp.DerivePrivateKey(seed, Chain::SOL, 0, private_key) == WalletError::UNSUPPORTED_CHAIN);
    BOOST_CHECK(ed.DerivePrivateKey(seed, Chain::BTC, 0, private_key) == WalletError::UNSUPPORTED_CHAIN);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 2: Address validation
 */
BOOST_AUTO_TEST_SUITE(address_tests)

BOOST_AUTO_TEST_CASE(eip55_checksum) {
    std::vector<uint8_t> raw = ParseHex("5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
    BOOST_CHECK_EQUAL(EncodeEvmAddress(raw), "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");

    std::vector<uint8_t> decoded;
    std::string error;
    BOOST_CHECK(DecodeEvmAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed", decoded, error));
    BOOST_CHECK(decoded == raw);

    // Single-case forms carry no checksum
    BOOST_CHECK(DecodeEvmAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed", decoded, error));
    BOOST_CHECK(DecodeEvmAddress("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED", decoded, error));

    // One letter's case flipped
    BOOST_CHECK(!DecodeEvmAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeD", decoded, error));
    BOOST_CHECK(!error.empty());
}

BOOST_AUTO_TEST_CASE(evm_format_errors) {
    std::string error;
    BOOST_CHECK(!ValidateAddress(Chain::ETH, "5aaeb6053f3e94c9b9a09f33669435e7ef1beaed", error));
    BOOST_CHECK(!ValidateAddress(Chain::ETH, "0x5aaeb6053f3e94c9b9a09f33669435e7ef1bea", error));
    BOOST_CHECK(!ValidateAddress(Chain::BSC, "0xzzaeb6053f3e94c9b9a09f33669435e7ef1beaed", error));
    BOOST_CHECK(ValidateAddress(Chain::POLYGON, "0x9858EfFD232B4033E47d90003D41EC34EcaEda94", error));
}

BOOST_AUTO_TEST_CASE(bitcoin_addresses) {
    std::string error;
    BOOST_CHECK(ValidateAddress(Chain::BTC, "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu", error));
    BOOST_CHECK(ValidateAddress(Chain::BTC, "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", error));
    BOOST_CHECK(!ValidateAddress(Chain::BTC, "tb1qw508d6qejxtdg4y5r3zarvary0c5xw7kxpjzsx", error));
    BOOST_CHECK(!ValidateAddress(Chain::BTC, "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t5", error));
    BOOST_CHECK(!ValidateAddress(Chain::BTC, "1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN2", error));
}

BOOST_AUTO_TEST_CASE(solana_and_ton_addresses) {
    std::string error;
    BOOST_CHECK(ValidateAddress(Chain::SOL, "11111111111111111111111111111111", error));
    BOOST_CHECK(!ValidateAddress(Chain::SOL, "1111", error));
    BOOST_CHECK(!ValidateAddress(Chain::SOL, "0OIl0OIl0OIl0OIl0OIl0OIl0OIl0OIl", error));

    std::string ton = "0:" + std::string(64, 'a');
    BOOST_CHECK(ValidateAddress(Chain::TON, ton, error));
    BOOST_CHECK(!ValidateAddress(Chain::TON, "0:abc", error));
    BOOST_CHECK(!ValidateAddress(Chain::TON, "-1:" + std::string(64, 'a'), error));
    BOOST_CHECK(!ValidateAddress(Chain::TON, "0:" + std::string(64, 'g'), error));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
