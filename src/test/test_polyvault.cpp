// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

/**
 * Main test entry point for the Polyvault test suite
 *
 * This file initializes the Boost Unit Test Framework for all Polyvault tests.
 * Following Bitcoin Core's testing approach.
 */

#define BOOST_TEST_MODULE Polyvault Test Suite
#include <boost/test/included/unit_test.hpp>

#include <util/logging.h>

#include <iostream>

/**
 * Global test suite setup
 */
struct PolyvaultTestSetup {
    PolyvaultTestSetup() {
        std::cout << "Polyvault Test Suite Starting..." << std::endl;
        std::cout << "Using Boost.Test version "
                  << BOOST_VERSION / 100000 << "."
                  << BOOST_VERSION / 100 % 1000 << "."
                  << BOOST_VERSION % 100 << std::endl;

        // Keep wallet/session chatter out of the test report
        CLoggingConfig::GetInstance().SetConsoleLogging(false);
    }

    ~PolyvaultTestSetup() {
        std::cout << "Polyvault Test Suite Complete" << std::endl;
    }
};

BOOST_GLOBAL_FIXTURE(PolyvaultTestSetup);

/**
 * Basic sanity check test
 */
BOOST_AUTO_TEST_SUITE(sanity_tests)

BOOST_AUTO_TEST_CASE(basic_sanity) {
    BOOST_CHECK_EQUAL(1 + 1, 2);
    BOOST_CHECK(true);
}

BOOST_AUTO_TEST_SUITE_END()
