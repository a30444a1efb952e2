// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_BIP39_WORDLIST_H
#define POLYVAULT_WALLET_BIP39_WORDLIST_H

#include <stddef.h>

static const size_t BIP39_WORDLIST_SIZE = 2048;

/**
 * BIP39 English wordlist (bitcoin/bips bip-0039/english.txt)
 *
 * Sorted ascending; CMnemonic relies on this for its binary search.
 */
extern const char* const BIP39_WORDLIST_ENGLISH[BIP39_WORDLIST_SIZE];

#endif // POLYVAULT_WALLET_BIP39_WORDLIST_H
