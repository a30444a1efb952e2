// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_MNEMONIC_H
#define POLYVAULT_WALLET_MNEMONIC_H

#include <stdint.h>
#include <string>
#include <vector>

class CKeyingMaterial;

/**
 * BIP39 Mnemonic Phrase Implementation
 *
 * BIP39 defines a method for converting entropy into a mnemonic phrase
 * (sequence of words from a predefined wordlist) and deriving a seed
 * from that phrase using PBKDF2.
 *
 * Word counts and entropy:
 *   12 words = 128 bits entropy + 4 bits checksum = 132 bits
 *   15 words = 160 bits entropy + 5 bits checksum = 165 bits
 *   18 words = 192 bits entropy + 6 bits checksum = 198 bits
 *   21 words = 224 bits entropy + 7 bits checksum = 231 bits
 *   24 words = 256 bits entropy + 8 bits checksum = 264 bits
 *
 * Checksum: First (entropy_bits / 32) bits of SHA256(entropy)
 * Each word represents 11 bits (2048 = 2^11 words in wordlist)
 */
class CMnemonic {
public:
    // Wallets are always created with 24 words
    static const size_t DEFAULT_ENTROPY_BITS = 256;

    /**
     * Generate a new mnemonic phrase from random entropy
     *
     * @param entropy_bits Number of entropy bits (must be 128, 160, 192, 224, or 256)
     * @param mnemonic Output string with space-separated words
     * @return true on success, false on failure
     */
    static bool Generate(size_t entropy_bits, std::string& mnemonic);

    /**
     * Generate a new mnemonic phrase from provided entropy
     *
     * @param entropy Entropy bytes (length must be 16, 20, 24, 28, or 32 bytes)
     * @param entropy_len Length of entropy in bytes
     * @param mnemonic Output string with space-separated words
     * @return true on success, false on failure
     */
    static bool FromEntropy(const uint8_t* entropy, size_t entropy_len, std::string& mnemonic);

    /**
     * Validate a mnemonic phrase
     *
     * Checks:
     * - Word count is valid (12, 15, 18, 21, or 24)
     * - All words are in the BIP39 wordlist
     * - Checksum is correct
     *
     * @param mnemonic Space-separated mnemonic words
     * @return true if valid, false otherwise
     */
    static bool Validate(const std::string& mnemonic);

    /**
     * Canonical form of a phrase: lowercase words joined by single spaces
     *
     * User input with stray whitespace or capitals yields the same seed
     * (and so the same wallet) as the canonical phrase.
     */
    static std::string Normalize(const std::string& mnemonic);

    /**
     * Convert mnemonic phrase to entropy
     *
     * @param mnemonic Space-separated mnemonic words
     * @param entropy Output buffer for entropy bytes
     * @return true on success, false if mnemonic is invalid
     */
    static bool ToEntropy(const std::string& mnemonic, std::vector<uint8_t>& entropy);

    /**
     * Convert mnemonic phrase to 64-byte seed
     *
     * PBKDF2-HMAC-SHA512 over the normalized phrase with salt
     * "mnemonic" + passphrase and 2048 iterations.
     *
     * @param mnemonic Space-separated mnemonic words
     * @param passphrase Optional passphrase (empty string if none)
     * @param seed Output 64-byte seed (secure buffer)
     * @return true on success, false if mnemonic is invalid
     */
    static bool ToSeed(const std::string& mnemonic, const std::string& passphrase,
                       CKeyingMaterial& seed);

    /**
     * Get the expected word count for a given entropy size
     *
     * @param entropy_bits Entropy size in bits
     * @return Expected word count, or 0 if entropy_bits is invalid
     */
    static size_t GetWordCount(size_t entropy_bits);

    /**
     * Get the expected entropy size for a given word count
     *
     * @param word_count Number of words in mnemonic
     * @return Expected entropy size in bits, or 0 if word_count is invalid
     */
    static size_t GetEntropyBits(size_t word_count);

private:
    static void SplitWords(const std::string& mnemonic, std::vector<std::string>& words);

    /**
     * Find word index in BIP39 wordlist (fixed 11-step binary search)
     *
     * @return Index (0-2047) if found, -1 if not found
     */
    static int FindWordIndex(const std::string& word);

    /**
     * Compute checksum for entropy
     *
     * @return First checksum_bits bits of SHA256(entropy), right-aligned
     */
    static uint8_t ComputeChecksum(const uint8_t* entropy, size_t entropy_len,
                                    size_t checksum_bits);

    /**
     * Decode words into entropy and compare the embedded checksum
     *
     * @return false on bad word count, unknown word, or checksum mismatch
     */
    static bool DecodeWords(const std::vector<std::string>& words, std::vector<uint8_t>& entropy);
};

#endif // POLYVAULT_WALLET_MNEMONIC_H
