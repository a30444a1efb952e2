// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/mnemonic.h>
#include <wallet/bip39_wordlist.h>
#include <wallet/crypter.h>
#include <crypto/sha256.h>
#include <crypto/pbkdf2.h>
#include <util/strencodings.h>

#include <cstring>
#include <sstream>
#include <stdexcept>

// BIP39 word count mappings
static const size_t VALID_ENTROPY_BITS[] = {128, 160, 192, 224, 256};
static const size_t VALID_WORD_COUNTS[] = {12, 15, 18, 21, 24};
static const size_t NUM_VALID_LENGTHS = 5;

static bool IsValidEntropyBits(size_t entropy_bits) {
    for (size_t i = 0; i < NUM_VALID_LENGTHS; i++) {
        if (VALID_ENTROPY_BITS[i] == entropy_bits) {
            return true;
        }
    }
    return false;
}

static bool IsValidWordCount(size_t word_count) {
    for (size_t i = 0; i < NUM_VALID_LENGTHS; i++) {
        if (VALID_WORD_COUNTS[i] == word_count) {
            return true;
        }
    }
    return false;
}

// Read bit i (MSB-first) from a byte buffer
static inline unsigned GetBit(const uint8_t* buf, size_t i) {
    return (buf[i / 8] >> (7 - (i % 8))) & 1;
}

size_t CMnemonic::GetWordCount(size_t entropy_bits) {
    if (!IsValidEntropyBits(entropy_bits)) {
        return 0;
    }
    // entropy + entropy/32 checksum bits, 11 bits per word
    return (entropy_bits + entropy_bits / 32) / 11;
}

size_t CMnemonic::GetEntropyBits(size_t word_count) {
    if (!IsValidWordCount(word_count)) {
        return 0;
    }
    // entropy_bits * 33/32 = word_count * 11
    return (word_count * 11 * 32) / 33;
}

void CMnemonic::SplitWords(const std::string& mnemonic, std::vector<std::string>& words) {
    words.clear();
    std::istringstream iss(mnemonic);
    std::string word;
    while (iss >> word) {
        words.push_back(ToLower(word));
    }
}

std::string CMnemonic::Normalize(const std::string& mnemonic) {
    std::vector<std::string> words;
    SplitWords(mnemonic, words);

    std::string result;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) {
            result += ' ';
        }
        result += words[i];
        memory_cleanse(&words[i][0], words[i].size());
    }
    return result;
}

int CMnemonic::FindWordIndex(const std::string& word) {
    // Always 12 rounds (enough for 2048 entries) with no early exit, so
    // lookup time does not depend on the word's position in the list
    const int last = static_cast<int>(BIP39_WORDLIST_SIZE) - 1;
    int result = -1;
    int left = 0;
    int right = last;

    for (int iter = 0; iter < 12; iter++) {
        int mid = left + (right - left) / 2;
        mid = (mid < 0) ? 0 : ((mid > last) ? last : mid);
        int cmp = word.compare(BIP39_WORDLIST_ENGLISH[mid]);

        result = (cmp == 0) ? mid : result;
        left = (cmp > 0) ? (mid + 1) : left;
        right = (cmp < 0) ? (mid - 1) : right;
    }

    return result;
}

uint8_t CMnemonic::ComputeChecksum(const uint8_t* entropy, size_t entropy_len,
                                    size_t checksum_bits) {
    uint8_t hash[32];
    SHA256(entropy, entropy_len, hash);

    // checksum_bits <= 8, so it always fits in the first hash byte
    uint8_t checksum = static_cast<uint8_t>(hash[0] >> (8 - checksum_bits));
    memory_cleanse(hash, sizeof(hash));
    return checksum;
}

bool CMnemonic::Generate(size_t entropy_bits, std::string& mnemonic) {
    if (!IsValidEntropyBits(entropy_bits)) {
        return false;
    }

    CKeyingMaterial entropy(entropy_bits / 8);
    if (!GetStrongRandBytes(entropy.data_ptr(), entropy.size())) {
        return false;
    }

    return FromEntropy(entropy.data_ptr(), entropy.size(), mnemonic);
}

bool CMnemonic::FromEntropy(const uint8_t* entropy, size_t entropy_len, std::string& mnemonic) {
    if (entropy == nullptr) {
        return false;
    }

    size_t entropy_bits = entropy_len * 8;
    if (!IsValidEntropyBits(entropy_bits)) {
        return false;
    }

    size_t checksum_bits = entropy_bits / 32;
    uint8_t checksum = ComputeChecksum(entropy, entropy_len, checksum_bits);

    // entropy || checksum, with the checksum left-aligned in one extra byte
    CKeyingMaterial buf(entropy_len + 1);
    std::memcpy(buf.data_ptr(), entropy, entropy_len);
    buf.data_ptr()[entropy_len] = static_cast<uint8_t>(checksum << (8 - checksum_bits));

    size_t word_count = (entropy_bits + checksum_bits) / 11;
    std::string result;

    for (size_t i = 0; i < word_count; i++) {
        uint16_t index = 0;
        for (size_t j = 0; j < 11; j++) {
            index = static_cast<uint16_t>((index << 1) | GetBit(buf.data_ptr(), i * 11 + j));
        }
        if (i > 0) {
            result += ' ';
        }
        result += BIP39_WORDLIST_ENGLISH[index];
    }

    mnemonic.swap(result);
    memory_cleanse(&result[0], result.size());
    return true;
}

bool CMnemonic::DecodeWords(const std::vector<std::string>& words, std::vector<uint8_t>& entropy) {
    if (!IsValidWordCount(words.size())) {
        return false;
    }

    size_t total_bits = words.size() * 11;
    size_t entropy_bits = GetEntropyBits(words.size());
    size_t checksum_bits = total_bits - entropy_bits;

    // Pack the 11-bit indices MSB-first; the final byte holds the checksum
    std::vector<uint8_t> bits((total_bits + 7) / 8, 0);
    for (size_t i = 0; i < words.size(); i++) {
        int index = FindWordIndex(words[i]);
        if (index < 0) {
            memory_cleanse(bits.data(), bits.size());
            return false;
        }
        for (size_t j = 0; j < 11; j++) {
            if ((index >> (10 - j)) & 1) {
                size_t pos = i * 11 + j;
                bits[pos / 8] |= static_cast<uint8_t>(1 << (7 - (pos % 8)));
            }
        }
    }

    size_t entropy_bytes = entropy_bits / 8;
    uint8_t checksum_expected = static_cast<uint8_t>(bits[entropy_bytes] >> (8 - checksum_bits));
    uint8_t checksum_actual = ComputeChecksum(bits.data(), entropy_bytes, checksum_bits);

    bool ok = (checksum_expected == checksum_actual);
    if (ok) {
        entropy.assign(bits.begin(), bits.begin() + entropy_bytes);
    }

    memory_cleanse(bits.data(), bits.size());
    return ok;
}

bool CMnemonic::Validate(const std::string& mnemonic) {
    std::vector<std::string> words;
    SplitWords(mnemonic, words);

    std::vector<uint8_t> entropy;
    bool ok = DecodeWords(words, entropy);

    memory_cleanse(entropy.data(), entropy.size());
    for (auto& word : words) {
        memory_cleanse(&word[0], word.size());
    }
    return ok;
}

bool CMnemonic::ToEntropy(const std::string& mnemonic, std::vector<uint8_t>& entropy) {
    entropy.clear();

    std::vector<std::string> words;
    SplitWords(mnemonic, words);

    bool ok = DecodeWords(words, entropy);
    for (auto& word : words) {
        memory_cleanse(&word[0], word.size());
    }
    return ok;
}

bool CMnemonic::ToSeed(const std::string& mnemonic, const std::string& passphrase,
                       CKeyingMaterial& seed) {
    if (!Validate(mnemonic)) {
        return false;
    }

    std::string normalized = Normalize(mnemonic);
    CKeyingMaterial out(64);

    bool ok = true;
    try {
        BIP39_MnemonicToSeed(normalized, passphrase, out.data_ptr());
    } catch (const std::exception&) {
        ok = false;
    }

    memory_cleanse(&normalized[0], normalized.size());
    if (!ok) {
        return false;
    }

    seed = std::move(out);
    return true;
}
