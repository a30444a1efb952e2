// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/passphrase_validator.h>
#include <util/strencodings.h>

#include <openssl/crypto.h>

#include <algorithm>
#include <cctype>
#include <cmath>

const std::vector<std::string> PassphraseValidator::COMMON_PASSWORDS = {
    "password", "123456", "123456789", "12345678", "12345", "1234567",
    "password1", "123123", "1234567890", "000000", "abc123", "qwerty",
    "iloveyou", "welcome", "monkey", "dragon", "master", "sunshine",
    "princess", "football", "baseball", "shadow", "michael", "trustno1",
    "letmein", "qwerty123", "admin", "welcome123", "passw0rd",
    "password123", "123qwe", "zxcvbnm", "p@ssw0rd", "pass@word1",
    "superman", "starwars", "whatever", "computer", "internet",
    "test123", "default", "admin123", "123321", "654321", "qwertyuiop",
    "password1!", "changeme", "welcome1", "letmein123", "freedom", "qazwsx",
    "mustang", "hunter2", "bitcoin", "ethereum", "satoshi", "metamask",
    "wallet123", "mnemonic", "crypto123", "blockchain", "tothemoon",
};

PassphraseValidator::PassphraseValidator(size_t min_length)
    : nMinLength(min_length == 0 ? DEFAULT_MIN_LENGTH : min_length) {
}

bool PassphraseValidator::HasUppercase(const std::string& passphrase) const {
    return std::any_of(passphrase.begin(), passphrase.end(),
                       [](char c) { return std::isupper(static_cast<unsigned char>(c)); });
}

bool PassphraseValidator::HasLowercase(const std::string& passphrase) const {
    return std::any_of(passphrase.begin(), passphrase.end(),
                       [](char c) { return std::islower(static_cast<unsigned char>(c)); });
}

bool PassphraseValidator::HasDigit(const std::string& passphrase) const {
    return std::any_of(passphrase.begin(), passphrase.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

bool PassphraseValidator::HasSpecialChar(const std::string& passphrase) const {
    return std::any_of(passphrase.begin(), passphrase.end(),
                       [](char c) {
                           unsigned char uc = static_cast<unsigned char>(c);
                           return !std::isalnum(uc) && !std::isspace(uc);
                       });
}

bool PassphraseValidator::IsCommonPassword(const std::string& passphrase) const {
    std::string lower = ToLower(passphrase);

    for (const auto& common : COMMON_PASSWORDS) {
        if (lower.length() == common.length() &&
            CRYPTO_memcmp(lower.data(), common.data(), common.length()) == 0) {
            return true;
        }
    }

    for (const auto& common : COMMON_PASSWORDS) {
        if (common.length() >= 6 && lower.find(common) != std::string::npos) {
            return true;
        }
    }

    return false;
}

bool PassphraseValidator::HasRepeatingChars(const std::string& passphrase) const {
    for (size_t i = 0; i + 2 < passphrase.length(); ++i) {
        if (passphrase[i] == passphrase[i + 1] && passphrase[i] == passphrase[i + 2]) {
            return true;
        }
    }
    return false;
}

bool PassphraseValidator::HasSequentialChars(const std::string& passphrase) const {
    for (size_t i = 0; i + 2 < passphrase.length(); ++i) {
        int c1 = static_cast<unsigned char>(passphrase[i]);
        int c2 = static_cast<unsigned char>(passphrase[i + 1]);
        int c3 = static_cast<unsigned char>(passphrase[i + 2]);

        if ((c2 == c1 + 1 && c3 == c2 + 1) || (c2 == c1 - 1 && c3 == c2 - 1)) {
            return true;
        }
    }
    return false;
}

int PassphraseValidator::CalculateDiversityScore(const std::string& passphrase) const {
    int score = 0;
    if (HasUppercase(passphrase)) score += 6;
    if (HasLowercase(passphrase)) score += 6;
    if (HasDigit(passphrase)) score += 6;
    if (HasSpecialChar(passphrase)) score += 7;
    return std::min(score, 25);
}

int PassphraseValidator::CalculateLengthScore(const std::string& passphrase) const {
    size_t len = passphrase.length();
    if (len < nMinLength) {
        return 0;
    }
    if (len >= RECOMMENDED_LENGTH || nMinLength >= RECOMMENDED_LENGTH) {
        return 25;
    }
    // 10 points at the minimum, rising to 25 at the recommended length
    return 10 + static_cast<int>(((len - nMinLength) * 15) / (RECOMMENDED_LENGTH - nMinLength));
}

int PassphraseValidator::CalculateComplexityScore(const std::string& passphrase) const {
    int score = 30;

    if (HasRepeatingChars(passphrase)) {
        score -= 10;
    }
    if (HasSequentialChars(passphrase)) {
        score -= 10;
    }

    std::string lower = ToLower(passphrase);
    const std::vector<std::string> patterns = {
        "qwerty", "asdfgh", "zxcvbn", "12345", "qazwsx"
    };
    for (const auto& pattern : patterns) {
        if (lower.find(pattern) != std::string::npos) {
            score -= 5;
            break;
        }
    }

    return std::max(0, score);
}

int PassphraseValidator::CalculateEntropyScore(const std::string& passphrase) const {
    size_t charset_size = 0;
    if (HasLowercase(passphrase)) charset_size += 26;
    if (HasUppercase(passphrase)) charset_size += 26;
    if (HasDigit(passphrase)) charset_size += 10;
    if (HasSpecialChar(passphrase)) charset_size += 32;

    if (charset_size == 0) {
        return 0;
    }

    // length * log2(charset), 80 bits earns full marks
    double entropy = passphrase.length() * std::log2(static_cast<double>(charset_size));
    int score = static_cast<int>((entropy / 80.0) * 20.0);
    return std::min(score, 20);
}

PassphraseValidationResult PassphraseValidator::Validate(const std::string& passphrase) const {
    PassphraseValidationResult result;

    if (passphrase.length() < nMinLength) {
        result.error_message = "Password must be at least " +
                               std::to_string(nMinLength) + " characters long";
        return result;
    }

    bool has_upper = HasUppercase(passphrase);
    bool has_lower = HasLowercase(passphrase);
    bool has_digit = HasDigit(passphrase);
    bool has_special = HasSpecialChar(passphrase);
    int classes = (has_upper ? 1 : 0) + (has_lower ? 1 : 0) + (has_digit ? 1 : 0) + (has_special ? 1 : 0);

    if (classes < REQUIRED_CHAR_CLASSES) {
        result.error_message = "Password must mix at least three of: uppercase letters, "
                               "lowercase letters, digits, special characters";
        return result;
    }

    if (IsCommonPassword(passphrase)) {
        result.error_message = "This password is too common and easily guessable";
        return result;
    }

    result.strength_score = CalculateDiversityScore(passphrase) +
                            CalculateLengthScore(passphrase) +
                            CalculateComplexityScore(passphrase) +
                            CalculateEntropyScore(passphrase);

    if (result.strength_score < MIN_ACCEPTABLE_SCORE) {
        result.error_message = "Password is too weak (strength score: " +
                               std::to_string(result.strength_score) + "/100)";
        return result;
    }

    result.is_valid = true;

    if (HasRepeatingChars(passphrase)) {
        result.warnings.push_back("Contains repeating characters (reduces strength)");
    }
    if (HasSequentialChars(passphrase)) {
        result.warnings.push_back("Contains sequential characters (reduces strength)");
    }
    if (passphrase.length() < RECOMMENDED_LENGTH) {
        result.warnings.push_back("Consider using " + std::to_string(RECOMMENDED_LENGTH) +
                                  "+ characters");
    }

    return result;
}

std::string PassphraseValidator::GetStrengthDescription(int score) {
    if (score < 40) {
        return "Weak";
    } else if (score < 60) {
        return "Moderate";
    } else if (score < 80) {
        return "Strong";
    }
    return "Very Strong";
}
