// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_PASSPHRASE_VALIDATOR_H
#define POLYVAULT_WALLET_PASSPHRASE_VALIDATOR_H

#include <stddef.h>
#include <string>
#include <vector>

/**
 * Passphrase validation result
 */
struct PassphraseValidationResult {
    bool is_valid;
    int strength_score;  // 0-100
    std::string error_message;
    std::vector<std::string> warnings;

    PassphraseValidationResult()
        : is_valid(false), strength_score(0) {}
};

/**
 * Passphrase Validator
 *
 * Policy applied to wallet passwords at create, recover and
 * change-password time:
 * - At least min_length characters (default 12, set by minpasswordlength)
 * - At least three of: uppercase, lowercase, digit, special character
 * - Not a common password, and no common password of 6+ characters inside it
 * - Strength score of at least 50
 *
 * Usage:
 *   PassphraseValidator validator(options.min_password_length);
 *   auto result = validator.Validate(password);
 *   if (!result.is_valid) {
 *       error = result.error_message;
 *   }
 */
class PassphraseValidator {
private:
    size_t nMinLength;

    static const size_t RECOMMENDED_LENGTH = 20;
    static const int MIN_ACCEPTABLE_SCORE = 50;
    static const int REQUIRED_CHAR_CLASSES = 3;

    static const std::vector<std::string> COMMON_PASSWORDS;

    bool HasUppercase(const std::string& passphrase) const;
    bool HasLowercase(const std::string& passphrase) const;
    bool HasDigit(const std::string& passphrase) const;
    bool HasSpecialChar(const std::string& passphrase) const;

    bool IsCommonPassword(const std::string& passphrase) const;

    /**
     * Check for 3+ repeating characters (e.g., "aaa", "111")
     */
    bool HasRepeatingChars(const std::string& passphrase) const;

    /**
     * Check for 3+ sequential characters (e.g., "abc", "321")
     */
    bool HasSequentialChars(const std::string& passphrase) const;

    int CalculateDiversityScore(const std::string& passphrase) const;   // 0-25
    int CalculateLengthScore(const std::string& passphrase) const;      // 0-25
    int CalculateComplexityScore(const std::string& passphrase) const;  // 0-30
    int CalculateEntropyScore(const std::string& passphrase) const;     // 0-20

public:
    static constexpr size_t DEFAULT_MIN_LENGTH = 12;

    explicit PassphraseValidator(size_t min_length = DEFAULT_MIN_LENGTH);

    /**
     * Validate a passphrase against all requirements
     *
     * @param passphrase The passphrase to validate
     * @return Validation result with score and error/warning messages
     */
    PassphraseValidationResult Validate(const std::string& passphrase) const;

    size_t GetMinLength() const { return nMinLength; }

    /**
     * Human-readable strength ("Weak" .. "Very Strong")
     */
    static std::string GetStrengthDescription(int score);
};

#endif // POLYVAULT_WALLET_PASSPHRASE_VALIDATOR_H
