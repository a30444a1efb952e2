// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/vault.h>
#include <util/logging.h>
#include <util/strencodings.h>

// Decrypt refuses stored iteration counts beyond this to bound unlock time
static const uint32_t VAULT_MAX_ITERATIONS = 100000000;

CMnemonicVault::CMnemonicVault(unsigned int iterations)
    : nIterations(iterations < WALLET_CRYPTO_PBKDF2_ROUNDS ? WALLET_CRYPTO_PBKDF2_ROUNDS : iterations) {
    if (iterations < WALLET_CRYPTO_PBKDF2_ROUNDS) {
        LogPrintVault(WARN, "PBKDF2 rounds %u below minimum, using %u", iterations, nIterations);
    }
}

CMnemonicVault::CMnemonicVault(unsigned int iterations, UncheckedIterations)
    : nIterations(iterations == 0 ? 1 : iterations) {
}

CMnemonicVault CMnemonicVault::WeakForTesting(unsigned int iterations) {
    return CMnemonicVault(iterations, UncheckedIterations());
}

WalletError CMnemonicVault::Encrypt(const std::string& mnemonic, const std::string& password,
                                    CEncryptedMnemonic& out) const {
    if (mnemonic.empty() || password.empty()) {
        LogPrintVault(ERROR, "Encrypt: empty mnemonic or password");
        return WalletError::ENCRYPTION_FAILED;
    }

    std::vector<uint8_t> salt;
    std::vector<uint8_t> nonce;
    if (!GenerateSalt(salt) || !GenerateNonce(nonce)) {
        LogPrintVault(ERROR, "Encrypt: random number generator failed");
        return WalletError::ENCRYPTION_FAILED;
    }

    CKeyingMaterial key;
    if (!DeriveKey(password, salt, nIterations, key)) {
        LogPrintVault(ERROR, "Encrypt: key derivation failed");
        return WalletError::ENCRYPTION_FAILED;
    }

    CCrypter crypter;
    if (!crypter.SetKey(key, nonce)) {
        LogPrintVault(ERROR, "Encrypt: cipher setup failed");
        return WalletError::ENCRYPTION_FAILED;
    }
    key.Wipe();

    CKeyingMaterial plaintext(reinterpret_cast<const uint8_t*>(mnemonic.data()), mnemonic.size());
    std::vector<uint8_t> ciphertext;
    bool ok = crypter.Encrypt(plaintext, ciphertext);
    crypter.Clear();

    if (!ok || ciphertext.size() != mnemonic.size() + WALLET_CRYPTO_TAG_SIZE) {
        LogPrintVault(ERROR, "Encrypt: AES-256-GCM encryption failed");
        return WalletError::ENCRYPTION_FAILED;
    }

    CEncryptedMnemonic result;
    result.ciphertext = EncodeBase64(ciphertext);
    result.salt = EncodeBase64(salt);
    result.nonce = EncodeBase64(nonce);
    result.algorithm = VAULT_ALGORITHM_AES256GCM;
    result.iterations = nIterations;

    out = result;
    LogPrintVault(DEBUG, "Encrypted mnemonic (%u PBKDF2 rounds)", nIterations);
    return WalletError::OK;
}

WalletError CMnemonicVault::Decrypt(const CEncryptedMnemonic& encrypted, const std::string& password,
                                    CKeyingMaterial& mnemonic) const {
    // Every rejection below is reported identically
    if (encrypted.algorithm != VAULT_ALGORITHM_AES256GCM ||
        encrypted.iterations == 0 || encrypted.iterations > VAULT_MAX_ITERATIONS ||
        password.empty()) {
        LogPrintVault(DEBUG, "Decrypt: rejected record parameters");
        return WalletError::DECRYPTION_FAILED;
    }

    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> nonce;
    if (!DecodeBase64(encrypted.ciphertext, ciphertext) ||
        !DecodeBase64(encrypted.salt, salt) ||
        !DecodeBase64(encrypted.nonce, nonce) ||
        salt.size() != WALLET_CRYPTO_SALT_SIZE ||
        nonce.size() != WALLET_CRYPTO_NONCE_SIZE ||
        ciphertext.size() <= WALLET_CRYPTO_TAG_SIZE) {
        LogPrintVault(DEBUG, "Decrypt: malformed encoded fields");
        return WalletError::DECRYPTION_FAILED;
    }

    CKeyingMaterial key;
    if (!DeriveKey(password, salt, encrypted.iterations, key)) {
        return WalletError::DECRYPTION_FAILED;
    }

    CCrypter crypter;
    bool ok = crypter.SetKey(key, nonce);
    key.Wipe();

    CKeyingMaterial plaintext;
    if (ok) {
        ok = crypter.Decrypt(ciphertext, plaintext);
    }
    crypter.Clear();

    if (!ok) {
        LogPrintVault(DEBUG, "Decrypt: authentication failed");
        return WalletError::DECRYPTION_FAILED;
    }

    mnemonic = std::move(plaintext);
    return WalletError::OK;
}
