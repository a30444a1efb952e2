// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/wallet_errors.h>

std::string GetWalletErrorMessage(WalletError error) {
    switch (error) {
        case WalletError::OK:
            return "Success";
        case WalletError::INVALID_MNEMONIC:
            return "Invalid recovery phrase. Check the words and their order.";
        case WalletError::ENCRYPTION_FAILED:
            return "Failed to encrypt the wallet.";
        case WalletError::DECRYPTION_FAILED:
            return "Unable to unlock wallet: incorrect password or damaged wallet data.";
        case WalletError::WALLET_LOCKED:
            return "Wallet is locked. Unlock it to continue.";
        case WalletError::WALLET_NOT_FOUND:
            return "Wallet not found.";
        case WalletError::UNSUPPORTED_CHAIN:
            return "This blockchain is not supported for signing.";
        case WalletError::STORAGE_FAILURE:
            return "Failed to read or write wallet storage.";
        case WalletError::INVALID_ARGUMENT:
            return "Invalid request parameters.";
        case WalletError::WEAK_PASSWORD:
            return "Password does not meet the minimum requirements.";
        case WalletError::SESSION_ACTIVE:
            return "Another wallet is unlocked. Lock it first.";
    }
    return "Unknown error";
}

const char* WalletErrorName(WalletError error) {
    switch (error) {
        case WalletError::OK: return "OK";
        case WalletError::INVALID_MNEMONIC: return "INVALID_MNEMONIC";
        case WalletError::ENCRYPTION_FAILED: return "ENCRYPTION_FAILED";
        case WalletError::DECRYPTION_FAILED: return "DECRYPTION_FAILED";
        case WalletError::WALLET_LOCKED: return "WALLET_LOCKED";
        case WalletError::WALLET_NOT_FOUND: return "WALLET_NOT_FOUND";
        case WalletError::UNSUPPORTED_CHAIN: return "UNSUPPORTED_CHAIN";
        case WalletError::STORAGE_FAILURE: return "STORAGE_FAILURE";
        case WalletError::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case WalletError::WEAK_PASSWORD: return "WEAK_PASSWORD";
        case WalletError::SESSION_ACTIVE: return "SESSION_ACTIVE";
    }
    return "UNKNOWN";
}
