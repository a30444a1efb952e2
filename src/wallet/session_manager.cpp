// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/session_manager.h>
#include <util/logging.h>

#include <chrono>
#include <stdexcept>

int64_t CSystemClock::Now() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

CSessionManager::CSessionManager(std::shared_ptr<CSessionClock> clock_in, int64_t timeout_seconds)
    : clock(std::move(clock_in)), nTimeout(timeout_seconds) {
    if (!clock) {
        throw std::invalid_argument("CSessionManager: clock is null");
    }
    if (nTimeout <= 0) {
        throw std::invalid_argument("CSessionManager: timeout must be positive");
    }
}

CSessionManager::~CSessionManager() {
    std::lock_guard<std::mutex> lock(cs_session);
    LockUnlocked();
}

void CSessionManager::LockUnlocked() {
    if (session) {
        session->master_key.Wipe();
        session.reset();
    }
}

bool CSessionManager::ExpireIfNeededUnlocked() {
    if (!session) {
        return false;
    }
    if (clock->Now() >= session->expires_at) {
        LogPrintSession(INFO, "Session for wallet %s expired", session->wallet_id.c_str());
        LockUnlocked();
        return false;
    }
    return true;
}

void CSessionManager::Start(const std::string& wallet_id, CKeyingMaterial&& master_key) {
    // Build the replacement before touching the current session
    std::unique_ptr<CSessionKey> fresh(new CSessionKey());
    fresh->wallet_id = wallet_id;
    fresh->master_key = std::move(master_key);

    std::lock_guard<std::mutex> lock(cs_session);
    int64_t now = clock->Now();
    fresh->unlocked_at = now;
    fresh->expires_at = now + nTimeout;

    LockUnlocked();
    session = std::move(fresh);
    LogPrintSession(INFO, "Session started for wallet %s (timeout %lld s)",
                    wallet_id.c_str(), static_cast<long long>(nTimeout));
}

bool CSessionManager::IsUnlocked() {
    std::lock_guard<std::mutex> lock(cs_session);
    return ExpireIfNeededUnlocked();
}

bool CSessionManager::IsUnlockedFor(const std::string& wallet_id) {
    std::lock_guard<std::mutex> lock(cs_session);
    return ExpireIfNeededUnlocked() && session->wallet_id == wallet_id;
}

bool CSessionManager::Refresh() {
    std::lock_guard<std::mutex> lock(cs_session);
    if (!ExpireIfNeededUnlocked()) {
        return false;
    }
    session->expires_at = clock->Now() + nTimeout;
    return true;
}

void CSessionManager::Lock() {
    std::lock_guard<std::mutex> lock(cs_session);
    if (session) {
        LogPrintSession(INFO, "Session for wallet %s locked", session->wallet_id.c_str());
    }
    LockUnlocked();
}

void CSessionManager::LockWallet(const std::string& wallet_id) {
    std::lock_guard<std::mutex> lock(cs_session);
    if (session && session->wallet_id == wallet_id) {
        LogPrintSession(INFO, "Session for wallet %s locked", wallet_id.c_str());
        LockUnlocked();
    }
}

std::string CSessionManager::GetActiveWalletId() {
    std::lock_guard<std::mutex> lock(cs_session);
    if (!ExpireIfNeededUnlocked()) {
        return std::string();
    }
    return session->wallet_id;
}

int64_t CSessionManager::GetRemainingSeconds() {
    std::lock_guard<std::mutex> lock(cs_session);
    if (!ExpireIfNeededUnlocked()) {
        return 0;
    }
    return session->expires_at - clock->Now();
}

WalletError CSessionManager::WithMasterKey(
    bool refresh,
    const std::function<WalletError(const std::string&, const CKeyingMaterial&)>& fn) {
    std::lock_guard<std::mutex> lock(cs_session);
    if (!ExpireIfNeededUnlocked()) {
        return WalletError::WALLET_LOCKED;
    }
    if (refresh) {
        session->expires_at = clock->Now() + nTimeout;
    }
    return fn(session->wallet_id, session->master_key);
}
