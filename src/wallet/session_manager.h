// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_SESSION_MANAGER_H
#define POLYVAULT_WALLET_SESSION_MANAGER_H

#include <wallet/crypter.h>
#include <wallet/wallet_errors.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stdint.h>
#include <string>

// Default inactivity timeout (15 minutes)
static const int64_t DEFAULT_SESSION_TIMEOUT = 900;

/**
 * Time source for session expiry, in whole seconds of a monotonic clock
 */
class CSessionClock {
public:
    virtual ~CSessionClock() {}
    virtual int64_t Now() const = 0;
};

/**
 * steady_clock-backed clock used outside of tests
 */
class CSystemClock : public CSessionClock {
public:
    int64_t Now() const override;
};

/**
 * Manually advanced clock for deterministic expiry tests
 */
class CManualClock : public CSessionClock {
private:
    std::atomic<int64_t> nNow;

public:
    explicit CManualClock(int64_t start = 0) : nNow(start) {}

    int64_t Now() const override { return nNow.load(); }
    void Advance(int64_t seconds) { nNow += seconds; }
    void Set(int64_t seconds) { nNow = seconds; }
};

/**
 * In-memory unlock session
 *
 * master_key holds the 64-byte BIP-39 seed. It is wiped by CKeyingMaterial
 * when the session is dropped.
 */
struct CSessionKey {
    std::string wallet_id;
    CKeyingMaterial master_key;
    int64_t unlocked_at;
    int64_t expires_at;

    CSessionKey() : unlocked_at(0), expires_at(0) {}
};

/**
 * CSessionManager
 *
 * Holds at most one session. Expiry is evaluated lazily: any query made at
 * or after expires_at drops the session before answering. There is no
 * background timer.
 *
 * Thread Safety: all public methods take cs_session.
 */
class CSessionManager {
private:
    mutable std::mutex cs_session;
    std::shared_ptr<CSessionClock> clock;
    int64_t nTimeout;
    std::unique_ptr<CSessionKey> session;

    // Assumes caller holds cs_session
    void LockUnlocked();
    bool ExpireIfNeededUnlocked();

public:
    explicit CSessionManager(std::shared_ptr<CSessionClock> clock_in,
                             int64_t timeout_seconds = DEFAULT_SESSION_TIMEOUT);
    ~CSessionManager();

    CSessionManager(const CSessionManager&) = delete;
    CSessionManager& operator=(const CSessionManager&) = delete;

    /**
     * Install a new session, replacing (and wiping) any existing one
     *
     * @param wallet_id Wallet the key belongs to
     * @param master_key Seed material; moved in
     */
    void Start(const std::string& wallet_id, CKeyingMaterial&& master_key);

    /**
     * True if a session exists and has not expired (drops an expired one)
     */
    bool IsUnlocked();

    /**
     * True if the active session belongs to wallet_id
     */
    bool IsUnlockedFor(const std::string& wallet_id);

    /**
     * Push expires_at to now + timeout
     *
     * @return false if locked
     */
    bool Refresh();

    /**
     * Wipe the session immediately
     */
    void Lock();

    /**
     * Lock only if the active session belongs to wallet_id
     */
    void LockWallet(const std::string& wallet_id);

    /**
     * Id of the unlocked wallet, empty when locked
     */
    std::string GetActiveWalletId();

    /**
     * Seconds until expiry, 0 when locked
     */
    int64_t GetRemainingSeconds();

    int64_t GetTimeout() const { return nTimeout; }

    /**
     * Run fn with the session's key material while holding the session lock
     *
     * Returns WALLET_LOCKED without calling fn when no live session exists.
     * With refresh set, the expiry is pushed forward before fn runs.
     */
    WalletError WithMasterKey(bool refresh,
                              const std::function<WalletError(const std::string&,
                                                              const CKeyingMaterial&)>& fn);
};

#endif // POLYVAULT_WALLET_SESSION_MANAGER_H
