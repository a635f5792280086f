#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include "config.hpp"

namespace cosign {

class WalletLockManager;

// Exclusive right to select inputs and mutate proposals of one wallet.
// Released on destruction; a lease that expired in the meantime may already
// belong to someone else, in which case releasing it does nothing.
class WalletLock {
public:
    WalletLock(const WalletLock&) = delete;
    WalletLock& operator=(const WalletLock&) = delete;

    WalletLock(WalletLock&& other) noexcept;
    WalletLock& operator=(WalletLock&& other) noexcept;

    ~WalletLock();

    void release();

    bool owns_lock() const { return manager_ != nullptr; }
    const std::string& wallet_id() const { return wallet_id_; }

private:
    friend class WalletLockManager;

    WalletLock(WalletLockManager* manager, std::string wallet_id, uint64_t token);

    WalletLockManager* manager_;
    std::string wallet_id_;
    uint64_t token_;
};

// Per-wallet advisory locks with a bounded acquisition wait and an expiring
// lease, so a holder that never releases cannot block a wallet forever
class WalletLockManager {
public:
    using Clock = std::chrono::steady_clock;

    WalletLockManager(std::chrono::milliseconds wait_time,
                      std::chrono::milliseconds lease_time,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

    explicit WalletLockManager(const ServiceConfig& config, std::shared_ptr<spdlog::logger> logger = nullptr);

    // Throws Error(LockBusy) when the wallet stays locked for the whole wait
    WalletLock acquire(const std::string& wallet_id);

    bool is_locked(const std::string& wallet_id) const;

private:
    friend class WalletLock;

    struct Lease {
        uint64_t token;
        Clock::time_point expires;
    };

    void release(const std::string& wallet_id, uint64_t token);

    std::chrono::milliseconds wait_time_;
    std::chrono::milliseconds lease_time_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::map<std::string, Lease> leases_;
    uint64_t next_token_ = 1;
};

} // namespace cosign
