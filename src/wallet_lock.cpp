#include "wallet_lock.hpp"
#include "error.hpp"
#include "logging.hpp"

#include <algorithm>

namespace cosign {

WalletLock::WalletLock(WalletLockManager* manager, std::string wallet_id, uint64_t token)
    : manager_(manager)
    , wallet_id_(std::move(wallet_id))
    , token_(token)
{}

WalletLock::WalletLock(WalletLock&& other) noexcept
    : manager_(other.manager_)
    , wallet_id_(std::move(other.wallet_id_))
    , token_(other.token_)
{
    other.manager_ = nullptr;
}

WalletLock& WalletLock::operator=(WalletLock&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        wallet_id_ = std::move(other.wallet_id_);
        token_ = other.token_;
        other.manager_ = nullptr;
    }
    return *this;
}

WalletLock::~WalletLock() {
    release();
}

void WalletLock::release() {
    if (manager_) {
        manager_->release(wallet_id_, token_);
        manager_ = nullptr;
    }
}

WalletLockManager::WalletLockManager(std::chrono::milliseconds wait_time,
                                     std::chrono::milliseconds lease_time,
                                     std::shared_ptr<spdlog::logger> logger)
    : wait_time_(wait_time)
    , lease_time_(lease_time)
    , logger_(logger ? std::move(logger) : get_logger())
{}

WalletLockManager::WalletLockManager(const ServiceConfig& config, std::shared_ptr<spdlog::logger> logger)
    : WalletLockManager(std::chrono::milliseconds(config.lock_wait_ms),
                        std::chrono::milliseconds(config.lock_lease_ms),
                        std::move(logger))
{}

WalletLock WalletLockManager::acquire(const std::string& wallet_id) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = Clock::now() + wait_time_;

    while (true) {
        auto now = Clock::now();
        auto it = leases_.find(wallet_id);
        if (it == leases_.end() || it->second.expires <= now) {
            if (it != leases_.end()) {
                logger_->warn("Lease on wallet {} expired, taking it over", wallet_id);
            }
            uint64_t token = next_token_++;
            leases_[wallet_id] = Lease{token, now + lease_time_};
            return WalletLock(this, wallet_id, token);
        }
        if (now >= deadline) {
            logger_->debug("Wallet {} still locked after {} ms", wallet_id, wait_time_.count());
            throw Error(Error::Code::LockBusy);
        }
        // Wake up on a release, when the current lease runs out or at the deadline
        released_.wait_until(lock, std::min(deadline, it->second.expires));
    }
}

bool WalletLockManager::is_locked(const std::string& wallet_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = leases_.find(wallet_id);
    return it != leases_.end() && it->second.expires > Clock::now();
}

void WalletLockManager::release(const std::string& wallet_id, uint64_t token) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = leases_.find(wallet_id);
        if (it == leases_.end() || it->second.token != token) {
            return;
        }
        leases_.erase(it);
    }
    released_.notify_all();
}

} // namespace cosign
