#include <gtest/gtest.h>
#include "error.hpp"
#include "wallet_lock.hpp"

#include <thread>

using namespace cosign;
using namespace std::chrono_literals;

////////////////////////////////////////////////////////////////////////////////
class WalletLockTest : public ::testing::Test
{
protected:
    WalletLockTest()
        : locks_(30ms, 10s)
    {}

    WalletLockManager locks_;
};

TEST_F(WalletLockTest, AcquireAndRelease)
{
    auto lock = locks_.acquire("w1");
    EXPECT_TRUE(lock.owns_lock());
    EXPECT_EQ(lock.wallet_id(), "w1");
    EXPECT_TRUE(locks_.is_locked("w1"));
    EXPECT_FALSE(locks_.is_locked("w2"));

    lock.release();
    EXPECT_FALSE(lock.owns_lock());
    EXPECT_FALSE(locks_.is_locked("w1"));

    // Releasing twice is harmless
    lock.release();
    EXPECT_NO_THROW(locks_.acquire("w1"));
}

TEST_F(WalletLockTest, BusyWallet)
{
    auto lock = locks_.acquire("w1");
    try {
        locks_.acquire("w1");
        FAIL() << "second holder got the lock";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), Error::Code::LockBusy);
    }

    // Other wallets are unaffected
    auto other = locks_.acquire("w2");
    EXPECT_TRUE(other.owns_lock());
}

TEST_F(WalletLockTest, ReleasedOnScopeExit)
{
    {
        auto lock = locks_.acquire("w1");
        EXPECT_TRUE(locks_.is_locked("w1"));
    }
    EXPECT_FALSE(locks_.is_locked("w1"));
}

TEST_F(WalletLockTest, Move)
{
    auto lock = locks_.acquire("w1");
    WalletLock moved = std::move(lock);
    EXPECT_FALSE(lock.owns_lock());
    EXPECT_TRUE(moved.owns_lock());

    // The moved-from lock no longer releases anything
    lock.release();
    EXPECT_TRUE(locks_.is_locked("w1"));

    auto other = locks_.acquire("w2");
    moved = std::move(other);
    EXPECT_FALSE(locks_.is_locked("w1"));
    EXPECT_TRUE(locks_.is_locked("w2"));
    EXPECT_EQ(moved.wallet_id(), "w2");
}

TEST_F(WalletLockTest, WaitsForRelease)
{
    WalletLockManager locks(5s, 10s);
    auto lock = locks.acquire("w1");

    std::thread holder([&lock] {
        std::this_thread::sleep_for(50ms);
        lock.release();
    });
    auto next = locks.acquire("w1");
    holder.join();

    EXPECT_TRUE(next.owns_lock());
    EXPECT_TRUE(locks.is_locked("w1"));
}

TEST_F(WalletLockTest, ExpiredLeaseIsTakenOver)
{
    WalletLockManager locks(5s, 50ms);
    auto stale = locks.acquire("w1");
    auto fresh = locks.acquire("w1");
    EXPECT_TRUE(fresh.owns_lock());

    // The stale holder must not free the new lease
    stale.release();
    EXPECT_TRUE(locks.is_locked("w1"));
    fresh.release();
    EXPECT_FALSE(locks.is_locked("w1"));
}

TEST_F(WalletLockTest, ExpiredLeaseIsNotLocked)
{
    WalletLockManager locks(10ms, 20ms);
    auto lock = locks.acquire("w1");
    std::this_thread::sleep_for(40ms);
    EXPECT_FALSE(locks.is_locked("w1"));
}

TEST_F(WalletLockTest, TimesFromConfig)
{
    ServiceConfig config;
    config.lock_wait_ms = 0;
    WalletLockManager locks(config);

    auto lock = locks.acquire("w1");
    EXPECT_THROW(locks.acquire("w1"), Error);
}
