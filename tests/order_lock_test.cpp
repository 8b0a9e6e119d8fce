#include <thread>

#include <gtest/gtest.h>

#include "infra/lock/InMemoryOrderLock.h"

using namespace std::chrono_literals;

class OrderLockTest : public ::testing::Test {
protected:
    InMemoryOrderLock locks_;
};

TEST_F(OrderLockTest, SecondAcquireFailsUntilReleased) {
    // Given
    auto first = locks_.TryAcquire("ord-1", 30s);
    ASSERT_TRUE(first.has_value());

    // When / Then
    EXPECT_FALSE(locks_.TryAcquire("ord-1", 30s).has_value());
    EXPECT_TRUE(locks_.TryAcquire("ord-2", 30s).has_value());

    locks_.Release("ord-1", *first);
    EXPECT_FALSE(locks_.IsHeld("ord-1"));
    EXPECT_TRUE(locks_.TryAcquire("ord-1", 30s).has_value());
}

TEST_F(OrderLockTest, ReleaseWithForeignTokenIsIgnored) {
    auto token = locks_.TryAcquire("ord-1", 30s);
    ASSERT_TRUE(token.has_value());

    locks_.Release("ord-1", "not-the-owner");

    EXPECT_TRUE(locks_.IsHeld("ord-1"));
}

TEST_F(OrderLockTest, ExpiredLockCanBeTakenOverAndOldOwnerCannotRelease) {
    // Given: 持有者的锁已过期
    auto stale = locks_.TryAcquire("ord-1", 20ms);
    ASSERT_TRUE(stale.has_value());
    std::this_thread::sleep_for(40ms);
    EXPECT_FALSE(locks_.IsHeld("ord-1"));

    // When: 新持有者获取后，旧持有者尝试释放
    auto fresh = locks_.TryAcquire("ord-1", 30s);
    ASSERT_TRUE(fresh.has_value());
    EXPECT_NE(*fresh, *stale);
    locks_.Release("ord-1", *stale);

    // Then
    EXPECT_TRUE(locks_.IsHeld("ord-1"));
}

TEST_F(OrderLockTest, GuardReleasesOnScopeExit) {
    {
        auto token = locks_.TryAcquire("ord-1", 30s);
        ASSERT_TRUE(token.has_value());
        OrderLockGuard guard(&locks_, "ord-1", *token);
        EXPECT_TRUE(locks_.IsHeld("ord-1"));
    }
    EXPECT_FALSE(locks_.IsHeld("ord-1"));
}
