#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "infra/lock/OrderLockManager.h"

class RedisPool;

/**
 * @brief RedisOrderLock：基于 SET NX PX 的订单咨询锁
 *
 * 获取：SET key token NX PX ttl；释放：Lua 脚本比较 token 后 DEL，
 * 过期后被他人重新获取的锁不会被误删。Redis 不可用时获取失败（fail fast）。
 */
class RedisOrderLock : public OrderLockManager {
public:
    struct Options {
        std::string keyPrefix{"fulfillment:lock:order:"};
    };

    RedisOrderLock(std::shared_ptr<RedisPool> pool, Options options);

    std::optional<std::string> TryAcquire(const std::string& orderId, std::chrono::milliseconds ttl) override;
    void Release(const std::string& orderId, const std::string& token) override;

private:
    std::string buildKey(const std::string& orderId) const;
    std::string nextToken();

    std::shared_ptr<RedisPool> pool_;
    Options options_;
    std::atomic<std::uint64_t> counter_{0};
};
