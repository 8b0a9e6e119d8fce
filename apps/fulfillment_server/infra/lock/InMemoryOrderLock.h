#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "infra/lock/OrderLockManager.h"

// 进程内实现：互斥锁 + 过期时间表，供测试与单机模式使用
class InMemoryOrderLock : public OrderLockManager {
public:
    std::optional<std::string> TryAcquire(const std::string& orderId, std::chrono::milliseconds ttl) override;
    void Release(const std::string& orderId, const std::string& token) override;

    bool IsHeld(const std::string& orderId) const;

private:
    struct Entry {
        std::string token;
        std::chrono::steady_clock::time_point expiresAt;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> locks_;
    std::uint64_t nextToken_{1};
};
