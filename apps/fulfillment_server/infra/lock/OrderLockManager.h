#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

/**
 * @brief OrderLockManager：按订单的短时咨询锁
 *
 * TryAcquire 不阻塞：锁被占用立即返回 nullopt。锁带 TTL，持有者崩溃后自动过期。
 * Release 只释放令牌匹配的锁，过期后被他人重新获取的锁不会被误删。
 */
class OrderLockManager {
public:
    virtual ~OrderLockManager() = default;

    virtual std::optional<std::string> TryAcquire(const std::string& orderId, std::chrono::milliseconds ttl) = 0;
    virtual void Release(const std::string& orderId, const std::string& token) = 0;
};

// RAII：析构时释放（相当于 finally）
class OrderLockGuard {
public:
    OrderLockGuard(OrderLockManager* manager, std::string orderId, std::string token) : manager_(manager), orderId_(std::move(orderId)), token_(std::move(token)) {}
    ~OrderLockGuard() {
        if (manager_)
            manager_->Release(orderId_, token_);
    }

    OrderLockGuard(const OrderLockGuard&) = delete;
    OrderLockGuard& operator=(const OrderLockGuard&) = delete;

private:
    OrderLockManager* manager_;
    std::string orderId_;
    std::string token_;
};
