#include "infra/lock/InMemoryOrderLock.h"

std::optional<std::string> InMemoryOrderLock::TryAcquire(const std::string& orderId, std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    auto it = locks_.find(orderId);
    if (it != locks_.end() && it->second.expiresAt > now)
        return std::nullopt;

    std::string token = std::to_string(nextToken_++);
    locks_[orderId] = Entry{token, now + ttl};
    return token;
}

void InMemoryOrderLock::Release(const std::string& orderId, const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(orderId);
    if (it != locks_.end() && it->second.token == token)
        locks_.erase(it);
}

bool InMemoryOrderLock::IsHeld(const std::string& orderId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(orderId);
    return it != locks_.end() && it->second.expiresAt > std::chrono::steady_clock::now();
}
