#include "infra/lock/RedisOrderLock.h"

#include <format>
#include <utility>

#include "LogMacros.h"
#include "RedisPool.h"
#include "domain/SequenceAllocator.h"

namespace {

// 仅当 value 仍是自己的 token 时删除
constexpr const char* kReleaseScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then "
    "return redis.call('del', KEYS[1]) "
    "else return 0 end";

}  // namespace

RedisOrderLock::RedisOrderLock(std::shared_ptr<RedisPool> pool, Options options) : pool_(std::move(pool)), options_(std::move(options)) {}

std::optional<std::string> RedisOrderLock::TryAcquire(const std::string& orderId, std::chrono::milliseconds ttl) {
    if (!pool_)
        return std::nullopt;
    auto client = pool_->GetClient();
    if (!client || !client->IsConnected()) {
        LOG_WARN("Order lock for {} not acquired: redis unavailable", orderId);
        return std::nullopt;
    }

    std::string token = nextToken();
    if (!client->SetIfAbsent(buildKey(orderId), token, ttl.count())) {
        LOG_DEBUG("Order lock for {} is held elsewhere", orderId);
        return std::nullopt;
    }
    return token;
}

void RedisOrderLock::Release(const std::string& orderId, const std::string& token) {
    if (!pool_)
        return;
    auto client = pool_->GetClient();
    if (!client || !client->IsConnected()) {
        LOG_WARN("Order lock for {} not released, it will expire by TTL", orderId);
        return;
    }

    auto deleted = client->EvalInteger(kReleaseScript, buildKey(orderId), {token});
    if (!deleted)
        LOG_WARN("Order lock release for {} failed, it will expire by TTL", orderId);
    else if (*deleted == 0)
        LOG_DEBUG("Order lock for {} already expired or taken over", orderId);
}

std::string RedisOrderLock::buildKey(const std::string& orderId) const {
    return options_.keyPrefix + orderId;
}

std::string RedisOrderLock::nextToken() {
    return std::format("{}-{}", GenerateDocumentId("lock"), counter_.fetch_add(1, std::memory_order_relaxed));
}
