#include "infra/cache/RedisOrderCache.h"

#include <utility>

#include "LogMacros.h"
#include "RedisPool.h"
#include "infra/codec/RecordJson.h"

using json = nlohmann::json;

// ========== 构造函数 ==========

RedisOrderCache::RedisOrderCache(std::shared_ptr<RedisPool> pool, Options options) : pool_(std::move(pool)), options_(std::move(options)) {}

// ========== 核心接口 ==========

std::optional<OrderRecord> RedisOrderCache::GetOrder(const std::string& orderId) {
    auto client = acquire();
    if (!client)
        return std::nullopt;

    std::string payload;
    if (!client->Get(buildOrderKey(orderId), payload))
        return std::nullopt;

    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("Discarding unreadable cache entry for order {}", orderId);
        client->Del(buildOrderKey(orderId));
        return std::nullopt;
    }
    try {
        return j.get<OrderRecord>();
    } catch (const json::exception& ex) {
        LOG_WARN("Cache entry for order {} has unexpected shape: {}", orderId, ex.what());
        return std::nullopt;
    }
}

void RedisOrderCache::PutOrder(const OrderRecord& order) {
    auto client = acquire();
    if (!client)
        return;
    const json j = order;
    if (!client->SetEx(buildOrderKey(order.orderId), DumpDocument(j), static_cast<int>(options_.ttl.count())))
        LOG_DEBUG("Caching order {} failed", order.orderId);
}

void RedisOrderCache::Invalidate(const std::string& orderId) {
    auto client = acquire();
    if (!client) {
        LOG_WARN("Cache invalidation for order {} skipped: redis unavailable", orderId);
        return;
    }
    if (!client->Del(buildOrderKey(orderId)))
        LOG_WARN("Cache invalidation for order {} failed", orderId);
}

// ========== 工具函数 ==========

std::string RedisOrderCache::buildOrderKey(std::string_view orderId) const {
    return options_.keyPrefix + std::string(orderId);
}

std::shared_ptr<RedisClient> RedisOrderCache::acquire() const {
    if (!pool_)
        return nullptr;
    auto client = pool_->GetClient();
    if (!client || !client->IsConnected())
        return nullptr;
    return client;
}
