#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "infra/cache/OrderReadCache.h"

class RedisPool;
class RedisClient;

// 订单读缓存的 Redis 实现：key = keyPrefix + orderId，value = 订单 JSON，带 TTL
class RedisOrderCache : public OrderReadCache {
public:
    struct Options {
        std::string keyPrefix{"fulfillment:order:"};
        std::chrono::seconds ttl{std::chrono::minutes(10)};
    };

    RedisOrderCache(std::shared_ptr<RedisPool> pool, Options options);

    const Options& options() const noexcept { return options_; }

    std::optional<OrderRecord> GetOrder(const std::string& orderId) override;
    void PutOrder(const OrderRecord& order) override;
    void Invalidate(const std::string& orderId) override;

private:
    std::string buildOrderKey(std::string_view orderId) const;
    std::shared_ptr<RedisClient> acquire() const;

    std::shared_ptr<RedisPool> pool_;
    Options options_;
};
