#pragma once

#include <optional>
#include <string>

#include "infra/store/FulfillmentRecords.h"

/**
 * @brief OrderReadCache：订单读缓存接口（read-through，尽力而为）
 *
 * 未命中或出错一律返回 nullopt，由调用方回源存储；失效失败只记日志。
 */
class OrderReadCache {
public:
    virtual ~OrderReadCache() = default;

    virtual std::optional<OrderRecord> GetOrder(const std::string& orderId) = 0;
    virtual void PutOrder(const OrderRecord& order) = 0;
    virtual void Invalidate(const std::string& orderId) = 0;
};
