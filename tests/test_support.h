#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "domain/EventSink.h"
#include "domain/FulfillmentService.h"
#include "domain/InventoryLedger.h"
#include "domain/OrderWriter.h"
#include "domain/PaymentAllocator.h"
#include "domain/ReturnReconciler.h"
#include "domain/SequenceAllocator.h"
#include "infra/cache/OrderReadCache.h"
#include "infra/lock/InMemoryOrderLock.h"
#include "infra/memory/InMemoryFulfillmentStore.h"

// 记录所有发布的事件，供断言
class RecordingEventSink : public EventSink {
public:
    struct Event {
        std::string name;
        nlohmann::json payload;
    };

    void Publish(const std::string& event, const nlohmann::json& payload) override;

    std::vector<Event> Events() const;
    int Count(const std::string& name) const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

// 进程内读缓存，记录失效调用
class RecordingOrderCache : public OrderReadCache {
public:
    std::optional<OrderRecord> GetOrder(const std::string& orderId) override;
    void PutOrder(const OrderRecord& order) override;
    void Invalidate(const std::string& orderId) override;

    int InvalidationsFor(const std::string& orderId) const;
    bool Contains(const std::string& orderId) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, OrderRecord> entries_;
    std::unordered_map<std::string, int> invalidations_;
};

/**
 * 领域层测试夹具：InMemoryFulfillmentStore + InMemoryOrderLock + 记录型事件 / 缓存。
 * 子类可在 SetUp 前替换 store_（例如注入故障的存储）。
 */
class FulfillmentTest : public ::testing::Test {
protected:
    void SetUp() override;

    // 在 SetUp 中构造存储；子类覆写以注入故障实现
    virtual std::unique_ptr<InMemoryFulfillmentStore> MakeStore();

    void AddProduct(const std::string& productId, const std::string& name, double price, std::optional<std::int64_t> stock);
    std::int64_t StockOf(const std::string& productId);

    FulfillmentService::ItemInput Item(const std::string& productId, double unitPrice, std::int64_t quantity) const;
    FulfillmentService::CreateOrderRequest StandardOrder(std::vector<FulfillmentService::ItemInput> items, double advance = 0.0) const;

    // 下单并断言成功
    OrderRecord PlaceOrder(std::vector<FulfillmentService::ItemInput> items, double advance = 0.0);
    // 整单发货并断言成功
    DeliveryRecord DeliverAll(const std::string& orderId);
    DeliveryRecord Deliver(const std::string& orderId, const std::string& lineId, std::int64_t quantity);
    OrderRecord Pay(const std::string& orderId, double amount);

    std::unique_ptr<InMemoryFulfillmentStore> store_;
    std::unique_ptr<InMemoryOrderLock> locks_;
    std::unique_ptr<RecordingEventSink> events_;
    std::unique_ptr<RecordingOrderCache> cache_;
    std::unique_ptr<SequenceAllocator> sequences_;
    std::unique_ptr<InventoryLedger> ledger_;
    std::unique_ptr<OrderWriter> writer_;
    std::unique_ptr<PaymentAllocator> payments_;
    std::unique_ptr<FulfillmentService> service_;
    std::unique_ptr<ReturnReconciler> returns_;
};
