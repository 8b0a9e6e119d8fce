#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/FulfillmentError.h"
#include "infra/store/FulfillmentStore.h"

class EventSink;

/**
 * @brief InventoryLedger：唯一允许修改商品库存的入口
 *
 * 每次变更都是一条守卫式原子操作（FulfillmentStore::DecrementStockIfAvailable / IncrementStock），
 * 库存因此不会在并发下变为负数；本类不加任何外部锁。
 * 批量操作中途失败时，按相反方向撤销本次调用已生效的变更。
 */
class InventoryLedger {
public:
    struct Dependencies {
        FulfillmentStore* store{nullptr};
        EventSink* events{nullptr};
    };

    struct Options {
        std::int64_t lowStockThreshold{10};
        bool publishEvents{true};
    };

    // 一行库存变动请求；productId 为空的行（手工录入行）不涉及库存
    struct Item {
        std::string productId;
        std::string productName;
        std::int64_t quantity{0};
    };

    struct StockChange {
        std::string productId;
        std::string productName;
        std::int64_t before{0};
        std::int64_t after{0};
    };

    struct Result {
        std::vector<StockChange> affected;
        std::vector<ProductRecord> lowStock;  // 变更后低于阈值的商品
        std::vector<Item> skipped;  // allowPartial 模式下因库存不足跳过的行
    };

    InventoryLedger(Dependencies deps);
    InventoryLedger(Dependencies deps, Options options);

    const Options& options() const noexcept { return options_; }

    // 逐行守卫扣减；严格模式下任一行不足即回滚本批并返回 kInsufficientStock
    std::optional<Result> Reduce(const std::vector<Item>& items, bool allowPartial = false, FulfillmentError* error = nullptr);
    // 逐行增加；未跟踪库存 / 不存在的商品跳过，存储故障时撤销本批已恢复的行
    std::optional<Result> Restore(const std::vector<Item>& items, FulfillmentError* error = nullptr);
    // 按商品计算 new - old：正数守卫扣减（失败回滚本次全部扣减），负数直接增加
    std::optional<Result> Adjust(const std::vector<Item>& oldItems, const std::vector<Item>& newItems, FulfillmentError* error = nullptr);

    // 撤销一次成功调用的全部变更（后续步骤失败时的补偿）
    void Revert(const Result& applied);

    std::vector<ProductRecord> ListLowStock() const;

private:
    // 撤销 changes 中的变更，不发布事件
    void rollback(const std::vector<StockChange>& changes, const char* reason);
    void publishChanges(const Result& result) const;

    Dependencies deps_;
    Options options_;
};
