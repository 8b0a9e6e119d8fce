#include "domain/InventoryLedger.h"

#include <map>
#include <utility>

#include "LogMacros.h"
#include "domain/EventSink.h"
#include "infra/codec/RecordJson.h"

namespace {

// 同一商品多行合并；productId 为空或数量非正的行不参与
std::map<std::string, InventoryLedger::Item> Aggregate(const std::vector<InventoryLedger::Item>& items) {
    std::map<std::string, InventoryLedger::Item> out;
    for (const auto& item : items) {
        if (item.productId.empty() || item.quantity <= 0)
            continue;
        auto& slot = out[item.productId];
        slot.productId = item.productId;
        if (slot.productName.empty())
            slot.productName = item.productName;
        slot.quantity += item.quantity;
    }
    return out;
}

}  // namespace

// ========== 构造函数 ==========

InventoryLedger::InventoryLedger(Dependencies deps) : InventoryLedger(std::move(deps), Options{}) {}

InventoryLedger::InventoryLedger(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

// ========== 扣减 ==========

std::optional<InventoryLedger::Result> InventoryLedger::Reduce(const std::vector<Item>& items, bool allowPartial, FulfillmentError* error) {
    if (!deps_.store) {
        SetError(error, FulfillmentError::Storage("inventory store unavailable"));
        return std::nullopt;
    }

    Result result;
    for (const auto& item : items) {
        if (item.productId.empty()) {
            LOG_DEBUG("Skipping stock for '{}': no product reference", item.productName);
            continue;
        }
        if (item.quantity <= 0)
            continue;

        auto mutation = deps_.store->DecrementStockIfAvailable(item.productId, item.quantity);
        if (mutation.status == StoreStatus::kOk && mutation.product && mutation.product->stock) {
            const auto after = *mutation.product->stock;
            result.affected.push_back({item.productId, mutation.product->name, after + item.quantity, after});
            if (after < options_.lowStockThreshold)
                result.lowStock.push_back(*mutation.product);
            continue;
        }

        if (mutation.status == StoreStatus::kNotFound) {
            LOG_WARN("Product {} not found, skipping stock reduction", item.productId);
            continue;
        }
        if (mutation.status == StoreStatus::kGuardFailed && mutation.product && !mutation.product->stock) {
            // 未跟踪库存，视为无限
            continue;
        }
        if (mutation.status == StoreStatus::kGuardFailed && mutation.product) {
            StockShortage shortage{item.productId, mutation.product->name, *mutation.product->stock, item.quantity};
            if (allowPartial) {
                LOG_WARN("Skipping '{}': insufficient stock ({} < {})", shortage.productName, shortage.available, shortage.requested);
                result.skipped.push_back(item);
                continue;
            }
            LOG_WARN("Insufficient stock for '{}': available {}, requested {}", shortage.productName, shortage.available, shortage.requested);
            rollback(result.affected, "insufficient stock");
            SetError(error, FulfillmentError::InsufficientStock(std::move(shortage)));
            return std::nullopt;
        }

        LOG_ERROR("Stock reduction for {} failed: {}", item.productId, ToString(mutation.status));
        rollback(result.affected, "storage failure");
        SetError(error, FulfillmentError::Storage("stock update failed for product " + item.productId));
        return std::nullopt;
    }

    publishChanges(result);
    return result;
}

// ========== 恢复 ==========

std::optional<InventoryLedger::Result> InventoryLedger::Restore(const std::vector<Item>& items, FulfillmentError* error) {
    if (!deps_.store) {
        SetError(error, FulfillmentError::Storage("inventory store unavailable"));
        return std::nullopt;
    }

    Result result;
    for (const auto& item : items) {
        if (item.productId.empty() || item.quantity <= 0)
            continue;

        auto mutation = deps_.store->IncrementStock(item.productId, item.quantity);
        if (mutation.status == StoreStatus::kOk && mutation.product && mutation.product->stock) {
            const auto after = *mutation.product->stock;
            result.affected.push_back({item.productId, mutation.product->name, after - item.quantity, after});
            if (after < options_.lowStockThreshold)
                result.lowStock.push_back(*mutation.product);
        } else if (mutation.status == StoreStatus::kNotFound) {
            LOG_WARN("Product {} not found for stock restoration", item.productId);
        } else if (mutation.status != StoreStatus::kGuardFailed) {
            // 增加没有下界可违反，只可能是存储故障
            LOG_ERROR("Stock restoration for {} (+{}) failed: {}", item.productId, item.quantity, ToString(mutation.status));
            rollback(result.affected, "storage failure");
            SetError(error, FulfillmentError::Storage("stock restore failed for product " + item.productId));
            return std::nullopt;
        }
    }

    if (!result.affected.empty())
        LOG_INFO("Stock restored for {} product(s)", result.affected.size());
    publishChanges(result);
    return result;
}

// ========== 调整 ==========

std::optional<InventoryLedger::Result> InventoryLedger::Adjust(const std::vector<Item>& oldItems, const std::vector<Item>& newItems, FulfillmentError* error) {
    auto before = Aggregate(oldItems);
    auto after = Aggregate(newItems);

    std::vector<Item> increases;  // 需要扣减库存
    std::vector<Item> decreases;  // 需要归还库存
    for (const auto& [productId, item] : after) {
        auto it = before.find(productId);
        const std::int64_t delta = item.quantity - (it == before.end() ? 0 : it->second.quantity);
        if (delta > 0)
            increases.push_back({productId, item.productName, delta});
        else if (delta < 0)
            decreases.push_back({productId, item.productName, -delta});
    }
    for (const auto& [productId, item] : before) {
        if (!after.count(productId))
            decreases.push_back({productId, item.productName, item.quantity});
    }

    // 先做可能失败的扣减，失败时只需撤销扣减本身
    auto reduced = Reduce(increases, false, error);
    if (!reduced)
        return std::nullopt;

    auto restored = Restore(decreases, error);
    if (!restored) {
        Revert(*reduced);
        return std::nullopt;
    }

    Result result = std::move(*reduced);
    result.affected.insert(result.affected.end(), restored->affected.begin(), restored->affected.end());
    result.lowStock.insert(result.lowStock.end(), restored->lowStock.begin(), restored->lowStock.end());
    return result;
}

// ========== 补偿 ==========

void InventoryLedger::Revert(const Result& applied) {
    rollback(applied.affected, "compensation");

    Result reverted;
    for (const auto& change : applied.affected)
        reverted.affected.push_back({change.productId, change.productName, change.after, change.before});
    publishChanges(reverted);
}

void InventoryLedger::rollback(const std::vector<StockChange>& changes, const char* reason) {
    if (changes.empty() || !deps_.store)
        return;
    LOG_INFO("Rolling back stock for {} product(s): {}", changes.size(), reason);

    for (auto it = changes.rbegin(); it != changes.rend(); ++it) {
        const std::int64_t delta = it->after - it->before;
        StockMutation mutation;
        if (delta < 0)
            mutation = deps_.store->IncrementStock(it->productId, -delta);
        else if (delta > 0)
            mutation = deps_.store->DecrementStockIfAvailable(it->productId, delta);
        else
            continue;

        if (mutation.status != StoreStatus::kOk)
            LOG_ERROR("Rollback of '{}' by {} failed: {}", it->productName, -delta, ToString(mutation.status));
    }
}

// ========== 查询 ==========

std::vector<ProductRecord> InventoryLedger::ListLowStock() const {
    if (!deps_.store)
        return {};
    return deps_.store->ListLowStock(options_.lowStockThreshold);
}

// ========== 事件发布 ==========

void InventoryLedger::publishChanges(const Result& result) const {
    if (!options_.publishEvents || !deps_.events)
        return;

    for (const auto& change : result.affected) {
        deps_.events->Publish(events::kInventoryUpdated, nlohmann::json{{"productId", change.productId}, {"name", change.productName}, {"before", change.before}, {"stock", change.after}});
    }
    if (!result.lowStock.empty())
        deps_.events->Publish(events::kLowStockAlert, nlohmann::json{{"products", result.lowStock}});
}
