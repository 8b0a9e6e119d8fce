#pragma once

#include <string>

#include <nlohmann/json.hpp>

/**
 * @brief EventSink：领域事件出口
 *
 * 事件名形如 "order:created"；payload 为 JSON 对象。
 * 发布失败只记录日志，不能影响已经完成的核心写入。
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void Publish(const std::string& event, const nlohmann::json& payload) = 0;
};

// 事件名常量
namespace events {
inline constexpr const char* kOrderCreated = "order:created";
inline constexpr const char* kOrderUpdated = "order:updated";
inline constexpr const char* kOrderCancelled = "order:cancelled";
inline constexpr const char* kOrderDeleted = "order:deleted";
inline constexpr const char* kDeliveryCreated = "delivery:created";
inline constexpr const char* kDeliveryStatusUpdated = "delivery:status-updated";
inline constexpr const char* kInvoiceCreated = "invoice:created";
inline constexpr const char* kInventoryUpdated = "product:inventory-updated";
inline constexpr const char* kLowStockAlert = "inventory:low-stock-alert";
inline constexpr const char* kPaymentRecorded = "payment:recorded";
inline constexpr const char* kClientAdvanceUpdated = "client:advance-updated";
inline constexpr const char* kReturnCreated = "return:created";
inline constexpr const char* kRefundRecorded = "refund:recorded";
}  // namespace events
