#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "domain/EventSink.h"
#include "domain/FulfillmentError.h"
#include "domain/InventoryLedger.h"
#include "domain/OrderStateMachine.h"
#include "domain/PaymentAllocator.h"
#include "infra/store/FulfillmentStore.h"

class OrderLockManager;
class OrderReadCache;
class OrderWriter;
class SequenceAllocator;

/**
 * @brief FulfillmentService：订单与发货编排
 *
 * 下单：解析客户 → 计价 → 库存严格扣减 → 持久化订单（失败则回滚库存）→ 客户 / 员工计数器。
 * 发货：订单咨询锁内校验剩余数量 → 写发货单 → 更新订单发货数量（失败则删除发货单）。
 * 其余：开票、发货状态、取消、管理删除、修改明细 / 备注、查询。
 */
class FulfillmentService {
public:
    struct Dependencies {
        FulfillmentStore* store{nullptr};
        InventoryLedger* ledger{nullptr};
        OrderWriter* writer{nullptr};
        SequenceAllocator* sequences{nullptr};
        PaymentAllocator* payments{nullptr};
        OrderLockManager* locks{nullptr};
        OrderReadCache* cache{nullptr};
        EventSink* events{nullptr};
    };

    struct Options {
        std::chrono::milliseconds lockTtl{std::chrono::seconds(30)};
        bool useCache{true};
        bool publishEvents{true};
    };

    // 下单 / 改单的一行；lineId 仅在改单时用于定位已有行
    struct ItemInput {
        std::string lineId;
        std::string productId;
        std::string productName;
        std::string narration;
        double unitPrice{0.0};
        std::int64_t quantity{0};
    };

    struct ClientInput {
        std::string clientId;
        std::string partyName;
        std::string mobile;
    };

    struct CreateOrderRequest {
        OrderKind kind{OrderKind::kStandard};
        ClientInput client;
        std::vector<ItemInput> items;
        Charges charges;
        double advance{0.0};
        std::string employeeId;
        std::optional<TimePoint> orderDate;
        std::optional<TimePoint> expectedDeliveryDate;
        std::string notes;
    };

    struct CreateOrderResult {
        OrderRecord order;
        InventoryLedger::Result inventory;
    };

    // 发货行：按 lineId → productId → 名称（大小写不敏感）顺序匹配订单行
    struct DeliveryItemInput {
        std::string lineId;
        std::string productId;
        std::string productName;
        std::optional<double> unitPrice;
        std::int64_t quantity{0};
    };

    struct CreateDeliveryRequest {
        std::string orderId;
        std::vector<DeliveryItemInput> items;  // 为空等同 deliverAll
        bool deliverAll{false};
        Charges charges;
        std::optional<TimePoint> deliveryDate;
        std::string employeeId;
        std::string notes;
    };

    struct CreateDeliveryResult {
        DeliveryRecord delivery;
        OrderRecord order;
    };

    struct GenerateInvoiceRequest {
        std::string deliveryId;
        double advance{0.0};
        PaymentMethod method{PaymentMethod::kCash};
        std::string notes;
    };

    struct InvoiceResult {
        InvoiceRecord invoice;
        std::optional<PaymentRecord> payment;
        std::optional<OrderRecord> order;
    };

    struct DeleteOrderResult {
        OrderRecord order;
        int deliveriesRemoved{0};
        int invoicesRemoved{0};
    };

    FulfillmentService(Dependencies deps);
    FulfillmentService(Dependencies deps, Options options);

    const Options& options() const noexcept { return options_; }

    // ========== 订单 ==========
    std::optional<CreateOrderResult> CreateOrder(const CreateOrderRequest& request, FulfillmentError* error = nullptr);
    std::optional<OrderRecord> CancelOrder(const std::string& orderId, const std::string& reason, FulfillmentError* error = nullptr);
    std::optional<DeleteOrderResult> DeleteOrder(const std::string& orderId, FulfillmentError* error = nullptr);
    std::optional<OrderRecord> UpdateOrderItems(const std::string& orderId, const std::vector<ItemInput>& items, const std::optional<Charges>& charges, FulfillmentError* error = nullptr);
    std::optional<OrderRecord> UpdateOrderDetails(const std::string& orderId, const std::optional<std::string>& notes, const std::optional<TimePoint>& expectedDeliveryDate, FulfillmentError* error = nullptr);

    // ========== 发货 / 开票 ==========
    std::optional<CreateDeliveryResult> CreateDelivery(const CreateDeliveryRequest& request, FulfillmentError* error = nullptr);
    std::optional<InvoiceResult> GenerateDeliveryInvoice(const GenerateInvoiceRequest& request, FulfillmentError* error = nullptr);
    std::optional<InvoiceRecord> GenerateOrderInvoice(const std::string& orderId, FulfillmentError* error = nullptr);
    std::optional<DeliveryRecord> UpdateDeliveryStatus(const std::string& deliveryId, DeliveryStatus status, FulfillmentError* error = nullptr);

    // ========== 查询 ==========
    std::optional<OrderRecord> GetOrder(const std::string& orderId, bool preferCache = true) const;
    std::optional<DeliveryRecord> GetDelivery(const std::string& deliveryId) const;
    std::vector<DeliveryRecord> ListDeliveries(const std::string& orderId) const;
    std::optional<ClientRecord> GetClient(const std::string& clientId) const;
    std::optional<EmployeeStatsRecord> GetEmployeeStats(const std::string& employeeId) const;
    std::vector<ProductRecord> ListLowStock() const;

private:
    std::optional<ClientRecord> resolveClient(const ClientInput& input, FulfillmentError* error);
    std::optional<std::vector<OrderLineItem>> buildLines(const std::vector<ItemInput>& items, const std::vector<OrderLineItem>& existing, FulfillmentError* error);
    static std::vector<InventoryLedger::Item> stockItems(const std::vector<OrderLineItem>& lines);

    void publish(const char* event, const nlohmann::json& payload) const;

    Dependencies deps_;
    Options options_;
};
