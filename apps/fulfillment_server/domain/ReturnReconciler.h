#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "domain/EventSink.h"
#include "domain/FulfillmentError.h"
#include "domain/InventoryLedger.h"
#include "infra/store/FulfillmentStore.h"

class OrderLockManager;
class OrderWriter;
class SequenceAllocator;

/**
 * @brief ReturnReconciler：退货与退款
 *
 * 退货：订单锁内校验可退数量 → 库存恢复 → 订单扣回发货数量 → 写退货单；
 * 任一步失败按相反顺序补偿。普通订单按 max(0, advance - effectiveTotal) 的增量产生可退金额；
 * 柜台零售单不产生退款义务，而是缩减订单明细，全部退回时直接删除订单。
 * 退款：退货单上的守卫式累加（refunded + amount <= refundable）→ 写 return_refund 收款单。
 */
class ReturnReconciler {
public:
    struct Dependencies {
        FulfillmentStore* store{nullptr};
        InventoryLedger* ledger{nullptr};
        OrderWriter* writer{nullptr};
        SequenceAllocator* sequences{nullptr};
        OrderLockManager* locks{nullptr};
        EventSink* events{nullptr};
    };

    struct Options {
        std::chrono::milliseconds lockTtl{std::chrono::seconds(30)};
        bool publishEvents{true};
    };

    struct ReturnItemInput {
        std::string lineId;
        std::string productId;
        std::string productName;
        std::int64_t quantity{0};
    };

    struct CreateReturnRequest {
        std::string orderId;
        std::string deliveryId;  // 可选：退回的是哪一张发货单
        std::vector<ReturnItemInput> items;
        std::string reason;
        std::string notes;
        std::optional<TimePoint> returnDate;
    };

    struct ReturnResult {
        ReturnRecord record;
        std::optional<OrderRecord> order;  // 柜台零售单被整单删除时为空
        InventoryLedger::Result inventory;
        std::optional<ClientRecord> client;
    };

    struct RefundInput {
        std::string returnId;
        double amount{0.0};
        PaymentMethod method{PaymentMethod::kCash};
        std::optional<TimePoint> paymentDate;
        std::string reference;
        std::string notes;
    };

    struct RefundResult {
        ReturnRecord record;
        PaymentRecord payment;
        std::optional<ClientRecord> client;
    };

    ReturnReconciler(Dependencies deps);
    ReturnReconciler(Dependencies deps, Options options);

    std::optional<ReturnResult> CreateReturn(const CreateReturnRequest& request, FulfillmentError* error = nullptr);
    std::optional<RefundResult> RecordRefund(const RefundInput& input, FulfillmentError* error = nullptr);

    std::optional<ReturnRecord> GetReturn(const std::string& returnId) const;
    std::vector<ReturnRecord> ListReturnsForOrder(const std::string& orderId) const;

    // 以实际退货前后的有效总额计算本次新增的可退金额
    static double RefundableIncrease(const OrderRecord& before, const OrderRecord& after);

private:
    // 柜台零售单：去掉已退空的行，按剩余明细重新计价并视为当场结清
    static void shrinkCounterSale(OrderRecord& order);
    // 把订单恢复成退货前的快照（写退货单失败时的补偿）
    void restoreSnapshot(const OrderRecord& snapshot, bool deleted);
    void publish(const char* event, const nlohmann::json& payload) const;

    Dependencies deps_;
    Options options_;
};
