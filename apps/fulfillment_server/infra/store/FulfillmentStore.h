#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "infra/store/FulfillmentRecords.h"

enum class StoreStatus : std::uint8_t {
    kOk = 0,
    kNotFound,
    kDuplicateKey,  // 唯一编号 / 唯一键冲突
    kConflict,  // 版本号不匹配或目标已被他人修改
    kGuardFailed,  // 守卫条件不成立（库存不足、余额不足等），未做任何修改
    kUnavailable,  // 存储不可达 / 执行失败
};

std::string ToString(StoreStatus status);

struct StockMutation {
    StoreStatus status{StoreStatus::kUnavailable};
    // kOk：修改后的商品；kGuardFailed：当前商品（stock 为空表示未跟踪库存）
    std::optional<ProductRecord> product;
};

struct RefundMutation {
    StoreStatus status{StoreStatus::kUnavailable};
    std::optional<ReturnRecord> record;  // kOk 时为更新后的退货单
};

/**
 * @brief FulfillmentStore：履约核心依赖的持久化接口
 *
 * 只提供单文档原子操作，不提供跨文档事务。带 "IfAvailable" / "Debit" / "Apply" 语义的方法
 * 是守卫式原子更新：条件判断与修改在同一条存储操作内完成，不存在读后写窗口。
 * 实现：MySQLFulfillmentStore（生产）、InMemoryFulfillmentStore（测试 / 单机）。
 */
class FulfillmentStore {
public:
    virtual ~FulfillmentStore() = default;

    // ========== 商品 ==========
    virtual std::optional<ProductRecord> GetProduct(const std::string& productId) = 0;
    // 名称大小写不敏感
    virtual std::optional<ProductRecord> FindProductByName(const std::string& name) = 0;
    virtual StoreStatus InsertProduct(const ProductRecord& product) = 0;
    // stock 非空且 stock >= quantity 时扣减
    virtual StockMutation DecrementStockIfAvailable(const std::string& productId, std::int64_t quantity) = 0;
    // stock 非空时增加；stock 为空返回 kGuardFailed
    virtual StockMutation IncrementStock(const std::string& productId, std::int64_t quantity) = 0;
    virtual std::vector<ProductRecord> ListLowStock(std::int64_t threshold) = 0;

    // ========== 编号 ==========
    // 指定种类中以 prefix 开头、prefix 之后的数字序号最大的编号（超过四位时按数值而非字典序比较）
    virtual std::optional<std::string> FindHighestNumber(DocumentKind kind, const std::string& prefix) = 0;

    // ========== 订单 ==========
    // orderNumber 重复返回 kDuplicateKey
    virtual StoreStatus InsertOrder(const OrderRecord& order) = 0;
    virtual std::optional<OrderRecord> GetOrder(const std::string& orderId) = 0;
    // 仅当存储中的 version == expectedVersion 时整体替换，并把 version 置为 expectedVersion + 1
    virtual StoreStatus ReplaceOrder(const OrderRecord& order, std::uint64_t expectedVersion) = 0;
    virtual StoreStatus RemoveOrder(const std::string& orderId) = 0;
    // 客户名下 balanceDue > 0 且未取消的订单，按 orderDate 升序
    virtual std::vector<OrderRecord> ListOrdersWithBalanceDue(const std::string& clientId) = 0;

    // ========== 发货单 ==========
    virtual StoreStatus InsertDelivery(const DeliveryRecord& delivery) = 0;
    virtual std::optional<DeliveryRecord> GetDelivery(const std::string& deliveryId) = 0;
    virtual std::vector<DeliveryRecord> ListDeliveriesForOrder(const std::string& orderId) = 0;
    virtual StoreStatus UpdateDeliveryStatus(const std::string& deliveryId, DeliveryStatus status) = 0;
    // 仅当发货单尚未关联发票时写入；已关联返回 kConflict
    virtual StoreStatus LinkDeliveryInvoice(const std::string& deliveryId, const std::string& invoiceId) = 0;
    // 仅当发货单当前关联的正是 invoiceId 时清除（开票失败的补偿）
    virtual StoreStatus UnlinkDeliveryInvoice(const std::string& deliveryId, const std::string& invoiceId) = 0;
    virtual StoreStatus RemoveDelivery(const std::string& deliveryId) = 0;

    // ========== 发票 ==========
    virtual StoreStatus InsertInvoice(const InvoiceRecord& invoice) = 0;
    virtual std::optional<InvoiceRecord> GetInvoice(const std::string& invoiceId) = 0;
    virtual std::vector<InvoiceRecord> ListInvoicesForOrder(const std::string& orderId) = 0;
    virtual StoreStatus UpdateInvoiceDeliveryStatus(const std::string& invoiceId, DeliveryStatus status) = 0;
    virtual StoreStatus RemoveInvoice(const std::string& invoiceId) = 0;

    // ========== 收款 ==========
    virtual StoreStatus InsertPayment(const PaymentRecord& payment) = 0;
    virtual std::optional<PaymentRecord> GetPayment(const std::string& paymentId) = 0;
    // 按 paymentDate 降序
    virtual std::vector<PaymentRecord> ListPaymentsForClient(const std::string& clientId) = 0;

    // ========== 客户 ==========
    virtual std::optional<ClientRecord> GetClient(const std::string& clientId) = 0;
    virtual std::optional<ClientRecord> FindClient(const std::string& partyName, const std::string& mobile) = 0;
    // (partyName, mobile) 重复返回 kDuplicateKey
    virtual StoreStatus InsertClient(const ClientRecord& client) = 0;
    virtual StoreStatus ApplyClientDelta(const std::string& clientId, const ClientDelta& delta) = 0;
    // advanceBalance >= amount 时扣减
    virtual StoreStatus DebitAdvanceBalance(const std::string& clientId, double amount) = 0;

    // ========== 员工统计 ==========
    virtual StoreStatus ApplyEmployeeDelta(const std::string& employeeId, const EmployeeDelta& delta) = 0;
    virtual std::optional<EmployeeStatsRecord> GetEmployeeStats(const std::string& employeeId) = 0;

    // ========== 退货单 ==========
    virtual StoreStatus InsertReturn(const ReturnRecord& record) = 0;
    virtual std::optional<ReturnRecord> GetReturn(const std::string& returnId) = 0;
    virtual std::vector<ReturnRecord> ListReturnsForOrder(const std::string& orderId) = 0;
    // refundedAmount + amount <= refundableAmount 时累加，并重算 refundStatus
    virtual RefundMutation ApplyRefund(const std::string& returnId, double amount) = 0;
    // 撤销一次 ApplyRefund（退款收款单写入失败时的补偿）
    virtual StoreStatus RevertRefund(const std::string& returnId, double amount) = 0;
};
