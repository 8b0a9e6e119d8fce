#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "infra/store/FulfillmentStore.h"

class MySQLConnPool;
struct SQLUpdateResult;

namespace sql {
class ResultSet;
}  // namespace sql

/**
 * @brief MySQLFulfillmentStore：FulfillmentStore 的 MySQL 实现
 *
 * 所有 SQL 经 MySQLConnPool 异步投递、同步等待结果。守卫式原子操作都是单条带条件的
 * UPDATE ... WHERE，受影响行数为 0 时再查一次以区分 kNotFound / kGuardFailed / kConflict。
 * 订单、发货单、发票、收款单、退货单以 JSON 文本整体存放（body 列），
 * 需要索引或原子更新的字段另设独立列，读取时以独立列为准。
 */
class MySQLFulfillmentStore : public FulfillmentStore {
public:
    struct Options {
        std::string tablePrefix{"ff_"};
    };

    explicit MySQLFulfillmentStore(std::shared_ptr<MySQLConnPool> pool);
    MySQLFulfillmentStore(std::shared_ptr<MySQLConnPool> pool, Options options);

    // 建表失败抛出 std::runtime_error
    void EnsureSchema();

    std::optional<ProductRecord> GetProduct(const std::string& productId) override;
    std::optional<ProductRecord> FindProductByName(const std::string& name) override;
    StoreStatus InsertProduct(const ProductRecord& product) override;
    StockMutation DecrementStockIfAvailable(const std::string& productId, std::int64_t quantity) override;
    StockMutation IncrementStock(const std::string& productId, std::int64_t quantity) override;
    std::vector<ProductRecord> ListLowStock(std::int64_t threshold) override;

    std::optional<std::string> FindHighestNumber(DocumentKind kind, const std::string& prefix) override;

    StoreStatus InsertOrder(const OrderRecord& order) override;
    std::optional<OrderRecord> GetOrder(const std::string& orderId) override;
    StoreStatus ReplaceOrder(const OrderRecord& order, std::uint64_t expectedVersion) override;
    StoreStatus RemoveOrder(const std::string& orderId) override;
    std::vector<OrderRecord> ListOrdersWithBalanceDue(const std::string& clientId) override;

    StoreStatus InsertDelivery(const DeliveryRecord& delivery) override;
    std::optional<DeliveryRecord> GetDelivery(const std::string& deliveryId) override;
    std::vector<DeliveryRecord> ListDeliveriesForOrder(const std::string& orderId) override;
    StoreStatus UpdateDeliveryStatus(const std::string& deliveryId, DeliveryStatus status) override;
    StoreStatus LinkDeliveryInvoice(const std::string& deliveryId, const std::string& invoiceId) override;
    StoreStatus UnlinkDeliveryInvoice(const std::string& deliveryId, const std::string& invoiceId) override;
    StoreStatus RemoveDelivery(const std::string& deliveryId) override;

    StoreStatus InsertInvoice(const InvoiceRecord& invoice) override;
    std::optional<InvoiceRecord> GetInvoice(const std::string& invoiceId) override;
    std::vector<InvoiceRecord> ListInvoicesForOrder(const std::string& orderId) override;
    StoreStatus UpdateInvoiceDeliveryStatus(const std::string& invoiceId, DeliveryStatus status) override;
    StoreStatus RemoveInvoice(const std::string& invoiceId) override;

    StoreStatus InsertPayment(const PaymentRecord& payment) override;
    std::optional<PaymentRecord> GetPayment(const std::string& paymentId) override;
    std::vector<PaymentRecord> ListPaymentsForClient(const std::string& clientId) override;

    std::optional<ClientRecord> GetClient(const std::string& clientId) override;
    std::optional<ClientRecord> FindClient(const std::string& partyName, const std::string& mobile) override;
    StoreStatus InsertClient(const ClientRecord& client) override;
    StoreStatus ApplyClientDelta(const std::string& clientId, const ClientDelta& delta) override;
    StoreStatus DebitAdvanceBalance(const std::string& clientId, double amount) override;

    StoreStatus ApplyEmployeeDelta(const std::string& employeeId, const EmployeeDelta& delta) override;
    std::optional<EmployeeStatsRecord> GetEmployeeStats(const std::string& employeeId) override;

    StoreStatus InsertReturn(const ReturnRecord& record) override;
    std::optional<ReturnRecord> GetReturn(const std::string& returnId) override;
    std::vector<ReturnRecord> ListReturnsForOrder(const std::string& orderId) override;
    RefundMutation ApplyRefund(const std::string& returnId, double amount) override;
    StoreStatus RevertRefund(const std::string& returnId, double amount) override;

private:
    std::string table(std::string_view name) const;

    std::unique_ptr<sql::ResultSet> query(const std::string& sql);
    SQLUpdateResult update(const std::string& sql);
    StoreStatus insert(const std::string& sql);
    StoreStatus remove(std::string_view tableName, std::string_view idColumn, const std::string& id);
    bool exists(std::string_view tableName, std::string_view idColumn, const std::string& id);
    // 受影响行数为 0 时：存在 → whenZero，不存在 → kNotFound
    StoreStatus guarded(const SQLUpdateResult& result, std::string_view tableName, std::string_view idColumn, const std::string& id, StoreStatus whenZero);

    std::optional<DeliveryRecord> parseDelivery(sql::ResultSet* rs) const;
    std::optional<InvoiceRecord> parseInvoice(sql::ResultSet* rs) const;
    std::optional<ReturnRecord> parseReturn(sql::ResultSet* rs) const;
    std::optional<OrderRecord> parseOrder(sql::ResultSet* rs) const;

    std::shared_ptr<MySQLConnPool> pool_;
    Options options_;
    bool schemaEnsured_{false};
};
