#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

#include "infra/store/FulfillmentStore.h"

/**
 * @brief InMemoryFulfillmentStore：进程内实现
 *
 * 单把互斥锁保护全部集合，每个接口方法即一次原子操作，语义与 MySQL 实现一致。
 * 用于单元测试与 storage.backend=memory 的单机运行。
 */
class InMemoryFulfillmentStore : public FulfillmentStore {
public:
    InMemoryFulfillmentStore() = default;

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
    bool numberTaken(DocumentKind kind, const std::string& number) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProductRecord> products_;
    std::unordered_map<std::string, OrderRecord> orders_;
    std::unordered_map<std::string, DeliveryRecord> deliveries_;
    std::unordered_map<std::string, InvoiceRecord> invoices_;
    std::unordered_map<std::string, PaymentRecord> payments_;
    std::unordered_map<std::string, ClientRecord> clients_;
    std::unordered_map<std::string, EmployeeStatsRecord> employees_;
    std::unordered_map<std::string, ReturnRecord> returns_;
    std::map<DocumentKind, std::set<std::string>> numbers_;  // 各种类已占用编号（有序，便于取最大）
};
