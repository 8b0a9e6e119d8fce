#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/FulfillmentError.h"
#include "domain/OrderWriter.h"
#include "infra/store/FulfillmentStore.h"

class EventSink;
class SequenceAllocator;

/**
 * @brief PaymentAllocator：收款入账与分摊
 *
 * 先改订单（订单自身的余额校验即闸门），再写收款单；收款单写入失败时撤销已入账的订单。
 * 不变量：payment.allocatedAmount + payment.remainingAmount == payment.amount。
 */
class PaymentAllocator {
public:
    struct Dependencies {
        FulfillmentStore* store{nullptr};
        OrderWriter* writer{nullptr};
        SequenceAllocator* sequences{nullptr};
        EventSink* events{nullptr};
    };

    struct Options {
        bool publishEvents{true};
    };

    struct PaymentInput {
        double amount{0.0};
        PaymentMethod method{PaymentMethod::kCash};
        std::optional<TimePoint> paymentDate;
        std::string reference;
        std::string notes;
    };

    struct AllocationInput {
        std::string orderId;
        double amount{0.0};
    };

    struct ClientPaymentRequest {
        std::string clientId;
        PaymentInput payment;
        std::vector<AllocationInput> allocations;  // 非空时按指定分摊
        bool autoAllocate{true};  // allocations 为空时：按下单日期从旧到新自动分摊
    };

    struct PaymentResult {
        PaymentRecord payment;
        std::vector<OrderRecord> orders;  // 被入账的订单（入账后）
        std::optional<ClientRecord> client;
    };

    struct FinancialSummary {
        ClientRecord client;
        std::vector<OrderRecord> ordersWithDue;
        double outstanding{0.0};  // Σ ordersWithDue.balanceDue
        double netDue{0.0};  // outstanding - advanceBalance
    };

    PaymentAllocator(Dependencies deps);
    PaymentAllocator(Dependencies deps, Options options);

    std::optional<PaymentResult> RecordOrderPayment(const std::string& orderId, const PaymentInput& input, FulfillmentError* error = nullptr);
    // 开票时随票收取的预付款（invoice_payment）
    std::optional<PaymentResult> RecordInvoicePayment(const std::string& orderId, const std::string& invoiceId, const PaymentInput& input, FulfillmentError* error = nullptr);
    std::optional<PaymentResult> RecordAdvancePayment(const std::string& clientId, const PaymentInput& input, FulfillmentError* error = nullptr);
    std::optional<PaymentResult> RecordClientPayment(const ClientPaymentRequest& request, FulfillmentError* error = nullptr);
    std::optional<PaymentResult> UseAdvanceForOrder(const std::string& orderId, double amount, FulfillmentError* error = nullptr);

    std::vector<PaymentRecord> ListClientPayments(const std::string& clientId) const;
    std::optional<FinancialSummary> ClientFinancialSummary(const std::string& clientId, FulfillmentError* error = nullptr) const;

private:
    std::optional<PaymentResult> recordSingleOrder(const std::string& orderId, const std::string& invoiceId, const PaymentInput& input, PaymentType type, FulfillmentError* error);

    // 订单 advance += amount；amount 超过当前 balanceDue 时拒绝
    std::optional<OrderRecord> creditOrder(const std::string& orderId, double amount, FulfillmentError* error);
    // 撤销 creditOrder
    void debitOrder(const std::string& orderId, double amount);

    bool persistPayment(PaymentRecord& payment, FulfillmentError* error);
    void notify(const PaymentResult& result, bool advanceChanged) const;

    Dependencies deps_;
    Options options_;
};
