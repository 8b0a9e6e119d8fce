#include "domain/PaymentAllocator.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <utility>

#include "LogMacros.h"
#include "domain/EventSink.h"
#include "domain/SequenceAllocator.h"
#include "infra/codec/RecordJson.h"

namespace {

bool ValidAmount(double amount) {
    return amount >= 0.01 && std::isfinite(amount);
}

PaymentRecord NewPayment(const PaymentAllocator::PaymentInput& input, PaymentType type, const std::string& clientId) {
    PaymentRecord p;
    p.paymentId = GenerateDocumentId("pay");
    p.amount = RoundMoney(input.amount);
    p.method = input.method;
    p.type = type;
    p.clientId = clientId;
    p.reference = input.reference;
    p.notes = input.notes;
    p.paymentDate = input.paymentDate.value_or(Clock::now());
    return p;
}

ClientDelta PaymentReceived(double paid, const PaymentRecord& payment) {
    ClientDelta d;
    d.totalPaid = paid;
    d.lastPaymentAmount = payment.amount;
    d.lastPaymentDate = payment.paymentDate;
    return d;
}

}  // namespace

// ========== 构造函数 ==========

PaymentAllocator::PaymentAllocator(Dependencies deps) : PaymentAllocator(std::move(deps), Options{}) {}

PaymentAllocator::PaymentAllocator(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

// ========== 单订单收款 ==========

std::optional<PaymentAllocator::PaymentResult> PaymentAllocator::RecordOrderPayment(const std::string& orderId, const PaymentInput& input, FulfillmentError* error) {
    return recordSingleOrder(orderId, {}, input, PaymentType::kOrderPayment, error);
}

std::optional<PaymentAllocator::PaymentResult> PaymentAllocator::RecordInvoicePayment(const std::string& orderId, const std::string& invoiceId, const PaymentInput& input, FulfillmentError* error) {
    return recordSingleOrder(orderId, invoiceId, input, PaymentType::kInvoicePayment, error);
}

std::optional<PaymentAllocator::PaymentResult> PaymentAllocator::recordSingleOrder(const std::string& orderId, const std::string& invoiceId, const PaymentInput& input, PaymentType type, FulfillmentError* error) {
    if (!ValidAmount(input.amount)) {
        SetError(error, FulfillmentError::Validation("payment amount must be positive"));
        return std::nullopt;
    }
    const double amount = RoundMoney(input.amount);

    auto order = creditOrder(orderId, amount, error);
    if (!order)
        return std::nullopt;

    PaymentRecord payment = NewPayment(input, type, order->clientId);
    payment.orderId = order->orderId;
    payment.invoiceId = invoiceId;
    payment.allocations.push_back({order->orderId, order->orderNumber, amount, Clock::now()});
    payment.allocatedAmount = amount;
    payment.remainingAmount = 0.0;

    if (!persistPayment(payment, error)) {
        debitOrder(orderId, amount);
        return std::nullopt;
    }

    PaymentResult result{payment, {*order}, std::nullopt};
    if (order->kind == OrderKind::kStandard && !order->clientId.empty()) {
        deps_.writer->ApplyClientDelta(*order, PaymentReceived(amount, payment));
        result.client = deps_.store->GetClient(order->clientId);
    }

    LOG_INFO("Payment {} of {:.2f} recorded against order {} ({} due)", payment.paymentNumber, amount, order->orderNumber, order->balanceDue);
    notify(result, false);
    return result;
}

// ========== 预收款 ==========

std::optional<PaymentAllocator::PaymentResult> PaymentAllocator::RecordAdvancePayment(const std::string& clientId, const PaymentInput& input, FulfillmentError* error) {
    if (!ValidAmount(input.amount)) {
        SetError(error, FulfillmentError::Validation("payment amount must be positive"));
        return std::nullopt;
    }
    if (!deps_.store->GetClient(clientId)) {
        SetError(error, FulfillmentError::NotFound("client", clientId));
        return std::nullopt;
    }

    PaymentRecord payment = NewPayment(input, PaymentType::kAdvancePayment, clientId);
    payment.allocatedAmount = 0.0;
    payment.remainingAmount = payment.amount;
    if (!persistPayment(payment, error))
        return std::nullopt;

    ClientDelta delta = PaymentReceived(payment.amount, payment);
    delta.advanceBalance = payment.amount;
    const StoreStatus status = deps_.store->ApplyClientDelta(clientId, delta);
    if (status != StoreStatus::kOk)
        LOG_ERROR("Advance {} saved but client {} balance not credited: {}", payment.paymentNumber, clientId, ToString(status));

    PaymentResult result{payment, {}, deps_.store->GetClient(clientId)};
    LOG_INFO("Advance payment {} of {:.2f} credited to client {}", payment.paymentNumber, payment.amount, clientId);
    notify(result, true);
    return result;
}

// ========== 客户收款分摊 ==========

std::optional<PaymentAllocator::PaymentResult> PaymentAllocator::RecordClientPayment(const ClientPaymentRequest& request, FulfillmentError* error) {
    const PaymentInput& input = request.payment;
    if (!ValidAmount(input.amount)) {
        SetError(error, FulfillmentError::Validation("payment amount must be positive"));
        return std::nullopt;
    }
    const double amount = RoundMoney(input.amount);

    if (!deps_.store->GetClient(request.clientId)) {
        SetError(error, FulfillmentError::NotFound("client", request.clientId));
        return std::nullopt;
    }

    PaymentRecord payment = NewPayment(input, PaymentType::kOrderPayment, request.clientId);
    std::vector<OrderRecord> updated;
    std::vector<std::pair<std::string, double>> applied;

    auto rollbackApplied = [&]() {
        for (auto it = applied.rbegin(); it != applied.rend(); ++it)
            debitOrder(it->first, it->second);
    };

    if (!request.allocations.empty()) {
        // 先整体校验，再逐笔入账
        double total = 0.0;
        std::map<std::string, double> perOrder;
        for (const auto& alloc : request.allocations) {
            if (!ValidAmount(alloc.amount)) {
                SetError(error, FulfillmentError::Validation("allocation amount must be positive"));
                return std::nullopt;
            }
            total += RoundMoney(alloc.amount);
            perOrder[alloc.orderId] += RoundMoney(alloc.amount);
        }
        if (total > amount + kMoneyEpsilon) {
            SetError(error, FulfillmentError::Validation(std::format("total allocation {:.2f} exceeds payment amount {:.2f}", total, amount)));
            return std::nullopt;
        }
        for (const auto& [orderId, sum] : perOrder) {
            auto order = deps_.store->GetOrder(orderId);
            if (!order) {
                SetError(error, FulfillmentError::NotFound("order", orderId));
                return std::nullopt;
            }
            if (order->clientId != request.clientId) {
                SetError(error, FulfillmentError::Validation("order " + order->orderNumber + " does not belong to client " + request.clientId));
                return std::nullopt;
            }
            if (order->status == OrderStatus::kCancelled) {
                SetError(error, FulfillmentError::Validation("order " + order->orderNumber + " is cancelled"));
                return std::nullopt;
            }
            if (sum > order->balanceDue + kMoneyEpsilon) {
                SetError(error, FulfillmentError::InsufficientBalance(std::format("allocation for order {} ({:.2f}) exceeds balance due ({:.2f})", order->orderNumber, sum, order->balanceDue)));
                return std::nullopt;
            }
        }

        for (const auto& alloc : request.allocations) {
            const double part = RoundMoney(alloc.amount);
            auto order = creditOrder(alloc.orderId, part, error);
            if (!order) {
                LOG_WARN("Allocation to order {} failed, rolling back {} earlier allocation(s)", alloc.orderId, applied.size());
                rollbackApplied();
                return std::nullopt;
            }
            applied.emplace_back(alloc.orderId, part);
            payment.allocations.push_back({order->orderId, order->orderNumber, part, Clock::now()});
            updated.push_back(std::move(*order));
        }
    } else if (request.autoAllocate) {
        double remaining = amount;
        for (const auto& due : deps_.store->ListOrdersWithBalanceDue(request.clientId)) {
            if (remaining < 0.01)
                break;

            double part = 0.0;
            FulfillmentError stepError;
            auto outcome = deps_.writer->Update(
                due.orderId,
                [&](OrderRecord& order, FulfillmentError*) {
                    // 以最新 balanceDue 为准截断
                    part = RoundMoney(std::min(remaining, order.balanceDue));
                    if (order.status == OrderStatus::kCancelled || part < 0.01)
                        return false;
                    order.advance = RoundMoney(order.advance + part);
                    return true;
                },
                &stepError);
            if (!outcome) {
                if (stepError) {
                    LOG_WARN("Auto allocation to order {} failed ({}), rolling back", due.orderNumber, stepError.message);
                    rollbackApplied();
                    SetError(error, std::move(stepError));
                    return std::nullopt;
                }
                continue;  // 该订单已无欠款
            }
            remaining = RoundMoney(remaining - part);
            applied.emplace_back(due.orderId, part);
            payment.allocations.push_back({due.orderId, due.orderNumber, part, Clock::now()});
            updated.push_back(std::move(outcome->after));
        }
    }

    double allocated = 0.0;
    for (const auto& a : payment.allocations)
        allocated += a.amount;
    payment.allocatedAmount = RoundMoney(allocated);
    payment.remainingAmount = RoundMoney(amount - payment.allocatedAmount);
    if (payment.allocations.empty())
        payment.type = PaymentType::kAdvancePayment;
    if (payment.allocations.size() == 1)
        payment.orderId = payment.allocations.front().orderId;

    if (!persistPayment(payment, error)) {
        rollbackApplied();
        return std::nullopt;
    }

    ClientDelta delta = PaymentReceived(amount, payment);
    delta.advanceBalance = payment.remainingAmount;
    const StoreStatus status = deps_.store->ApplyClientDelta(request.clientId, delta);
    if (status != StoreStatus::kOk)
        LOG_ERROR("Payment {} saved but client {} counters not updated: {}", payment.paymentNumber, request.clientId, ToString(status));

    PaymentResult result{payment, std::move(updated), deps_.store->GetClient(request.clientId)};
    LOG_INFO("Client payment {} of {:.2f}: {:.2f} allocated to {} order(s), {:.2f} kept as advance", payment.paymentNumber, amount, payment.allocatedAmount, payment.allocations.size(),
             payment.remainingAmount);
    notify(result, payment.remainingAmount >= 0.01);
    return result;
}

// ========== 使用预收款 ==========

std::optional<PaymentAllocator::PaymentResult> PaymentAllocator::UseAdvanceForOrder(const std::string& orderId, double amount, FulfillmentError* error) {
    if (!ValidAmount(amount)) {
        SetError(error, FulfillmentError::Validation("amount must be positive"));
        return std::nullopt;
    }
    amount = RoundMoney(amount);

    auto current = deps_.store->GetOrder(orderId);
    if (!current) {
        SetError(error, FulfillmentError::NotFound("order", orderId));
        return std::nullopt;
    }
    if (current->clientId.empty()) {
        SetError(error, FulfillmentError::Validation("order " + current->orderNumber + " has no client account"));
        return std::nullopt;
    }
    auto client = deps_.store->GetClient(current->clientId);
    if (!client) {
        SetError(error, FulfillmentError::NotFound("client", current->clientId));
        return std::nullopt;
    }
    if (amount > client->advanceBalance + kMoneyEpsilon) {
        SetError(error, FulfillmentError::InsufficientBalance(std::format("insufficient advance balance: available {:.2f}, requested {:.2f}", client->advanceBalance, amount)));
        return std::nullopt;
    }

    // 订单先入账（balanceDue 校验即闸门），再守卫扣减客户预收款
    auto order = creditOrder(orderId, amount, error);
    if (!order)
        return std::nullopt;

    const StoreStatus debit = deps_.store->DebitAdvanceBalance(client->clientId, amount);
    if (debit != StoreStatus::kOk) {
        debitOrder(orderId, amount);
        if (debit == StoreStatus::kGuardFailed)
            SetError(error, FulfillmentError::InsufficientBalance("advance balance changed concurrently and is now insufficient"));
        else
            SetError(error, FulfillmentError::Storage("failed to debit advance balance of client " + client->clientId));
        return std::nullopt;
    }

    PaymentRecord payment = NewPayment(PaymentInput{amount, PaymentMethod::kOther, std::nullopt, {}, "advance applied"}, PaymentType::kAdjustment, client->clientId);
    payment.orderId = order->orderId;
    payment.allocations.push_back({order->orderId, order->orderNumber, amount, Clock::now()});
    payment.allocatedAmount = amount;
    payment.remainingAmount = 0.0;
    if (!persistPayment(payment, error)) {
        debitOrder(orderId, amount);
        ClientDelta refund;
        refund.advanceBalance = amount;
        if (deps_.store->ApplyClientDelta(client->clientId, refund) != StoreStatus::kOk)
            LOG_ERROR("Compensation failed: advance {:.2f} not returned to client {}", amount, client->clientId);
        return std::nullopt;
    }

    PaymentResult result{payment, {*order}, deps_.store->GetClient(client->clientId)};
    LOG_INFO("Applied {:.2f} of client {} advance to order {}", amount, client->clientId, order->orderNumber);
    notify(result, true);
    return result;
}

// ========== 查询 ==========

std::vector<PaymentRecord> PaymentAllocator::ListClientPayments(const std::string& clientId) const {
    return deps_.store ? deps_.store->ListPaymentsForClient(clientId) : std::vector<PaymentRecord>{};
}

std::optional<PaymentAllocator::FinancialSummary> PaymentAllocator::ClientFinancialSummary(const std::string& clientId, FulfillmentError* error) const {
    auto client = deps_.store->GetClient(clientId);
    if (!client) {
        SetError(error, FulfillmentError::NotFound("client", clientId));
        return std::nullopt;
    }
    FinancialSummary summary;
    summary.client = std::move(*client);
    summary.ordersWithDue = deps_.store->ListOrdersWithBalanceDue(clientId);
    for (const auto& o : summary.ordersWithDue)
        summary.outstanding += o.balanceDue;
    summary.outstanding = RoundMoney(summary.outstanding);
    summary.netDue = RoundMoney(summary.outstanding - summary.client.advanceBalance);
    return summary;
}

// ========== 内部工具函数 ==========

std::optional<OrderRecord> PaymentAllocator::creditOrder(const std::string& orderId, double amount, FulfillmentError* error) {
    auto outcome = deps_.writer->Update(
        orderId,
        [amount](OrderRecord& order, FulfillmentError* err) {
            if (order.status == OrderStatus::kCancelled) {
                SetError(err, FulfillmentError::Validation("order " + order.orderNumber + " is cancelled"));
                return false;
            }
            if (amount > order.balanceDue + kMoneyEpsilon) {
                SetError(err, FulfillmentError::InsufficientBalance(std::format("payment amount ({:.2f}) exceeds balance due ({:.2f})", amount, order.balanceDue)));
                return false;
            }
            order.advance = RoundMoney(order.advance + amount);
            return true;
        },
        error);
    if (!outcome)
        return std::nullopt;
    return std::move(outcome->after);
}

void PaymentAllocator::debitOrder(const std::string& orderId, double amount) {
    FulfillmentError error;
    auto outcome = deps_.writer->Update(
        orderId,
        [amount](OrderRecord& order, FulfillmentError*) {
            order.advance = std::max(0.0, RoundMoney(order.advance - amount));
            return true;
        },
        &error);
    if (!outcome)
        LOG_ERROR("Compensation failed: could not revert {:.2f} on order {}: {}", amount, orderId, error.message);
}

bool PaymentAllocator::persistPayment(PaymentRecord& payment, FulfillmentError* error) {
    if (!deps_.sequences) {
        SetError(error, FulfillmentError::Storage("sequence allocator unavailable"));
        return false;
    }
    auto allocation = deps_.sequences->AllocateAndPersist(DocumentKind::kPayment, payment.paymentDate, [&](const std::string& number) {
        payment.paymentNumber = number;
        return deps_.store->InsertPayment(payment);
    });
    if (allocation.status != StoreStatus::kOk) {
        LOG_ERROR("Persisting payment of {:.2f} failed: {}", payment.amount, ToString(allocation.status));
        SetError(error, FulfillmentError::Storage("failed to save payment"));
        return false;
    }
    return true;
}

void PaymentAllocator::notify(const PaymentResult& result, bool advanceChanged) const {
    if (!options_.publishEvents || !deps_.events)
        return;

    nlohmann::json payload{{"payment", result.payment}, {"orders", result.orders}};
    if (result.client)
        payload["client"] = *result.client;
    deps_.events->Publish(events::kPaymentRecorded, payload);

    for (const auto& order : result.orders)
        deps_.events->Publish(events::kOrderUpdated, nlohmann::json{{"order", order}});

    if (advanceChanged && result.client)
        deps_.events->Publish(events::kClientAdvanceUpdated, nlohmann::json{{"clientId", result.client->clientId}, {"advanceBalance", result.client->advanceBalance}});
}
