#include "domain/OrderWriter.h"

#include <cmath>
#include <utility>

#include "LogMacros.h"
#include "domain/OrderStateMachine.h"
#include "infra/cache/OrderReadCache.h"

namespace {

bool HasClientLedger(const OrderRecord& order) {
    return order.kind == OrderKind::kStandard && !order.clientId.empty();
}

double DueContribution(const OrderRecord& order) {
    return order.status == OrderStatus::kCancelled ? 0.0 : order.balanceDue;
}

bool IsEmpty(const ClientDelta& d) {
    return d.totalOrders == 0 && d.openOrders == 0 && d.completedOrders == 0 && std::abs(d.totalSpent) < kMoneyEpsilon && std::abs(d.totalPaid) < kMoneyEpsilon &&
           std::abs(d.totalDue) < kMoneyEpsilon && std::abs(d.advanceBalance) < kMoneyEpsilon && std::abs(d.refundableBalance) < kMoneyEpsilon && d.totalReturns == 0 &&
           std::abs(d.totalReturnValue) < kMoneyEpsilon && !d.lastPaymentAmount;
}

}  // namespace

// ========== 构造函数 ==========

OrderWriter::OrderWriter(Dependencies deps) : OrderWriter(std::move(deps), Options{}) {}

OrderWriter::OrderWriter(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

// ========== 读-改-写 ==========

std::optional<OrderWriter::Outcome> OrderWriter::Update(const std::string& orderId, const Mutator& mutate, FulfillmentError* error) {
    if (!deps_.store) {
        SetError(error, FulfillmentError::Storage("order store unavailable"));
        return std::nullopt;
    }

    for (int attempt = 1; attempt <= options_.maxAttempts; ++attempt) {
        auto current = deps_.store->GetOrder(orderId);
        if (!current) {
            SetError(error, FulfillmentError::NotFound("order", orderId));
            return std::nullopt;
        }

        Outcome outcome{*current, *current};
        if (!mutate(outcome.after, error))
            return std::nullopt;

        OrderStateMachine::Apply(outcome.after);
        outcome.after.updatedAt = Clock::now();

        const StoreStatus status = deps_.store->ReplaceOrder(outcome.after, outcome.before.version);
        if (status == StoreStatus::kOk) {
            outcome.after.version = outcome.before.version + 1;
            Invalidate(orderId);
            ApplyClientDelta(outcome.after, TransitionDelta(outcome.before, outcome.after));
            return outcome;
        }
        if (status == StoreStatus::kConflict) {
            LOG_DEBUG("Order {} version {} changed concurrently (attempt {}/{})", orderId, outcome.before.version, attempt, options_.maxAttempts);
            continue;
        }
        if (status == StoreStatus::kNotFound) {
            SetError(error, FulfillmentError::NotFound("order", orderId));
            return std::nullopt;
        }

        LOG_ERROR("Saving order {} failed: {}", orderId, ToString(status));
        SetError(error, FulfillmentError::Storage("failed to save order " + orderId));
        return std::nullopt;
    }

    LOG_WARN("Order {} update gave up after {} conflicting attempts", orderId, options_.maxAttempts);
    SetError(error, FulfillmentError::Conflict("order " + orderId + " is being modified concurrently, retry"));
    return std::nullopt;
}

// ========== 客户计数器 ==========

ClientDelta OrderWriter::ContributionOf(const OrderRecord& order) {
    ClientDelta d;
    if (!HasClientLedger(order))
        return d;
    d.totalOrders = 1;
    d.openOrders = OrderStateMachine::CountsAsOpen(order.status) ? 1 : 0;
    d.completedOrders = order.status == OrderStatus::kCompleted ? 1 : 0;
    d.totalSpent = order.pricing.grandTotal;
    d.totalDue = DueContribution(order);
    return d;
}

ClientDelta OrderWriter::TransitionDelta(const OrderRecord& before, const OrderRecord& after) {
    ClientDelta d;
    if (!HasClientLedger(after))
        return d;
    d.openOrders = (OrderStateMachine::CountsAsOpen(after.status) ? 1 : 0) - (OrderStateMachine::CountsAsOpen(before.status) ? 1 : 0);
    d.completedOrders = (after.status == OrderStatus::kCompleted ? 1 : 0) - (before.status == OrderStatus::kCompleted ? 1 : 0);
    d.totalSpent = RoundMoney(after.pricing.grandTotal - before.pricing.grandTotal);
    d.totalDue = RoundMoney(DueContribution(after) - DueContribution(before));
    return d;
}

void OrderWriter::ApplyClientDelta(const OrderRecord& order, const ClientDelta& delta) const {
    if (!deps_.store || !HasClientLedger(order) || IsEmpty(delta))
        return;
    const StoreStatus status = deps_.store->ApplyClientDelta(order.clientId, delta);
    if (status != StoreStatus::kOk)
        LOG_ERROR("Client {} counters not updated for order {}: {}", order.clientId, order.orderNumber, ToString(status));
}

void OrderWriter::Invalidate(const std::string& orderId) const {
    if (deps_.cache)
        deps_.cache->Invalidate(orderId);
}
