#include "domain/ReturnReconciler.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <utility>

#include "LogMacros.h"
#include "domain/OrderStateMachine.h"
#include "domain/OrderWriter.h"
#include "domain/SequenceAllocator.h"
#include "infra/codec/RecordJson.h"
#include "infra/lock/OrderLockManager.h"

namespace {

double Owed(double advance, double effectiveTotal) {
    return std::max(0.0, advance - std::max(0.0, effectiveTotal));
}

}  // namespace

// ========== 构造函数 ==========

ReturnReconciler::ReturnReconciler(Dependencies deps) : ReturnReconciler(std::move(deps), Options{}) {}

ReturnReconciler::ReturnReconciler(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

// ========== 退货 ==========

std::optional<ReturnReconciler::ReturnResult> ReturnReconciler::CreateReturn(const CreateReturnRequest& request, FulfillmentError* error) {
    if (request.orderId.empty() || request.items.empty()) {
        SetError(error, FulfillmentError::Validation("orderId and at least one returned item are required"));
        return std::nullopt;
    }

    auto token = deps_.locks ? deps_.locks->TryAcquire(request.orderId, options_.lockTtl) : std::optional<std::string>(std::string{});
    if (!token) {
        LOG_WARN("Return rejected: order {} is locked by another operation", request.orderId);
        SetError(error, FulfillmentError::LockContention(request.orderId));
        return std::nullopt;
    }
    OrderLockGuard guard(deps_.locks, request.orderId, *token);

    auto snapshot = deps_.store->GetOrder(request.orderId);
    if (!snapshot) {
        SetError(error, FulfillmentError::NotFound("order", request.orderId));
        return std::nullopt;
    }
    if (snapshot->status == OrderStatus::kCancelled) {
        SetError(error, FulfillmentError::Validation("cannot return items of cancelled order " + snapshot->orderNumber));
        return std::nullopt;
    }
    if (OrderStateMachine::TotalDelivered(*snapshot) <= 0) {
        SetError(error, FulfillmentError::Validation("order " + snapshot->orderNumber + " has no delivered items to return"));
        return std::nullopt;
    }
    if (!request.deliveryId.empty()) {
        auto delivery = deps_.store->GetDelivery(request.deliveryId);
        if (!delivery || delivery->orderId != snapshot->orderId) {
            SetError(error, FulfillmentError::NotFound("delivery", request.deliveryId));
            return std::nullopt;
        }
    }

    // lineId -> 本次退货数量
    std::map<std::string, std::int64_t> returned;
    std::vector<ReturnLineItem> lines;
    std::vector<InventoryLedger::Item> restock;
    for (const auto& item : request.items) {
        const std::string label = item.productName.empty() ? item.productId : item.productName;
        if (item.quantity <= 0) {
            SetError(error, FulfillmentError::Validation("invalid return quantity for \"" + label + "\""));
            return std::nullopt;
        }
        const int idx = OrderStateMachine::FindLine(snapshot->items, item.lineId, item.productId, item.productName);
        if (idx < 0) {
            SetError(error, FulfillmentError::Validation("product \"" + label + "\" not found in order " + snapshot->orderNumber));
            return std::nullopt;
        }
        const OrderLineItem& line = snapshot->items[static_cast<std::size_t>(idx)];
        const std::int64_t returnable = line.deliveredQty - returned[line.lineId];
        if (item.quantity > returnable) {
            SetError(error, FulfillmentError::Validation(std::format("cannot return {} of \"{}\", only {} delivered", item.quantity, line.productName, returnable)));
            return std::nullopt;
        }
        returned[line.lineId] += item.quantity;
        lines.push_back({line.lineId, line.productId, line.productName, line.unitPrice, item.quantity, RoundMoney(line.unitPrice * static_cast<double>(item.quantity))});
        restock.push_back({line.productId, line.productName, item.quantity});
    }

    double returnTotal = 0.0;
    for (const auto& line : lines)
        returnTotal += line.lineTotal;
    returnTotal = RoundMoney(returnTotal);

    const bool counterSale = snapshot->kind == OrderKind::kCounterSale;
    bool deleteOrder = false;
    if (counterSale) {
        deleteOrder = true;
        for (const auto& line : snapshot->items) {
            auto it = returned.find(line.lineId);
            if (line.orderedQty > 0 && (it == returned.end() || it->second < line.orderedQty))
                deleteOrder = false;
        }
    }

    auto restored = deps_.ledger->Restore(restock, error);
    if (!restored)
        return std::nullopt;

    std::optional<OrderRecord> updated;
    double refundable = 0.0;
    if (deleteOrder) {
        // 柜台零售单全部退回：没有客户账可保留，直接删除
        const StoreStatus removed = deps_.store->RemoveOrder(snapshot->orderId);
        if (removed != StoreStatus::kOk) {
            LOG_ERROR("Removing fully returned counter sale {} failed: {}", snapshot->orderNumber, ToString(removed));
            deps_.ledger->Revert(*restored);
            SetError(error, FulfillmentError::Storage("failed to remove order " + snapshot->orderNumber));
            return std::nullopt;
        }
        deps_.writer->Invalidate(snapshot->orderId);
    } else {
        auto outcome = deps_.writer->Update(
            snapshot->orderId,
            [&](OrderRecord& order, FulfillmentError* err) {
                if (order.status == OrderStatus::kCancelled) {
                    SetError(err, FulfillmentError::Validation("order " + order.orderNumber + " was cancelled"));
                    return false;
                }
                for (const auto& [lineId, qty] : returned) {
                    const int idx = OrderStateMachine::FindLine(order.items, lineId, {}, {});
                    if (idx < 0 || order.items[static_cast<std::size_t>(idx)].deliveredQty < qty) {
                        SetError(err, FulfillmentError::Conflict("order " + order.orderNumber + " items changed concurrently"));
                        return false;
                    }
                    auto& line = order.items[static_cast<std::size_t>(idx)];
                    line.deliveredQty -= qty;
                    line.orderedQty -= qty;
                    line.returnedQty += qty;
                }
                order.returnedAmount = RoundMoney(order.returnedAmount + returnTotal);
                order.totalReturns += 1;
                order.isLocked = false;
                if (order.kind == OrderKind::kCounterSale)
                    shrinkCounterSale(order);
                return true;
            },
            error);
        if (!outcome) {
            deps_.ledger->Revert(*restored);
            return std::nullopt;
        }
        if (!counterSale)
            refundable = RefundableIncrease(outcome->before, outcome->after);
        updated = std::move(outcome->after);
    }

    ReturnRecord record;
    record.returnId = GenerateDocumentId("ret");
    record.orderId = snapshot->orderId;
    record.orderNumber = snapshot->orderNumber;
    record.deliveryId = request.deliveryId;
    record.clientId = snapshot->clientId;
    record.partyName = snapshot->partyName;
    record.orderKind = snapshot->kind;
    record.items = std::move(lines);
    record.returnTotal = returnTotal;
    record.refundableAmount = refundable;
    record.refundedAmount = 0.0;
    record.refundStatus = DeriveRefundStatus(refundable, 0.0);
    record.reason = request.reason;
    record.notes = request.notes;
    record.orderDeleted = deleteOrder;
    record.returnDate = request.returnDate.value_or(Clock::now());

    auto allocation = deps_.sequences->AllocateAndPersist(DocumentKind::kReturn, record.returnDate, [&](const std::string& number) {
        record.returnNumber = number;
        return deps_.store->InsertReturn(record);
    });
    if (allocation.status != StoreStatus::kOk) {
        LOG_ERROR("Return for order {} could not be saved ({}), compensating", snapshot->orderNumber, ToString(allocation.status));
        restoreSnapshot(*snapshot, deleteOrder);
        deps_.ledger->Revert(*restored);
        SetError(error, FulfillmentError::Storage("failed to save return"));
        return std::nullopt;
    }

    ReturnResult result{record, updated, std::move(*restored), std::nullopt};
    if (!counterSale && !snapshot->clientId.empty()) {
        ClientDelta delta;
        delta.totalReturns = 1;
        delta.totalReturnValue = returnTotal;
        delta.refundableBalance = refundable;
        deps_.writer->ApplyClientDelta(*snapshot, delta);
        result.client = deps_.store->GetClient(snapshot->clientId);
    }

    LOG_INFO("Return {} recorded for order {}: {} line(s), value {:.2f}, refundable {:.2f}{}", record.returnNumber, snapshot->orderNumber, record.items.size(), returnTotal, refundable,
             deleteOrder ? " (order removed)" : "");
    publish(events::kReturnCreated, nlohmann::json{{"return", record}});
    if (deleteOrder)
        publish(events::kOrderDeleted, nlohmann::json{{"orderId", snapshot->orderId}, {"orderNumber", snapshot->orderNumber}});
    else
        publish(events::kOrderUpdated, nlohmann::json{{"order", *updated}});
    return result;
}

// ========== 退款 ==========

std::optional<ReturnReconciler::RefundResult> ReturnReconciler::RecordRefund(const RefundInput& input, FulfillmentError* error) {
    if (!std::isfinite(input.amount) || input.amount < 0.01) {
        SetError(error, FulfillmentError::Validation("refund amount must be positive"));
        return std::nullopt;
    }
    const double amount = RoundMoney(input.amount);

    auto existing = deps_.store->GetReturn(input.returnId);
    if (!existing) {
        SetError(error, FulfillmentError::NotFound("return", input.returnId));
        return std::nullopt;
    }

    auto mutation = deps_.store->ApplyRefund(input.returnId, amount);
    if (mutation.status == StoreStatus::kGuardFailed) {
        const double outstanding = RoundMoney(existing->refundableAmount - existing->refundedAmount);
        LOG_WARN("Refund of {:.2f} on return {} rejected, {:.2f} outstanding", amount, existing->returnNumber, outstanding);
        SetError(error, FulfillmentError::InsufficientBalance(std::format("refund {:.2f} exceeds refundable balance {:.2f}", amount, std::max(0.0, outstanding))));
        return std::nullopt;
    }
    if (mutation.status == StoreStatus::kNotFound) {
        SetError(error, FulfillmentError::NotFound("return", input.returnId));
        return std::nullopt;
    }
    if (mutation.status != StoreStatus::kOk || !mutation.record) {
        LOG_ERROR("Refund on return {} failed: {}", existing->returnNumber, ToString(mutation.status));
        SetError(error, FulfillmentError::Storage("failed to apply refund"));
        return std::nullopt;
    }

    PaymentRecord payment;
    payment.paymentId = GenerateDocumentId("pay");
    payment.amount = amount;
    payment.method = input.method;
    payment.type = PaymentType::kReturnRefund;
    payment.clientId = existing->clientId;
    payment.orderId = existing->orderId;
    payment.returnId = existing->returnId;
    payment.allocations.push_back({existing->orderId, existing->orderNumber, amount, Clock::now()});
    payment.allocatedAmount = amount;
    payment.remainingAmount = 0.0;
    payment.reference = input.reference;
    payment.notes = input.notes.empty() ? "Refund for return " + existing->returnNumber : input.notes;
    payment.paymentDate = input.paymentDate.value_or(Clock::now());

    auto allocation = deps_.sequences->AllocateAndPersist(DocumentKind::kPayment, payment.paymentDate, [&](const std::string& number) {
        payment.paymentNumber = number;
        return deps_.store->InsertPayment(payment);
    });
    if (allocation.status != StoreStatus::kOk) {
        LOG_ERROR("Refund payment for return {} not saved ({}), reverting refund", existing->returnNumber, ToString(allocation.status));
        if (deps_.store->RevertRefund(existing->returnId, amount) != StoreStatus::kOk)
            LOG_ERROR("Refund of {:.2f} on return {} could not be reverted", amount, existing->returnNumber);
        SetError(error, FulfillmentError::Storage("failed to save refund payment"));
        return std::nullopt;
    }

    RefundResult result{*mutation.record, payment, std::nullopt};
    if (!existing->clientId.empty()) {
        ClientDelta delta;
        delta.refundableBalance = -amount;
        delta.totalPaid = -amount;
        const StoreStatus status = deps_.store->ApplyClientDelta(existing->clientId, delta);
        if (status != StoreStatus::kOk)
            LOG_ERROR("Refund {} saved but client {} balances not updated: {}", payment.paymentNumber, existing->clientId, ToString(status));
        result.client = deps_.store->GetClient(existing->clientId);
    }

    LOG_INFO("Refund {} of {:.2f} recorded on return {} ({})", payment.paymentNumber, amount, existing->returnNumber, ToString(result.record.refundStatus));
    publish(events::kRefundRecorded, nlohmann::json{{"return", result.record}, {"payment", payment}});
    return result;
}

// ========== 查询 ==========

std::optional<ReturnRecord> ReturnReconciler::GetReturn(const std::string& returnId) const {
    return deps_.store->GetReturn(returnId);
}

std::vector<ReturnRecord> ReturnReconciler::ListReturnsForOrder(const std::string& orderId) const {
    return deps_.store->ListReturnsForOrder(orderId);
}

double ReturnReconciler::RefundableIncrease(const OrderRecord& before, const OrderRecord& after) {
    const double owedBefore = Owed(before.advance, OrderStateMachine::EffectiveTotal(before));
    const double owedAfter = Owed(after.advance, OrderStateMachine::EffectiveTotal(after));
    return std::max(0.0, RoundMoney(owedAfter - owedBefore));
}

// ========== 内部工具函数 ==========

void ReturnReconciler::shrinkCounterSale(OrderRecord& order) {
    std::erase_if(order.items, [](const OrderLineItem& line) { return line.orderedQty <= 0; });
    for (auto& line : order.items) {
        line.returnedQty = 0;
        line.lineTotal = OrderStateMachine::LineTotal(line);
    }
    order.pricing = OrderStateMachine::ComputePricing(order.items, OrderStateMachine::ChargesOf(order.pricing));
    order.returnedAmount = 0.0;
    order.advance = std::max(0.0, order.pricing.grandTotal);
}

void ReturnReconciler::restoreSnapshot(const OrderRecord& snapshot, bool deleted) {
    if (deleted) {
        if (deps_.store->InsertOrder(snapshot) != StoreStatus::kOk)
            LOG_ERROR("Counter sale {} could not be re-inserted after failed return", snapshot.orderNumber);
        return;
    }

    FulfillmentError err;
    auto reverted = deps_.writer->Update(
        snapshot.orderId,
        [&](OrderRecord& order, FulfillmentError*) {
            order.items = snapshot.items;
            order.pricing = snapshot.pricing;
            order.advance = snapshot.advance;
            order.returnedAmount = snapshot.returnedAmount;
            order.totalReturns = snapshot.totalReturns;
            order.isLocked = snapshot.isLocked;
            return true;
        },
        &err);
    if (!reverted)
        LOG_ERROR("Order {} could not be restored after failed return: {}", snapshot.orderNumber, err.message);
}

void ReturnReconciler::publish(const char* event, const nlohmann::json& payload) const {
    if (options_.publishEvents && deps_.events)
        deps_.events->Publish(event, payload);
}
