#include "domain/FulfillmentService.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <utility>

#include "LogMacros.h"
#include "domain/OrderWriter.h"
#include "domain/SequenceAllocator.h"
#include "infra/cache/OrderReadCache.h"
#include "infra/codec/RecordJson.h"
#include "infra/lock/OrderLockManager.h"

namespace {

bool ValidMoney(double v) {
    return std::isfinite(v) && v >= 0.0;
}

bool ValidateCharges(const Charges& c, FulfillmentError* error) {
    if (!ValidMoney(c.freight) || !ValidMoney(c.discount) || !ValidMoney(c.taxPercent) || c.taxPercent > 100.0) {
        SetError(error, FulfillmentError::Validation("freight, discount and tax percent must be non-negative (tax <= 100)"));
        return false;
    }
    return true;
}

int LineSequence(const std::string& lineId) {
    if (lineId.size() < 2 || lineId[0] != 'L')
        return 0;
    int value = 0;
    for (std::size_t i = 1; i < lineId.size(); ++i) {
        if (lineId[i] < '0' || lineId[i] > '9')
            return 0;
        value = value * 10 + (lineId[i] - '0');
    }
    return value;
}

bool SameLines(const std::vector<OrderLineItem>& a, const std::vector<OrderLineItem>& b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].lineId != b[i].lineId || a[i].orderedQty != b[i].orderedQty || a[i].deliveredQty != b[i].deliveredQty || a[i].returnedQty != b[i].returnedQty)
            return false;
    }
    return true;
}

ClientDelta Negate(const ClientDelta& d) {
    ClientDelta n;
    n.totalOrders = -d.totalOrders;
    n.openOrders = -d.openOrders;
    n.completedOrders = -d.completedOrders;
    n.totalSpent = -d.totalSpent;
    n.totalPaid = -d.totalPaid;
    n.totalDue = -d.totalDue;
    n.advanceBalance = -d.advanceBalance;
    n.refundableBalance = -d.refundableBalance;
    n.totalReturns = -d.totalReturns;
    n.totalReturnValue = -d.totalReturnValue;
    return n;
}

EmployeeDelta DeliveryTally(DeliveryPerformance performance, int sign) {
    EmployeeDelta d;
    d.totalDeliveries = sign;
    if (performance == DeliveryPerformance::kEarly)
        d.earlyDeliveries = sign;
    else if (performance == DeliveryPerformance::kOnTime)
        d.onTimeDeliveries = sign;
    else if (performance == DeliveryPerformance::kLate)
        d.lateDeliveries = sign;
    return d;
}

}  // namespace

// ========== 构造函数 ==========

FulfillmentService::FulfillmentService(Dependencies deps) : FulfillmentService(std::move(deps), Options{}) {}

FulfillmentService::FulfillmentService(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

// ========== 下单 ==========

std::optional<FulfillmentService::CreateOrderResult> FulfillmentService::CreateOrder(const CreateOrderRequest& request, FulfillmentError* error) {
    if (request.items.empty()) {
        SetError(error, FulfillmentError::Validation("order must contain at least one item"));
        return std::nullopt;
    }
    if (!ValidateCharges(request.charges, error))
        return std::nullopt;
    if (!ValidMoney(request.advance)) {
        SetError(error, FulfillmentError::Validation("advance must be non-negative"));
        return std::nullopt;
    }
    const bool counterSale = request.kind == OrderKind::kCounterSale;
    if (!counterSale && request.client.clientId.empty() && request.client.partyName.empty()) {
        SetError(error, FulfillmentError::Validation("partyName or clientId is required"));
        return std::nullopt;
    }

    auto lines = buildLines(request.items, {}, error);
    if (!lines)
        return std::nullopt;

    OrderRecord order;
    order.orderId = GenerateDocumentId("ord");
    order.kind = request.kind;
    order.items = std::move(*lines);
    order.pricing = OrderStateMachine::ComputePricing(order.items, request.charges);
    if (order.pricing.grandTotal < 0.0) {
        SetError(error, FulfillmentError::Validation("discount exceeds order total"));
        return std::nullopt;
    }
    if (!counterSale && request.advance > order.pricing.grandTotal + kMoneyEpsilon) {
        SetError(error, FulfillmentError::Validation(std::format("advance {:.2f} exceeds grand total {:.2f}", request.advance, order.pricing.grandTotal)));
        return std::nullopt;
    }

    if (!counterSale) {
        auto client = resolveClient(request.client, error);
        if (!client)
            return std::nullopt;
        order.clientId = client->clientId;
        order.partyName = client->partyName;
        order.mobile = client->mobile;
    } else {
        order.partyName = request.client.partyName;
        order.mobile = request.client.mobile;
    }

    const TimePoint now = Clock::now();
    order.employeeId = request.employeeId;
    order.orderDate = request.orderDate.value_or(now);
    order.createdAt = now;
    order.updatedAt = now;
    order.expectedDeliveryDate = request.expectedDeliveryDate;
    order.notes = request.notes;
    if (counterSale) {
        // 柜台零售：当场交付、当场付清
        for (auto& line : order.items)
            line.deliveredQty = line.orderedQty;
        order.advance = order.pricing.grandTotal;
        order.actualDeliveryDate = order.orderDate;
    } else {
        order.advance = RoundMoney(request.advance);
    }
    OrderStateMachine::Apply(order);

    // 严格扣减：库存不足时不会有订单落库
    auto inventory = deps_.ledger->Reduce(stockItems(order.items), false, error);
    if (!inventory)
        return std::nullopt;

    auto allocation = deps_.sequences->AllocateAndPersist(DocumentKind::kOrder, order.orderDate, [&](const std::string& number) {
        order.orderNumber = number;
        return deps_.store->InsertOrder(order);
    });
    if (allocation.status != StoreStatus::kOk) {
        LOG_ERROR("Order insert failed ({}), restoring reserved stock", ToString(allocation.status));
        deps_.ledger->Revert(*inventory);
        SetError(error, FulfillmentError::Storage("failed to save order"));
        return std::nullopt;
    }

    ClientDelta contribution = OrderWriter::ContributionOf(order);
    contribution.totalPaid = order.advance;
    deps_.writer->ApplyClientDelta(order, contribution);

    if (!order.employeeId.empty()) {
        EmployeeDelta tally;
        tally.totalOrders = 1;
        if (deps_.store->ApplyEmployeeDelta(order.employeeId, tally) != StoreStatus::kOk)
            LOG_WARN("Employee {} stats not updated for order {}", order.employeeId, order.orderNumber);
    }

    if (options_.useCache && deps_.cache)
        deps_.cache->PutOrder(order);

    LOG_INFO("Order {} created: {} line(s), total {:.2f}, advance {:.2f}, kind {}", order.orderNumber, order.items.size(), order.pricing.grandTotal, order.advance, ToString(order.kind));
    publish(events::kOrderCreated, nlohmann::json{{"order", order}});
    return CreateOrderResult{std::move(order), std::move(*inventory)};
}

// ========== 取消 ==========

std::optional<OrderRecord> FulfillmentService::CancelOrder(const std::string& orderId, const std::string& reason, FulfillmentError* error) {
    auto token = deps_.locks ? deps_.locks->TryAcquire(orderId, options_.lockTtl) : std::optional<std::string>(std::string{});
    if (!token) {
        SetError(error, FulfillmentError::LockContention(orderId));
        return std::nullopt;
    }
    OrderLockGuard guard(deps_.locks, orderId, *token);

    std::vector<InventoryLedger::Item> undelivered;
    auto outcome = deps_.writer->Update(
        orderId,
        [&](OrderRecord& order, FulfillmentError* err) {
            if (order.status == OrderStatus::kCancelled) {
                SetError(err, FulfillmentError::Validation("order " + order.orderNumber + " is already cancelled"));
                return false;
            }
            if (order.isLocked || order.status == OrderStatus::kCompleted) {
                SetError(err, FulfillmentError::Validation("completed order " + order.orderNumber + " cannot be cancelled"));
                return false;
            }
            undelivered.clear();
            for (const auto& line : order.items) {
                const std::int64_t remaining = line.orderedQty - line.deliveredQty;
                if (remaining > 0)
                    undelivered.push_back({line.productId, line.productName, remaining});
            }
            order.status = OrderStatus::kCancelled;
            order.cancelReason = reason;
            return true;
        },
        error);
    if (!outcome)
        return std::nullopt;

    // 订单已取消，归还尚未发出的数量；已发出的只能走退货
    FulfillmentError restoreError;
    if (!deps_.ledger->Restore(undelivered, &restoreError))
        LOG_ERROR("Order {} cancelled but stock restore failed: {}", outcome->after.orderNumber, restoreError.message);

    LOG_INFO("Order {} cancelled: {}", outcome->after.orderNumber, reason);
    publish(events::kOrderCancelled, nlohmann::json{{"order", outcome->after}, {"reason", reason}});
    return std::move(outcome->after);
}

// ========== 管理删除 ==========

std::optional<FulfillmentService::DeleteOrderResult> FulfillmentService::DeleteOrder(const std::string& orderId, FulfillmentError* error) {
    auto token = deps_.locks ? deps_.locks->TryAcquire(orderId, options_.lockTtl) : std::optional<std::string>(std::string{});
    if (!token) {
        SetError(error, FulfillmentError::LockContention(orderId));
        return std::nullopt;
    }
    OrderLockGuard guard(deps_.locks, orderId, *token);

    auto order = deps_.store->GetOrder(orderId);
    if (!order) {
        SetError(error, FulfillmentError::NotFound("order", orderId));
        return std::nullopt;
    }
    const auto deliveries = deps_.store->ListDeliveriesForOrder(orderId);
    const auto invoices = deps_.store->ListInvoicesForOrder(orderId);

    const StoreStatus removed = deps_.store->RemoveOrder(orderId);
    if (removed != StoreStatus::kOk) {
        if (removed == StoreStatus::kNotFound)
            SetError(error, FulfillmentError::NotFound("order", orderId));
        else
            SetError(error, FulfillmentError::Storage("failed to delete order " + orderId));
        return std::nullopt;
    }

    DeleteOrderResult result{*order, 0, 0};
    for (const auto& delivery : deliveries) {
        if (deps_.store->RemoveDelivery(delivery.deliveryId) == StoreStatus::kOk)
            ++result.deliveriesRemoved;
        else
            LOG_ERROR("Delivery {} of deleted order {} could not be removed", delivery.deliveryNumber, order->orderNumber);

        const std::string& employeeId = delivery.employeeId.empty() ? order->employeeId : delivery.employeeId;
        if (!employeeId.empty() && deps_.store->ApplyEmployeeDelta(employeeId, DeliveryTally(delivery.performance, -1)) != StoreStatus::kOk)
            LOG_WARN("Employee {} delivery stats not reversed for {}", employeeId, delivery.deliveryNumber);
    }
    for (const auto& invoice : invoices) {
        if (deps_.store->RemoveInvoice(invoice.invoiceId) == StoreStatus::kOk)
            ++result.invoicesRemoved;
        else
            LOG_ERROR("Invoice {} of deleted order {} could not be removed", invoice.invoiceNumber, order->orderNumber);
    }

    // 计数器回退，库存不回退（与取消不同）
    deps_.writer->ApplyClientDelta(*order, Negate(OrderWriter::ContributionOf(*order)));
    if (!order->employeeId.empty()) {
        EmployeeDelta tally;
        tally.totalOrders = -1;
        if (deps_.store->ApplyEmployeeDelta(order->employeeId, tally) != StoreStatus::kOk)
            LOG_WARN("Employee {} order count not reversed for {}", order->employeeId, order->orderNumber);
    }
    deps_.writer->Invalidate(orderId);

    LOG_INFO("Order {} deleted with {} delivery(ies) and {} invoice(s)", order->orderNumber, result.deliveriesRemoved, result.invoicesRemoved);
    publish(events::kOrderDeleted, nlohmann::json{{"orderId", order->orderId}, {"orderNumber", order->orderNumber}});
    return result;
}

// ========== 修改明细 ==========

std::optional<OrderRecord> FulfillmentService::UpdateOrderItems(const std::string& orderId, const std::vector<ItemInput>& items, const std::optional<Charges>& charges, FulfillmentError* error) {
    if (items.empty()) {
        SetError(error, FulfillmentError::Validation("order must contain at least one item"));
        return std::nullopt;
    }
    if (charges && !ValidateCharges(*charges, error))
        return std::nullopt;

    auto token = deps_.locks ? deps_.locks->TryAcquire(orderId, options_.lockTtl) : std::optional<std::string>(std::string{});
    if (!token) {
        SetError(error, FulfillmentError::LockContention(orderId));
        return std::nullopt;
    }
    OrderLockGuard guard(deps_.locks, orderId, *token);

    auto snapshot = deps_.store->GetOrder(orderId);
    if (!snapshot) {
        SetError(error, FulfillmentError::NotFound("order", orderId));
        return std::nullopt;
    }
    if (!OrderStateMachine::IsEditable(*snapshot)) {
        SetError(error, FulfillmentError::Validation("order " + snapshot->orderNumber + " is locked or cancelled"));
        return std::nullopt;
    }

    auto lines = buildLines(items, snapshot->items, error);
    if (!lines)
        return std::nullopt;
    const Pricing pricing = OrderStateMachine::ComputePricing(*lines, charges.value_or(OrderStateMachine::ChargesOf(snapshot->pricing)));
    if (pricing.grandTotal < 0.0) {
        SetError(error, FulfillmentError::Validation("discount exceeds order total"));
        return std::nullopt;
    }
    if (snapshot->advance > pricing.grandTotal - snapshot->returnedAmount + kMoneyEpsilon) {
        SetError(error, FulfillmentError::Validation(std::format("amount already paid ({:.2f}) exceeds the new total", snapshot->advance)));
        return std::nullopt;
    }

    auto adjusted = deps_.ledger->Adjust(stockItems(snapshot->items), stockItems(*lines), error);
    if (!adjusted)
        return std::nullopt;

    auto outcome = deps_.writer->Update(
        orderId,
        [&](OrderRecord& order, FulfillmentError* err) {
            if (!OrderStateMachine::IsEditable(order)) {
                SetError(err, FulfillmentError::Validation("order " + order.orderNumber + " is locked or cancelled"));
                return false;
            }
            if (!SameLines(order.items, snapshot->items)) {
                SetError(err, FulfillmentError::Conflict("order " + order.orderNumber + " items changed concurrently"));
                return false;
            }
            // 快照之后可能有付款入账，按最新的已付金额重新校验
            if (order.advance > pricing.grandTotal - order.returnedAmount + kMoneyEpsilon) {
                SetError(err, FulfillmentError::Validation(std::format("amount already paid ({:.2f}) exceeds the new total", order.advance)));
                return false;
            }
            order.items = *lines;
            order.pricing = pricing;
            return true;
        },
        error);
    if (!outcome) {
        deps_.ledger->Revert(*adjusted);
        return std::nullopt;
    }

    LOG_INFO("Order {} items updated: total {:.2f} -> {:.2f}", outcome->after.orderNumber, outcome->before.pricing.grandTotal, outcome->after.pricing.grandTotal);
    publish(events::kOrderUpdated, nlohmann::json{{"order", outcome->after}});
    return std::move(outcome->after);
}

std::optional<OrderRecord> FulfillmentService::UpdateOrderDetails(const std::string& orderId, const std::optional<std::string>& notes, const std::optional<TimePoint>& expectedDeliveryDate, FulfillmentError* error) {
    auto outcome = deps_.writer->Update(
        orderId,
        [&](OrderRecord& order, FulfillmentError* err) {
            if (!OrderStateMachine::IsEditable(order)) {
                SetError(err, FulfillmentError::Validation("order " + order.orderNumber + " is locked or cancelled"));
                return false;
            }
            if (notes)
                order.notes = *notes;
            if (expectedDeliveryDate)
                order.expectedDeliveryDate = expectedDeliveryDate;
            return true;
        },
        error);
    if (!outcome)
        return std::nullopt;

    publish(events::kOrderUpdated, nlohmann::json{{"order", outcome->after}});
    return std::move(outcome->after);
}

// ========== 发货 ==========

std::optional<FulfillmentService::CreateDeliveryResult> FulfillmentService::CreateDelivery(const CreateDeliveryRequest& request, FulfillmentError* error) {
    if (request.orderId.empty()) {
        SetError(error, FulfillmentError::Validation("orderId is required"));
        return std::nullopt;
    }
    if (!ValidateCharges(request.charges, error))
        return std::nullopt;

    // 同一订单的两次发货不能交错读写剩余数量
    auto token = deps_.locks ? deps_.locks->TryAcquire(request.orderId, options_.lockTtl) : std::optional<std::string>(std::string{});
    if (!token) {
        LOG_WARN("Delivery rejected: order {} is locked by another operation", request.orderId);
        SetError(error, FulfillmentError::LockContention(request.orderId));
        return std::nullopt;
    }
    OrderLockGuard guard(deps_.locks, request.orderId, *token);

    auto order = deps_.store->GetOrder(request.orderId);
    if (!order) {
        SetError(error, FulfillmentError::NotFound("order", request.orderId));
        return std::nullopt;
    }
    if (order->status == OrderStatus::kCancelled) {
        SetError(error, FulfillmentError::Validation("cannot deliver cancelled order " + order->orderNumber));
        return std::nullopt;
    }

    // lineId -> 本次发货数量
    std::map<std::string, std::int64_t> shipped;
    std::vector<DeliveryLineItem> lines;
    if (request.deliverAll || request.items.empty()) {
        for (const auto& line : order->items) {
            const std::int64_t remaining = line.orderedQty - line.deliveredQty;
            if (remaining <= 0)
                continue;
            shipped[line.lineId] = remaining;
            lines.push_back({line.lineId, line.productId, line.productName, line.unitPrice, remaining, RoundMoney(line.unitPrice * static_cast<double>(remaining))});
        }
        if (lines.empty()) {
            SetError(error, FulfillmentError::Validation("no remaining items to deliver on order " + order->orderNumber));
            return std::nullopt;
        }
    } else {
        for (const auto& item : request.items) {
            const std::string label = item.productName.empty() ? item.productId : item.productName;
            if (item.quantity <= 0) {
                SetError(error, FulfillmentError::Validation("invalid delivery quantity for \"" + label + "\""));
                return std::nullopt;
            }
            const int idx = OrderStateMachine::FindLine(order->items, item.lineId, item.productId, item.productName);
            if (idx < 0) {
                SetError(error, FulfillmentError::Validation("product \"" + label + "\" not found in order " + order->orderNumber));
                return std::nullopt;
            }
            const OrderLineItem& line = order->items[static_cast<std::size_t>(idx)];
            const std::int64_t remaining = line.orderedQty - line.deliveredQty - shipped[line.lineId];
            if (item.quantity > remaining) {
                SetError(error, FulfillmentError::Validation(std::format("cannot deliver {} of \"{}\", only {} remaining", item.quantity, line.productName, remaining)));
                return std::nullopt;
            }
            shipped[line.lineId] += item.quantity;
            const double price = item.unitPrice.value_or(line.unitPrice);
            if (!ValidMoney(price)) {
                SetError(error, FulfillmentError::Validation("invalid unit price for \"" + label + "\""));
                return std::nullopt;
            }
            lines.push_back({line.lineId, line.productId, line.productName, price, item.quantity, RoundMoney(price * static_cast<double>(item.quantity))});
        }
    }

    DeliveryRecord delivery;
    delivery.deliveryId = GenerateDocumentId("del");
    delivery.orderId = order->orderId;
    delivery.orderNumber = order->orderNumber;
    delivery.clientId = order->clientId;
    delivery.partyName = order->partyName;
    delivery.employeeId = request.employeeId.empty() ? order->employeeId : request.employeeId;
    delivery.items = std::move(lines);
    delivery.pricing = OrderStateMachine::ComputePricing(delivery.items, request.charges);
    delivery.deliveryDate = request.deliveryDate.value_or(Clock::now());
    delivery.expectedDeliveryDate = order->expectedDeliveryDate;
    delivery.performance = OrderStateMachine::DerivePerformance(delivery.deliveryDate, delivery.expectedDeliveryDate);
    delivery.status = DeliveryStatus::kPending;
    delivery.notes = request.notes;
    delivery.createdAt = Clock::now();

    auto allocation = deps_.sequences->AllocateAndPersist(DocumentKind::kDelivery, delivery.deliveryDate, [&](const std::string& number) {
        delivery.deliveryNumber = number;
        return deps_.store->InsertDelivery(delivery);
    });
    if (allocation.status != StoreStatus::kOk) {
        LOG_ERROR("Delivery insert for order {} failed: {}", order->orderNumber, ToString(allocation.status));
        SetError(error, FulfillmentError::Storage("failed to save delivery"));
        return std::nullopt;
    }

    auto outcome = deps_.writer->Update(
        order->orderId,
        [&](OrderRecord& current, FulfillmentError* err) {
            if (current.status == OrderStatus::kCancelled) {
                SetError(err, FulfillmentError::Validation("order " + current.orderNumber + " was cancelled"));
                return false;
            }
            for (const auto& [lineId, qty] : shipped) {
                const int idx = OrderStateMachine::FindLine(current.items, lineId, {}, {});
                if (idx < 0 || current.items[static_cast<std::size_t>(idx)].orderedQty - current.items[static_cast<std::size_t>(idx)].deliveredQty < qty) {
                    SetError(err, FulfillmentError::Conflict("order " + current.orderNumber + " items changed concurrently"));
                    return false;
                }
                current.items[static_cast<std::size_t>(idx)].deliveredQty += qty;
            }
            current.totalDeliveries += 1;
            if (OrderStateMachine::ComputeProgress(current.items) == 100 && !current.actualDeliveryDate) {
                current.actualDeliveryDate = delivery.deliveryDate;
                current.deliveryPerformance = OrderStateMachine::DerivePerformance(delivery.deliveryDate, current.expectedDeliveryDate);
            }
            return true;
        },
        error);
    if (!outcome) {
        LOG_WARN("Order update for delivery {} failed, removing delivery", delivery.deliveryNumber);
        if (deps_.store->RemoveDelivery(delivery.deliveryId) != StoreStatus::kOk)
            LOG_ERROR("Orphan delivery {} could not be removed", delivery.deliveryNumber);
        return std::nullopt;
    }

    if (!delivery.employeeId.empty() && deps_.store->ApplyEmployeeDelta(delivery.employeeId, DeliveryTally(delivery.performance, 1)) != StoreStatus::kOk)
        LOG_WARN("Employee {} delivery stats not updated", delivery.employeeId);

    LOG_INFO("Delivery {} created for order {}: {} line(s), progress {}%", delivery.deliveryNumber, outcome->after.orderNumber, delivery.items.size(), outcome->after.progress);
    publish(events::kDeliveryCreated, nlohmann::json{{"delivery", delivery}, {"order", outcome->after}});
    publish(events::kOrderUpdated, nlohmann::json{{"order", outcome->after}});
    return CreateDeliveryResult{std::move(delivery), std::move(outcome->after)};
}

// ========== 开票 ==========

std::optional<FulfillmentService::InvoiceResult> FulfillmentService::GenerateDeliveryInvoice(const GenerateInvoiceRequest& request, FulfillmentError* error) {
    if (!ValidMoney(request.advance)) {
        SetError(error, FulfillmentError::Validation("advance must be non-negative"));
        return std::nullopt;
    }
    auto delivery = deps_.store->GetDelivery(request.deliveryId);
    if (!delivery) {
        SetError(error, FulfillmentError::NotFound("delivery", request.deliveryId));
        return std::nullopt;
    }
    if (!delivery->invoiceId.empty()) {
        SetError(error, FulfillmentError::Validation("invoice already generated for delivery " + delivery->deliveryNumber));
        return std::nullopt;
    }
    auto order = deps_.store->GetOrder(delivery->orderId);
    if (!order) {
        SetError(error, FulfillmentError::NotFound("order", delivery->orderId));
        return std::nullopt;
    }
    const double advance = RoundMoney(request.advance);
    if (advance > order->balanceDue + kMoneyEpsilon) {
        SetError(error, FulfillmentError::InsufficientBalance(std::format("advance ({:.2f}) exceeds order balance due ({:.2f})", advance, order->balanceDue)));
        return std::nullopt;
    }

    InvoiceRecord invoice;
    invoice.invoiceId = GenerateDocumentId("inv");
    invoice.source = InvoiceSource::kDelivery;
    invoice.orderId = order->orderId;
    invoice.orderNumber = order->orderNumber;
    invoice.deliveryId = delivery->deliveryId;
    invoice.clientId = order->clientId;
    invoice.partyName = delivery->partyName;
    invoice.items = delivery->items;
    invoice.pricing = delivery->pricing;
    invoice.advance = advance;
    invoice.balanceDue = std::max(0.0, RoundMoney(invoice.pricing.grandTotal - advance));
    invoice.paymentStatus = OrderStateMachine::DerivePaymentStatus(advance, invoice.pricing.grandTotal);
    invoice.deliveryStatus = delivery->status;
    invoice.notes = request.notes.empty() ? "Invoice for delivery " + delivery->deliveryNumber : request.notes;
    invoice.invoiceDate = Clock::now();

    auto allocation = deps_.sequences->AllocateAndPersist(DocumentKind::kInvoice, invoice.invoiceDate, [&](const std::string& number) {
        invoice.invoiceNumber = number;
        return deps_.store->InsertInvoice(invoice);
    });
    if (allocation.status != StoreStatus::kOk) {
        SetError(error, FulfillmentError::Storage("failed to save invoice"));
        return std::nullopt;
    }

    const StoreStatus link = deps_.store->LinkDeliveryInvoice(delivery->deliveryId, invoice.invoiceId);
    if (link != StoreStatus::kOk) {
        if (deps_.store->RemoveInvoice(invoice.invoiceId) != StoreStatus::kOk)
            LOG_ERROR("Orphan invoice {} could not be removed", invoice.invoiceNumber);
        if (link == StoreStatus::kConflict)
            SetError(error, FulfillmentError::Conflict("delivery " + delivery->deliveryNumber + " was invoiced concurrently"));
        else
            SetError(error, FulfillmentError::Storage("failed to link invoice to delivery"));
        return std::nullopt;
    }

    InvoiceResult result{invoice, std::nullopt, std::nullopt};
    if (advance >= 0.01) {
        PaymentAllocator::PaymentInput input{advance, request.method, invoice.invoiceDate, {}, "Advance collected with invoice " + invoice.invoiceNumber};
        auto payment = deps_.payments->RecordInvoicePayment(order->orderId, invoice.invoiceId, input, error);
        if (!payment) {
            LOG_WARN("Invoice {} advance not recorded, withdrawing invoice", invoice.invoiceNumber);
            if (deps_.store->UnlinkDeliveryInvoice(delivery->deliveryId, invoice.invoiceId) != StoreStatus::kOk || deps_.store->RemoveInvoice(invoice.invoiceId) != StoreStatus::kOk)
                LOG_ERROR("Invoice {} could not be withdrawn from delivery {}", invoice.invoiceNumber, delivery->deliveryNumber);
            return std::nullopt;
        }
        result.payment = payment->payment;
        if (!payment->orders.empty())
            result.order = payment->orders.front();
    }

    LOG_INFO("Invoice {} generated for delivery {} (total {:.2f}, advance {:.2f})", invoice.invoiceNumber, delivery->deliveryNumber, invoice.pricing.grandTotal, advance);
    publish(events::kInvoiceCreated, nlohmann::json{{"invoice", result.invoice}});
    return result;
}

std::optional<InvoiceRecord> FulfillmentService::GenerateOrderInvoice(const std::string& orderId, FulfillmentError* error) {
    auto order = deps_.store->GetOrder(orderId);
    if (!order) {
        SetError(error, FulfillmentError::NotFound("order", orderId));
        return std::nullopt;
    }
    if (order->status == OrderStatus::kCancelled) {
        SetError(error, FulfillmentError::Validation("cannot invoice cancelled order " + order->orderNumber));
        return std::nullopt;
    }

    InvoiceRecord invoice;
    invoice.invoiceId = GenerateDocumentId("inv");
    invoice.source = InvoiceSource::kOrder;
    invoice.orderId = order->orderId;
    invoice.orderNumber = order->orderNumber;
    invoice.clientId = order->clientId;
    invoice.partyName = order->partyName;
    for (const auto& line : order->items) {
        if (line.orderedQty > 0)
            invoice.items.push_back({line.lineId, line.productId, line.productName, line.unitPrice, line.orderedQty, RoundMoney(line.unitPrice * static_cast<double>(line.orderedQty))});
    }
    invoice.pricing = order->pricing;
    invoice.advance = order->advance;
    invoice.balanceDue = order->balanceDue;
    invoice.paymentStatus = order->paymentStatus;
    invoice.deliveryStatus = order->progress >= 100 ? DeliveryStatus::kDelivered : DeliveryStatus::kPending;
    invoice.invoiceDate = Clock::now();

    auto allocation = deps_.sequences->AllocateAndPersist(DocumentKind::kInvoice, invoice.invoiceDate, [&](const std::string& number) {
        invoice.invoiceNumber = number;
        return deps_.store->InsertInvoice(invoice);
    });
    if (allocation.status != StoreStatus::kOk) {
        SetError(error, FulfillmentError::Storage("failed to save invoice"));
        return std::nullopt;
    }

    LOG_INFO("Invoice {} generated for order {}", invoice.invoiceNumber, order->orderNumber);
    publish(events::kInvoiceCreated, nlohmann::json{{"invoice", invoice}});
    return invoice;
}

std::optional<DeliveryRecord> FulfillmentService::UpdateDeliveryStatus(const std::string& deliveryId, DeliveryStatus status, FulfillmentError* error) {
    const StoreStatus updated = deps_.store->UpdateDeliveryStatus(deliveryId, status);
    if (updated == StoreStatus::kNotFound) {
        SetError(error, FulfillmentError::NotFound("delivery", deliveryId));
        return std::nullopt;
    }
    if (updated != StoreStatus::kOk) {
        SetError(error, FulfillmentError::Storage("failed to update delivery " + deliveryId));
        return std::nullopt;
    }

    auto delivery = deps_.store->GetDelivery(deliveryId);
    if (!delivery) {
        SetError(error, FulfillmentError::NotFound("delivery", deliveryId));
        return std::nullopt;
    }
    // 已开票时同步发票上的发货状态
    if (!delivery->invoiceId.empty() && deps_.store->UpdateInvoiceDeliveryStatus(delivery->invoiceId, status) != StoreStatus::kOk)
        LOG_WARN("Invoice {} delivery status not synced", delivery->invoiceId);

    publish(events::kDeliveryStatusUpdated, nlohmann::json{{"deliveryId", delivery->deliveryId}, {"deliveryNumber", delivery->deliveryNumber}, {"status", ToString(status)}});
    return delivery;
}

// ========== 查询接口 ==========

std::optional<OrderRecord> FulfillmentService::GetOrder(const std::string& orderId, bool preferCache) const {
    if (preferCache && options_.useCache && deps_.cache) {
        if (auto cached = deps_.cache->GetOrder(orderId))
            return cached;
    }
    auto order = deps_.store->GetOrder(orderId);
    if (order && options_.useCache && deps_.cache)
        deps_.cache->PutOrder(*order);
    return order;
}

std::optional<DeliveryRecord> FulfillmentService::GetDelivery(const std::string& deliveryId) const {
    return deps_.store->GetDelivery(deliveryId);
}

std::vector<DeliveryRecord> FulfillmentService::ListDeliveries(const std::string& orderId) const {
    return deps_.store->ListDeliveriesForOrder(orderId);
}

std::optional<ClientRecord> FulfillmentService::GetClient(const std::string& clientId) const {
    return deps_.store->GetClient(clientId);
}

std::optional<EmployeeStatsRecord> FulfillmentService::GetEmployeeStats(const std::string& employeeId) const {
    return deps_.store->GetEmployeeStats(employeeId);
}

std::vector<ProductRecord> FulfillmentService::ListLowStock() const {
    return deps_.ledger->ListLowStock();
}

// ========== 内部工具函数 ==========

std::optional<ClientRecord> FulfillmentService::resolveClient(const ClientInput& input, FulfillmentError* error) {
    if (!input.clientId.empty()) {
        auto client = deps_.store->GetClient(input.clientId);
        if (!client)
            SetError(error, FulfillmentError::NotFound("client", input.clientId));
        return client;
    }
    if (auto existing = deps_.store->FindClient(input.partyName, input.mobile))
        return existing;

    ClientRecord client;
    client.clientId = GenerateDocumentId("cli");
    client.partyName = input.partyName;
    client.mobile = input.mobile;
    client.createdAt = Clock::now();
    const StoreStatus status = deps_.store->InsertClient(client);
    if (status == StoreStatus::kOk) {
        LOG_INFO("New client {} registered for '{}'", client.clientId, client.partyName);
        return client;
    }
    if (status == StoreStatus::kDuplicateKey) {
        // 并发下单同时创建了同一客户
        if (auto existing = deps_.store->FindClient(input.partyName, input.mobile))
            return existing;
    }
    SetError(error, FulfillmentError::Storage("failed to register client " + input.partyName));
    return std::nullopt;
}

std::optional<std::vector<OrderLineItem>> FulfillmentService::buildLines(const std::vector<ItemInput>& items, const std::vector<OrderLineItem>& existing, FulfillmentError* error) {
    int nextSeq = 0;
    for (const auto& line : existing)
        nextSeq = std::max(nextSeq, LineSequence(line.lineId));

    std::vector<OrderLineItem> lines;
    std::vector<bool> kept(existing.size(), false);
    for (const auto& item : items) {
        const std::string label = item.productName.empty() ? item.productId : item.productName;
        if (item.quantity <= 0) {
            SetError(error, FulfillmentError::Validation("invalid quantity for \"" + label + "\""));
            return std::nullopt;
        }
        if (!ValidMoney(item.unitPrice)) {
            SetError(error, FulfillmentError::Validation("invalid unit price for \"" + label + "\""));
            return std::nullopt;
        }

        OrderLineItem line;
        if (!item.lineId.empty()) {
            const int idx = OrderStateMachine::FindLine(existing, item.lineId, {}, {});
            if (idx < 0) {
                SetError(error, FulfillmentError::Validation("line " + item.lineId + " does not belong to this order"));
                return std::nullopt;
            }
            if (kept[static_cast<std::size_t>(idx)]) {
                SetError(error, FulfillmentError::Validation("line " + item.lineId + " listed twice"));
                return std::nullopt;
            }
            kept[static_cast<std::size_t>(idx)] = true;
            line = existing[static_cast<std::size_t>(idx)];
            if (item.quantity < line.deliveredQty) {
                SetError(error, FulfillmentError::Validation(std::format("\"{}\" cannot drop below its delivered quantity {}", line.productName, line.deliveredQty)));
                return std::nullopt;
            }
            if (!item.productName.empty())
                line.productName = item.productName;
            line.narration = item.narration;
        } else {
            if (item.productId.empty() && item.productName.empty()) {
                SetError(error, FulfillmentError::Validation("each item needs a productId or productName"));
                return std::nullopt;
            }
            line.lineId = std::format("L{}", ++nextSeq);
            line.productId = item.productId;
            line.productName = item.productName;
            line.narration = item.narration;
            if (!item.productId.empty()) {
                auto product = deps_.store->GetProduct(item.productId);
                if (!product) {
                    SetError(error, FulfillmentError::NotFound("product", item.productId));
                    return std::nullopt;
                }
                if (line.productName.empty())
                    line.productName = product->name;
            } else if (auto product = deps_.store->FindProductByName(item.productName); product && product->isActive) {
                line.productId = product->productId;
            }
        }
        line.unitPrice = RoundMoney(item.unitPrice);
        line.orderedQty = item.quantity;
        line.lineTotal = OrderStateMachine::LineTotal(line);
        lines.push_back(std::move(line));
    }

    for (std::size_t i = 0; i < existing.size(); ++i) {
        if (!kept[i] && (existing[i].deliveredQty > 0 || existing[i].returnedQty > 0)) {
            SetError(error, FulfillmentError::Validation("line \"" + existing[i].productName + "\" has deliveries and cannot be removed"));
            return std::nullopt;
        }
    }
    return lines;
}

std::vector<InventoryLedger::Item> FulfillmentService::stockItems(const std::vector<OrderLineItem>& lines) {
    std::vector<InventoryLedger::Item> out;
    out.reserve(lines.size());
    for (const auto& line : lines)
        out.push_back({line.productId, line.productName, line.orderedQty});
    return out;
}

void FulfillmentService::publish(const char* event, const nlohmann::json& payload) const {
    if (options_.publishEvents && deps_.events)
        deps_.events->Publish(event, payload);
}
