#include "domain/OrderStateMachine.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

std::string NormalizeName(const std::string& name) {
    auto begin = name.find_first_not_of(" \t");
    if (begin == std::string::npos)
        return {};
    auto end = name.find_last_not_of(" \t");
    std::string out = name.substr(begin, end - begin + 1);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

// ========== 计价 ==========

Pricing OrderStateMachine::ComputePricing(double subtotal, const Charges& charges) {
    Pricing p;
    p.subtotal = RoundMoney(subtotal);
    p.freight = RoundMoney(charges.freight);
    p.taxPercent = charges.taxPercent;
    p.taxAmount = RoundMoney(p.subtotal * charges.taxPercent / 100.0);
    p.discount = RoundMoney(charges.discount);
    p.grandTotal = RoundMoney(p.subtotal + p.freight + p.taxAmount - p.discount);
    return p;
}

Pricing OrderStateMachine::ComputePricing(const std::vector<OrderLineItem>& items, const Charges& charges) {
    double subtotal = 0.0;
    for (const auto& item : items)
        subtotal += item.lineTotal;
    return ComputePricing(subtotal, charges);
}

Pricing OrderStateMachine::ComputePricing(const std::vector<DeliveryLineItem>& items, const Charges& charges) {
    double subtotal = 0.0;
    for (const auto& item : items)
        subtotal += item.lineTotal;
    return ComputePricing(subtotal, charges);
}

Charges OrderStateMachine::ChargesOf(const Pricing& pricing) {
    return Charges{pricing.freight, pricing.taxPercent, pricing.discount};
}

double OrderStateMachine::LineTotal(const OrderLineItem& item) {
    return RoundMoney(item.unitPrice * static_cast<double>(item.orderedQty + item.returnedQty));
}

// ========== 派生字段 ==========

int OrderStateMachine::ComputeProgress(const std::vector<OrderLineItem>& items) {
    std::int64_t ordered = 0;
    std::int64_t delivered = 0;
    for (const auto& item : items) {
        ordered += item.orderedQty;
        delivered += item.deliveredQty;
    }
    if (ordered <= 0 || delivered <= 0)
        return 0;
    if (delivered >= ordered)
        return 100;
    // 未全部发完时不能因四舍五入显示 100
    int pct = static_cast<int>(std::lround(100.0 * static_cast<double>(delivered) / static_cast<double>(ordered)));
    return std::clamp(pct, 1, 99);
}

double OrderStateMachine::EffectiveTotal(const OrderRecord& order) {
    return RoundMoney(order.pricing.grandTotal - order.returnedAmount);
}

PaymentStatus OrderStateMachine::DerivePaymentStatus(double advance, double effectiveTotal) {
    if (advance + kMoneyEpsilon >= effectiveTotal)
        return PaymentStatus::kPaid;
    if (advance > kMoneyEpsilon)
        return PaymentStatus::kPartial;
    return PaymentStatus::kUnpaid;
}

std::int64_t OrderStateMachine::TotalDelivered(const OrderRecord& order) {
    std::int64_t delivered = 0;
    for (const auto& item : order.items)
        delivered += item.deliveredQty;
    return delivered;
}

DeliveryPerformance OrderStateMachine::DerivePerformance(TimePoint actual, const std::optional<TimePoint>& expected) {
    if (!expected)
        return DeliveryPerformance::kUnknown;
    const auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(actual - *expected).count();
    constexpr double kDayMs = 24.0 * 60 * 60 * 1000;
    const auto days = static_cast<long long>(std::floor(static_cast<double>(diff) / kDayMs));
    if (days < 0)
        return DeliveryPerformance::kEarly;
    if (days == 0)
        return DeliveryPerformance::kOnTime;
    return DeliveryPerformance::kLate;
}

void OrderStateMachine::Apply(OrderRecord& order) {
    for (auto& item : order.items)
        item.remainingQty = std::max<std::int64_t>(0, item.orderedQty - item.deliveredQty);

    order.progress = ComputeProgress(order.items);

    const double effective = EffectiveTotal(order);
    order.paymentStatus = DerivePaymentStatus(order.advance, effective);
    order.balanceDue = std::max(0.0, RoundMoney(effective - order.advance));

    if (order.status == OrderStatus::kCancelled) {
        order.isLocked = false;
        return;
    }

    OrderStatus next = OrderStatus::kOpen;
    if (order.progress >= 100)
        next = order.paymentStatus == PaymentStatus::kPaid ? OrderStatus::kCompleted : OrderStatus::kDelivered;
    else if (order.progress > 0)
        next = OrderStatus::kPartialDelivered;

    // 进入 completed 时上锁；退货解锁后仍满足 completed 的订单保持解锁
    if (next == OrderStatus::kCompleted && order.status != OrderStatus::kCompleted)
        order.isLocked = true;
    else if (next != OrderStatus::kCompleted)
        order.isLocked = false;
    order.status = next;
}

int OrderStateMachine::FindLine(const std::vector<OrderLineItem>& items, const std::string& lineId, const std::string& productId, const std::string& productName) {
    if (!lineId.empty()) {
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (items[i].lineId == lineId)
                return static_cast<int>(i);
        }
        return -1;
    }
    if (!productId.empty()) {
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (items[i].productId == productId)
                return static_cast<int>(i);
        }
    }
    const std::string wanted = NormalizeName(productName);
    if (wanted.empty())
        return -1;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (NormalizeName(items[i].productName) == wanted)
            return static_cast<int>(i);
    }
    return -1;
}

bool OrderStateMachine::IsEditable(const OrderRecord& order) noexcept {
    return !order.isLocked && order.status != OrderStatus::kCancelled;
}

bool OrderStateMachine::CountsAsOpen(OrderStatus status) noexcept {
    return status != OrderStatus::kCompleted && status != OrderStatus::kCancelled;
}
