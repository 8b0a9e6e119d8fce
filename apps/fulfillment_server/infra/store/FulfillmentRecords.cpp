#include "infra/store/FulfillmentRecords.h"

#include <cmath>

std::string ToString(OrderStatus v) {
    switch (v) {
        case OrderStatus::kOpen:             return "open";
        case OrderStatus::kInProgress:       return "in_progress";
        case OrderStatus::kPartialDelivered: return "partial_delivered";
        case OrderStatus::kDelivered:        return "delivered";
        case OrderStatus::kCompleted:        return "completed";
        case OrderStatus::kCancelled:        return "cancelled";
    }
    return "open";
}

std::string ToString(PaymentStatus v) {
    switch (v) {
        case PaymentStatus::kUnpaid:  return "unpaid";
        case PaymentStatus::kPartial: return "partial";
        case PaymentStatus::kPaid:    return "paid";
    }
    return "unpaid";
}

std::string ToString(OrderKind v) {
    return v == OrderKind::kCounterSale ? "counter_sale" : "standard";
}

std::string ToString(DeliveryStatus v) {
    switch (v) {
        case DeliveryStatus::kPending:   return "pending";
        case DeliveryStatus::kInTransit: return "in_transit";
        case DeliveryStatus::kDelivered: return "delivered";
        case DeliveryStatus::kReturned:  return "returned";
    }
    return "delivered";
}

std::string ToString(DeliveryPerformance v) {
    switch (v) {
        case DeliveryPerformance::kUnknown: return "";
        case DeliveryPerformance::kEarly:   return "early";
        case DeliveryPerformance::kOnTime:  return "on_time";
        case DeliveryPerformance::kLate:    return "late";
    }
    return "";
}

std::string ToString(PaymentMethod v) {
    switch (v) {
        case PaymentMethod::kCash:         return "cash";
        case PaymentMethod::kCard:         return "card";
        case PaymentMethod::kUpi:          return "upi";
        case PaymentMethod::kBankTransfer: return "bank_transfer";
        case PaymentMethod::kCheque:       return "cheque";
        case PaymentMethod::kOther:        return "other";
    }
    return "other";
}

std::string ToString(PaymentType v) {
    switch (v) {
        case PaymentType::kOrderPayment:   return "order_payment";
        case PaymentType::kAdvancePayment: return "advance_payment";
        case PaymentType::kInvoicePayment: return "invoice_payment";
        case PaymentType::kReturnRefund:   return "return_refund";
        case PaymentType::kAdjustment:     return "adjustment";
    }
    return "order_payment";
}

std::string ToString(RefundStatus v) {
    switch (v) {
        case RefundStatus::kPending:  return "pending";
        case RefundStatus::kPartial:  return "partial";
        case RefundStatus::kRefunded: return "refunded";
        case RefundStatus::kNoRefund: return "no_refund";
    }
    return "no_refund";
}

std::string ToString(InvoiceSource v) {
    return v == InvoiceSource::kOrder ? "order" : "delivery";
}

std::string ToString(DocumentKind v) {
    switch (v) {
        case DocumentKind::kOrder:    return "order";
        case DocumentKind::kDelivery: return "delivery";
        case DocumentKind::kInvoice:  return "invoice";
        case DocumentKind::kPayment:  return "payment";
        case DocumentKind::kReturn:   return "return";
    }
    return "order";
}

OrderStatus OrderStatusFromString(std::string_view s) {
    if (s == "in_progress")       return OrderStatus::kInProgress;
    if (s == "partial_delivered") return OrderStatus::kPartialDelivered;
    if (s == "delivered")         return OrderStatus::kDelivered;
    if (s == "completed")         return OrderStatus::kCompleted;
    if (s == "cancelled")         return OrderStatus::kCancelled;
    return OrderStatus::kOpen;
}

PaymentStatus PaymentStatusFromString(std::string_view s) {
    if (s == "partial") return PaymentStatus::kPartial;
    if (s == "paid")    return PaymentStatus::kPaid;
    return PaymentStatus::kUnpaid;
}

OrderKind OrderKindFromString(std::string_view s) {
    // "fast" 为旧数据中的写法
    if (s == "counter_sale" || s == "fast")
        return OrderKind::kCounterSale;
    return OrderKind::kStandard;
}

std::optional<DeliveryStatus> DeliveryStatusFromString(std::string_view s) {
    if (s == "pending")    return DeliveryStatus::kPending;
    if (s == "in_transit") return DeliveryStatus::kInTransit;
    if (s == "delivered")  return DeliveryStatus::kDelivered;
    if (s == "returned")   return DeliveryStatus::kReturned;
    return std::nullopt;
}

DeliveryPerformance DeliveryPerformanceFromString(std::string_view s) {
    if (s == "early")   return DeliveryPerformance::kEarly;
    if (s == "on_time") return DeliveryPerformance::kOnTime;
    if (s == "late")    return DeliveryPerformance::kLate;
    return DeliveryPerformance::kUnknown;
}

std::optional<PaymentMethod> PaymentMethodFromString(std::string_view s) {
    if (s == "cash")          return PaymentMethod::kCash;
    if (s == "card")          return PaymentMethod::kCard;
    if (s == "upi")           return PaymentMethod::kUpi;
    if (s == "bank_transfer") return PaymentMethod::kBankTransfer;
    if (s == "cheque")        return PaymentMethod::kCheque;
    if (s == "other")         return PaymentMethod::kOther;
    return std::nullopt;
}

PaymentType PaymentTypeFromString(std::string_view s) {
    if (s == "advance_payment") return PaymentType::kAdvancePayment;
    if (s == "invoice_payment") return PaymentType::kInvoicePayment;
    if (s == "return_refund")   return PaymentType::kReturnRefund;
    if (s == "adjustment")      return PaymentType::kAdjustment;
    return PaymentType::kOrderPayment;
}

RefundStatus RefundStatusFromString(std::string_view s) {
    if (s == "pending")  return RefundStatus::kPending;
    if (s == "partial")  return RefundStatus::kPartial;
    if (s == "refunded") return RefundStatus::kRefunded;
    return RefundStatus::kNoRefund;
}

InvoiceSource InvoiceSourceFromString(std::string_view s) {
    return s == "order" ? InvoiceSource::kOrder : InvoiceSource::kDelivery;
}

RefundStatus DeriveRefundStatus(double refundableAmount, double refundedAmount) {
    if (refundableAmount <= kMoneyEpsilon)
        return RefundStatus::kNoRefund;
    if (refundedAmount + kMoneyEpsilon >= refundableAmount)
        return RefundStatus::kRefunded;
    if (refundedAmount > kMoneyEpsilon)
        return RefundStatus::kPartial;
    return RefundStatus::kPending;
}

double RoundMoney(double value) {
    return std::round(value * 100.0) / 100.0;
}
