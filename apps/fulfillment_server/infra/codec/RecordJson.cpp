#include "infra/codec/RecordJson.h"

using json = nlohmann::json;

std::int64_t ToEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromEpochMillis(std::int64_t ms) {
    return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms))};
}

std::string DumpDocument(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

namespace {

json OptionalTime(const std::optional<TimePoint>& tp) {
    return tp ? json(ToEpochMillis(*tp)) : json(nullptr);
}

std::optional<TimePoint> ReadOptionalTime(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer())
        return std::nullopt;
    return FromEpochMillis(it->get<std::int64_t>());
}

TimePoint ReadTime(const json& j, const char* key) {
    return FromEpochMillis(j.value(key, std::int64_t{0}));
}

template <typename T>
std::vector<T> ReadList(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_array())
        return {};
    return it->get<std::vector<T>>();
}

}  // namespace

// ========== 商品 ==========

void to_json(json& j, const ProductRecord& v) {
    j = json{{"productId", v.productId}, {"name", v.name}, {"price", v.price}, {"category", v.category}, {"isActive", v.isActive}, {"updatedAt", ToEpochMillis(v.updatedAt)}};
    j["stock"] = v.stock ? json(*v.stock) : json(nullptr);
}

void from_json(const json& j, ProductRecord& v) {
    v.productId = j.value("productId", "");
    v.name = j.value("name", "");
    v.price = j.value("price", 0.0);
    v.category = j.value("category", "");
    v.isActive = j.value("isActive", true);
    v.updatedAt = ReadTime(j, "updatedAt");
    auto it = j.find("stock");
    if (it != j.end() && it->is_number_integer())
        v.stock = it->get<std::int64_t>();
    else
        v.stock.reset();
}

// ========== 订单 ==========

void to_json(json& j, const OrderLineItem& v) {
    j = json{{"lineId", v.lineId},
             {"productId", v.productId},
             {"productName", v.productName},
             {"narration", v.narration},
             {"unitPrice", v.unitPrice},
             {"orderedQty", v.orderedQty},
             {"deliveredQty", v.deliveredQty},
             {"remainingQty", v.remainingQty},
             {"returnedQty", v.returnedQty},
             {"lineTotal", v.lineTotal}};
}

void from_json(const json& j, OrderLineItem& v) {
    v.lineId = j.value("lineId", "");
    v.productId = j.value("productId", "");
    v.productName = j.value("productName", "");
    v.narration = j.value("narration", "");
    v.unitPrice = j.value("unitPrice", 0.0);
    v.orderedQty = j.value("orderedQty", std::int64_t{0});
    v.deliveredQty = j.value("deliveredQty", std::int64_t{0});
    v.remainingQty = j.value("remainingQty", v.orderedQty - v.deliveredQty);
    v.returnedQty = j.value("returnedQty", std::int64_t{0});
    v.lineTotal = j.value("lineTotal", 0.0);
}

void to_json(json& j, const Pricing& v) {
    j = json{{"subtotal", v.subtotal}, {"freight", v.freight}, {"taxPercent", v.taxPercent}, {"taxAmount", v.taxAmount}, {"discount", v.discount}, {"grandTotal", v.grandTotal}};
}

void from_json(const json& j, Pricing& v) {
    v.subtotal = j.value("subtotal", 0.0);
    v.freight = j.value("freight", 0.0);
    v.taxPercent = j.value("taxPercent", 0.0);
    v.taxAmount = j.value("taxAmount", 0.0);
    v.discount = j.value("discount", 0.0);
    v.grandTotal = j.value("grandTotal", 0.0);
}

void to_json(json& j, const OrderRecord& v) {
    j = json{{"orderId", v.orderId},
             {"orderNumber", v.orderNumber},
             {"kind", ToString(v.kind)},
             {"clientId", v.clientId},
             {"partyName", v.partyName},
             {"mobile", v.mobile},
             {"employeeId", v.employeeId},
             {"items", v.items},
             {"pricing", v.pricing},
             {"advance", v.advance},
             {"balanceDue", v.balanceDue},
             {"returnedAmount", v.returnedAmount},
             {"totalReturns", v.totalReturns},
             {"progress", v.progress},
             {"status", ToString(v.status)},
             {"paymentStatus", ToString(v.paymentStatus)},
             {"isLocked", v.isLocked},
             {"totalDeliveries", v.totalDeliveries},
             {"expectedDeliveryDate", OptionalTime(v.expectedDeliveryDate)},
             {"actualDeliveryDate", OptionalTime(v.actualDeliveryDate)},
             {"deliveryPerformance", ToString(v.deliveryPerformance)},
             {"notes", v.notes},
             {"cancelReason", v.cancelReason},
             {"orderDate", ToEpochMillis(v.orderDate)},
             {"createdAt", ToEpochMillis(v.createdAt)},
             {"updatedAt", ToEpochMillis(v.updatedAt)},
             {"version", v.version}};
}

void from_json(const json& j, OrderRecord& v) {
    v.orderId = j.value("orderId", "");
    v.orderNumber = j.value("orderNumber", "");
    v.kind = OrderKindFromString(j.value("kind", "standard"));
    v.clientId = j.value("clientId", "");
    v.partyName = j.value("partyName", "");
    v.mobile = j.value("mobile", "");
    v.employeeId = j.value("employeeId", "");
    v.items = ReadList<OrderLineItem>(j, "items");
    if (j.contains("pricing"))
        v.pricing = j.at("pricing").get<Pricing>();
    v.advance = j.value("advance", 0.0);
    v.balanceDue = j.value("balanceDue", 0.0);
    v.returnedAmount = j.value("returnedAmount", 0.0);
    v.totalReturns = j.value("totalReturns", 0);
    v.progress = j.value("progress", 0);
    v.status = OrderStatusFromString(j.value("status", "open"));
    v.paymentStatus = PaymentStatusFromString(j.value("paymentStatus", "unpaid"));
    v.isLocked = j.value("isLocked", false);
    v.totalDeliveries = j.value("totalDeliveries", 0);
    v.expectedDeliveryDate = ReadOptionalTime(j, "expectedDeliveryDate");
    v.actualDeliveryDate = ReadOptionalTime(j, "actualDeliveryDate");
    v.deliveryPerformance = DeliveryPerformanceFromString(j.value("deliveryPerformance", ""));
    v.notes = j.value("notes", "");
    v.cancelReason = j.value("cancelReason", "");
    v.orderDate = ReadTime(j, "orderDate");
    v.createdAt = ReadTime(j, "createdAt");
    v.updatedAt = ReadTime(j, "updatedAt");
    v.version = j.value("version", std::uint64_t{0});
}

// ========== 发货单 / 发票 ==========

void to_json(json& j, const DeliveryLineItem& v) {
    j = json{{"lineId", v.lineId}, {"productId", v.productId}, {"productName", v.productName}, {"unitPrice", v.unitPrice}, {"quantity", v.quantity}, {"lineTotal", v.lineTotal}};
}

void from_json(const json& j, DeliveryLineItem& v) {
    v.lineId = j.value("lineId", "");
    v.productId = j.value("productId", "");
    v.productName = j.value("productName", "");
    v.unitPrice = j.value("unitPrice", 0.0);
    v.quantity = j.value("quantity", std::int64_t{0});
    v.lineTotal = j.value("lineTotal", 0.0);
}

void to_json(json& j, const DeliveryRecord& v) {
    j = json{{"deliveryId", v.deliveryId},
             {"deliveryNumber", v.deliveryNumber},
             {"orderId", v.orderId},
             {"orderNumber", v.orderNumber},
             {"clientId", v.clientId},
             {"partyName", v.partyName},
             {"employeeId", v.employeeId},
             {"items", v.items},
             {"pricing", v.pricing},
             {"deliveryDate", ToEpochMillis(v.deliveryDate)},
             {"expectedDeliveryDate", OptionalTime(v.expectedDeliveryDate)},
             {"performance", ToString(v.performance)},
             {"status", ToString(v.status)},
             {"invoiceId", v.invoiceId},
             {"notes", v.notes},
             {"createdAt", ToEpochMillis(v.createdAt)}};
}

void from_json(const json& j, DeliveryRecord& v) {
    v.deliveryId = j.value("deliveryId", "");
    v.deliveryNumber = j.value("deliveryNumber", "");
    v.orderId = j.value("orderId", "");
    v.orderNumber = j.value("orderNumber", "");
    v.clientId = j.value("clientId", "");
    v.partyName = j.value("partyName", "");
    v.employeeId = j.value("employeeId", "");
    v.items = ReadList<DeliveryLineItem>(j, "items");
    if (j.contains("pricing"))
        v.pricing = j.at("pricing").get<Pricing>();
    v.deliveryDate = ReadTime(j, "deliveryDate");
    v.expectedDeliveryDate = ReadOptionalTime(j, "expectedDeliveryDate");
    v.performance = DeliveryPerformanceFromString(j.value("performance", ""));
    v.status = DeliveryStatusFromString(j.value("status", "delivered")).value_or(DeliveryStatus::kDelivered);
    v.invoiceId = j.value("invoiceId", "");
    v.notes = j.value("notes", "");
    v.createdAt = ReadTime(j, "createdAt");
}

void to_json(json& j, const InvoiceRecord& v) {
    j = json{{"invoiceId", v.invoiceId},
             {"invoiceNumber", v.invoiceNumber},
             {"source", ToString(v.source)},
             {"orderId", v.orderId},
             {"orderNumber", v.orderNumber},
             {"deliveryId", v.deliveryId},
             {"clientId", v.clientId},
             {"partyName", v.partyName},
             {"items", v.items},
             {"pricing", v.pricing},
             {"advance", v.advance},
             {"balanceDue", v.balanceDue},
             {"paymentStatus", ToString(v.paymentStatus)},
             {"deliveryStatus", ToString(v.deliveryStatus)},
             {"notes", v.notes},
             {"invoiceDate", ToEpochMillis(v.invoiceDate)}};
}

void from_json(const json& j, InvoiceRecord& v) {
    v.invoiceId = j.value("invoiceId", "");
    v.invoiceNumber = j.value("invoiceNumber", "");
    v.source = InvoiceSourceFromString(j.value("source", "delivery"));
    v.orderId = j.value("orderId", "");
    v.orderNumber = j.value("orderNumber", "");
    v.deliveryId = j.value("deliveryId", "");
    v.clientId = j.value("clientId", "");
    v.partyName = j.value("partyName", "");
    v.items = ReadList<DeliveryLineItem>(j, "items");
    if (j.contains("pricing"))
        v.pricing = j.at("pricing").get<Pricing>();
    v.advance = j.value("advance", 0.0);
    v.balanceDue = j.value("balanceDue", 0.0);
    v.paymentStatus = PaymentStatusFromString(j.value("paymentStatus", "unpaid"));
    v.deliveryStatus = DeliveryStatusFromString(j.value("deliveryStatus", "delivered")).value_or(DeliveryStatus::kDelivered);
    v.notes = j.value("notes", "");
    v.invoiceDate = ReadTime(j, "invoiceDate");
}

// ========== 收款 ==========

void to_json(json& j, const PaymentAllocation& v) {
    j = json{{"orderId", v.orderId}, {"orderNumber", v.orderNumber}, {"amount", v.amount}, {"allocatedAt", ToEpochMillis(v.allocatedAt)}};
}

void from_json(const json& j, PaymentAllocation& v) {
    v.orderId = j.value("orderId", "");
    v.orderNumber = j.value("orderNumber", "");
    v.amount = j.value("amount", 0.0);
    v.allocatedAt = ReadTime(j, "allocatedAt");
}

void to_json(json& j, const PaymentRecord& v) {
    j = json{{"paymentId", v.paymentId},
             {"paymentNumber", v.paymentNumber},
             {"amount", v.amount},
             {"method", ToString(v.method)},
             {"type", ToString(v.type)},
             {"clientId", v.clientId},
             {"orderId", v.orderId},
             {"invoiceId", v.invoiceId},
             {"returnId", v.returnId},
             {"allocations", v.allocations},
             {"allocatedAmount", v.allocatedAmount},
             {"remainingAmount", v.remainingAmount},
             {"reference", v.reference},
             {"notes", v.notes},
             {"paymentDate", ToEpochMillis(v.paymentDate)}};
}

void from_json(const json& j, PaymentRecord& v) {
    v.paymentId = j.value("paymentId", "");
    v.paymentNumber = j.value("paymentNumber", "");
    v.amount = j.value("amount", 0.0);
    v.method = PaymentMethodFromString(j.value("method", "other")).value_or(PaymentMethod::kOther);
    v.type = PaymentTypeFromString(j.value("type", "order_payment"));
    v.clientId = j.value("clientId", "");
    v.orderId = j.value("orderId", "");
    v.invoiceId = j.value("invoiceId", "");
    v.returnId = j.value("returnId", "");
    v.allocations = ReadList<PaymentAllocation>(j, "allocations");
    v.allocatedAmount = j.value("allocatedAmount", 0.0);
    v.remainingAmount = j.value("remainingAmount", v.amount - v.allocatedAmount);
    v.reference = j.value("reference", "");
    v.notes = j.value("notes", "");
    v.paymentDate = ReadTime(j, "paymentDate");
}

// ========== 客户 / 员工 ==========

void to_json(json& j, const ClientRecord& v) {
    j = json{{"clientId", v.clientId},
             {"partyName", v.partyName},
             {"mobile", v.mobile},
             {"totalOrders", v.totalOrders},
             {"openOrders", v.openOrders},
             {"completedOrders", v.completedOrders},
             {"totalSpent", v.totalSpent},
             {"totalPaid", v.totalPaid},
             {"totalDue", v.totalDue},
             {"advanceBalance", v.advanceBalance},
             {"refundableBalance", v.refundableBalance},
             {"totalReturns", v.totalReturns},
             {"totalReturnValue", v.totalReturnValue},
             {"lastPaymentAmount", v.lastPaymentAmount},
             {"lastPaymentDate", OptionalTime(v.lastPaymentDate)},
             {"createdAt", ToEpochMillis(v.createdAt)}};
}

void from_json(const json& j, ClientRecord& v) {
    v.clientId = j.value("clientId", "");
    v.partyName = j.value("partyName", "");
    v.mobile = j.value("mobile", "");
    v.totalOrders = j.value("totalOrders", 0);
    v.openOrders = j.value("openOrders", 0);
    v.completedOrders = j.value("completedOrders", 0);
    v.totalSpent = j.value("totalSpent", 0.0);
    v.totalPaid = j.value("totalPaid", 0.0);
    v.totalDue = j.value("totalDue", 0.0);
    v.advanceBalance = j.value("advanceBalance", 0.0);
    v.refundableBalance = j.value("refundableBalance", 0.0);
    v.totalReturns = j.value("totalReturns", 0);
    v.totalReturnValue = j.value("totalReturnValue", 0.0);
    v.lastPaymentAmount = j.value("lastPaymentAmount", 0.0);
    v.lastPaymentDate = ReadOptionalTime(j, "lastPaymentDate");
    v.createdAt = ReadTime(j, "createdAt");
}

void to_json(json& j, const EmployeeStatsRecord& v) {
    j = json{{"employeeId", v.employeeId},
             {"totalOrders", v.totalOrders},
             {"totalDeliveries", v.totalDeliveries},
             {"earlyDeliveries", v.earlyDeliveries},
             {"onTimeDeliveries", v.onTimeDeliveries},
             {"lateDeliveries", v.lateDeliveries}};
}

// ========== 退货 ==========

void to_json(json& j, const ReturnLineItem& v) {
    j = json{{"lineId", v.lineId}, {"productId", v.productId}, {"productName", v.productName}, {"unitPrice", v.unitPrice}, {"quantity", v.quantity}, {"lineTotal", v.lineTotal}};
}

void from_json(const json& j, ReturnLineItem& v) {
    v.lineId = j.value("lineId", "");
    v.productId = j.value("productId", "");
    v.productName = j.value("productName", "");
    v.unitPrice = j.value("unitPrice", 0.0);
    v.quantity = j.value("quantity", std::int64_t{0});
    v.lineTotal = j.value("lineTotal", 0.0);
}

void to_json(json& j, const ReturnRecord& v) {
    j = json{{"returnId", v.returnId},
             {"returnNumber", v.returnNumber},
             {"orderId", v.orderId},
             {"orderNumber", v.orderNumber},
             {"deliveryId", v.deliveryId},
             {"clientId", v.clientId},
             {"partyName", v.partyName},
             {"orderKind", ToString(v.orderKind)},
             {"items", v.items},
             {"returnTotal", v.returnTotal},
             {"refundableAmount", v.refundableAmount},
             {"refundedAmount", v.refundedAmount},
             {"refundStatus", ToString(v.refundStatus)},
             {"reason", v.reason},
             {"notes", v.notes},
             {"orderDeleted", v.orderDeleted},
             {"returnDate", ToEpochMillis(v.returnDate)}};
}

void from_json(const json& j, ReturnRecord& v) {
    v.returnId = j.value("returnId", "");
    v.returnNumber = j.value("returnNumber", "");
    v.orderId = j.value("orderId", "");
    v.orderNumber = j.value("orderNumber", "");
    v.deliveryId = j.value("deliveryId", "");
    v.clientId = j.value("clientId", "");
    v.partyName = j.value("partyName", "");
    v.orderKind = OrderKindFromString(j.value("orderKind", "standard"));
    v.items = ReadList<ReturnLineItem>(j, "items");
    v.returnTotal = j.value("returnTotal", 0.0);
    v.refundableAmount = j.value("refundableAmount", 0.0);
    v.refundedAmount = j.value("refundedAmount", 0.0);
    v.refundStatus = RefundStatusFromString(j.value("refundStatus", "no_refund"));
    v.reason = j.value("reason", "");
    v.notes = j.value("notes", "");
    v.orderDeleted = j.value("orderDeleted", false);
    v.returnDate = ReadTime(j, "returnDate");
}
