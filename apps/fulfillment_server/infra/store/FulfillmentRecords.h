#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ------------------- 枚举 -------------------

enum class OrderStatus : std::uint8_t { kOpen = 0, kInProgress, kPartialDelivered, kDelivered, kCompleted, kCancelled };
enum class PaymentStatus : std::uint8_t { kUnpaid = 0, kPartial, kPaid };
enum class OrderKind : std::uint8_t { kStandard = 0, kCounterSale };
enum class DeliveryStatus : std::uint8_t { kPending = 0, kInTransit, kDelivered, kReturned };
enum class DeliveryPerformance : std::uint8_t { kUnknown = 0, kEarly, kOnTime, kLate };
enum class PaymentMethod : std::uint8_t { kCash = 0, kCard, kUpi, kBankTransfer, kCheque, kOther };
enum class PaymentType : std::uint8_t { kOrderPayment = 0, kAdvancePayment, kInvoicePayment, kReturnRefund, kAdjustment };
enum class RefundStatus : std::uint8_t { kPending = 0, kPartial, kRefunded, kNoRefund };
enum class InvoiceSource : std::uint8_t { kOrder = 0, kDelivery };

// 编号种类：决定前缀（ORD / DEL / INV / PAY / RET）
enum class DocumentKind : std::uint8_t { kOrder = 0, kDelivery, kInvoice, kPayment, kReturn };

// 落库 / 序列化使用小写下划线形式（"partial_delivered"），无法识别时回落到各自的默认值
std::string ToString(OrderStatus v);
std::string ToString(PaymentStatus v);
std::string ToString(OrderKind v);
std::string ToString(DeliveryStatus v);
std::string ToString(DeliveryPerformance v);
std::string ToString(PaymentMethod v);
std::string ToString(PaymentType v);
std::string ToString(RefundStatus v);
std::string ToString(InvoiceSource v);
std::string ToString(DocumentKind v);

OrderStatus OrderStatusFromString(std::string_view s);
PaymentStatus PaymentStatusFromString(std::string_view s);
OrderKind OrderKindFromString(std::string_view s);
std::optional<DeliveryStatus> DeliveryStatusFromString(std::string_view s);
DeliveryPerformance DeliveryPerformanceFromString(std::string_view s);
std::optional<PaymentMethod> PaymentMethodFromString(std::string_view s);
PaymentType PaymentTypeFromString(std::string_view s);
RefundStatus RefundStatusFromString(std::string_view s);
InvoiceSource InvoiceSourceFromString(std::string_view s);

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ------------------- 文档记录 -------------------

struct ProductRecord {
    std::string productId;
    std::string name;
    double price{0.0};
    std::optional<std::int64_t> stock;  // nullopt = 不跟踪库存（视为无限）
    std::string category;
    bool isActive{true};
    TimePoint updatedAt{};
};

// 订单行：lineId 在下单时生成，后续发货 / 退货都以它定位
struct OrderLineItem {
    std::string lineId;
    std::string productId;  // 可为空（手工录入的非库存行）
    std::string productName;
    std::string narration;
    double unitPrice{0.0};
    std::int64_t orderedQty{0};
    std::int64_t deliveredQty{0};
    std::int64_t remainingQty{0};
    std::int64_t returnedQty{0};
    double lineTotal{0.0};
};

struct Pricing {
    double subtotal{0.0};
    double freight{0.0};
    double taxPercent{0.0};
    double taxAmount{0.0};
    double discount{0.0};
    double grandTotal{0.0};
};

struct OrderRecord {
    std::string orderId;
    std::string orderNumber;
    OrderKind kind{OrderKind::kStandard};
    std::string clientId;
    std::string partyName;
    std::string mobile;
    std::string employeeId;
    std::vector<OrderLineItem> items;
    Pricing pricing;
    double advance{0.0};
    double balanceDue{0.0};
    double returnedAmount{0.0};
    int totalReturns{0};
    int progress{0};
    OrderStatus status{OrderStatus::kOpen};
    PaymentStatus paymentStatus{PaymentStatus::kUnpaid};
    bool isLocked{false};
    int totalDeliveries{0};
    std::optional<TimePoint> expectedDeliveryDate;
    std::optional<TimePoint> actualDeliveryDate;
    DeliveryPerformance deliveryPerformance{DeliveryPerformance::kUnknown};
    std::string notes;
    std::string cancelReason;
    TimePoint orderDate{};
    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::uint64_t version{0};  // 乐观并发令牌：每次成功保存 +1
};

struct DeliveryLineItem {
    std::string lineId;
    std::string productId;
    std::string productName;
    double unitPrice{0.0};
    std::int64_t quantity{0};
    double lineTotal{0.0};
};

struct DeliveryRecord {
    std::string deliveryId;
    std::string deliveryNumber;
    std::string orderId;
    std::string orderNumber;
    std::string clientId;
    std::string partyName;
    std::string employeeId;
    std::vector<DeliveryLineItem> items;
    Pricing pricing;
    TimePoint deliveryDate{};
    std::optional<TimePoint> expectedDeliveryDate;
    DeliveryPerformance performance{DeliveryPerformance::kUnknown};
    DeliveryStatus status{DeliveryStatus::kDelivered};
    std::string invoiceId;  // 空 = 尚未开票
    std::string notes;
    TimePoint createdAt{};
};

struct InvoiceRecord {
    std::string invoiceId;
    std::string invoiceNumber;
    InvoiceSource source{InvoiceSource::kDelivery};
    std::string orderId;
    std::string orderNumber;
    std::string deliveryId;
    std::string clientId;
    std::string partyName;
    std::vector<DeliveryLineItem> items;
    Pricing pricing;
    double advance{0.0};
    double balanceDue{0.0};
    PaymentStatus paymentStatus{PaymentStatus::kUnpaid};
    DeliveryStatus deliveryStatus{DeliveryStatus::kDelivered};
    std::string notes;
    TimePoint invoiceDate{};
};

struct PaymentAllocation {
    std::string orderId;
    std::string orderNumber;
    double amount{0.0};
    TimePoint allocatedAt{};
};

struct PaymentRecord {
    std::string paymentId;
    std::string paymentNumber;
    double amount{0.0};
    PaymentMethod method{PaymentMethod::kCash};
    PaymentType type{PaymentType::kOrderPayment};
    std::string clientId;
    std::string orderId;
    std::string invoiceId;
    std::string returnId;
    std::vector<PaymentAllocation> allocations;
    double allocatedAmount{0.0};
    double remainingAmount{0.0};  // amount - allocatedAmount
    std::string reference;
    std::string notes;
    TimePoint paymentDate{};
};

struct ClientRecord {
    std::string clientId;
    std::string partyName;
    std::string mobile;
    int totalOrders{0};
    int openOrders{0};
    int completedOrders{0};
    double totalSpent{0.0};
    double totalPaid{0.0};
    double totalDue{0.0};
    double advanceBalance{0.0};
    double refundableBalance{0.0};
    int totalReturns{0};
    double totalReturnValue{0.0};
    double lastPaymentAmount{0.0};
    std::optional<TimePoint> lastPaymentDate;
    TimePoint createdAt{};
};

// 客户计数器的增量：所有字段原子地加到现有值上
struct ClientDelta {
    int totalOrders{0};
    int openOrders{0};
    int completedOrders{0};
    double totalSpent{0.0};
    double totalPaid{0.0};
    double totalDue{0.0};
    double advanceBalance{0.0};
    double refundableBalance{0.0};
    int totalReturns{0};
    double totalReturnValue{0.0};
    std::optional<double> lastPaymentAmount;  // 有值时覆盖（非累加）
    std::optional<TimePoint> lastPaymentDate;
};

struct EmployeeDelta {
    int totalOrders{0};
    int totalDeliveries{0};
    int earlyDeliveries{0};
    int onTimeDeliveries{0};
    int lateDeliveries{0};
};

struct EmployeeStatsRecord {
    std::string employeeId;
    int totalOrders{0};
    int totalDeliveries{0};
    int earlyDeliveries{0};
    int onTimeDeliveries{0};
    int lateDeliveries{0};
};

struct ReturnLineItem {
    std::string lineId;
    std::string productId;
    std::string productName;
    double unitPrice{0.0};
    std::int64_t quantity{0};
    double lineTotal{0.0};
};

struct ReturnRecord {
    std::string returnId;
    std::string returnNumber;
    std::string orderId;
    std::string orderNumber;
    std::string deliveryId;
    std::string clientId;
    std::string partyName;
    OrderKind orderKind{OrderKind::kStandard};
    std::vector<ReturnLineItem> items;
    double returnTotal{0.0};
    double refundableAmount{0.0};
    double refundedAmount{0.0};
    RefundStatus refundStatus{RefundStatus::kNoRefund};
    std::string reason;
    std::string notes;
    bool orderDeleted{false};  // 零售单全部退回后订单被删除
    TimePoint returnDate{};
};

// 退款状态只由可退 / 已退金额决定
RefundStatus DeriveRefundStatus(double refundableAmount, double refundedAmount);

// 金额比较容差（两位小数货币）
constexpr double kMoneyEpsilon = 0.005;

// 四舍五入到分
double RoundMoney(double value);
