#pragma once

#include <optional>
#include <string>
#include <vector>

#include "infra/store/FulfillmentRecords.h"

// 附加费用：运费 / 税率（百分比）/ 折扣
struct Charges {
    double freight{0.0};
    double taxPercent{0.0};
    double discount{0.0};
};

/**
 * @brief OrderStateMachine：订单派生字段的唯一计算处
 *
 * 每次保存订单前调用 Apply，由当前字段纯函数式地得出
 * remainingQty / progress / paymentStatus / status / balanceDue / isLocked。
 * cancelled 是粘滞状态；completed 需要 progress == 100 且 paymentStatus == paid。
 */
class OrderStateMachine {
public:
    // subtotal = Σ lineTotal；tax = subtotal × taxPercent / 100；grand = subtotal + freight + tax - discount
    static Pricing ComputePricing(double subtotal, const Charges& charges);
    static Pricing ComputePricing(const std::vector<OrderLineItem>& items, const Charges& charges);
    static Pricing ComputePricing(const std::vector<DeliveryLineItem>& items, const Charges& charges);
    static Charges ChargesOf(const Pricing& pricing);

    // 计价数量 = 当前订购 + 已退（退货金额单独记在 returnedAmount 中）
    static double LineTotal(const OrderLineItem& item);

    static int ComputeProgress(const std::vector<OrderLineItem>& items);
    static double EffectiveTotal(const OrderRecord& order);
    static PaymentStatus DerivePaymentStatus(double advance, double effectiveTotal);
    static std::int64_t TotalDelivered(const OrderRecord& order);

    // 以发货单自身日期计算：按天取整的 (actual - expected) <0 提前，==0 准时，>0 延迟
    static DeliveryPerformance DerivePerformance(TimePoint actual, const std::optional<TimePoint>& expected);

    static void Apply(OrderRecord& order);

    // 定位订单行：lineId 优先，其次 productId，最后名称（忽略大小写与首尾空白，兼容旧调用方）；找不到返回 -1
    static int FindLine(const std::vector<OrderLineItem>& items, const std::string& lineId, const std::string& productId, const std::string& productName);

    // 未锁定且未取消的订单才允许修改明细 / 备注
    static bool IsEditable(const OrderRecord& order) noexcept;
    // 客户 openOrders 口径：未完成且未取消
    static bool CountsAsOpen(OrderStatus status) noexcept;
};
