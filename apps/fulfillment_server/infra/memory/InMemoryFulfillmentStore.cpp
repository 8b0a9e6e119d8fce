#include "infra/memory/InMemoryFulfillmentStore.h"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace {

std::string Lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename Map>
auto FindCopy(const Map& map, const std::string& key) -> std::optional<typename Map::mapped_type> {
    auto it = map.find(key);
    if (it == map.end())
        return std::nullopt;
    return it->second;
}

// prefix 之后连续数字的数值；"ORD261010000" 高于 "ORD26109999"
std::uint64_t SequenceAfter(const std::string& number, std::size_t prefixLength) {
    std::uint64_t value = 0;
    for (std::size_t i = prefixLength; i < number.size() && std::isdigit(static_cast<unsigned char>(number[i])); ++i)
        value = value * 10 + static_cast<std::uint64_t>(number[i] - '0');
    return value;
}

}  // namespace

bool InMemoryFulfillmentStore::numberTaken(DocumentKind kind, const std::string& number) const {
    auto it = numbers_.find(kind);
    return it != numbers_.end() && it->second.count(number) > 0;
}

// ========== 商品 ==========

std::optional<ProductRecord> InMemoryFulfillmentStore::GetProduct(const std::string& productId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindCopy(products_, productId);
}

std::optional<ProductRecord> InMemoryFulfillmentStore::FindProductByName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string wanted = Lower(name);
    for (const auto& [id, product] : products_) {
        if (Lower(product.name) == wanted)
            return product;
    }
    return std::nullopt;
}

StoreStatus InMemoryFulfillmentStore::InsertProduct(const ProductRecord& product) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!products_.emplace(product.productId, product).second)
        return StoreStatus::kDuplicateKey;
    return StoreStatus::kOk;
}

StockMutation InMemoryFulfillmentStore::DecrementStockIfAvailable(const std::string& productId, std::int64_t quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = products_.find(productId);
    if (it == products_.end())
        return {StoreStatus::kNotFound, std::nullopt};
    ProductRecord& p = it->second;
    if (!p.stock || *p.stock < quantity)
        return {StoreStatus::kGuardFailed, p};
    *p.stock -= quantity;
    p.updatedAt = Clock::now();
    return {StoreStatus::kOk, p};
}

StockMutation InMemoryFulfillmentStore::IncrementStock(const std::string& productId, std::int64_t quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = products_.find(productId);
    if (it == products_.end())
        return {StoreStatus::kNotFound, std::nullopt};
    ProductRecord& p = it->second;
    if (!p.stock)
        return {StoreStatus::kGuardFailed, p};
    *p.stock += quantity;
    p.updatedAt = Clock::now();
    return {StoreStatus::kOk, p};
}

std::vector<ProductRecord> InMemoryFulfillmentStore::ListLowStock(std::int64_t threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProductRecord> out;
    for (const auto& [id, p] : products_) {
        if (p.isActive && p.stock && *p.stock < threshold)
            out.push_back(p);
    }
    std::sort(out.begin(), out.end(), [](const ProductRecord& a, const ProductRecord& b) { return *a.stock < *b.stock; });
    return out;
}

// ========== 编号 ==========

std::optional<std::string> InMemoryFulfillmentStore::FindHighestNumber(DocumentKind kind, const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = numbers_.find(kind);
    if (it == numbers_.end())
        return std::nullopt;
    std::optional<std::string> best;
    std::uint64_t bestSequence = 0;
    for (const auto& number : it->second) {
        if (number.compare(0, prefix.size(), prefix) != 0)
            continue;
        const std::uint64_t sequence = SequenceAfter(number, prefix.size());
        // 序号相同时保留字典序靠后的（set 有序）
        if (!best || sequence >= bestSequence) {
            best = number;
            bestSequence = sequence;
        }
    }
    return best;
}

// ========== 订单 ==========

StoreStatus InMemoryFulfillmentStore::InsertOrder(const OrderRecord& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (orders_.count(order.orderId) || numberTaken(DocumentKind::kOrder, order.orderNumber))
        return StoreStatus::kDuplicateKey;
    orders_.emplace(order.orderId, order);
    numbers_[DocumentKind::kOrder].insert(order.orderNumber);
    return StoreStatus::kOk;
}

std::optional<OrderRecord> InMemoryFulfillmentStore::GetOrder(const std::string& orderId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindCopy(orders_, orderId);
}

StoreStatus InMemoryFulfillmentStore::ReplaceOrder(const OrderRecord& order, std::uint64_t expectedVersion) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order.orderId);
    if (it == orders_.end())
        return StoreStatus::kNotFound;
    if (it->second.version != expectedVersion)
        return StoreStatus::kConflict;
    it->second = order;
    it->second.version = expectedVersion + 1;
    return StoreStatus::kOk;
}

StoreStatus InMemoryFulfillmentStore::RemoveOrder(const std::string& orderId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(orderId);
    if (it == orders_.end())
        return StoreStatus::kNotFound;
    // 与 MySQL 行删除一致：编号随订单一起释放
    numbers_[DocumentKind::kOrder].erase(it->second.orderNumber);
    orders_.erase(it);
    return StoreStatus::kOk;
}

std::vector<OrderRecord> InMemoryFulfillmentStore::ListOrdersWithBalanceDue(const std::string& clientId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OrderRecord> out;
    for (const auto& [id, o] : orders_) {
        if (o.clientId == clientId && o.status != OrderStatus::kCancelled && o.balanceDue > kMoneyEpsilon)
            out.push_back(o);
    }
    std::sort(out.begin(), out.end(), [](const OrderRecord& a, const OrderRecord& b) {
        if (a.orderDate != b.orderDate)
            return a.orderDate < b.orderDate;
        return a.orderNumber < b.orderNumber;
    });
    return out;
}

// ========== 发货单 ==========

StoreStatus InMemoryFulfillmentStore::InsertDelivery(const DeliveryRecord& delivery) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (deliveries_.count(delivery.deliveryId) || numberTaken(DocumentKind::kDelivery, delivery.deliveryNumber))
        return StoreStatus::kDuplicateKey;
    deliveries_.emplace(delivery.deliveryId, delivery);
    numbers_[DocumentKind::kDelivery].insert(delivery.deliveryNumber);
    return StoreStatus::kOk;
}

std::optional<DeliveryRecord> InMemoryFulfillmentStore::GetDelivery(const std::string& deliveryId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindCopy(deliveries_, deliveryId);
}

std::vector<DeliveryRecord> InMemoryFulfillmentStore::ListDeliveriesForOrder(const std::string& orderId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeliveryRecord> out;
    for (const auto& [id, d] : deliveries_) {
        if (d.orderId == orderId)
            out.push_back(d);
    }
    std::sort(out.begin(), out.end(), [](const DeliveryRecord& a, const DeliveryRecord& b) { return a.deliveryNumber < b.deliveryNumber; });
    return out;
}

StoreStatus InMemoryFulfillmentStore::UpdateDeliveryStatus(const std::string& deliveryId, DeliveryStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deliveries_.find(deliveryId);
    if (it == deliveries_.end())
        return StoreStatus::kNotFound;
    it->second.status = status;
    return StoreStatus::kOk;
}

StoreStatus InMemoryFulfillmentStore::LinkDeliveryInvoice(const std::string& deliveryId, const std::string& invoiceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deliveries_.find(deliveryId);
    if (it == deliveries_.end())
        return StoreStatus::kNotFound;
    if (!it->second.invoiceId.empty())
        return StoreStatus::kConflict;
    it->second.invoiceId = invoiceId;
    return StoreStatus::kOk;
}

StoreStatus InMemoryFulfillmentStore::UnlinkDeliveryInvoice(const std::string& deliveryId, const std::string& invoiceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deliveries_.find(deliveryId);
    if (it == deliveries_.end())
        return StoreStatus::kNotFound;
    if (it->second.invoiceId != invoiceId)
        return StoreStatus::kConflict;
    it->second.invoiceId.clear();
    return StoreStatus::kOk;
}

StoreStatus InMemoryFulfillmentStore::RemoveDelivery(const std::string& deliveryId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_.erase(deliveryId) ? StoreStatus::kOk : StoreStatus::kNotFound;
}

// ========== 发票 ==========

StoreStatus InMemoryFulfillmentStore::InsertInvoice(const InvoiceRecord& invoice) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (invoices_.count(invoice.invoiceId) || numberTaken(DocumentKind::kInvoice, invoice.invoiceNumber))
        return StoreStatus::kDuplicateKey;
    invoices_.emplace(invoice.invoiceId, invoice);
    numbers_[DocumentKind::kInvoice].insert(invoice.invoiceNumber);
    return StoreStatus::kOk;
}

std::optional<InvoiceRecord> InMemoryFulfillmentStore::GetInvoice(const std::string& invoiceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindCopy(invoices_, invoiceId);
}

std::vector<InvoiceRecord> InMemoryFulfillmentStore::ListInvoicesForOrder(const std::string& orderId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InvoiceRecord> out;
    for (const auto& [id, inv] : invoices_) {
        if (inv.orderId == orderId)
            out.push_back(inv);
    }
    return out;
}

StoreStatus InMemoryFulfillmentStore::UpdateInvoiceDeliveryStatus(const std::string& invoiceId, DeliveryStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invoices_.find(invoiceId);
    if (it == invoices_.end())
        return StoreStatus::kNotFound;
    it->second.deliveryStatus = status;
    return StoreStatus::kOk;
}

StoreStatus InMemoryFulfillmentStore::RemoveInvoice(const std::string& invoiceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return invoices_.erase(invoiceId) ? StoreStatus::kOk : StoreStatus::kNotFound;
}

// ========== 收款 ==========

StoreStatus InMemoryFulfillmentStore::InsertPayment(const PaymentRecord& payment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (payments_.count(payment.paymentId) || numberTaken(DocumentKind::kPayment, payment.paymentNumber))
        return StoreStatus::kDuplicateKey;
    payments_.emplace(payment.paymentId, payment);
    numbers_[DocumentKind::kPayment].insert(payment.paymentNumber);
    return StoreStatus::kOk;
}

std::optional<PaymentRecord> InMemoryFulfillmentStore::GetPayment(const std::string& paymentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindCopy(payments_, paymentId);
}

std::vector<PaymentRecord> InMemoryFulfillmentStore::ListPaymentsForClient(const std::string& clientId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PaymentRecord> out;
    for (const auto& [id, p] : payments_) {
        if (p.clientId == clientId)
            out.push_back(p);
    }
    std::sort(out.begin(), out.end(), [](const PaymentRecord& a, const PaymentRecord& b) {
        if (a.paymentDate != b.paymentDate)
            return a.paymentDate > b.paymentDate;
        return a.paymentNumber > b.paymentNumber;
    });
    return out;
}

// ========== 客户 ==========

std::optional<ClientRecord> InMemoryFulfillmentStore::GetClient(const std::string& clientId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindCopy(clients_, clientId);
}

std::optional<ClientRecord> InMemoryFulfillmentStore::FindClient(const std::string& partyName, const std::string& mobile) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string wanted = Lower(partyName);
    for (const auto& [id, c] : clients_) {
        if (Lower(c.partyName) == wanted && c.mobile == mobile)
            return c;
    }
    return std::nullopt;
}

StoreStatus InMemoryFulfillmentStore::InsertClient(const ClientRecord& client) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string wanted = Lower(client.partyName);
    for (const auto& [id, c] : clients_) {
        if (Lower(c.partyName) == wanted && c.mobile == client.mobile)
            return StoreStatus::kDuplicateKey;
    }
    if (!clients_.emplace(client.clientId, client).second)
        return StoreStatus::kDuplicateKey;
    return StoreStatus::kOk;
}

StoreStatus InMemoryFulfillmentStore::ApplyClientDelta(const std::string& clientId, const ClientDelta& d) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(clientId);
    if (it == clients_.end())
        return StoreStatus::kNotFound;
    ClientRecord& c = it->second;
    c.totalOrders += d.totalOrders;
    c.openOrders += d.openOrders;
    c.completedOrders += d.completedOrders;
    c.totalSpent = RoundMoney(c.totalSpent + d.totalSpent);
    c.totalPaid = RoundMoney(c.totalPaid + d.totalPaid);
    c.totalDue = RoundMoney(c.totalDue + d.totalDue);
    c.advanceBalance = RoundMoney(c.advanceBalance + d.advanceBalance);
    c.refundableBalance = RoundMoney(c.refundableBalance + d.refundableBalance);
    c.totalReturns += d.totalReturns;
    c.totalReturnValue = RoundMoney(c.totalReturnValue + d.totalReturnValue);
    if (d.lastPaymentAmount)
        c.lastPaymentAmount = *d.lastPaymentAmount;
    if (d.lastPaymentDate)
        c.lastPaymentDate = d.lastPaymentDate;
    return StoreStatus::kOk;
}

StoreStatus InMemoryFulfillmentStore::DebitAdvanceBalance(const std::string& clientId, double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(clientId);
    if (it == clients_.end())
        return StoreStatus::kNotFound;
    if (it->second.advanceBalance + kMoneyEpsilon < amount)
        return StoreStatus::kGuardFailed;
    it->second.advanceBalance = RoundMoney(it->second.advanceBalance - amount);
    return StoreStatus::kOk;
}

// ========== 员工统计 ==========

StoreStatus InMemoryFulfillmentStore::ApplyEmployeeDelta(const std::string& employeeId, const EmployeeDelta& d) {
    std::lock_guard<std::mutex> lock(mutex_);
    EmployeeStatsRecord& e = employees_[employeeId];
    e.employeeId = employeeId;
    e.totalOrders += d.totalOrders;
    e.totalDeliveries += d.totalDeliveries;
    e.earlyDeliveries += d.earlyDeliveries;
    e.onTimeDeliveries += d.onTimeDeliveries;
    e.lateDeliveries += d.lateDeliveries;
    return StoreStatus::kOk;
}

std::optional<EmployeeStatsRecord> InMemoryFulfillmentStore::GetEmployeeStats(const std::string& employeeId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindCopy(employees_, employeeId);
}

// ========== 退货单 ==========

StoreStatus InMemoryFulfillmentStore::InsertReturn(const ReturnRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (returns_.count(record.returnId) || numberTaken(DocumentKind::kReturn, record.returnNumber))
        return StoreStatus::kDuplicateKey;
    returns_.emplace(record.returnId, record);
    numbers_[DocumentKind::kReturn].insert(record.returnNumber);
    return StoreStatus::kOk;
}

std::optional<ReturnRecord> InMemoryFulfillmentStore::GetReturn(const std::string& returnId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindCopy(returns_, returnId);
}

std::vector<ReturnRecord> InMemoryFulfillmentStore::ListReturnsForOrder(const std::string& orderId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ReturnRecord> out;
    for (const auto& [id, r] : returns_) {
        if (r.orderId == orderId)
            out.push_back(r);
    }
    std::sort(out.begin(), out.end(), [](const ReturnRecord& a, const ReturnRecord& b) { return a.returnNumber < b.returnNumber; });
    return out;
}

RefundMutation InMemoryFulfillmentStore::ApplyRefund(const std::string& returnId, double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = returns_.find(returnId);
    if (it == returns_.end())
        return {StoreStatus::kNotFound, std::nullopt};
    ReturnRecord& r = it->second;
    if (r.refundedAmount + amount > r.refundableAmount + kMoneyEpsilon)
        return {StoreStatus::kGuardFailed, r};
    r.refundedAmount = RoundMoney(r.refundedAmount + amount);
    r.refundStatus = DeriveRefundStatus(r.refundableAmount, r.refundedAmount);
    return {StoreStatus::kOk, r};
}

StoreStatus InMemoryFulfillmentStore::RevertRefund(const std::string& returnId, double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = returns_.find(returnId);
    if (it == returns_.end())
        return StoreStatus::kNotFound;
    ReturnRecord& r = it->second;
    r.refundedAmount = std::max(0.0, RoundMoney(r.refundedAmount - amount));
    r.refundStatus = DeriveRefundStatus(r.refundableAmount, r.refundedAmount);
    return StoreStatus::kOk;
}
