#include "infra/db/MySQLFulfillmentStore.h"

#include <cppconn/resultset.h>

#include <format>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "LogMacros.h"
#include "MySQLConnPool.h"
#include "infra/codec/RecordJson.h"

using json = nlohmann::json;

namespace {

// 单引号字符串字面量，转义 \ 与 '
std::string Quote(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
        if (c == '\\' || c == '\'')
            out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string Money(double value) {
    return std::format("{:.2f}", value);
}

std::string Body(const json& j) {
    return Quote(DumpDocument(j));
}

std::string SafeString(sql::ResultSet* rs, const char* column) {
    return rs->isNull(column) ? std::string{} : rs->getString(column).asStdString();
}

template <typename Record>
std::optional<Record> ParseBody(sql::ResultSet* rs) {
    json j = json::parse(SafeString(rs, "body"), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_ERROR("[MySQLFulfillmentStore] Unreadable document body");
        return std::nullopt;
    }
    try {
        return j.get<Record>();
    } catch (const json::exception& ex) {
        LOG_ERROR("[MySQLFulfillmentStore] Document body has unexpected shape: {}", ex.what());
        return std::nullopt;
    }
}

ProductRecord ParseProduct(sql::ResultSet* rs) {
    ProductRecord p;
    p.productId = SafeString(rs, "product_id");
    p.name = SafeString(rs, "name");
    p.price = static_cast<double>(rs->getDouble("price"));
    if (!rs->isNull("stock"))
        p.stock = static_cast<std::int64_t>(rs->getInt64("stock"));
    p.category = SafeString(rs, "category");
    p.isActive = rs->getInt("is_active") != 0;
    p.updatedAt = FromEpochMillis(rs->getInt64("updated_at"));
    return p;
}

ClientRecord ParseClient(sql::ResultSet* rs) {
    ClientRecord c;
    c.clientId = SafeString(rs, "client_id");
    c.partyName = SafeString(rs, "party_name");
    c.mobile = SafeString(rs, "mobile");
    c.totalOrders = rs->getInt("total_orders");
    c.openOrders = rs->getInt("open_orders");
    c.completedOrders = rs->getInt("completed_orders");
    c.totalSpent = static_cast<double>(rs->getDouble("total_spent"));
    c.totalPaid = static_cast<double>(rs->getDouble("total_paid"));
    c.totalDue = static_cast<double>(rs->getDouble("total_due"));
    c.advanceBalance = static_cast<double>(rs->getDouble("advance_balance"));
    c.refundableBalance = static_cast<double>(rs->getDouble("refundable_balance"));
    c.totalReturns = rs->getInt("total_returns");
    c.totalReturnValue = static_cast<double>(rs->getDouble("total_return_value"));
    c.lastPaymentAmount = static_cast<double>(rs->getDouble("last_payment_amount"));
    if (!rs->isNull("last_payment_date"))
        c.lastPaymentDate = FromEpochMillis(rs->getInt64("last_payment_date"));
    c.createdAt = FromEpochMillis(rs->getInt64("created_at"));
    return c;
}

}  // namespace

// ------------------- 构造与模式初始化 -------------------

MySQLFulfillmentStore::MySQLFulfillmentStore(std::shared_ptr<MySQLConnPool> pool) : MySQLFulfillmentStore(std::move(pool), Options{}) {}

MySQLFulfillmentStore::MySQLFulfillmentStore(std::shared_ptr<MySQLConnPool> pool, Options options) : pool_(std::move(pool)), options_(std::move(options)) {
    if (!pool_)
        throw std::invalid_argument("MySQLFulfillmentStore: MySQLConnPool cannot be null");
}

void MySQLFulfillmentStore::EnsureSchema() {
    if (schemaEnsured_)
        return;

    const std::vector<std::string> ddl = {
        "CREATE TABLE IF NOT EXISTS " + table("products") +
            " (product_id VARCHAR(64) PRIMARY KEY, name VARCHAR(255) NOT NULL, price DOUBLE NOT NULL DEFAULT 0,"
            " stock BIGINT NULL, category VARCHAR(128), is_active TINYINT NOT NULL DEFAULT 1, updated_at BIGINT NOT NULL DEFAULT 0,"
            " INDEX idx_name (name))",
        "CREATE TABLE IF NOT EXISTS " + table("orders") +
            " (order_id VARCHAR(64) PRIMARY KEY, order_number VARCHAR(64) NOT NULL UNIQUE, client_id VARCHAR(64),"
            " kind VARCHAR(32) NOT NULL, status VARCHAR(32) NOT NULL, balance_due DOUBLE NOT NULL DEFAULT 0,"
            " order_date BIGINT NOT NULL, version BIGINT UNSIGNED NOT NULL DEFAULT 0, body MEDIUMTEXT NOT NULL,"
            " INDEX idx_client (client_id, order_date))",
        "CREATE TABLE IF NOT EXISTS " + table("deliveries") +
            " (delivery_id VARCHAR(64) PRIMARY KEY, delivery_number VARCHAR(64) NOT NULL UNIQUE, order_id VARCHAR(64) NOT NULL,"
            " status VARCHAR(32) NOT NULL, invoice_id VARCHAR(64) NOT NULL DEFAULT '', body MEDIUMTEXT NOT NULL,"
            " INDEX idx_order (order_id))",
        "CREATE TABLE IF NOT EXISTS " + table("invoices") +
            " (invoice_id VARCHAR(64) PRIMARY KEY, invoice_number VARCHAR(64) NOT NULL UNIQUE, order_id VARCHAR(64) NOT NULL,"
            " delivery_status VARCHAR(32) NOT NULL, body MEDIUMTEXT NOT NULL, INDEX idx_order (order_id))",
        "CREATE TABLE IF NOT EXISTS " + table("payments") +
            " (payment_id VARCHAR(64) PRIMARY KEY, payment_number VARCHAR(64) NOT NULL UNIQUE, client_id VARCHAR(64),"
            " payment_date BIGINT NOT NULL, body MEDIUMTEXT NOT NULL, INDEX idx_client (client_id, payment_date))",
        "CREATE TABLE IF NOT EXISTS " + table("clients") +
            " (client_id VARCHAR(64) PRIMARY KEY, party_name VARCHAR(255) NOT NULL, mobile VARCHAR(32) NOT NULL DEFAULT '',"
            " total_orders INT NOT NULL DEFAULT 0, open_orders INT NOT NULL DEFAULT 0, completed_orders INT NOT NULL DEFAULT 0,"
            " total_spent DOUBLE NOT NULL DEFAULT 0, total_paid DOUBLE NOT NULL DEFAULT 0, total_due DOUBLE NOT NULL DEFAULT 0,"
            " advance_balance DOUBLE NOT NULL DEFAULT 0, refundable_balance DOUBLE NOT NULL DEFAULT 0,"
            " total_returns INT NOT NULL DEFAULT 0, total_return_value DOUBLE NOT NULL DEFAULT 0,"
            " last_payment_amount DOUBLE NOT NULL DEFAULT 0, last_payment_date BIGINT NULL, created_at BIGINT NOT NULL,"
            " UNIQUE KEY uk_party (party_name, mobile))",
        "CREATE TABLE IF NOT EXISTS " + table("employee_stats") +
            " (employee_id VARCHAR(64) PRIMARY KEY, total_orders INT NOT NULL DEFAULT 0, total_deliveries INT NOT NULL DEFAULT 0,"
            " early_deliveries INT NOT NULL DEFAULT 0, on_time_deliveries INT NOT NULL DEFAULT 0, late_deliveries INT NOT NULL DEFAULT 0)",
        "CREATE TABLE IF NOT EXISTS " + table("returns") +
            " (return_id VARCHAR(64) PRIMARY KEY, return_number VARCHAR(64) NOT NULL UNIQUE, order_id VARCHAR(64) NOT NULL,"
            " refundable_amount DOUBLE NOT NULL DEFAULT 0, refunded_amount DOUBLE NOT NULL DEFAULT 0,"
            " refund_status VARCHAR(32) NOT NULL, body MEDIUMTEXT NOT NULL, INDEX idx_order (order_id))",
    };

    for (const auto& statement : ddl) {
        if (!pool_->SubmitExec(statement).get())
            throw std::runtime_error("MySQLFulfillmentStore: schema creation failed");
    }
    schemaEnsured_ = true;
    LOG_INFO("[MySQLFulfillmentStore] Schema ready ({} tables, prefix '{}')", ddl.size(), options_.tablePrefix);
}

// ------------------- 商品 -------------------

std::optional<ProductRecord> MySQLFulfillmentStore::GetProduct(const std::string& productId) {
    auto rs = query("SELECT * FROM " + table("products") + " WHERE product_id=" + Quote(productId));
    if (!rs || !rs->next())
        return std::nullopt;
    return ParseProduct(rs.get());
}

std::optional<ProductRecord> MySQLFulfillmentStore::FindProductByName(const std::string& name) {
    auto rs = query("SELECT * FROM " + table("products") + " WHERE LOWER(name)=LOWER(" + Quote(name) + ") LIMIT 1");
    if (!rs || !rs->next())
        return std::nullopt;
    return ParseProduct(rs.get());
}

StoreStatus MySQLFulfillmentStore::InsertProduct(const ProductRecord& p) {
    std::ostringstream oss;
    oss << "INSERT INTO " << table("products") << " (product_id,name,price,stock,category,is_active,updated_at) VALUES (" << Quote(p.productId) << ',' << Quote(p.name) << ','
        << Money(p.price) << ',' << (p.stock ? std::to_string(*p.stock) : "NULL") << ',' << Quote(p.category) << ',' << (p.isActive ? 1 : 0) << ',' << ToEpochMillis(p.updatedAt) << ')';
    return insert(oss.str());
}

StockMutation MySQLFulfillmentStore::DecrementStockIfAvailable(const std::string& productId, std::int64_t quantity) {
    const auto result = update(std::format("UPDATE {} SET stock=stock-{}, updated_at={} WHERE product_id={} AND stock IS NOT NULL AND stock>={}", table("products"), quantity,
                                           ToEpochMillis(Clock::now()), Quote(productId), quantity));
    if (!result.ok())
        return {StoreStatus::kUnavailable, std::nullopt};

    auto product = GetProduct(productId);
    if (result.affectedRows > 0)
        return {StoreStatus::kOk, std::move(product)};
    if (!product)
        return {StoreStatus::kNotFound, std::nullopt};
    return {StoreStatus::kGuardFailed, std::move(product)};
}

StockMutation MySQLFulfillmentStore::IncrementStock(const std::string& productId, std::int64_t quantity) {
    const auto result = update(std::format("UPDATE {} SET stock=stock+{}, updated_at={} WHERE product_id={} AND stock IS NOT NULL", table("products"), quantity, ToEpochMillis(Clock::now()),
                                           Quote(productId)));
    if (!result.ok())
        return {StoreStatus::kUnavailable, std::nullopt};

    auto product = GetProduct(productId);
    if (result.affectedRows > 0)
        return {StoreStatus::kOk, std::move(product)};
    if (!product)
        return {StoreStatus::kNotFound, std::nullopt};
    return {StoreStatus::kGuardFailed, std::move(product)};
}

std::vector<ProductRecord> MySQLFulfillmentStore::ListLowStock(std::int64_t threshold) {
    std::vector<ProductRecord> list;
    auto rs = query(std::format("SELECT * FROM {} WHERE stock IS NOT NULL AND stock<{} AND is_active=1 ORDER BY stock ASC", table("products"), threshold));
    while (rs && rs->next())
        list.push_back(ParseProduct(rs.get()));
    return list;
}

// ------------------- 编号 -------------------

std::optional<std::string> MySQLFulfillmentStore::FindHighestNumber(DocumentKind kind, const std::string& prefix) {
    std::string tableName;
    std::string column;
    switch (kind) {
        case DocumentKind::kOrder:    tableName = table("orders");     column = "order_number";    break;
        case DocumentKind::kDelivery: tableName = table("deliveries"); column = "delivery_number"; break;
        case DocumentKind::kInvoice:  tableName = table("invoices");   column = "invoice_number";  break;
        case DocumentKind::kPayment:  tableName = table("payments");   column = "payment_number";  break;
        case DocumentKind::kReturn:   tableName = table("returns");    column = "return_number";   break;
    }
    // 编号只含字母数字与下划线，前缀直接用于 LIKE；按 prefix 之后、'_' 之前的数值排序，五位序号排在四位之前
    auto rs = query(std::format("SELECT {0} FROM {1} WHERE {0} LIKE {2} ORDER BY CAST(SUBSTRING_INDEX(SUBSTRING({0}, {3}), '_', 1) AS UNSIGNED) DESC, {0} DESC LIMIT 1",
                                column, tableName, Quote(prefix + "%"), prefix.size() + 1));
    if (!rs || !rs->next())
        return std::nullopt;
    return SafeString(rs.get(), column.c_str());
}

// ------------------- 订单 -------------------

StoreStatus MySQLFulfillmentStore::InsertOrder(const OrderRecord& o) {
    std::ostringstream oss;
    oss << "INSERT INTO " << table("orders") << " (order_id,order_number,client_id,kind,status,balance_due,order_date,version,body) VALUES (" << Quote(o.orderId) << ','
        << Quote(o.orderNumber) << ',' << Quote(o.clientId) << ',' << Quote(ToString(o.kind)) << ',' << Quote(ToString(o.status)) << ',' << Money(o.balanceDue) << ','
        << ToEpochMillis(o.orderDate) << ',' << o.version << ',' << Body(o) << ')';
    return insert(oss.str());
}

std::optional<OrderRecord> MySQLFulfillmentStore::GetOrder(const std::string& orderId) {
    auto rs = query("SELECT * FROM " + table("orders") + " WHERE order_id=" + Quote(orderId));
    if (!rs || !rs->next())
        return std::nullopt;
    return parseOrder(rs.get());
}

StoreStatus MySQLFulfillmentStore::ReplaceOrder(const OrderRecord& order, std::uint64_t expectedVersion) {
    OrderRecord stored = order;
    stored.version = expectedVersion + 1;

    std::ostringstream oss;
    oss << "UPDATE " << table("orders") << " SET status=" << Quote(ToString(stored.status)) << ", balance_due=" << Money(stored.balanceDue) << ", client_id=" << Quote(stored.clientId)
        << ", version=" << stored.version << ", body=" << Body(stored) << " WHERE order_id=" << Quote(stored.orderId) << " AND version=" << expectedVersion;
    return guarded(update(oss.str()), "orders", "order_id", stored.orderId, StoreStatus::kConflict);
}

StoreStatus MySQLFulfillmentStore::RemoveOrder(const std::string& orderId) {
    return remove("orders", "order_id", orderId);
}

std::vector<OrderRecord> MySQLFulfillmentStore::ListOrdersWithBalanceDue(const std::string& clientId) {
    std::vector<OrderRecord> list;
    auto rs = query(std::format("SELECT * FROM {} WHERE client_id={} AND balance_due>{} AND status<>'cancelled' ORDER BY order_date ASC", table("orders"), Quote(clientId),
                                Money(kMoneyEpsilon)));
    while (rs && rs->next()) {
        if (auto order = parseOrder(rs.get()))
            list.push_back(std::move(*order));
    }
    return list;
}

// ------------------- 发货单 -------------------

StoreStatus MySQLFulfillmentStore::InsertDelivery(const DeliveryRecord& d) {
    std::ostringstream oss;
    oss << "INSERT INTO " << table("deliveries") << " (delivery_id,delivery_number,order_id,status,invoice_id,body) VALUES (" << Quote(d.deliveryId) << ',' << Quote(d.deliveryNumber) << ','
        << Quote(d.orderId) << ',' << Quote(ToString(d.status)) << ',' << Quote(d.invoiceId) << ',' << Body(d) << ')';
    return insert(oss.str());
}

std::optional<DeliveryRecord> MySQLFulfillmentStore::GetDelivery(const std::string& deliveryId) {
    auto rs = query("SELECT * FROM " + table("deliveries") + " WHERE delivery_id=" + Quote(deliveryId));
    if (!rs || !rs->next())
        return std::nullopt;
    return parseDelivery(rs.get());
}

std::vector<DeliveryRecord> MySQLFulfillmentStore::ListDeliveriesForOrder(const std::string& orderId) {
    std::vector<DeliveryRecord> list;
    auto rs = query("SELECT * FROM " + table("deliveries") + " WHERE order_id=" + Quote(orderId) + " ORDER BY delivery_number ASC");
    while (rs && rs->next()) {
        if (auto delivery = parseDelivery(rs.get()))
            list.push_back(std::move(*delivery));
    }
    return list;
}

StoreStatus MySQLFulfillmentStore::UpdateDeliveryStatus(const std::string& deliveryId, DeliveryStatus status) {
    const auto result = update("UPDATE " + table("deliveries") + " SET status=" + Quote(ToString(status)) + " WHERE delivery_id=" + Quote(deliveryId));
    // 状态未变化时受影响行数同样为 0
    return guarded(result, "deliveries", "delivery_id", deliveryId, StoreStatus::kOk);
}

StoreStatus MySQLFulfillmentStore::LinkDeliveryInvoice(const std::string& deliveryId, const std::string& invoiceId) {
    const auto result = update("UPDATE " + table("deliveries") + " SET invoice_id=" + Quote(invoiceId) + " WHERE delivery_id=" + Quote(deliveryId) + " AND invoice_id=''");
    return guarded(result, "deliveries", "delivery_id", deliveryId, StoreStatus::kConflict);
}

StoreStatus MySQLFulfillmentStore::UnlinkDeliveryInvoice(const std::string& deliveryId, const std::string& invoiceId) {
    const auto result = update("UPDATE " + table("deliveries") + " SET invoice_id='' WHERE delivery_id=" + Quote(deliveryId) + " AND invoice_id=" + Quote(invoiceId));
    return guarded(result, "deliveries", "delivery_id", deliveryId, StoreStatus::kConflict);
}

StoreStatus MySQLFulfillmentStore::RemoveDelivery(const std::string& deliveryId) {
    return remove("deliveries", "delivery_id", deliveryId);
}

// ------------------- 发票 -------------------

StoreStatus MySQLFulfillmentStore::InsertInvoice(const InvoiceRecord& i) {
    std::ostringstream oss;
    oss << "INSERT INTO " << table("invoices") << " (invoice_id,invoice_number,order_id,delivery_status,body) VALUES (" << Quote(i.invoiceId) << ',' << Quote(i.invoiceNumber) << ','
        << Quote(i.orderId) << ',' << Quote(ToString(i.deliveryStatus)) << ',' << Body(i) << ')';
    return insert(oss.str());
}

std::optional<InvoiceRecord> MySQLFulfillmentStore::GetInvoice(const std::string& invoiceId) {
    auto rs = query("SELECT * FROM " + table("invoices") + " WHERE invoice_id=" + Quote(invoiceId));
    if (!rs || !rs->next())
        return std::nullopt;
    return parseInvoice(rs.get());
}

std::vector<InvoiceRecord> MySQLFulfillmentStore::ListInvoicesForOrder(const std::string& orderId) {
    std::vector<InvoiceRecord> list;
    auto rs = query("SELECT * FROM " + table("invoices") + " WHERE order_id=" + Quote(orderId) + " ORDER BY invoice_number ASC");
    while (rs && rs->next()) {
        if (auto invoice = parseInvoice(rs.get()))
            list.push_back(std::move(*invoice));
    }
    return list;
}

StoreStatus MySQLFulfillmentStore::UpdateInvoiceDeliveryStatus(const std::string& invoiceId, DeliveryStatus status) {
    const auto result = update("UPDATE " + table("invoices") + " SET delivery_status=" + Quote(ToString(status)) + " WHERE invoice_id=" + Quote(invoiceId));
    return guarded(result, "invoices", "invoice_id", invoiceId, StoreStatus::kOk);
}

StoreStatus MySQLFulfillmentStore::RemoveInvoice(const std::string& invoiceId) {
    return remove("invoices", "invoice_id", invoiceId);
}

// ------------------- 收款单 -------------------

StoreStatus MySQLFulfillmentStore::InsertPayment(const PaymentRecord& p) {
    std::ostringstream oss;
    oss << "INSERT INTO " << table("payments") << " (payment_id,payment_number,client_id,payment_date,body) VALUES (" << Quote(p.paymentId) << ',' << Quote(p.paymentNumber) << ','
        << Quote(p.clientId) << ',' << ToEpochMillis(p.paymentDate) << ',' << Body(p) << ')';
    return insert(oss.str());
}

std::optional<PaymentRecord> MySQLFulfillmentStore::GetPayment(const std::string& paymentId) {
    auto rs = query("SELECT * FROM " + table("payments") + " WHERE payment_id=" + Quote(paymentId));
    if (!rs || !rs->next())
        return std::nullopt;
    return ParseBody<PaymentRecord>(rs.get());
}

std::vector<PaymentRecord> MySQLFulfillmentStore::ListPaymentsForClient(const std::string& clientId) {
    std::vector<PaymentRecord> list;
    auto rs = query("SELECT * FROM " + table("payments") + " WHERE client_id=" + Quote(clientId) + " ORDER BY payment_date DESC");
    while (rs && rs->next()) {
        if (auto payment = ParseBody<PaymentRecord>(rs.get()))
            list.push_back(std::move(*payment));
    }
    return list;
}

// ------------------- 客户 -------------------

std::optional<ClientRecord> MySQLFulfillmentStore::GetClient(const std::string& clientId) {
    auto rs = query("SELECT * FROM " + table("clients") + " WHERE client_id=" + Quote(clientId));
    if (!rs || !rs->next())
        return std::nullopt;
    return ParseClient(rs.get());
}

std::optional<ClientRecord> MySQLFulfillmentStore::FindClient(const std::string& partyName, const std::string& mobile) {
    // 默认排序规则对 party_name 大小写不敏感
    auto rs = query("SELECT * FROM " + table("clients") + " WHERE party_name=" + Quote(partyName) + " AND mobile=" + Quote(mobile) + " LIMIT 1");
    if (!rs || !rs->next())
        return std::nullopt;
    return ParseClient(rs.get());
}

StoreStatus MySQLFulfillmentStore::InsertClient(const ClientRecord& c) {
    std::ostringstream oss;
    oss << "INSERT INTO " << table("clients") << " (client_id,party_name,mobile,created_at) VALUES (" << Quote(c.clientId) << ',' << Quote(c.partyName) << ',' << Quote(c.mobile) << ','
        << ToEpochMillis(c.createdAt) << ')';
    return insert(oss.str());
}

StoreStatus MySQLFulfillmentStore::ApplyClientDelta(const std::string& clientId, const ClientDelta& d) {
    std::ostringstream oss;
    oss << "UPDATE " << table("clients") << " SET total_orders=total_orders+(" << d.totalOrders << "), open_orders=open_orders+(" << d.openOrders << "), completed_orders=completed_orders+("
        << d.completedOrders << "), total_spent=ROUND(total_spent+(" << Money(d.totalSpent) << "),2), total_paid=ROUND(total_paid+(" << Money(d.totalPaid)
        << "),2), total_due=ROUND(total_due+(" << Money(d.totalDue) << "),2), advance_balance=ROUND(advance_balance+(" << Money(d.advanceBalance)
        << "),2), refundable_balance=ROUND(refundable_balance+(" << Money(d.refundableBalance) << "),2), total_returns=total_returns+(" << d.totalReturns
        << "), total_return_value=ROUND(total_return_value+(" << Money(d.totalReturnValue) << "),2)";
    if (d.lastPaymentAmount)
        oss << ", last_payment_amount=" << Money(*d.lastPaymentAmount);
    if (d.lastPaymentDate)
        oss << ", last_payment_date=" << ToEpochMillis(*d.lastPaymentDate);
    oss << " WHERE client_id=" << Quote(clientId);
    return guarded(update(oss.str()), "clients", "client_id", clientId, StoreStatus::kOk);
}

StoreStatus MySQLFulfillmentStore::DebitAdvanceBalance(const std::string& clientId, double amount) {
    const auto result = update(std::format("UPDATE {} SET advance_balance=ROUND(advance_balance-{},2) WHERE client_id={} AND advance_balance+{}>={}", table("clients"), Money(amount),
                                           Quote(clientId), Money(kMoneyEpsilon), Money(amount)));
    return guarded(result, "clients", "client_id", clientId, StoreStatus::kGuardFailed);
}

// ------------------- 员工统计 -------------------

StoreStatus MySQLFulfillmentStore::ApplyEmployeeDelta(const std::string& employeeId, const EmployeeDelta& d) {
    std::ostringstream oss;
    oss << "INSERT INTO " << table("employee_stats") << " (employee_id,total_orders,total_deliveries,early_deliveries,on_time_deliveries,late_deliveries) VALUES (" << Quote(employeeId)
        << ',' << d.totalOrders << ',' << d.totalDeliveries << ',' << d.earlyDeliveries << ',' << d.onTimeDeliveries << ',' << d.lateDeliveries << ')'
        << " ON DUPLICATE KEY UPDATE total_orders=total_orders+(" << d.totalOrders << "), total_deliveries=total_deliveries+(" << d.totalDeliveries
        << "), early_deliveries=early_deliveries+(" << d.earlyDeliveries << "), on_time_deliveries=on_time_deliveries+(" << d.onTimeDeliveries
        << "), late_deliveries=late_deliveries+(" << d.lateDeliveries << ')';
    return update(oss.str()).ok() ? StoreStatus::kOk : StoreStatus::kUnavailable;
}

std::optional<EmployeeStatsRecord> MySQLFulfillmentStore::GetEmployeeStats(const std::string& employeeId) {
    auto rs = query("SELECT * FROM " + table("employee_stats") + " WHERE employee_id=" + Quote(employeeId));
    if (!rs || !rs->next())
        return std::nullopt;
    EmployeeStatsRecord e;
    e.employeeId = SafeString(rs.get(), "employee_id");
    e.totalOrders = rs->getInt("total_orders");
    e.totalDeliveries = rs->getInt("total_deliveries");
    e.earlyDeliveries = rs->getInt("early_deliveries");
    e.onTimeDeliveries = rs->getInt("on_time_deliveries");
    e.lateDeliveries = rs->getInt("late_deliveries");
    return e;
}

// ------------------- 退货单 -------------------

StoreStatus MySQLFulfillmentStore::InsertReturn(const ReturnRecord& r) {
    std::ostringstream oss;
    oss << "INSERT INTO " << table("returns") << " (return_id,return_number,order_id,refundable_amount,refunded_amount,refund_status,body) VALUES (" << Quote(r.returnId) << ','
        << Quote(r.returnNumber) << ',' << Quote(r.orderId) << ',' << Money(r.refundableAmount) << ',' << Money(r.refundedAmount) << ',' << Quote(ToString(r.refundStatus)) << ','
        << Body(r) << ')';
    return insert(oss.str());
}

std::optional<ReturnRecord> MySQLFulfillmentStore::GetReturn(const std::string& returnId) {
    auto rs = query("SELECT * FROM " + table("returns") + " WHERE return_id=" + Quote(returnId));
    if (!rs || !rs->next())
        return std::nullopt;
    return parseReturn(rs.get());
}

std::vector<ReturnRecord> MySQLFulfillmentStore::ListReturnsForOrder(const std::string& orderId) {
    std::vector<ReturnRecord> list;
    auto rs = query("SELECT * FROM " + table("returns") + " WHERE order_id=" + Quote(orderId) + " ORDER BY return_number ASC");
    while (rs && rs->next()) {
        if (auto record = parseReturn(rs.get()))
            list.push_back(std::move(*record));
    }
    return list;
}

RefundMutation MySQLFulfillmentStore::ApplyRefund(const std::string& returnId, double amount) {
    // 单表 UPDATE 按书写顺序赋值，refund_status 读到的是累加后的 refunded_amount
    const std::string sql = std::format(
        "UPDATE {0} SET refunded_amount=ROUND(refunded_amount+{1},2),"
        " refund_status=IF(refundable_amount<={2},'no_refund',IF(refunded_amount+{2}>=refundable_amount,'refunded',IF(refunded_amount>{2},'partial','pending')))"
        " WHERE return_id={3} AND refunded_amount+{1}<=refundable_amount+{2}",
        table("returns"), Money(amount), Money(kMoneyEpsilon), Quote(returnId));
    const auto result = update(sql);
    if (!result.ok())
        return {StoreStatus::kUnavailable, std::nullopt};

    auto record = GetReturn(returnId);
    if (result.affectedRows > 0)
        return {StoreStatus::kOk, std::move(record)};
    if (!record)
        return {StoreStatus::kNotFound, std::nullopt};
    return {StoreStatus::kGuardFailed, std::move(record)};
}

StoreStatus MySQLFulfillmentStore::RevertRefund(const std::string& returnId, double amount) {
    const std::string sql = std::format(
        "UPDATE {0} SET refunded_amount=GREATEST(0,ROUND(refunded_amount-{1},2)),"
        " refund_status=IF(refundable_amount<={2},'no_refund',IF(refunded_amount+{2}>=refundable_amount,'refunded',IF(refunded_amount>{2},'partial','pending')))"
        " WHERE return_id={3}",
        table("returns"), Money(amount), Money(kMoneyEpsilon), Quote(returnId));
    return guarded(update(sql), "returns", "return_id", returnId, StoreStatus::kOk);
}

// ------------------- 结果集解析 -------------------

std::optional<OrderRecord> MySQLFulfillmentStore::parseOrder(sql::ResultSet* rs) const {
    auto order = ParseBody<OrderRecord>(rs);
    if (order)
        order->version = static_cast<std::uint64_t>(rs->getUInt64("version"));
    return order;
}

std::optional<DeliveryRecord> MySQLFulfillmentStore::parseDelivery(sql::ResultSet* rs) const {
    auto delivery = ParseBody<DeliveryRecord>(rs);
    if (delivery) {
        delivery->invoiceId = SafeString(rs, "invoice_id");
        delivery->status = DeliveryStatusFromString(SafeString(rs, "status")).value_or(delivery->status);
    }
    return delivery;
}

std::optional<InvoiceRecord> MySQLFulfillmentStore::parseInvoice(sql::ResultSet* rs) const {
    auto invoice = ParseBody<InvoiceRecord>(rs);
    if (invoice)
        invoice->deliveryStatus = DeliveryStatusFromString(SafeString(rs, "delivery_status")).value_or(invoice->deliveryStatus);
    return invoice;
}

std::optional<ReturnRecord> MySQLFulfillmentStore::parseReturn(sql::ResultSet* rs) const {
    auto record = ParseBody<ReturnRecord>(rs);
    if (record) {
        record->refundableAmount = static_cast<double>(rs->getDouble("refundable_amount"));
        record->refundedAmount = static_cast<double>(rs->getDouble("refunded_amount"));
        record->refundStatus = RefundStatusFromString(SafeString(rs, "refund_status"));
    }
    return record;
}

// ------------------- SQL 基础封装 -------------------

std::string MySQLFulfillmentStore::table(std::string_view name) const {
    return options_.tablePrefix + std::string(name);
}

std::unique_ptr<sql::ResultSet> MySQLFulfillmentStore::query(const std::string& sql) {
    return pool_->SubmitQuery(sql).get();
}

SQLUpdateResult MySQLFulfillmentStore::update(const std::string& sql) {
    return pool_->SubmitUpdate(sql).get();
}

StoreStatus MySQLFulfillmentStore::insert(const std::string& sql) {
    const auto result = update(sql);
    if (result.duplicateKey())
        return StoreStatus::kDuplicateKey;
    return result.ok() ? StoreStatus::kOk : StoreStatus::kUnavailable;
}

StoreStatus MySQLFulfillmentStore::remove(std::string_view tableName, std::string_view idColumn, const std::string& id) {
    const auto result = update(std::format("DELETE FROM {} WHERE {}={}", table(tableName), idColumn, Quote(id)));
    if (!result.ok())
        return StoreStatus::kUnavailable;
    return result.affectedRows > 0 ? StoreStatus::kOk : StoreStatus::kNotFound;
}

bool MySQLFulfillmentStore::exists(std::string_view tableName, std::string_view idColumn, const std::string& id) {
    auto rs = query(std::format("SELECT 1 FROM {} WHERE {}={} LIMIT 1", table(tableName), idColumn, Quote(id)));
    return rs && rs->next();
}

StoreStatus MySQLFulfillmentStore::guarded(const SQLUpdateResult& result, std::string_view tableName, std::string_view idColumn, const std::string& id, StoreStatus whenZero) {
    if (!result.ok())
        return StoreStatus::kUnavailable;
    if (result.affectedRows > 0)
        return StoreStatus::kOk;
    return exists(tableName, idColumn, id) ? whenZero : StoreStatus::kNotFound;
}
