#include "interface/mq/CommandRouter.h"

#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

#include "LogMacros.h"
#include "domain/FulfillmentService.h"
#include "domain/PaymentAllocator.h"
#include "domain/ReturnReconciler.h"
#include "domain/SequenceAllocator.h"
#include "infra/codec/RecordJson.h"
#include "infra/mq/CommandConsumer.h"

using json = nlohmann::json;

namespace {

// 命令字段缺失或类型不对
class BadCommand : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

std::string RequireString(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty())
        throw BadCommand(std::string("field '") + key + "' is required");
    return j[key].get<std::string>();
}

std::string OptString(const json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : std::string{};
}

double OptNumber(const json& j, const char* key, double fallback = 0.0) {
    if (!j.contains(key) || j[key].is_null())
        return fallback;
    if (!j[key].is_number())
        throw BadCommand(std::string("field '") + key + "' must be a number");
    return j[key].get<double>();
}

std::int64_t RequireQuantity(const json& j) {
    if (!j.contains("quantity") || !j["quantity"].is_number_integer())
        throw BadCommand("field 'quantity' must be an integer");
    return j["quantity"].get<std::int64_t>();
}

std::optional<TimePoint> OptTime(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null())
        return std::nullopt;
    if (!j[key].is_number_integer())
        throw BadCommand(std::string("field '") + key + "' must be epoch milliseconds");
    return FromEpochMillis(j[key].get<std::int64_t>());
}

const json& RequireArray(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_array())
        throw BadCommand(std::string("field '") + key + "' must be an array");
    return j[key];
}

PaymentMethod ParseMethod(const json& j) {
    const std::string raw = OptString(j, "method");
    if (raw.empty())
        return PaymentMethod::kCash;
    auto method = PaymentMethodFromString(raw);
    if (!method)
        throw BadCommand("unknown payment method '" + raw + "'");
    return *method;
}

Charges ParseCharges(const json& j) {
    return Charges{OptNumber(j, "freight"), OptNumber(j, "taxPercent"), OptNumber(j, "discount")};
}

bool HasCharges(const json& j) {
    return j.contains("freight") || j.contains("taxPercent") || j.contains("discount");
}

PaymentAllocator::PaymentInput ParsePayment(const json& j) {
    PaymentAllocator::PaymentInput input;
    input.amount = OptNumber(j, "amount");
    input.method = ParseMethod(j);
    input.paymentDate = OptTime(j, "paymentDate");
    input.reference = OptString(j, "reference");
    input.notes = OptString(j, "notes");
    return input;
}

std::vector<FulfillmentService::ItemInput> ParseItems(const json& j) {
    std::vector<FulfillmentService::ItemInput> items;
    for (const auto& raw : RequireArray(j, "items")) {
        FulfillmentService::ItemInput item;
        item.lineId = OptString(raw, "lineId");
        item.productId = OptString(raw, "productId");
        item.productName = OptString(raw, "productName");
        item.narration = OptString(raw, "narration");
        item.unitPrice = OptNumber(raw, "unitPrice");
        item.quantity = RequireQuantity(raw);
        items.push_back(std::move(item));
    }
    return items;
}

json LedgerToJson(const InventoryLedger::Result& result) {
    json affected = json::array();
    for (const auto& change : result.affected)
        affected.push_back(json{{"productId", change.productId}, {"productName", change.productName}, {"before", change.before}, {"after", change.after}});
    return json{{"affected", affected}, {"lowStock", result.lowStock}};
}

json PaymentToJson(const PaymentAllocator::PaymentResult& result) {
    json j{{"payment", result.payment}, {"orders", result.orders}};
    if (result.client)
        j["client"] = *result.client;
    return j;
}

template <typename T>
std::optional<json> Found(const std::optional<T>& value, const char* what, const std::string& id, FulfillmentError* error) {
    if (!value) {
        SetError(error, FulfillmentError::NotFound(what, id));
        return std::nullopt;
    }
    return json(*value);
}

}  // namespace

// ========== 构造与初始化 ==========

CommandRouter::CommandRouter(Dependencies deps) : CommandRouter(std::move(deps), Options{}) {}

CommandRouter::CommandRouter(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

void CommandRouter::Initialize() {
    auto* fulfillment = deps_.fulfillment;
    auto* payments = deps_.payments;
    auto* returns = deps_.returns;

    if (fulfillment) {
        registerHandler("order.create", [this](const json& p, FulfillmentError* e) { return onCreateOrder(p, e); });
        registerHandler("order.cancel", [fulfillment](const json& p, FulfillmentError* e) -> std::optional<json> {
            auto order = fulfillment->CancelOrder(RequireString(p, "orderId"), OptString(p, "reason"), e);
            return order ? std::optional<json>(json(*order)) : std::nullopt;
        });
        registerHandler("order.delete", [fulfillment](const json& p, FulfillmentError* e) -> std::optional<json> {
            auto result = fulfillment->DeleteOrder(RequireString(p, "orderId"), e);
            if (!result)
                return std::nullopt;
            return json{{"order", result->order}, {"deliveriesRemoved", result->deliveriesRemoved}, {"invoicesRemoved", result->invoicesRemoved}};
        });
        registerHandler("order.updateItems", [this](const json& p, FulfillmentError* e) { return onUpdateOrderItems(p, e); });
        registerHandler("order.updateDetails", [fulfillment](const json& p, FulfillmentError* e) -> std::optional<json> {
            std::optional<std::string> notes;
            if (p.contains("notes"))
                notes = OptString(p, "notes");
            auto order = fulfillment->UpdateOrderDetails(RequireString(p, "orderId"), notes, OptTime(p, "expectedDeliveryDate"), e);
            return order ? std::optional<json>(json(*order)) : std::nullopt;
        });
        registerHandler("order.get", [fulfillment](const json& p, FulfillmentError* e) {
            const std::string id = RequireString(p, "orderId");
            return Found(fulfillment->GetOrder(id), "order", id, e);
        });
        registerHandler("order.invoice", [fulfillment](const json& p, FulfillmentError* e) -> std::optional<json> {
            auto invoice = fulfillment->GenerateOrderInvoice(RequireString(p, "orderId"), e);
            return invoice ? std::optional<json>(json(*invoice)) : std::nullopt;
        });
        registerHandler("delivery.create", [this](const json& p, FulfillmentError* e) { return onCreateDelivery(p, e); });
        registerHandler("delivery.invoice", [this](const json& p, FulfillmentError* e) { return onGenerateInvoice(p, e); });
        registerHandler("delivery.updateStatus", [fulfillment](const json& p, FulfillmentError* e) -> std::optional<json> {
            const std::string raw = RequireString(p, "status");
            auto status = DeliveryStatusFromString(raw);
            if (!status)
                throw BadCommand("unknown delivery status '" + raw + "'");
            auto delivery = fulfillment->UpdateDeliveryStatus(RequireString(p, "deliveryId"), *status, e);
            return delivery ? std::optional<json>(json(*delivery)) : std::nullopt;
        });
        registerHandler("delivery.get", [fulfillment](const json& p, FulfillmentError* e) {
            const std::string id = RequireString(p, "deliveryId");
            return Found(fulfillment->GetDelivery(id), "delivery", id, e);
        });
        registerHandler("delivery.list", [fulfillment](const json& p, FulfillmentError*) -> std::optional<json> { return json(fulfillment->ListDeliveries(RequireString(p, "orderId"))); });
        registerHandler("client.get", [fulfillment](const json& p, FulfillmentError* e) {
            const std::string id = RequireString(p, "clientId");
            return Found(fulfillment->GetClient(id), "client", id, e);
        });
        registerHandler("employee.stats", [fulfillment](const json& p, FulfillmentError* e) {
            const std::string id = RequireString(p, "employeeId");
            return Found(fulfillment->GetEmployeeStats(id), "employee", id, e);
        });
        registerHandler("inventory.lowStock", [fulfillment](const json&, FulfillmentError*) -> std::optional<json> { return json(fulfillment->ListLowStock()); });
    }

    if (payments) {
        registerHandler("payment.order", [payments](const json& p, FulfillmentError* e) -> std::optional<json> {
            auto result = payments->RecordOrderPayment(RequireString(p, "orderId"), ParsePayment(p), e);
            return result ? std::optional<json>(PaymentToJson(*result)) : std::nullopt;
        });
        registerHandler("payment.advance", [payments](const json& p, FulfillmentError* e) -> std::optional<json> {
            auto result = payments->RecordAdvancePayment(RequireString(p, "clientId"), ParsePayment(p), e);
            return result ? std::optional<json>(PaymentToJson(*result)) : std::nullopt;
        });
        registerHandler("payment.client", [this](const json& p, FulfillmentError* e) { return onClientPayment(p, e); });
        registerHandler("payment.useAdvance", [payments](const json& p, FulfillmentError* e) -> std::optional<json> {
            auto result = payments->UseAdvanceForOrder(RequireString(p, "orderId"), OptNumber(p, "amount"), e);
            return result ? std::optional<json>(PaymentToJson(*result)) : std::nullopt;
        });
        registerHandler("payment.list", [payments](const json& p, FulfillmentError*) -> std::optional<json> { return json(payments->ListClientPayments(RequireString(p, "clientId"))); });
        registerHandler("client.summary", [payments](const json& p, FulfillmentError* e) -> std::optional<json> {
            auto summary = payments->ClientFinancialSummary(RequireString(p, "clientId"), e);
            if (!summary)
                return std::nullopt;
            return json{{"client", summary->client}, {"ordersWithDue", summary->ordersWithDue}, {"outstanding", summary->outstanding}, {"netDue", summary->netDue}};
        });
    }

    if (returns) {
        registerHandler("return.create", [this](const json& p, FulfillmentError* e) { return onCreateReturn(p, e); });
        registerHandler("return.refund", [this](const json& p, FulfillmentError* e) { return onRecordRefund(p, e); });
        registerHandler("return.get", [returns](const json& p, FulfillmentError* e) {
            const std::string id = RequireString(p, "returnId");
            return Found(returns->GetReturn(id), "return", id, e);
        });
        registerHandler("return.list", [returns](const json& p, FulfillmentError*) -> std::optional<json> { return json(returns->ListReturnsForOrder(RequireString(p, "orderId"))); });
    }

    if (deps_.store) {
        registerHandler("product.create", [this](const json& p, FulfillmentError* e) { return onCreateProduct(p, e); });
        registerHandler("product.get", [this](const json& p, FulfillmentError* e) {
            const std::string id = RequireString(p, "productId");
            return Found(deps_.store->GetProduct(id), "product", id, e);
        });
    }

    if (options_.enableLogging)
        LOG_INFO("[CommandRouter] Initialized with {} handlers", handlers_.size());
}

// ========== 启动与停止 ==========

void CommandRouter::Start() {
    if (running_)
        return;
    if (!deps_.consumer) {
        LOG_ERROR("[CommandRouter] Missing CommandConsumer dependency");
        return;
    }
    running_ = true;
    deps_.consumer->Start([this](const std::string& payload) { HandleMessage(payload); });
    LOG_INFO("[CommandRouter] Started routing commands");
}

void CommandRouter::Stop() {
    if (!running_)
        return;
    running_ = false;
    if (deps_.consumer)
        deps_.consumer->Stop();
    LOG_INFO("[CommandRouter] Stopped routing commands");
}

// ========== 消息路由核心逻辑 ==========

json CommandRouter::HandleMessage(const std::string& message) {
    json reply{{"correlationId", nullptr}, {"ok", false}};
    std::string replyTo;
    FulfillmentError error;

    json envelope = json::parse(message, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        LOG_WARN("[CommandRouter] Malformed command message ({} bytes)", message.size());
        error = FulfillmentError::Validation("message is not a JSON object");
    } else {
        replyTo = OptString(envelope, "replyTo");
        if (envelope.contains("correlationId"))
            reply["correlationId"] = envelope["correlationId"];

        const std::string command = OptString(envelope, "command");
        auto it = handlers_.find(command);
        if (command.empty() || it == handlers_.end()) {
            LOG_WARN("[CommandRouter] Unknown command '{}'", command);
            error = FulfillmentError::Validation("unknown command '" + command + "'");
        } else {
            const json payload = envelope.contains("payload") && envelope["payload"].is_object() ? envelope["payload"] : json::object();
            if (options_.enableLogging)
                LOG_DEBUG("[CommandRouter] Dispatching {}", command);
            try {
                if (auto result = it->second(payload, &error)) {
                    reply["ok"] = true;
                    reply["result"] = std::move(*result);
                } else if (!error) {
                    error = FulfillmentError::Storage("command produced no result");
                }
            } catch (const BadCommand& ex) {
                error = FulfillmentError::Validation(ex.what());
            } catch (const json::exception& ex) {
                error = FulfillmentError::Validation(std::string("invalid payload: ") + ex.what());
            } catch (const std::exception& ex) {
                LOG_ERROR("[CommandRouter] Handler exception for {}: {}", command, ex.what());
                error = FulfillmentError::Storage(std::string("internal error: ") + ex.what());
            }
            if (!reply["ok"].get<bool>())
                LOG_INFO("[CommandRouter] {} rejected: {} ({})", command, error.message, ToString(error.code));
        }
    }

    if (!reply["ok"].get<bool>())
        reply["error"] = ErrorToJson(error);

    if (!replyTo.empty() && deps_.publishReply) {
        std::string body;
        try {
            body = reply.dump();
        } catch (const json::exception& ex) {
            LOG_ERROR("[CommandRouter] Reply not serializable: {}", ex.what());
            return reply;
        }
        deps_.publishReply(replyTo, body);
    }
    return reply;
}

json CommandRouter::ErrorToJson(const FulfillmentError& error) {
    json j{{"code", ToString(error.code)}, {"message", error.message}, {"retryable", error.retryable()}};
    if (error.shortage) {
        j["shortage"] = {{"productId", error.shortage->productId},
                         {"productName", error.shortage->productName},
                         {"available", error.shortage->available},
                         {"requested", error.shortage->requested}};
    }
    return j;
}

void CommandRouter::registerHandler(std::string_view command, Handler handler) {
    handlers_.emplace(std::string(command), std::move(handler));
}

// ========== 命令处理函数 ==========

std::optional<json> CommandRouter::onCreateOrder(const json& p, FulfillmentError* error) {
    FulfillmentService::CreateOrderRequest request;
    request.kind = OrderKindFromString(OptString(p, "kind"));
    request.client.clientId = OptString(p, "clientId");
    request.client.partyName = OptString(p, "partyName");
    request.client.mobile = OptString(p, "mobile");
    request.items = ParseItems(p);
    request.charges = ParseCharges(p);
    request.advance = OptNumber(p, "advance");
    request.employeeId = OptString(p, "employeeId");
    request.orderDate = OptTime(p, "orderDate");
    request.expectedDeliveryDate = OptTime(p, "expectedDeliveryDate");
    request.notes = OptString(p, "notes");

    auto result = deps_.fulfillment->CreateOrder(request, error);
    if (!result)
        return std::nullopt;
    return json{{"order", result->order}, {"inventory", LedgerToJson(result->inventory)}};
}

std::optional<json> CommandRouter::onUpdateOrderItems(const json& p, FulfillmentError* error) {
    std::optional<Charges> charges;
    if (HasCharges(p))
        charges = ParseCharges(p);
    auto order = deps_.fulfillment->UpdateOrderItems(RequireString(p, "orderId"), ParseItems(p), charges, error);
    if (!order)
        return std::nullopt;
    return json(*order);
}

std::optional<json> CommandRouter::onCreateDelivery(const json& p, FulfillmentError* error) {
    FulfillmentService::CreateDeliveryRequest request;
    request.orderId = RequireString(p, "orderId");
    request.deliverAll = p.value("deliverAll", false);
    if (p.contains("items")) {
        for (const auto& raw : RequireArray(p, "items")) {
            FulfillmentService::DeliveryItemInput item;
            item.lineId = OptString(raw, "lineId");
            item.productId = OptString(raw, "productId");
            item.productName = OptString(raw, "productName");
            if (raw.contains("unitPrice") && !raw["unitPrice"].is_null())
                item.unitPrice = OptNumber(raw, "unitPrice");
            item.quantity = RequireQuantity(raw);
            request.items.push_back(std::move(item));
        }
    }
    request.charges = ParseCharges(p);
    request.deliveryDate = OptTime(p, "deliveryDate");
    request.employeeId = OptString(p, "employeeId");
    request.notes = OptString(p, "notes");

    auto result = deps_.fulfillment->CreateDelivery(request, error);
    if (!result)
        return std::nullopt;
    return json{{"delivery", result->delivery}, {"order", result->order}};
}

std::optional<json> CommandRouter::onGenerateInvoice(const json& p, FulfillmentError* error) {
    FulfillmentService::GenerateInvoiceRequest request;
    request.deliveryId = RequireString(p, "deliveryId");
    request.advance = OptNumber(p, "advance");
    request.method = ParseMethod(p);
    request.notes = OptString(p, "notes");

    auto result = deps_.fulfillment->GenerateDeliveryInvoice(request, error);
    if (!result)
        return std::nullopt;
    json j{{"invoice", result->invoice}};
    if (result->payment)
        j["payment"] = *result->payment;
    if (result->order)
        j["order"] = *result->order;
    return j;
}

std::optional<json> CommandRouter::onClientPayment(const json& p, FulfillmentError* error) {
    PaymentAllocator::ClientPaymentRequest request;
    request.clientId = RequireString(p, "clientId");
    request.payment = ParsePayment(p);
    request.autoAllocate = p.value("autoAllocate", true);
    if (p.contains("allocations")) {
        for (const auto& raw : RequireArray(p, "allocations"))
            request.allocations.push_back({RequireString(raw, "orderId"), OptNumber(raw, "amount")});
    }
    auto result = deps_.payments->RecordClientPayment(request, error);
    if (!result)
        return std::nullopt;
    return PaymentToJson(*result);
}

std::optional<json> CommandRouter::onCreateReturn(const json& p, FulfillmentError* error) {
    ReturnReconciler::CreateReturnRequest request;
    request.orderId = RequireString(p, "orderId");
    request.deliveryId = OptString(p, "deliveryId");
    for (const auto& raw : RequireArray(p, "items")) {
        ReturnReconciler::ReturnItemInput item;
        item.lineId = OptString(raw, "lineId");
        item.productId = OptString(raw, "productId");
        item.productName = OptString(raw, "productName");
        item.quantity = RequireQuantity(raw);
        request.items.push_back(std::move(item));
    }
    request.reason = OptString(p, "reason");
    request.notes = OptString(p, "notes");
    request.returnDate = OptTime(p, "returnDate");

    auto result = deps_.returns->CreateReturn(request, error);
    if (!result)
        return std::nullopt;
    json j{{"return", result->record}, {"order", nullptr}, {"inventory", LedgerToJson(result->inventory)}};
    if (result->order)
        j["order"] = *result->order;
    if (result->client)
        j["client"] = *result->client;
    return j;
}

std::optional<json> CommandRouter::onRecordRefund(const json& p, FulfillmentError* error) {
    ReturnReconciler::RefundInput input;
    input.returnId = RequireString(p, "returnId");
    input.amount = OptNumber(p, "amount");
    input.method = ParseMethod(p);
    input.paymentDate = OptTime(p, "paymentDate");
    input.reference = OptString(p, "reference");
    input.notes = OptString(p, "notes");

    auto result = deps_.returns->RecordRefund(input, error);
    if (!result)
        return std::nullopt;
    json j{{"return", result->record}, {"payment", result->payment}};
    if (result->client)
        j["client"] = *result->client;
    return j;
}

std::optional<json> CommandRouter::onCreateProduct(const json& p, FulfillmentError* error) {
    ProductRecord product;
    product.productId = OptString(p, "productId");
    if (product.productId.empty())
        product.productId = GenerateDocumentId("prd");
    product.name = RequireString(p, "name");
    product.price = OptNumber(p, "price");
    if (p.contains("stock") && !p["stock"].is_null()) {
        if (!p["stock"].is_number_integer() || p["stock"].get<std::int64_t>() < 0)
            throw BadCommand("field 'stock' must be a non-negative integer");
        product.stock = p["stock"].get<std::int64_t>();
    }
    product.category = OptString(p, "category");
    product.isActive = p.value("isActive", true);
    product.updatedAt = Clock::now();
    if (!std::isfinite(product.price) || product.price < 0.0) {
        SetError(error, FulfillmentError::Validation("price must be non-negative"));
        return std::nullopt;
    }

    const StoreStatus status = deps_.store->InsertProduct(product);
    if (status == StoreStatus::kDuplicateKey) {
        SetError(error, FulfillmentError::Validation("product " + product.productId + " already exists"));
        return std::nullopt;
    }
    if (status != StoreStatus::kOk) {
        SetError(error, FulfillmentError::Storage("failed to save product"));
        return std::nullopt;
    }
    LOG_INFO("Product {} '{}' created (stock {})", product.productId, product.name, product.stock ? std::to_string(*product.stock) : "untracked");
    return json(product);
}
