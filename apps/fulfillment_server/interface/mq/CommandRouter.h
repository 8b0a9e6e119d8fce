#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "domain/FulfillmentError.h"

class CommandConsumer;
class FulfillmentService;
class PaymentAllocator;
class ReturnReconciler;
class FulfillmentStore;

/**
 * @brief CommandRouter：命令消息路由器
 *
 * interface 层组件：解析 {"command","correlationId","replyTo","payload"}，按命令名调用领域操作，
 * 结果封装为 {"correlationId","ok","result"|"error"} 并发往 replyTo。
 * 不直接依赖 MQ 底层，只依赖 CommandConsumer 与一个回复发布函数。
 */
class CommandRouter {
public:
    using ReplyPublisher = std::function<void(const std::string& routingKey, const std::string& body)>;

    struct Dependencies {
        CommandConsumer* consumer{nullptr};
        FulfillmentService* fulfillment{nullptr};
        PaymentAllocator* payments{nullptr};
        ReturnReconciler* returns{nullptr};
        FulfillmentStore* store{nullptr};  // 商品维护命令直接落库
        ReplyPublisher publishReply;
    };

    struct Options {
        bool enableLogging{true};
    };

    // 成功返回结果 JSON；失败返回 nullopt 并填充 error
    using Handler = std::function<std::optional<nlohmann::json>(const nlohmann::json& payload, FulfillmentError* error)>;

    CommandRouter(Dependencies deps);
    CommandRouter(Dependencies deps, Options options);

    void Initialize();  // 注册所有命令处理函数
    void Start();  // 启动消费
    void Stop();  // 停止消费

    // 处理一条消息原文并返回回复 JSON（同时按 replyTo 发布）
    nlohmann::json HandleMessage(const std::string& message);

    bool HasHandler(std::string_view command) const { return handlers_.count(std::string(command)) > 0; }

    static nlohmann::json ErrorToJson(const FulfillmentError& error);

private:
    void registerHandler(std::string_view command, Handler handler);

    std::optional<nlohmann::json> onCreateOrder(const nlohmann::json& payload, FulfillmentError* error);
    std::optional<nlohmann::json> onUpdateOrderItems(const nlohmann::json& payload, FulfillmentError* error);
    std::optional<nlohmann::json> onCreateDelivery(const nlohmann::json& payload, FulfillmentError* error);
    std::optional<nlohmann::json> onGenerateInvoice(const nlohmann::json& payload, FulfillmentError* error);
    std::optional<nlohmann::json> onClientPayment(const nlohmann::json& payload, FulfillmentError* error);
    std::optional<nlohmann::json> onCreateReturn(const nlohmann::json& payload, FulfillmentError* error);
    std::optional<nlohmann::json> onRecordRefund(const nlohmann::json& payload, FulfillmentError* error);
    std::optional<nlohmann::json> onCreateProduct(const nlohmann::json& payload, FulfillmentError* error);

    Dependencies deps_;
    Options options_;
    std::unordered_map<std::string, Handler> handlers_;
    bool running_{false};
};
