#pragma once

#include <string>

#include "domain/EventSink.h"

class MQProducer;

/**
 * @brief MQEventSink：领域事件发布到 AMQP topic exchange
 *
 * routing key 为事件名，消息体 {"event", "source", "publishedAt", "payload"}。
 * 序列化或发送失败只记日志。
 */
class MQEventSink : public EventSink {
public:
    struct Dependencies {
        MQProducer* producer{nullptr};
    };

    struct Options {
        std::string exchange{"fulfillment.events"};
        std::string source{"fulfillment_server"};
    };

    MQEventSink(Dependencies deps);
    MQEventSink(Dependencies deps, Options options);

    // 声明 exchange（幂等）
    void Initialize();

    void Publish(const std::string& event, const nlohmann::json& payload) override;

private:
    Dependencies deps_;
    Options options_;
};
