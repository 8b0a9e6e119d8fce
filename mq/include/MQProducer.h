#pragma once

#include "MQClient.h"

#include <memory>
#include <string>

// 异步发布者封装：publish 可在任意线程调用，实际发送投递到 MQEventLoop 线程执行
class MQProducer {
public:
    explicit MQProducer(MQClient* client);
    ~MQProducer();

    // 声明 topic exchange（幂等）
    void declareExchange(const std::string& exchange);

    // exchange 可为 ""（直连到队列），routingKey 为队列名 / 事件名
    void publish(const std::string& exchange, const std::string& routingKey, const std::string& message);

private:
    MQClient* client_{nullptr};
    std::unique_ptr<AMQP::TcpChannel> channel_;
};
