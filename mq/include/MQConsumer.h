#pragma once

#include "MQClient.h"

#include <functional>
#include <memory>
#include <string>

// 异步消费者封装：回调在 MQEventLoop 线程上执行，处理完成后 ack
class MQConsumer {
public:
    using MessageCallback = std::function<void(const std::string&)>;

    explicit MQConsumer(MQClient* client);
    ~MQConsumer();

    // 订阅队列：声明队列（幂等）后开始消费，收到消息后回调 cb(body)
    void consume(const std::string& queue, MessageCallback cb);

private:
    MQClient* client_{nullptr};
    std::unique_ptr<AMQP::TcpChannel> channel_;
};
