#pragma once

#include <memory>
#include <string>

#include "MQHandler.h"

// 负责创建 MQHandler 与 AMQP::TcpConnection；连接在 MQEventLoop 线程上建立与关闭
class MQClient {
public:
    MQClient(MQEventLoop* loop, const std::string& url);
    ~MQClient();

    MQClient(const MQClient&) = delete;
    MQClient& operator=(const MQClient&) = delete;

    AMQP::TcpConnection* connection() const { return connection_.get(); }
    MQEventLoop* loop() const { return loop_; }
    bool isReady() const { return handler_ && handler_->isReady(); }

private:
    MQEventLoop* loop_{nullptr};
    std::unique_ptr<MQHandler> handler_;
    std::unique_ptr<AMQP::TcpConnection> connection_;
};
