#pragma once
#include <openssl/ssl.h>  // 必须：tcphandler.h 的 onSecured 等签名依赖 SSL 类型
#include <amqpcpp.h>
#include <amqpcpp/linux_tcp/tcpparent.h>  // 先于 tcpconnection
#include <amqpcpp/linux_tcp/tcphandler.h>
#include <amqpcpp/linux_tcp/tcpconnection.h>
#include <amqpcpp/linux_tcp/tcpchannel.h>

#include <atomic>
#include <string>

#include "MQEventLoop.h"

// 将 AMQP-CPP 的 TcpHandler 事件对接到 MQEventLoop
class MQHandler : public AMQP::TcpHandler {
public:
    explicit MQHandler(MQEventLoop* loop) : loop_(loop) {}

    void monitor(AMQP::TcpConnection* connection, int fd, int flags) override;

    void onConnected(AMQP::TcpConnection* connection) override;
    void onReady(AMQP::TcpConnection* connection) override;
    void onError(AMQP::TcpConnection* connection, const char* message) override;
    void onClosed(AMQP::TcpConnection* connection) override;

    bool isReady() const noexcept { return ready_.load(std::memory_order_acquire); }
    bool hasFailed() const noexcept { return failed_.load(std::memory_order_acquire); }

private:
    MQEventLoop* loop_{nullptr};
    std::atomic<bool> ready_{false};
    std::atomic<bool> failed_{false};
};
