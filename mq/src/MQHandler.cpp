#include "MQHandler.h"

#include "LogMacros.h"

void MQHandler::monitor(AMQP::TcpConnection* connection, int fd, int flags) {
    // flags==0 表示 AMQP-CPP 不再关心该 fd（连接关闭中或已关闭）
    if (flags == 0) {
        loop_->unwatch(fd);
        return;
    }

    int interest = MQEventLoop::kNone;
    if (flags & AMQP::readable)
        interest |= MQEventLoop::kReadable;
    if (flags & AMQP::writable)
        interest |= MQEventLoop::kWritable;

    loop_->watch(fd, interest, [connection, fd](int ready) {
        int amqpFlags = 0;
        if (ready & MQEventLoop::kReadable)
            amqpFlags |= AMQP::readable;
        if (ready & MQEventLoop::kWritable)
            amqpFlags |= AMQP::writable;
        connection->process(fd, amqpFlags);
    });
}

void MQHandler::onConnected(AMQP::TcpConnection*) {
    LOG_INFO("[MQ] TCP connection established");
}

void MQHandler::onReady(AMQP::TcpConnection*) {
    ready_.store(true, std::memory_order_release);
    LOG_INFO("[MQ] AMQP login succeeded, connection ready");
}

void MQHandler::onError(AMQP::TcpConnection*, const char* message) {
    failed_.store(true, std::memory_order_release);
    ready_.store(false, std::memory_order_release);
    LOG_ERROR("[MQ] Connection error: {}", message);
}

void MQHandler::onClosed(AMQP::TcpConnection*) {
    ready_.store(false, std::memory_order_release);
    LOG_INFO("[MQ] Connection closed");
}
