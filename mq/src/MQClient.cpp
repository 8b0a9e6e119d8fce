#include "MQClient.h"

#include <future>

MQClient::MQClient(MQEventLoop* loop, const std::string& url) : loop_(loop), handler_(std::make_unique<MQHandler>(loop)) {
    AMQP::Address address(url);
    // TcpConnection 构造即发起连接并回调 monitor，必须在循环线程完成
    std::promise<void> created;
    auto done = created.get_future();
    loop_->runInLoop([this, address, &created]() {
        connection_ = std::make_unique<AMQP::TcpConnection>(handler_.get(), address);
        created.set_value();
    });
    done.wait();
}

MQClient::~MQClient() {
    if (!connection_)
        return;
    std::promise<void> closed;
    auto done = closed.get_future();
    loop_->runInLoop([this, &closed]() {
        connection_->close(true);
        connection_.reset();
        closed.set_value();
    });
    done.wait();
}
