#include "MQConsumer.h"

#include <future>

#include "LogMacros.h"

MQConsumer::MQConsumer(MQClient* client) : client_(client) {
    std::promise<void> created;
    auto done = created.get_future();
    client_->loop()->runInLoop([this, &created]() {
        channel_ = std::make_unique<AMQP::TcpChannel>(client_->connection());
        channel_->onError([](const char* msg) { LOG_ERROR("[MQConsumer] Channel error: {}", msg); });
        created.set_value();
    });
    done.wait();
}

MQConsumer::~MQConsumer() {
    std::promise<void> closed;
    auto done = closed.get_future();
    client_->loop()->runInLoop([this, &closed]() {
        channel_.reset();
        closed.set_value();
    });
    done.wait();
}

void MQConsumer::consume(const std::string& queue, MessageCallback cb) {
    client_->loop()->runInLoop([this, queue, cb = std::move(cb)]() {
        channel_->declareQueue(queue, AMQP::durable).onSuccess([queue](const std::string&, uint32_t messages, uint32_t) {
            LOG_INFO("[MQConsumer] Declared queue: {} ({} pending)", queue, messages);
        });

        // 一次只处理一条，处理完再 ack，保证命令按到达顺序串行执行
        channel_->setQos(1);
        auto* channel = channel_.get();
        channel_->consume(queue)
            .onReceived([channel, cb](const AMQP::Message& msg, uint64_t deliveryTag, bool) {
                cb(std::string(msg.body(), msg.bodySize()));
                channel->ack(deliveryTag);
            })
            .onError([queue](const char* msg) { LOG_ERROR("[MQConsumer] consume({}) failed: {}", queue, msg); });
    });
}
