#include "MQProducer.h"

#include <future>

#include "LogMacros.h"

MQProducer::MQProducer(MQClient* client) : client_(client) {
    std::promise<void> created;
    auto done = created.get_future();
    client_->loop()->runInLoop([this, &created]() {
        channel_ = std::make_unique<AMQP::TcpChannel>(client_->connection());
        channel_->onError([](const char* msg) { LOG_ERROR("[MQProducer] Channel error: {}", msg); });
        created.set_value();
    });
    done.wait();
}

MQProducer::~MQProducer() {
    std::promise<void> closed;
    auto done = closed.get_future();
    client_->loop()->runInLoop([this, &closed]() {
        channel_.reset();
        closed.set_value();
    });
    done.wait();
}

void MQProducer::declareExchange(const std::string& exchange) {
    if (exchange.empty())
        return;
    client_->loop()->runInLoop([this, exchange]() {
        channel_->declareExchange(exchange, AMQP::topic, AMQP::durable).onSuccess([exchange]() { LOG_INFO("[MQProducer] Declared exchange: {}", exchange); });
    });
}

void MQProducer::publish(const std::string& exchange, const std::string& routingKey, const std::string& message) {
    client_->loop()->runInLoop([this, exchange, routingKey, message]() {
        // 若 exchange 为空，则按直连到队列的语义（默认交换机）
        if (!channel_->publish(exchange, routingKey, message))
            LOG_WARN("[MQProducer] Publish rejected by channel: [{}] key=[{}]", exchange, routingKey);
        else
            LOG_DEBUG("[MQProducer] Published to [{}] key=[{}] size={}", exchange, routingKey, message.size());
    });
}
