#include "infra/mq/CommandConsumer.h"

#include <exception>
#include <utility>

#include "LogMacros.h"
#include "MQConsumer.h"

// ========== 构造函数 ==========

CommandConsumer::CommandConsumer(Dependencies deps) : CommandConsumer(std::move(deps), Options{}) {}

CommandConsumer::CommandConsumer(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

// ========== 生命周期管理 ==========

void CommandConsumer::Start(RawHandler handler) {
    if (IsRunning())
        return;
    handler_ = std::move(handler);
    running_.store(true, std::memory_order_release);

    if (!deps_.mq) {
        LOG_WARN("[CommandConsumer] No MQ consumer attached, commands accepted only via Deliver()");
        return;
    }
    deps_.mq->consume(options_.queueName, [this](const std::string& payload) { Deliver(payload); });
    LOG_INFO("[CommandConsumer] Started consuming queue: {}", options_.queueName);
}

void CommandConsumer::Stop() {
    if (!IsRunning())
        return;
    running_.store(false, std::memory_order_release);
    LOG_INFO("[CommandConsumer] Stopped consuming queue: {}", options_.queueName);
}

// ========== 消息分发 ==========

void CommandConsumer::Deliver(const std::string& payload) {
    if (!IsRunning() || !handler_) {
        LOG_WARN("[CommandConsumer] Dropping message ({} bytes): consumer stopped", payload.size());
        return;
    }
    try {
        handler_(payload);
    } catch (const std::exception& e) {
        LOG_ERROR("[CommandConsumer] Handler exception: {}", e.what());
    }
}
