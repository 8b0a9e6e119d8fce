#include "infra/mq/MQEventSink.h"

#include <utility>

#include "LogMacros.h"
#include "MQProducer.h"
#include "infra/codec/RecordJson.h"

using json = nlohmann::json;

MQEventSink::MQEventSink(Dependencies deps) : MQEventSink(std::move(deps), Options{}) {}

MQEventSink::MQEventSink(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

void MQEventSink::Initialize() {
    if (deps_.producer)
        deps_.producer->declareExchange(options_.exchange);
}

void MQEventSink::Publish(const std::string& event, const json& payload) {
    if (!deps_.producer)
        return;

    std::string body;
    try {
        body = json{{"event", event}, {"source", options_.source}, {"publishedAt", ToEpochMillis(Clock::now())}, {"payload", payload}}.dump();
    } catch (const json::exception& ex) {
        LOG_ERROR("[MQEventSink] Event {} not serializable: {}", event, ex.what());
        return;
    }
    deps_.producer->publish(options_.exchange, event, body);
    LOG_DEBUG("[MQEventSink] {} -> {} ({} bytes)", event, options_.exchange, body.size());
}
