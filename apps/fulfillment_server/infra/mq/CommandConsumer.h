#pragma once

#include <atomic>
#include <functional>
#include <string>

class MQConsumer;

/**
 * @brief CommandConsumer：命令队列消费器
 *
 * 提供 Start/Stop 生命周期管理，并将消息原文分发给上层回调；
 * 回调抛出的异常在这里截获并记录，不会回到 AMQP 事件循环。
 */
class CommandConsumer {
public:
    struct Dependencies {
        MQConsumer* mq{nullptr};
    };

    struct Options {
        std::string queueName{"fulfillment.commands"};
    };

    using RawHandler = std::function<void(const std::string& payload)>;

    CommandConsumer(Dependencies deps);
    CommandConsumer(Dependencies deps, Options options);

    void Start(RawHandler handler);
    void Stop();

    bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }
    const Options& options() const noexcept { return options_; }

    // 直接投递一条消息（与队列回调走同一路径）
    void Deliver(const std::string& payload);

private:
    Dependencies deps_;
    Options options_;
    RawHandler handler_;
    std::atomic<bool> running_{false};
};
