#pragma once

#include <memory>
#include <string>

#include "app/FulfillmentConfig.h"
#include "NonCopyable.h"

// 前置声明：解耦具体实现
class MQEventLoop;
class MQClient;
class MQConsumer;
class MQProducer;
class RedisPool;
class MySQLConnPool;
class FulfillmentStore;
class OrderReadCache;
class OrderLockManager;
class EventSink;
class SequenceAllocator;
class InventoryLedger;
class OrderWriter;
class PaymentAllocator;
class FulfillmentService;
class ReturnReconciler;
class CommandConsumer;
class CommandRouter;

/**
 * @brief FulfillmentApplication：履约服务主协调器
 *
 * 功能职责：
 *  1. 按配置初始化日志、存储后端（MySQL / 内存）与 Redis 连接池
 *  2. 组装领域组件：编号、库存台账、订单写入、收款、履约编排、退货
 *  3. 启动 AMQP 命令消费与事件发布
 *
 * 架构定位：
 *  作为系统的“业务协调层”，衔接存储层（DB/Cache）、消息层（MQ）与领域层。
 */
class FulfillmentApplication : public NonCopyable {
public:
    using Options = FulfillmentServerOptions;

    // ===== 构造与析构 =====
    explicit FulfillmentApplication(MQEventLoop* loop, Options options = Options());
    ~FulfillmentApplication();

    // ===== 生命周期控制 =====
    void start();  // 启动整个服务（幂等）
    void stop();
    bool isStarted() const noexcept { return started_; }

    // ===== 对外扩展接口 =====
    const Options& options() const noexcept { return options_; }
    FulfillmentStore* store() const noexcept { return store_.get(); }
    FulfillmentService* fulfillment() const noexcept { return fulfillment_.get(); }
    PaymentAllocator* payments() const noexcept { return payments_.get(); }
    ReturnReconciler* returns() const noexcept { return returns_.get(); }
    CommandRouter* router() const noexcept { return router_.get(); }

private:
    // ===== 内部初始化阶段 =====
    void configureLogging();  // 日志级别 / 控制台 / 文件
    void initStorage();  // 存储后端与 Redis
    void initMessageQueue();  // MQ 客户端、生产者与消费者
    void initDomain();  // 领域组件装配
    void initCommandRouter();  // 命令路由

private:
    // ===== 核心组件 =====
    MQEventLoop* loop_;  // AMQP 事件循环（非拥有）
    Options options_;

    // ===== 中间件与资源层 =====
    std::shared_ptr<MySQLConnPool> mysqlPool_;
    std::shared_ptr<RedisPool> redisPool_;
    std::unique_ptr<MQClient> mqClient_;
    std::unique_ptr<MQProducer> mqProducer_;
    std::unique_ptr<MQConsumer> mqConsumer_;

    // ===== 适配器 =====
    std::unique_ptr<FulfillmentStore> store_;
    std::unique_ptr<OrderReadCache> cache_;
    std::unique_ptr<OrderLockManager> locks_;
    std::unique_ptr<EventSink> events_;

    // ===== 领域层 =====
    std::unique_ptr<SequenceAllocator> sequences_;
    std::unique_ptr<InventoryLedger> ledger_;
    std::unique_ptr<OrderWriter> writer_;
    std::unique_ptr<PaymentAllocator> payments_;
    std::unique_ptr<FulfillmentService> fulfillment_;
    std::unique_ptr<ReturnReconciler> returns_;

    // ===== 接口层 =====
    std::unique_ptr<CommandConsumer> commandConsumer_;
    std::unique_ptr<CommandRouter> router_;

    bool started_{false};  // 防止重复启动
};
