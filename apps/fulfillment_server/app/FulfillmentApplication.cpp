#include "app/FulfillmentApplication.h"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "LogMacros.h"
#include "Logger.h"
#include "MQClient.h"
#include "MQConsumer.h"
#include "MQEventLoop.h"
#include "MQProducer.h"
#include "MySQLConnPool.h"
#include "RedisPool.h"

#include "domain/FulfillmentService.h"
#include "domain/InventoryLedger.h"
#include "domain/OrderWriter.h"
#include "domain/PaymentAllocator.h"
#include "domain/ReturnReconciler.h"
#include "domain/SequenceAllocator.h"
#include "infra/cache/RedisOrderCache.h"
#include "infra/db/MySQLFulfillmentStore.h"
#include "infra/lock/InMemoryOrderLock.h"
#include "infra/lock/RedisOrderLock.h"
#include "infra/memory/InMemoryFulfillmentStore.h"
#include "infra/mq/CommandConsumer.h"
#include "infra/mq/MQEventSink.h"
#include "interface/mq/CommandRouter.h"

FulfillmentApplication::FulfillmentApplication(MQEventLoop* loop, Options options) : loop_(loop), options_(std::move(options)) {}

FulfillmentApplication::~FulfillmentApplication() {
    stop();
}

void FulfillmentApplication::start() {
    if (started_)
        return;

    configureLogging();
    initStorage();
    initMessageQueue();
    initDomain();
    initCommandRouter();

    if (router_)
        router_->Start();

    started_ = true;
    LOG_INFO("{} started (storage={}, cache={}, lock={}, mq={})", options_.serviceName, options_.storage.backend, cache_ ? "redis" : "off", options_.redis.enableLock ? "redis" : "in-process",
             options_.mq.enabled() ? options_.mq.url : "off");
}

void FulfillmentApplication::stop() {
    if (router_)
        router_->Stop();
    if (commandConsumer_ && commandConsumer_->IsRunning())
        commandConsumer_->Stop();
    if (started_)
        LOG_INFO("{} stopped", options_.serviceName);
    started_ = false;
}

void FulfillmentApplication::configureLogging() {
    auto& logger = Logger::instance();
    logger.setLogLevel(ParseLogLevel(options_.logging.level));
    logger.setOutputToConsole(options_.logging.console);
    if (!options_.logging.file.empty()) {
        if (options_.logging.async)
            logger.setOutputToFileAsync(options_.logging.file);
        else
            logger.setOutputToFile(options_.logging.file);
    }
}

void FulfillmentApplication::initStorage() {
    if (options_.storage.useMySQL()) {
        if (!options_.database.validate())
            throw std::runtime_error("Invalid database configuration");

        mysqlPool_ = MySQLConnPool::GetInstance(options_.database.connInfo.database);
        const auto connections = mysqlPool_->InitPool(options_.database.connInfo, options_.database.poolSize, options_.database.keepAliveSec);
        if (connections == 0)
            throw std::runtime_error("Unable to open any MySQL connection to " + options_.database.connInfo.url);

        MySQLFulfillmentStore::Options storeOptions;
        storeOptions.tablePrefix = options_.database.tablePrefix;
        auto mysqlStore = std::make_unique<MySQLFulfillmentStore>(mysqlPool_, storeOptions);
        mysqlStore->EnsureSchema();
        store_ = std::move(mysqlStore);
    } else {
        LOG_WARN("Using in-memory storage; data is lost on restart");
        store_ = std::make_unique<InMemoryFulfillmentStore>();
    }

    // Redis
    if (options_.redis.enabled()) {
        if (!options_.redis.validate())
            throw std::runtime_error("Invalid redis configuration");
        redisPool_ = std::make_shared<RedisPool>(options_.redis.host, options_.redis.port, options_.redis.poolSize, options_.redis.password, options_.redis.timeoutMs);
    }

    if (redisPool_ && options_.redis.enableCache) {
        RedisOrderCache::Options cacheOptions;
        cacheOptions.keyPrefix = options_.redis.keyPrefix + "order:";
        cacheOptions.ttl = std::chrono::seconds(options_.cache.ttlSeconds);
        cache_ = std::make_unique<RedisOrderCache>(redisPool_, cacheOptions);
    }

    if (redisPool_ && options_.redis.enableLock) {
        RedisOrderLock::Options lockOptions;
        lockOptions.keyPrefix = options_.redis.keyPrefix + "lock:order:";
        locks_ = std::make_unique<RedisOrderLock>(redisPool_, lockOptions);
    } else {
        locks_ = std::make_unique<InMemoryOrderLock>();
    }
}

void FulfillmentApplication::initMessageQueue() {
    if (!options_.mq.enabled())
        return;
    if (!options_.mq.validate()) {
        LOG_WARN("MQ configuration invalid, skipping MQ initialization");
        return;
    }
    if (!loop_)
        throw std::runtime_error("FulfillmentApplication requires an MQEventLoop when MQ is enabled");

    loop_->startThread();
    mqClient_ = std::make_unique<MQClient>(loop_, options_.mq.url);
    if (options_.mq.enablePublisher || options_.mq.enableConsumer)
        mqProducer_ = std::make_unique<MQProducer>(mqClient_.get());
    if (options_.mq.enableConsumer)
        mqConsumer_ = std::make_unique<MQConsumer>(mqClient_.get());

    if (mqProducer_ && options_.mq.enablePublisher) {
        MQEventSink::Options sinkOptions;
        sinkOptions.exchange = options_.mq.exchange;
        sinkOptions.source = options_.serviceName;
        auto sink = std::make_unique<MQEventSink>(MQEventSink::Dependencies{mqProducer_.get()}, sinkOptions);
        sink->Initialize();
        events_ = std::move(sink);
    }
}

void FulfillmentApplication::initDomain() {
    if (!store_)
        throw std::runtime_error("Fulfillment store not initialized");

    const auto& ff = options_.fulfillment;
    const std::chrono::milliseconds lockTtl = std::chrono::seconds(ff.lockTtlSeconds);

    sequences_ = std::make_unique<SequenceAllocator>(store_.get(), SequenceAllocator::Options{ff.maxNumberRetries});

    InventoryLedger::Options ledgerOptions;
    ledgerOptions.lowStockThreshold = ff.lowStockThreshold;
    ledger_ = std::make_unique<InventoryLedger>(InventoryLedger::Dependencies{store_.get(), events_.get()}, ledgerOptions);

    writer_ = std::make_unique<OrderWriter>(OrderWriter::Dependencies{store_.get(), cache_.get()}, OrderWriter::Options{ff.maxOrderUpdateAttempts});

    PaymentAllocator::Dependencies paymentDeps;
    paymentDeps.store = store_.get();
    paymentDeps.writer = writer_.get();
    paymentDeps.sequences = sequences_.get();
    paymentDeps.events = events_.get();
    payments_ = std::make_unique<PaymentAllocator>(paymentDeps);

    FulfillmentService::Dependencies serviceDeps;
    serviceDeps.store = store_.get();
    serviceDeps.ledger = ledger_.get();
    serviceDeps.writer = writer_.get();
    serviceDeps.sequences = sequences_.get();
    serviceDeps.payments = payments_.get();
    serviceDeps.locks = locks_.get();
    serviceDeps.cache = cache_.get();
    serviceDeps.events = events_.get();

    FulfillmentService::Options serviceOptions;
    serviceOptions.lockTtl = lockTtl;
    serviceOptions.useCache = static_cast<bool>(cache_);
    fulfillment_ = std::make_unique<FulfillmentService>(serviceDeps, serviceOptions);

    ReturnReconciler::Dependencies returnDeps;
    returnDeps.store = store_.get();
    returnDeps.ledger = ledger_.get();
    returnDeps.writer = writer_.get();
    returnDeps.sequences = sequences_.get();
    returnDeps.locks = locks_.get();
    returnDeps.events = events_.get();

    ReturnReconciler::Options returnOptions;
    returnOptions.lockTtl = lockTtl;
    returns_ = std::make_unique<ReturnReconciler>(returnDeps, returnOptions);
}

void FulfillmentApplication::initCommandRouter() {
    if (!mqConsumer_) {
        LOG_INFO("Command consumer disabled; no commands will be read from MQ");
        return;
    }

    CommandConsumer::Options consumerOptions;
    consumerOptions.queueName = options_.mq.commandQueue;
    commandConsumer_ = std::make_unique<CommandConsumer>(CommandConsumer::Dependencies{mqConsumer_.get()}, consumerOptions);

    CommandRouter::Dependencies deps;
    deps.consumer = commandConsumer_.get();
    deps.fulfillment = fulfillment_.get();
    deps.payments = payments_.get();
    deps.returns = returns_.get();
    deps.store = store_.get();
    if (mqProducer_) {
        MQProducer* producer = mqProducer_.get();
        const std::string exchange = options_.mq.replyExchange;
        deps.publishReply = [producer, exchange](const std::string& routingKey, const std::string& body) { producer->publish(exchange, routingKey, body); };
    }

    router_ = std::make_unique<CommandRouter>(deps);
    router_->Initialize();
}
