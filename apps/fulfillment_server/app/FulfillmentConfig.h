#pragma once

#include <cstddef>
#include <string>

#include "MySQLConnInfo.h"

// --------------------------- Storage ---------------------------
struct StorageOptions {
    std::string backend{"memory"};  // mysql | memory

    bool useMySQL() const { return backend == "mysql"; }
    bool validate() const { return backend == "mysql" || backend == "memory"; }
};

// --------------------------- Database ---------------------------
struct DatabaseOptions {
    MySQLConnInfo connInfo;
    int poolSize{4};
    int keepAliveSec{30};
    std::string tablePrefix{"ff_"};

    bool validate() const { return connInfo.validate() && poolSize > 0 && keepAliveSec > 0; }
};

// --------------------------- Redis ---------------------------
struct RedisOptions {
    std::string host{"127.0.0.1"};
    int port{6379};
    std::string password;
    std::size_t poolSize{4};
    int timeoutMs{1000};
    std::string keyPrefix{"fulfillment:"};
    bool enableCache{false};
    bool enableLock{false};

    bool enabled() const { return enableCache || enableLock; }
    bool validate() const { return !host.empty() && port > 0 && port < 65536 && poolSize > 0; }
};

// --------------------------- MQ ---------------------------
struct MQOptions {
    std::string url;
    std::string exchange{"fulfillment.events"};
    std::string commandQueue{"fulfillment.commands"};
    std::string replyExchange;  // 空：回复直接投递到 replyTo 队列
    bool enableConsumer{false};
    bool enablePublisher{false};

    bool enabled() const { return enableConsumer || enablePublisher; }
    bool validate() const { return !url.empty() && !exchange.empty() && !commandQueue.empty(); }
};

// --------------------------- Logging ---------------------------
struct LoggingOptions {
    std::string level{"INFO"};
    bool console{true};
    std::string file;  // 空表示不写文件
    bool async{true};
};

// --------------------------- Cache ---------------------------
struct CacheOptions {
    int ttlSeconds{600};
};

// --------------------------- Fulfillment ---------------------------
struct FulfillmentOptions {
    int lowStockThreshold{10};
    int lockTtlSeconds{30};
    int maxNumberRetries{5};
    int maxOrderUpdateAttempts{5};

    bool validate() const { return lowStockThreshold >= 0 && lockTtlSeconds > 0 && maxNumberRetries > 0 && maxOrderUpdateAttempts > 0; }
};

// --------------------------- FulfillmentServer ---------------------------
struct FulfillmentServerOptions {
    std::string serviceName{"FulfillmentServer"};

    StorageOptions storage;
    DatabaseOptions database;
    RedisOptions redis;
    MQOptions mq;
    LoggingOptions logging;
    CacheOptions cache;
    FulfillmentOptions fulfillment;

    bool validate() const;

    static FulfillmentServerOptions FromConfig(const std::string& path);
};
