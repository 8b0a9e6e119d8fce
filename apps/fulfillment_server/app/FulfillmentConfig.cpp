#include "app/FulfillmentConfig.h"

#include <stdexcept>

#include "app/ConfigLoader.hpp"

bool FulfillmentServerOptions::validate() const {
    if (serviceName.empty()) {
        LOG_ERROR("Config: serviceName must not be empty");
        return false;
    }
    if (!storage.validate()) {
        LOG_ERROR("Config: unknown storage.backend '{}'", storage.backend);
        return false;
    }
    if (storage.useMySQL() && !database.validate()) {
        LOG_ERROR("Config: database section incomplete for mysql backend");
        return false;
    }
    if (redis.enabled() && !redis.validate()) {
        LOG_ERROR("Config: redis section invalid ({}:{})", redis.host, redis.port);
        return false;
    }
    if (mq.enabled() && !mq.validate()) {
        LOG_ERROR("Config: mq section requires url, exchange and commandQueue");
        return false;
    }
    if (cache.ttlSeconds <= 0) {
        LOG_ERROR("Config: cache.ttlSeconds must be positive");
        return false;
    }
    if (!fulfillment.validate()) {
        LOG_ERROR("Config: fulfillment limits must be positive");
        return false;
    }
    return true;
}

FulfillmentServerOptions FulfillmentServerOptions::FromConfig(const std::string& path) {
    ConfigLoader cfg(path);
    FulfillmentServerOptions opt;

    // --------------------------- 基础 ---------------------------
    opt.serviceName = cfg.get("serviceName", opt.serviceName);
    opt.storage.backend = cfg.getPath("storage.backend", opt.storage.backend);

    // --------------------------- Database ---------------------------
    auto& db = opt.database;
    db.connInfo.url = cfg.getPath("database.connInfo.url", db.connInfo.url);
    db.connInfo.user = cfg.getPath("database.connInfo.user", db.connInfo.user);
    db.connInfo.password = cfg.getPath("database.connInfo.password", db.connInfo.password);
    db.connInfo.database = cfg.getPath("database.connInfo.database", db.connInfo.database);
    db.connInfo.timeout_sec = cfg.getPath("database.connInfo.timeout_sec", db.connInfo.timeout_sec);
    db.poolSize = cfg.getPath("database.poolSize", db.poolSize);
    db.keepAliveSec = cfg.getPath("database.keepAliveSec", db.keepAliveSec);
    db.tablePrefix = cfg.getPath("database.tablePrefix", db.tablePrefix);

    // --------------------------- Redis ---------------------------
    auto& redis = opt.redis;
    redis.host = cfg.getPath("redis.host", redis.host);
    redis.port = cfg.getPath("redis.port", redis.port);
    redis.password = cfg.getPath("redis.password", redis.password);
    redis.poolSize = cfg.getPath("redis.poolSize", redis.poolSize);
    redis.timeoutMs = cfg.getPath("redis.timeoutMs", redis.timeoutMs);
    redis.keyPrefix = cfg.getPath("redis.keyPrefix", redis.keyPrefix);
    redis.enableCache = cfg.getPath("redis.enableCache", redis.enableCache);
    redis.enableLock = cfg.getPath("redis.enableLock", redis.enableLock);

    // --------------------------- MQ ---------------------------
    auto& mq = opt.mq;
    mq.url = cfg.getPath("mq.url", mq.url);
    mq.exchange = cfg.getPath("mq.exchange", mq.exchange);
    mq.commandQueue = cfg.getPath("mq.commandQueue", mq.commandQueue);
    mq.replyExchange = cfg.getPath("mq.replyExchange", mq.replyExchange);
    mq.enableConsumer = cfg.getPath("mq.enableConsumer", mq.enableConsumer);
    mq.enablePublisher = cfg.getPath("mq.enablePublisher", mq.enablePublisher);

    // --------------------------- Logging ---------------------------
    auto& log = opt.logging;
    log.level = cfg.getPath("logging.level", log.level);
    log.console = cfg.getPath("logging.console", log.console);
    log.file = cfg.getPath("logging.file", log.file);
    log.async = cfg.getPath("logging.async", log.async);

    // --------------------------- Cache ---------------------------
    opt.cache.ttlSeconds = cfg.getPath("cache.ttlSeconds", opt.cache.ttlSeconds);

    // --------------------------- Fulfillment ---------------------------
    auto& ff = opt.fulfillment;
    ff.lowStockThreshold = cfg.getPath("fulfillment.lowStockThreshold", ff.lowStockThreshold);
    ff.lockTtlSeconds = cfg.getPath("fulfillment.lockTtlSeconds", ff.lockTtlSeconds);
    ff.maxNumberRetries = cfg.getPath("fulfillment.maxNumberRetries", ff.maxNumberRetries);
    ff.maxOrderUpdateAttempts = cfg.getPath("fulfillment.maxOrderUpdateAttempts", ff.maxOrderUpdateAttempts);

    // --------------------------- 校验 ---------------------------
    if (!opt.validate())
        throw std::runtime_error("Invalid configuration detected in " + path);

    return opt;
}
