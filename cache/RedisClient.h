#pragma once

#include <hiredis/hiredis.h>

#include <optional>
#include <string>
#include <vector>

// -----------------------------------------------------------------------------
// RedisClient
// -----------------------------------------------------------------------------
// 单连接 Redis 客户端封装：同步命令，失败返回 false / nullopt 并记录日志。
// 线程不安全，需配合连接池（RedisPool）使用。
// -----------------------------------------------------------------------------
class RedisClient {
public:
    RedisClient(const std::string& host, int port, const std::string& password = "", const struct timeval& timeout = {1, 500000});
    ~RedisClient() noexcept;

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    bool Connect();
    void Close() noexcept;
    bool IsConnected() const noexcept;

    bool Get(const std::string& key, std::string& value);
    bool Set(const std::string& key, const std::string& value);
    // SET key value EX ttlSeconds
    bool SetEx(const std::string& key, const std::string& value, int ttlSeconds);
    // SET key value NX PX ttlMs：key 已存在时返回 false
    bool SetIfAbsent(const std::string& key, const std::string& value, long long ttlMs);
    bool Del(const std::string& key);

    // EVAL script 1 key args...；返回整型结果，出错返回 nullopt
    std::optional<long long> EvalInteger(const std::string& script, const std::string& key, const std::vector<std::string>& args);

private:
    bool EnsureConnected();
    redisReply* Command(const std::vector<std::string>& argv);

    std::string host_;
    int port_;
    std::string password_;
    struct timeval timeout_;
    redisContext* context_;
};
