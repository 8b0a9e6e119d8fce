#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

#include "RedisClient.h"

/**
 * @brief RedisPool：固定大小的 RedisClient 连接池
 *
 * GetClient 返回带自定义删除器的 shared_ptr，析构时自动归还；
 * 池在所有客户端被借出时最多等待 acquireTimeout，超时返回 nullptr（调用方需快速失败）。
 */
class RedisPool : public std::enable_shared_from_this<RedisPool> {
public:
    RedisPool(const std::string& host, int port, size_t pool_size, const std::string& password = "", int timeout_ms = 1000);
    ~RedisPool();

    std::shared_ptr<RedisClient> GetClient();

    size_t available() const;

private:
    void Release(RedisClient* client);

    std::string host_;
    int port_;
    std::string password_;
    struct timeval timeout_;
    std::chrono::milliseconds acquireTimeout_;

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::queue<std::unique_ptr<RedisClient>> clients_;
};
