#pragma once
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "MySQLConn.h"
#include "SQLTask.h"

/**
 * @brief MySQLConnPool：按库名单例的异步连接池
 *
 * 每个连接绑定一个 MySQLWorker 线程，所有 SQL 以 SQLOperation 形式投递到共享队列，
 * 调用方通过 future 取回结果。心跳线程定期 SELECT 1 并重连失效连接。
 */
class MySQLConnPool {
public:
    explicit MySQLConnPool(std::string database);
    ~MySQLConnPool();

    MySQLConnPool(const MySQLConnPool&) = delete;
    MySQLConnPool& operator=(const MySQLConnPool&) = delete;

    static std::shared_ptr<MySQLConnPool> GetInstance(const std::string& database);

    // 返回实际建立的连接数；为 0 时池不可用
    std::size_t InitPool(const MySQLConnInfo& info, int poolSize = 4, int keepAliveSec = 30);

    std::future<std::unique_ptr<sql::ResultSet>> SubmitQuery(const std::string& sql);
    std::future<bool> SubmitExec(const std::string& sql);
    std::future<SQLUpdateResult> SubmitUpdate(const std::string& sql);

    bool IsReady() const noexcept { return ready_.load(std::memory_order_acquire); }
    const std::string& database() const noexcept { return database_; }

    void Shutdown();

private:
    void KeepAliveLoop();

    std::string database_;
    std::vector<std::shared_ptr<MySQLConn>> conns_;
    std::vector<std::unique_ptr<MySQLWorker>> workers_;
    std::shared_ptr<SQLTaskQueue> queue_;
    std::atomic<bool> ready_{false};
    int keepAliveSec_{30};

    std::thread keepAliveThread_;
    std::mutex keepAliveMutex_;
    std::condition_variable keepAliveCv_;
    bool stopping_{false};

    std::mutex poolMutex_;

    static std::unordered_map<std::string, std::weak_ptr<MySQLConnPool>> instances_;
    static std::mutex instanceMutex_;
};
