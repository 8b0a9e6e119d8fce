#pragma once
#include <cppconn/connection.h>
#include <cppconn/driver.h>
#include <cppconn/resultset.h>
#include <cppconn/statement.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "BlockingQueue.h"
#include "MySQLConnInfo.h"
#include "SQLTask.h"

// ------------------ 数据库连接 ------------------
// 单个 Connector/C++ 连接；同一时刻只被一个 MySQLWorker 或心跳线程使用（conn_mtx_ 保护）
class MySQLConn {
public:
    explicit MySQLConn(const MySQLConnInfo& info);
    ~MySQLConn() noexcept;

    bool Open();
    bool Open(int maxRetries, int retryDelaySec);
    void Close() noexcept;

    std::unique_ptr<sql::ResultSet> ExecuteQuery(const std::string& sql);
    bool ExecuteStatement(const std::string& sql);
    SQLUpdateResult ExecuteUpdate(const std::string& sql);

    bool IsOpen() const noexcept { return conn_ != nullptr; }
    bool IsAlive() const noexcept { return alive_.load(std::memory_order_relaxed); }
    bool Ping() noexcept;

private:
    sql::Driver* driver_{nullptr};
    std::unique_ptr<sql::Connection> conn_;
    MySQLConnInfo info_;
    std::atomic<bool> alive_{false};
    std::mutex conn_mtx_;
};

using SQLTaskQueue = BlockingQueue<std::shared_ptr<SQLOperation>>;

// ------------------ 异步执行线程 ------------------
class MySQLWorker {
public:
    MySQLWorker(std::shared_ptr<MySQLConn> conn, std::shared_ptr<SQLTaskQueue> queue);
    ~MySQLWorker();

    void Start();
    void Join();

private:
    void WorkerLoop();

    std::shared_ptr<MySQLConn> conn_;
    std::shared_ptr<SQLTaskQueue> queue_;
    std::thread thread_;
};
