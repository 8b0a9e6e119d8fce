#include "MySQLConnPool.h"

#include <algorithm>
#include <chrono>

#include "LogMacros.h"

// ------------------ 静态成员定义 ------------------
std::unordered_map<std::string, std::weak_ptr<MySQLConnPool>> MySQLConnPool::instances_;
std::mutex MySQLConnPool::instanceMutex_;

MySQLConnPool::MySQLConnPool(std::string database) : database_(std::move(database)), queue_(std::make_shared<SQLTaskQueue>()) {}

MySQLConnPool::~MySQLConnPool() {
    Shutdown();
}

std::shared_ptr<MySQLConnPool> MySQLConnPool::GetInstance(const std::string& database) {
    std::lock_guard<std::mutex> lock(instanceMutex_);
    auto it = instances_.find(database);
    if (it != instances_.end()) {
        if (auto existing = it->second.lock())
            return existing;
    }
    auto pool = std::make_shared<MySQLConnPool>(database);
    instances_[database] = pool;
    return pool;
}

// ------------------ 初始化 ------------------
std::size_t MySQLConnPool::InitPool(const MySQLConnInfo& info, int poolSize, int keepAliveSec) {
    std::lock_guard<std::mutex> lock(poolMutex_);
    if (ready_.load(std::memory_order_acquire))
        return conns_.size();

    keepAliveSec_ = std::max(5, keepAliveSec);
    for (int i = 0; i < poolSize; ++i) {
        auto conn = std::make_shared<MySQLConn>(info);
        if (conn->Open(3, std::max(1, info.timeout_sec / 2)))
            conns_.push_back(std::move(conn));
    }
    for (auto& conn : conns_) {
        auto worker = std::make_unique<MySQLWorker>(conn, queue_);
        worker->Start();
        workers_.push_back(std::move(worker));
    }

    if (conns_.empty()) {
        LOG_ERROR("[MySQLConnPool] No connection could be opened for {}", database_);
        return 0;
    }

    keepAliveThread_ = std::thread(&MySQLConnPool::KeepAliveLoop, this);
    ready_.store(true, std::memory_order_release);
    LOG_INFO("[MySQLConnPool] {} ready with {} connections", database_, conns_.size());
    return conns_.size();
}

// ------------------ 提交异步任务 ------------------
std::future<std::unique_ptr<sql::ResultSet>> MySQLConnPool::SubmitQuery(const std::string& sql) {
    auto op = std::make_shared<SQLOperation>(SQLKind::Query, sql);
    auto fut = op->GetQueryFuture();
    if (!IsReady() || !queue_->Push(op))
        op->Fail();
    return fut;
}

std::future<bool> MySQLConnPool::SubmitExec(const std::string& sql) {
    auto op = std::make_shared<SQLOperation>(SQLKind::Exec, sql);
    auto fut = op->GetExecFuture();
    if (!IsReady() || !queue_->Push(op))
        op->Fail();
    return fut;
}

std::future<SQLUpdateResult> MySQLConnPool::SubmitUpdate(const std::string& sql) {
    auto op = std::make_shared<SQLOperation>(SQLKind::Update, sql);
    auto fut = op->GetUpdateFuture();
    if (!IsReady() || !queue_->Push(op))
        op->Fail();
    return fut;
}

// ------------------ 停止 ------------------
void MySQLConnPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(keepAliveMutex_);
        if (stopping_)
            return;
        stopping_ = true;
    }
    keepAliveCv_.notify_all();
    if (keepAliveThread_.joinable())
        keepAliveThread_.join();

    std::lock_guard<std::mutex> lock(poolMutex_);
    queue_->Close();
    for (auto& w : workers_)
        w->Join();
    workers_.clear();
    conns_.clear();
    ready_.store(false, std::memory_order_release);
    LOG_INFO("[MySQLConnPool] Shutdown completed for {}", database_);
}

void MySQLConnPool::KeepAliveLoop() {
    const auto interval = std::chrono::seconds(keepAliveSec_);
    std::unique_lock<std::mutex> lk(keepAliveMutex_);
    while (!keepAliveCv_.wait_for(lk, interval, [this]() { return stopping_; })) {
        lk.unlock();
        {
            std::lock_guard<std::mutex> lock(poolMutex_);
            for (auto& conn : conns_) {
                if (!conn->Ping()) {
                    LOG_WARN("[MySQLConnPool] Keep-alive failed, reconnecting to {}", database_);
                    conn->Close();
                    conn->Open(1, 1);
                }
            }
        }
        lk.lock();
    }
}
