#include "MySQLConn.h"

#include <cppconn/exception.h>
#include <cppconn/statement.h>

#include <chrono>

#include "LogMacros.h"

// ------------------ MySQLConn ------------------
MySQLConn::MySQLConn(const MySQLConnInfo& info) : info_(info) {
    driver_ = get_driver_instance();
}

MySQLConn::~MySQLConn() noexcept {
    Close();
}

bool MySQLConn::Open(int maxRetries, int retryDelaySec) {
    for (int attempt = 1; attempt <= maxRetries; ++attempt) {
        try {
            std::lock_guard<std::mutex> lock(conn_mtx_);
            conn_.reset(driver_->connect(info_.url, info_.user, info_.password));
            if (conn_) {
                conn_->setSchema(info_.database);
                alive_.store(true, std::memory_order_relaxed);
                LOG_INFO("[MySQLConn] Connected to {} (schema {})", info_.url, info_.database);
                return true;
            }
            LOG_ERROR("[MySQLConn] driver returned null connection (attempt {}/{})", attempt, maxRetries);
        } catch (const sql::SQLException& e) {
            LOG_ERROR("[MySQLConn] Connection failed ({}/{}): {} (Code: {}, SQLState: {})", attempt, maxRetries, e.what(), e.getErrorCode(), e.getSQLStateCStr());
        }
        alive_.store(false, std::memory_order_relaxed);
        if (attempt < maxRetries)
            std::this_thread::sleep_for(std::chrono::seconds(retryDelaySec));
    }
    LOG_ERROR("[MySQLConn] Giving up on {} after {} attempts", info_.url, maxRetries);
    return false;
}

bool MySQLConn::Open() {
    return Open(3, 2);
}

void MySQLConn::Close() noexcept {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    if (conn_) {
        try {
            conn_->close();
        } catch (const sql::SQLException& e) {
            LOG_WARN("[MySQLConn] close() failed: {}", e.what());
        }
        conn_.reset();
    }
    alive_.store(false, std::memory_order_relaxed);
}

// ------------------ SQL 操作 ------------------
std::unique_ptr<sql::ResultSet> MySQLConn::ExecuteQuery(const std::string& sql) {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    if (!conn_)
        return nullptr;
    try {
        std::unique_ptr<sql::Statement> stmt(conn_->createStatement());
        return std::unique_ptr<sql::ResultSet>(stmt->executeQuery(sql));
    } catch (const sql::SQLException& e) {
        LOG_ERROR("[MySQLConn] Query failed: {} (Code: {}, SQLState: {})", e.what(), e.getErrorCode(), e.getSQLStateCStr());
        if (e.getErrorCode() == 2006 || e.getErrorCode() == 2013)  // server gone away / lost connection
            alive_.store(false, std::memory_order_relaxed);
        return nullptr;
    }
}

bool MySQLConn::ExecuteStatement(const std::string& sql) {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    if (!conn_)
        return false;
    try {
        std::unique_ptr<sql::Statement> stmt(conn_->createStatement());
        stmt->execute(sql);
        return true;
    } catch (const sql::SQLException& e) {
        LOG_ERROR("[MySQLConn] Execute failed: {} (Code: {}, SQLState: {})", e.what(), e.getErrorCode(), e.getSQLStateCStr());
        return false;
    }
}

SQLUpdateResult MySQLConn::ExecuteUpdate(const std::string& sql) {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    SQLUpdateResult result;
    if (!conn_)
        return result;
    try {
        std::unique_ptr<sql::Statement> stmt(conn_->createStatement());
        result.affectedRows = stmt->executeUpdate(sql);
    } catch (const sql::SQLException& e) {
        result.errorCode = e.getErrorCode();
        // 唯一键冲突是编号分配的正常分支，降级为 DEBUG
        if (result.duplicateKey())
            LOG_DEBUG("[MySQLConn] Duplicate key: {}", e.what());
        else
            LOG_ERROR("[MySQLConn] Update failed: {} (Code: {}, SQLState: {})", e.what(), e.getErrorCode(), e.getSQLStateCStr());
    }
    return result;
}

bool MySQLConn::Ping() noexcept {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    if (!conn_)
        return false;
    try {
        bool ok = conn_->isValid();
        alive_.store(ok, std::memory_order_relaxed);
        return ok;
    } catch (const sql::SQLException&) {
        alive_.store(false, std::memory_order_relaxed);
        return false;
    }
}

// ------------------ MySQLWorker ------------------
MySQLWorker::MySQLWorker(std::shared_ptr<MySQLConn> conn, std::shared_ptr<SQLTaskQueue> queue) : conn_(std::move(conn)), queue_(std::move(queue)) {}

MySQLWorker::~MySQLWorker() {
    Join();
}

void MySQLWorker::Start() {
    thread_ = std::thread(&MySQLWorker::WorkerLoop, this);
}

void MySQLWorker::Join() {
    if (thread_.joinable())
        thread_.join();
}

void MySQLWorker::WorkerLoop() {
    std::shared_ptr<SQLOperation> task;
    // 队列关闭后 Pop 返回 false，worker 自然退出
    while (queue_->Pop(task)) {
        if (!task)
            continue;

        if (!conn_->IsAlive()) {
            LOG_WARN("[MySQLWorker] Connection invalid, attempting reconnect");
            conn_->Close();
            conn_->Open();
        }

        task->Execute(conn_.get());
        task.reset();
    }
}
