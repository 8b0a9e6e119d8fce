#pragma once
#include <cppconn/resultset.h>

#include <future>
#include <memory>
#include <string>

class MySQLConn;

// UPDATE/INSERT/DELETE 的执行结果：affectedRows < 0 表示执行失败，errorCode 为 MySQL 错误码
struct SQLUpdateResult {
    int affectedRows{-1};
    int errorCode{0};

    bool ok() const noexcept { return affectedRows >= 0; }
    bool duplicateKey() const noexcept { return errorCode == 1062; }  // ER_DUP_ENTRY
};

// ------------------ SQL 异步任务 ------------------
enum class SQLKind { Query, Exec, Update };

class SQLOperation {
public:
    explicit SQLOperation(std::string sql) : kind_(SQLKind::Query), sql_(std::move(sql)) {}
    SQLOperation(SQLKind kind, std::string sql) : kind_(kind), sql_(std::move(sql)) {}

    // 由 MySQLWorker 在其专属连接上执行；无论成功失败都会兑现对应的 promise
    void Execute(MySQLConn* conn);

    // 未能执行（连接池已关闭或无连接）时以失败值兑现
    void Fail();

    std::future<std::unique_ptr<sql::ResultSet>> GetQueryFuture() { return queryPromise_.get_future(); }
    std::future<bool> GetExecFuture() { return execPromise_.get_future(); }
    std::future<SQLUpdateResult> GetUpdateFuture() { return updatePromise_.get_future(); }

    const std::string& sql() const noexcept { return sql_; }

private:
    SQLKind kind_;
    std::string sql_;
    std::promise<std::unique_ptr<sql::ResultSet>> queryPromise_;
    std::promise<bool> execPromise_;
    std::promise<SQLUpdateResult> updatePromise_;
};
