#include "SQLTask.h"

#include <exception>

#include "LogMacros.h"
#include "MySQLConn.h"

void SQLOperation::Execute(MySQLConn* conn) {
    if (!conn) {
        Fail();
        return;
    }
    try {
        switch (kind_) {
        case SQLKind::Query:
            queryPromise_.set_value(conn->ExecuteQuery(sql_));
            break;
        case SQLKind::Exec:
            execPromise_.set_value(conn->ExecuteStatement(sql_));
            break;
        case SQLKind::Update:
            updatePromise_.set_value(conn->ExecuteUpdate(sql_));
            break;
        }
    } catch (const std::exception& e) {
        // 连接层之外的异常（如驱动内部错误）同样以失败值兑现，避免调用方永久阻塞在 future 上
        LOG_ERROR("[SQLOperation] Unexpected exception: {}", e.what());
        Fail();
    }
}

void SQLOperation::Fail() {
    if (kind_ == SQLKind::Query)
        queryPromise_.set_value(nullptr);
    else if (kind_ == SQLKind::Exec)
        execPromise_.set_value(false);
    else
        updatePromise_.set_value(SQLUpdateResult{});
}
