#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

enum class ErrorCode : std::uint8_t {
    kNone = 0,
    kValidation,  // 输入形状 / 取值非法，未做任何写入
    kInsufficientStock,  // 库存不足，本批次已回滚
    kInsufficientBalance,  // 金额超过可收 / 可退 / 可用余额
    kNotFound,  // 订单 / 客户 / 商品等不存在
    kLockContention,  // 订单咨询锁被占用，可重试
    kConflict,  // 乐观锁重试耗尽，可重试
    kStorage,  // 存储不可用或写入失败
};

std::string ToString(ErrorCode code);

// 库存不足的明细：哪个商品、现有多少、请求多少
struct StockShortage {
    std::string productId;
    std::string productName;
    std::int64_t available{0};
    std::int64_t requested{0};
};

/**
 * @brief FulfillmentError：核心操作的结构化错误
 *
 * 操作签名统一为 std::optional<Result> Op(..., FulfillmentError* error = nullptr)，
 * 返回 nullopt 时 error 被填充。编号冲突在内部消化，不会出现在这里。
 */
struct FulfillmentError {
    ErrorCode code{ErrorCode::kNone};
    std::string message;
    std::optional<StockShortage> shortage;

    bool retryable() const noexcept { return code == ErrorCode::kLockContention || code == ErrorCode::kConflict; }
    explicit operator bool() const noexcept { return code != ErrorCode::kNone; }

    static FulfillmentError Validation(std::string message);
    static FulfillmentError NotFound(const std::string& what, const std::string& id);
    static FulfillmentError InsufficientStock(StockShortage shortage);
    static FulfillmentError InsufficientBalance(std::string message);
    static FulfillmentError LockContention(const std::string& orderId);
    static FulfillmentError Conflict(std::string message);
    static FulfillmentError Storage(std::string message);
};

// 写入可选的输出参数
inline void SetError(FulfillmentError* out, FulfillmentError error) {
    if (out)
        *out = std::move(error);
}
