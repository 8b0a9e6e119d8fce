#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "infra/store/FulfillmentStore.h"

/**
 * @brief SequenceAllocator：按月分段的单据编号分配器
 *
 * 编号格式 <PREFIX><YY><MM><4 位序号>，例如 DEL26100007。
 * 分配流程：读取本月最大编号 → +1 → 交给调用方持久化；唯一键冲突则递增重试，
 * 重试耗尽后改用 <prefix><seq>_<毫秒后缀>，保证不会因为编号冲突拒绝创建单据。
 */
class SequenceAllocator {
public:
    struct Options {
        int maxAttempts{5};
    };

    // 用候选编号持久化单据；kDuplicateKey 触发重试，其余非 kOk 状态原样返回给调用方
    using PersistFn = std::function<StoreStatus(const std::string& number)>;

    struct Allocation {
        std::string number;
        StoreStatus status{StoreStatus::kUnavailable};
        int attempts{0};
        bool fallback{false};
    };

    explicit SequenceAllocator(FulfillmentStore* store);
    SequenceAllocator(FulfillmentStore* store, Options options);

    static std::string_view KindPrefix(DocumentKind kind);
    // 本地时区的 <PREFIX><YY><MM>
    static std::string MonthPrefix(DocumentKind kind, TimePoint date);
    // 从 "<monthPrefix>0007" 或 "<monthPrefix>0007_123456" 中取出 7；格式不符返回 0
    static int ParseSequence(const std::string& number, const std::string& monthPrefix);

    // 下一个候选编号（不占用）
    std::string Next(DocumentKind kind, TimePoint date) const;

    Allocation AllocateAndPersist(DocumentKind kind, TimePoint date, const PersistFn& persist) const;

private:
    int highestSequence(DocumentKind kind, const std::string& monthPrefix) const;

    FulfillmentStore* store_{nullptr};
    Options options_;
};

// 文档主键：<prefix>-<微秒时间戳十六进制>-<进程内自增>
std::string GenerateDocumentId(std::string_view prefix);
