#pragma once

#include <functional>
#include <optional>
#include <string>

#include "domain/FulfillmentError.h"
#include "infra/store/FulfillmentStore.h"

class OrderReadCache;

/**
 * @brief OrderWriter：订单的读-改-写（乐观并发）
 *
 * 读取当前版本 → 调用 mutator 修改 → OrderStateMachine::Apply → ReplaceOrder(expectedVersion)。
 * 版本冲突时重新读取并重放 mutator，最多 maxAttempts 次，仍冲突返回 kConflict。
 * 保存成功后失效读缓存，并把订单层面的变化（open / completed 计数、totalDue、totalSpent）同步到客户计数器。
 */
class OrderWriter {
public:
    struct Dependencies {
        FulfillmentStore* store{nullptr};
        OrderReadCache* cache{nullptr};
    };

    struct Options {
        int maxAttempts{5};
    };

    // 返回 false 表示放弃本次修改，error 由 mutator 填写；mutator 可能被调用多次
    using Mutator = std::function<bool(OrderRecord& order, FulfillmentError* error)>;

    struct Outcome {
        OrderRecord before;
        OrderRecord after;
    };

    OrderWriter(Dependencies deps);
    OrderWriter(Dependencies deps, Options options);

    std::optional<Outcome> Update(const std::string& orderId, const Mutator& mutate, FulfillmentError* error = nullptr);

    // 新订单 / 删除订单对客户计数器的贡献
    static ClientDelta ContributionOf(const OrderRecord& order);
    // after 相对 before 的客户计数器增量
    static ClientDelta TransitionDelta(const OrderRecord& before, const OrderRecord& after);

    void Invalidate(const std::string& orderId) const;
    void ApplyClientDelta(const OrderRecord& order, const ClientDelta& delta) const;

private:
    Dependencies deps_;
    Options options_;
};
