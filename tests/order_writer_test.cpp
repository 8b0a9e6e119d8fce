#include <atomic>

#include "test_support.h"

namespace {

// 前 conflicts 次 ReplaceOrder 返回版本冲突
class ConflictingStore : public InMemoryFulfillmentStore {
public:
    StoreStatus ReplaceOrder(const OrderRecord& order, std::uint64_t expectedVersion) override {
        ++replaceCalls;
        if (conflicts > 0) {
            --conflicts;
            return StoreStatus::kConflict;
        }
        return InMemoryFulfillmentStore::ReplaceOrder(order, expectedVersion);
    }

    std::atomic<int> conflicts{0};
    std::atomic<int> replaceCalls{0};
};

}  // namespace

class OrderWriterTest : public FulfillmentTest {
protected:
    std::unique_ptr<InMemoryFulfillmentStore> MakeStore() override {
        auto store = std::make_unique<ConflictingStore>();
        flaky_ = store.get();
        return store;
    }

    void SetUp() override {
        FulfillmentTest::SetUp();
        AddProduct("A", "Alpha", 100.0, 50);
    }

    ConflictingStore* flaky_{nullptr};
};

TEST_F(OrderWriterTest, RetriesMutatorAfterVersionConflict) {
    // Given
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 2)});
    flaky_->conflicts = 2;
    int mutatorCalls = 0;

    // When
    auto outcome = writer_->Update(order.orderId, [&](OrderRecord& current, FulfillmentError*) {
        ++mutatorCalls;
        current.notes = "rush";
        return true;
    });

    // Then
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(mutatorCalls, 3);
    EXPECT_EQ(flaky_->replaceCalls.load(), 3);
    EXPECT_EQ(outcome->after.version, order.version + 1);
    EXPECT_EQ(store_->GetOrder(order.orderId)->notes, "rush");
}

TEST_F(OrderWriterTest, ExhaustedRetriesReportRetryableConflict) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 2)});
    flaky_->conflicts = 100;
    FulfillmentError error;

    auto outcome = writer_->Update(order.orderId, [](OrderRecord& current, FulfillmentError*) {
        current.notes = "never saved";
        return true;
    }, &error);

    EXPECT_FALSE(outcome.has_value());
    EXPECT_EQ(error.code, ErrorCode::kConflict);
    EXPECT_TRUE(error.retryable());
    EXPECT_EQ(flaky_->replaceCalls.load(), 5);
    EXPECT_TRUE(store_->GetOrder(order.orderId)->notes.empty());
}

TEST_F(OrderWriterTest, RejectedMutationLeavesOrderUntouched) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 2)});
    FulfillmentError error;

    auto outcome = writer_->Update(order.orderId, [](OrderRecord&, FulfillmentError* err) {
        SetError(err, FulfillmentError::Validation("nope"));
        return false;
    }, &error);

    EXPECT_FALSE(outcome.has_value());
    EXPECT_EQ(error.code, ErrorCode::kValidation);
    EXPECT_EQ(flaky_->replaceCalls.load(), 0);
    EXPECT_EQ(store_->GetOrder(order.orderId)->version, order.version);
}

TEST_F(OrderWriterTest, MissingOrderIsNotFound) {
    FulfillmentError error;

    auto outcome = writer_->Update("ord-missing", [](OrderRecord&, FulfillmentError*) { return true; }, &error);

    EXPECT_FALSE(outcome.has_value());
    EXPECT_EQ(error.code, ErrorCode::kNotFound);
}

TEST_F(OrderWriterTest, SaveInvalidatesCacheAndSyncsClientCounters) {
    // Given: 已缓存的订单，客户欠款 200
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 2)});
    ASSERT_TRUE(cache_->Contains(order.orderId));
    ASSERT_DOUBLE_EQ(store_->GetClient(order.clientId)->totalDue, 200.0);

    // When: 全部发货并付清
    auto outcome = writer_->Update(order.orderId, [](OrderRecord& current, FulfillmentError*) {
        current.items.front().deliveredQty = current.items.front().orderedQty;
        current.advance = current.pricing.grandTotal;
        return true;
    });

    // Then
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->after.status, OrderStatus::kCompleted);
    EXPECT_FALSE(cache_->Contains(order.orderId));
    EXPECT_EQ(cache_->InvalidationsFor(order.orderId), 1);

    const auto client = store_->GetClient(order.clientId);
    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(client->openOrders, 0);
    EXPECT_EQ(client->completedOrders, 1);
    EXPECT_DOUBLE_EQ(client->totalDue, 0.0);
}

TEST_F(OrderWriterTest, TransitionDeltaIgnoresCounterSales) {
    OrderRecord before;
    before.kind = OrderKind::kCounterSale;
    before.clientId = "cli-1";
    OrderRecord after = before;
    after.status = OrderStatus::kCompleted;

    const ClientDelta delta = OrderWriter::TransitionDelta(before, after);

    EXPECT_EQ(delta.completedOrders, 0);
    EXPECT_EQ(delta.openOrders, 0);
    EXPECT_EQ(OrderWriter::ContributionOf(before).totalOrders, 0);
}
