#include <functional>
#include <utility>

#include "test_support.h"

using namespace std::chrono_literals;

class OrderMaintenanceTest : public FulfillmentTest {
protected:
    void SetUp() override {
        FulfillmentTest::SetUp();
        AddProduct("A", "Alpha", 100.0, 20);
        AddProduct("B", "Beta", 50.0, 20);
    }

    FulfillmentService::ItemInput Existing(const std::string& lineId, double price, std::int64_t quantity) const {
        FulfillmentService::ItemInput item;
        item.lineId = lineId;
        item.unitPrice = price;
        item.quantity = quantity;
        return item;
    }
};

TEST_F(OrderMaintenanceTest, CancelRestoresUndeliveredStock) {
    // Given: 订购 10，发出 4
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});
    Deliver(order.orderId, "L1", 4);
    ASSERT_EQ(StockOf("A"), 10);

    // When
    FulfillmentError error;
    auto cancelled = service_->CancelOrder(order.orderId, "out of budget", &error);

    // Then: 只归还未发出的 6 件
    ASSERT_TRUE(cancelled.has_value()) << error.message;
    EXPECT_EQ(cancelled->status, OrderStatus::kCancelled);
    EXPECT_EQ(cancelled->cancelReason, "out of budget");
    EXPECT_EQ(StockOf("A"), 16);
    const auto client = store_->GetClient(order.clientId);
    EXPECT_EQ(client->openOrders, 0);
    EXPECT_DOUBLE_EQ(client->totalDue, 0.0);
    EXPECT_EQ(events_->Count(events::kOrderCancelled), 1);

    // 再次取消
    EXPECT_FALSE(service_->CancelOrder(order.orderId, "again", &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
}

TEST_F(OrderMaintenanceTest, CompletedOrderCannotBeCancelled) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 2)}, 200.0);
    DeliverAll(order.orderId);
    FulfillmentError error;

    EXPECT_FALSE(service_->CancelOrder(order.orderId, "late", &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
    EXPECT_EQ(store_->GetOrder(order.orderId)->status, OrderStatus::kCompleted);
}

TEST_F(OrderMaintenanceTest, DeleteRemovesDocumentsAndReversesCounters) {
    // Given
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 5)});
    const DeliveryRecord delivery = Deliver(order.orderId, "L1", 2);
    FulfillmentService::GenerateInvoiceRequest invoiceRequest;
    invoiceRequest.deliveryId = delivery.deliveryId;
    ASSERT_TRUE(service_->GenerateDeliveryInvoice(invoiceRequest));

    // When
    FulfillmentError error;
    auto result = service_->DeleteOrder(order.orderId, &error);

    // Then: 单据删除、计数器回退、库存不回退
    ASSERT_TRUE(result.has_value()) << error.message;
    EXPECT_EQ(result->deliveriesRemoved, 1);
    EXPECT_EQ(result->invoicesRemoved, 1);
    EXPECT_FALSE(store_->GetOrder(order.orderId).has_value());
    EXPECT_FALSE(store_->GetDelivery(delivery.deliveryId).has_value());
    EXPECT_EQ(StockOf("A"), 15);

    const auto client = store_->GetClient(order.clientId);
    EXPECT_EQ(client->totalOrders, 0);
    EXPECT_EQ(client->openOrders, 0);
    EXPECT_DOUBLE_EQ(client->totalSpent, 0.0);
    const auto stats = store_->GetEmployeeStats("emp-1");
    EXPECT_EQ(stats->totalOrders, 0);
    EXPECT_EQ(stats->totalDeliveries, 0);
    EXPECT_EQ(events_->Count(events::kOrderDeleted), 1);

    EXPECT_FALSE(service_->DeleteOrder(order.orderId, &error));
    EXPECT_EQ(error.code, ErrorCode::kNotFound);
}

TEST_F(OrderMaintenanceTest, UpdateItemsAdjustsStockByDelta) {
    // Given: A×5
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 5)});
    ASSERT_EQ(StockOf("A"), 15);

    // When: A 改为 2，新增 B×4
    FulfillmentError error;
    auto updated = service_->UpdateOrderItems(order.orderId, {Existing("L1", 100.0, 2), Item("B", 50.0, 4)}, std::nullopt, &error);

    // Then
    ASSERT_TRUE(updated.has_value()) << error.message;
    EXPECT_EQ(StockOf("A"), 18);
    EXPECT_EQ(StockOf("B"), 16);
    ASSERT_EQ(updated->items.size(), 2u);
    EXPECT_EQ(updated->items[1].lineId, "L2");
    EXPECT_DOUBLE_EQ(updated->pricing.grandTotal, 400.0);
    EXPECT_DOUBLE_EQ(store_->GetClient(order.clientId)->totalSpent, 400.0);
    EXPECT_EQ(events_->Count(events::kOrderUpdated), 1);
}

TEST_F(OrderMaintenanceTest, UpdateItemsRespectsDeliveredQuantities) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 5), Item("B", 50.0, 2)});
    Deliver(order.orderId, "L1", 3);
    FulfillmentError error;

    // 不能低于已发数量
    EXPECT_FALSE(service_->UpdateOrderItems(order.orderId, {Existing("L1", 100.0, 2), Existing("L2", 50.0, 2)}, std::nullopt, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);

    // 已发货的行不能删除
    EXPECT_FALSE(service_->UpdateOrderItems(order.orderId, {Existing("L2", 50.0, 2)}, std::nullopt, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);

    // 未发货的行可以删除
    auto updated = service_->UpdateOrderItems(order.orderId, {Existing("L1", 100.0, 3)}, std::nullopt, &error);
    ASSERT_TRUE(updated.has_value()) << error.message;
    EXPECT_EQ(updated->status, OrderStatus::kDelivered);
    EXPECT_EQ(StockOf("A"), 17);
    EXPECT_EQ(StockOf("B"), 20);
}

TEST_F(OrderMaintenanceTest, UpdateItemsFailureLeavesStockAndOrder) {
    AddProduct("C", "Gamma", 10.0, 1);
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 5)});
    FulfillmentError error;

    auto updated = service_->UpdateOrderItems(order.orderId, {Existing("L1", 100.0, 1), Item("C", 10.0, 5)}, std::nullopt, &error);

    EXPECT_FALSE(updated.has_value());
    EXPECT_EQ(error.code, ErrorCode::kInsufficientStock);
    EXPECT_EQ(StockOf("A"), 15);
    EXPECT_EQ(StockOf("C"), 1);
    EXPECT_EQ(store_->GetOrder(order.orderId)->items.size(), 1u);
}

TEST_F(OrderMaintenanceTest, PaidAmountCapsNewTotal) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 5)}, 400.0);
    FulfillmentError error;

    EXPECT_FALSE(service_->UpdateOrderItems(order.orderId, {Existing("L1", 100.0, 3)}, std::nullopt, &error));

    EXPECT_EQ(error.code, ErrorCode::kValidation);
    EXPECT_EQ(StockOf("A"), 15);
}

TEST_F(OrderMaintenanceTest, LockedOrderRejectsEdits) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 2)}, 200.0);
    DeliverAll(order.orderId);
    FulfillmentError error;

    EXPECT_FALSE(service_->UpdateOrderItems(order.orderId, {Existing("L1", 100.0, 3)}, std::nullopt, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
    EXPECT_FALSE(service_->UpdateOrderDetails(order.orderId, std::string("note"), std::nullopt, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
}

TEST_F(OrderMaintenanceTest, UpdateDetailsChangesNotesAndExpectedDate) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 2)});
    const TimePoint expected = Clock::now() + 72h;

    auto updated = service_->UpdateOrderDetails(order.orderId, std::string("call before delivery"), expected);

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->notes, "call before delivery");
    ASSERT_TRUE(updated->expectedDeliveryDate.has_value());
    EXPECT_EQ(*updated->expectedDeliveryDate, expected);
    EXPECT_EQ(updated->items.front().orderedQty, 2);
}

TEST_F(OrderMaintenanceTest, GetOrderServesFromCacheUntilInvalidated) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 2)});
    ASSERT_TRUE(cache_->Contains(order.orderId));

    ASSERT_TRUE(service_->UpdateOrderDetails(order.orderId, std::string("updated"), std::nullopt));
    EXPECT_FALSE(cache_->Contains(order.orderId));

    auto fetched = service_->GetOrder(order.orderId);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->notes, "updated");
    EXPECT_TRUE(cache_->Contains(order.orderId));
}

namespace {

// 第一次 ReplaceOrder 之前执行一次回调，模拟与保存交错的并发写入
class InterleavingStore : public InMemoryFulfillmentStore {
public:
    StoreStatus ReplaceOrder(const OrderRecord& order, std::uint64_t expectedVersion) override {
        if (beforeReplace) {
            auto hook = std::move(beforeReplace);
            beforeReplace = nullptr;
            hook();
        }
        return InMemoryFulfillmentStore::ReplaceOrder(order, expectedVersion);
    }

    std::function<void()> beforeReplace;
};

}  // namespace

class ConcurrentOrderEditTest : public OrderMaintenanceTest {
protected:
    std::unique_ptr<InMemoryFulfillmentStore> MakeStore() override {
        auto store = std::make_unique<InterleavingStore>();
        interleaving_ = store.get();
        return store;
    }

    InterleavingStore* interleaving_{nullptr};
};

TEST_F(ConcurrentOrderEditTest, PaymentDuringItemUpdateCapsNewTotal) {
    // Given: 总额 1000，未付款
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});
    ASSERT_EQ(StockOf("A"), 10);

    // 改单通过快照校验后、保存之前，另一笔付款 900 入账
    interleaving_->beforeReplace = [this, orderId = order.orderId] { Pay(orderId, 900.0); };

    // When: 总额降到 600
    FulfillmentError error;
    auto updated = service_->UpdateOrderItems(order.orderId, {Existing("L1", 100.0, 6)}, std::nullopt, &error);

    // Then: 按最新已付金额拒绝，库存调整回滚，付款保留
    EXPECT_FALSE(updated.has_value());
    EXPECT_EQ(error.code, ErrorCode::kValidation);
    EXPECT_EQ(StockOf("A"), 10);

    const auto saved = store_->GetOrder(order.orderId);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->items.front().orderedQty, 10);
    EXPECT_DOUBLE_EQ(saved->pricing.grandTotal, 1000.0);
    EXPECT_DOUBLE_EQ(saved->advance, 900.0);
    EXPECT_DOUBLE_EQ(saved->balanceDue, 100.0);
}
