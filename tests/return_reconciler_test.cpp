#include "test_support.h"

using namespace std::chrono_literals;

namespace {

// 退货单写入总是失败
class FailingReturnStore : public InMemoryFulfillmentStore {
public:
    StoreStatus InsertReturn(const ReturnRecord&) override { return StoreStatus::kUnavailable; }
};

}  // namespace

class ReturnReconcilerTest : public FulfillmentTest {
protected:
    void SetUp() override {
        FulfillmentTest::SetUp();
        AddProduct("A", "Alpha", 100.0, 10);
        AddProduct("B", "Beta", 50.0, 10);
    }

    std::optional<ReturnReconciler::ReturnResult> Return(const std::string& orderId, const std::string& lineId, std::int64_t quantity, FulfillmentError* error = nullptr) {
        ReturnReconciler::CreateReturnRequest request;
        request.orderId = orderId;
        ReturnReconciler::ReturnItemInput item;
        item.lineId = lineId;
        item.quantity = quantity;
        request.items.push_back(item);
        request.reason = "damaged";
        return returns_->CreateReturn(request, error);
    }

    std::optional<ReturnReconciler::RefundResult> Refund(const std::string& returnId, double amount, FulfillmentError* error = nullptr) {
        ReturnReconciler::RefundInput input;
        input.returnId = returnId;
        input.amount = amount;
        return returns_->RecordRefund(input, error);
    }

    OrderRecord PlaceCounterSale(std::vector<FulfillmentService::ItemInput> items) {
        FulfillmentService::CreateOrderRequest request;
        request.kind = OrderKind::kCounterSale;
        request.items = std::move(items);
        auto result = service_->CreateOrder(request);
        EXPECT_TRUE(result.has_value());
        return result ? result->order : OrderRecord{};
    }
};

TEST_F(ReturnReconcilerTest, ReturnOfPaidGoodsCreatesRefundableBalance) {
    // Given: 订购 10 × 100，发出 4，付清 1000
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});
    Deliver(order.orderId, "L1", 4);
    Pay(order.orderId, 1000.0);
    ASSERT_EQ(StockOf("A"), 0);

    // When: 退回已发出的 4 件
    FulfillmentError error;
    auto result = Return(order.orderId, "L1", 4, &error);

    // Then
    ASSERT_TRUE(result.has_value()) << error.message;
    EXPECT_EQ(result->record.returnNumber.substr(0, 3), "RET");
    EXPECT_DOUBLE_EQ(result->record.returnTotal, 400.0);
    EXPECT_DOUBLE_EQ(result->record.refundableAmount, 400.0);
    EXPECT_EQ(result->record.refundStatus, RefundStatus::kPending);
    EXPECT_EQ(StockOf("A"), 4);

    ASSERT_TRUE(result->order.has_value());
    const OrderRecord& updated = *result->order;
    EXPECT_EQ(updated.items.front().orderedQty, 6);
    EXPECT_EQ(updated.items.front().deliveredQty, 0);
    EXPECT_EQ(updated.items.front().returnedQty, 4);
    // 退回的货已入库，待发数量保持退货前的 6，不会再次发出
    EXPECT_EQ(updated.items.front().remainingQty, 6);
    EXPECT_DOUBLE_EQ(updated.returnedAmount, 400.0);
    EXPECT_EQ(updated.totalReturns, 1);
    EXPECT_EQ(updated.status, OrderStatus::kOpen);
    EXPECT_DOUBLE_EQ(updated.balanceDue, 0.0);

    ASSERT_TRUE(result->client.has_value());
    EXPECT_DOUBLE_EQ(result->client->refundableBalance, 400.0);
    EXPECT_EQ(result->client->totalReturns, 1);
    EXPECT_EQ(events_->Count(events::kReturnCreated), 1);
}

TEST_F(ReturnReconcilerTest, RefundsAccumulateUpToRefundableAmount) {
    // Given
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});
    Deliver(order.orderId, "L1", 4);
    Pay(order.orderId, 1000.0);
    auto returned = Return(order.orderId, "L1", 4);
    ASSERT_TRUE(returned.has_value());
    const std::string returnId = returned->record.returnId;

    // When / Then: 先退 100，再退剩下的 300
    auto first = Refund(returnId, 100.0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->record.refundStatus, RefundStatus::kPartial);
    EXPECT_EQ(first->payment.type, PaymentType::kReturnRefund);
    EXPECT_EQ(first->payment.returnId, returnId);

    auto second = Refund(returnId, 300.0);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->record.refundStatus, RefundStatus::kRefunded);
    EXPECT_DOUBLE_EQ(second->record.refundedAmount, 400.0);
    ASSERT_TRUE(second->client.has_value());
    EXPECT_DOUBLE_EQ(second->client->refundableBalance, 0.0);
    EXPECT_DOUBLE_EQ(second->client->totalPaid, 600.0);

    FulfillmentError error;
    EXPECT_FALSE(Refund(returnId, 0.01, &error));
    EXPECT_EQ(error.code, ErrorCode::kInsufficientBalance);
    EXPECT_EQ(events_->Count(events::kRefundRecorded), 2);
}

TEST_F(ReturnReconcilerTest, ReturnUnlocksCompletedOrder) {
    // Given: 完成并锁定的订单
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 3)});
    DeliverAll(order.orderId);
    const OrderRecord paid = Pay(order.orderId, 300.0);
    ASSERT_EQ(paid.status, OrderStatus::kCompleted);
    ASSERT_TRUE(paid.isLocked);

    // When
    auto result = Return(order.orderId, "L1", 1);

    // Then: 仍然 completed，但已解锁，可退一件的价款
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->order->status, OrderStatus::kCompleted);
    EXPECT_FALSE(result->order->isLocked);
    EXPECT_DOUBLE_EQ(result->record.refundableAmount, 100.0);
}

TEST_F(ReturnReconcilerTest, UnpaidReturnOnlyReducesBalanceDue) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 5)}, 200.0);
    DeliverAll(order.orderId);

    auto result = Return(order.orderId, "L1", 2);

    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->record.refundableAmount, 0.0);
    EXPECT_EQ(result->record.refundStatus, RefundStatus::kNoRefund);
    EXPECT_DOUBLE_EQ(result->order->balanceDue, 100.0);

    FulfillmentError error;
    EXPECT_FALSE(Refund(result->record.returnId, 10.0, &error));
    EXPECT_EQ(error.code, ErrorCode::kInsufficientBalance);
}

TEST_F(ReturnReconcilerTest, ReturnBeyondDeliveredIsRejected) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 5)});
    FulfillmentError error;

    EXPECT_FALSE(Return(order.orderId, "L1", 1, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);

    Deliver(order.orderId, "L1", 2);
    EXPECT_FALSE(Return(order.orderId, "L1", 3, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
    EXPECT_FALSE(Return(order.orderId, "L9", 1, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
    EXPECT_EQ(StockOf("A"), 5);
}

TEST_F(ReturnReconcilerTest, HeldOrderLockRejectsReturn) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 5)});
    DeliverAll(order.orderId);
    auto token = locks_->TryAcquire(order.orderId, 30s);
    ASSERT_TRUE(token.has_value());
    FulfillmentError error;

    EXPECT_FALSE(Return(order.orderId, "L1", 1, &error));

    EXPECT_EQ(error.code, ErrorCode::kLockContention);
    locks_->Release(order.orderId, *token);
}

TEST_F(ReturnReconcilerTest, CounterSaleReturnShrinksTheSale) {
    // Given: A 3 × 100 + B 1 × 50 = 350
    const OrderRecord sale = PlaceCounterSale({Item("A", 100.0, 3), Item("B", 50.0, 1)});

    // When: 退回一件 A
    auto result = Return(sale.orderId, "L1", 1);

    // Then: 订单按剩余明细重新计价，不产生退款义务
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->order.has_value());
    EXPECT_DOUBLE_EQ(result->order->pricing.grandTotal, 250.0);
    EXPECT_DOUBLE_EQ(result->order->advance, 250.0);
    EXPECT_DOUBLE_EQ(result->order->returnedAmount, 0.0);
    EXPECT_DOUBLE_EQ(result->record.refundableAmount, 0.0);
    EXPECT_DOUBLE_EQ(result->record.returnTotal, 100.0);
    EXPECT_FALSE(result->client.has_value());
    EXPECT_EQ(StockOf("A"), 8);

    FulfillmentError error;
    EXPECT_FALSE(Refund(result->record.returnId, 100.0, &error));
    EXPECT_EQ(error.code, ErrorCode::kInsufficientBalance);
}

TEST_F(ReturnReconcilerTest, FullyReturnedCounterSaleIsDeleted) {
    const OrderRecord sale = PlaceCounterSale({Item("A", 100.0, 2), Item("B", 50.0, 1)});

    ReturnReconciler::CreateReturnRequest request;
    request.orderId = sale.orderId;
    ReturnReconciler::ReturnItemInput a;
    a.lineId = "L1";
    a.quantity = 2;
    ReturnReconciler::ReturnItemInput b;
    b.lineId = "L2";
    b.quantity = 1;
    request.items = {a, b};
    auto result = returns_->CreateReturn(request);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->record.orderDeleted);
    EXPECT_FALSE(result->order.has_value());
    EXPECT_FALSE(store_->GetOrder(sale.orderId).has_value());
    EXPECT_EQ(StockOf("A"), 10);
    EXPECT_EQ(StockOf("B"), 10);
    EXPECT_EQ(events_->Count(events::kOrderDeleted), 1);
    EXPECT_EQ(returns_->ListReturnsForOrder(sale.orderId).size(), 1u);
}

class ReturnCompensationTest : public ReturnReconcilerTest {
protected:
    std::unique_ptr<InMemoryFulfillmentStore> MakeStore() override { return std::make_unique<FailingReturnStore>(); }
};

TEST_F(ReturnCompensationTest, FailedReturnRecordRestoresOrderAndStock) {
    // Given
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 5)});
    DeliverAll(order.orderId);
    const OrderRecord before = *store_->GetOrder(order.orderId);

    // When
    FulfillmentError error;
    auto result = Return(order.orderId, "L1", 2, &error);

    // Then
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(error.code, ErrorCode::kStorage);
    EXPECT_EQ(StockOf("A"), 5);
    const auto after = store_->GetOrder(order.orderId);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->items.front().deliveredQty, before.items.front().deliveredQty);
    EXPECT_EQ(after->items.front().orderedQty, before.items.front().orderedQty);
    EXPECT_DOUBLE_EQ(after->returnedAmount, 0.0);
    EXPECT_EQ(after->status, before.status);
    EXPECT_FALSE(locks_->IsHeld(order.orderId));
}

TEST_F(ReturnCompensationTest, FailedCounterSaleReturnReinsertsOrder) {
    const OrderRecord sale = PlaceCounterSale({Item("A", 100.0, 1)});
    FulfillmentError error;

    auto result = Return(sale.orderId, "L1", 1, &error);

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(error.code, ErrorCode::kStorage);
    EXPECT_TRUE(store_->GetOrder(sale.orderId).has_value());
    EXPECT_EQ(StockOf("A"), 9);
}
