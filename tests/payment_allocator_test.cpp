#include "test_support.h"

using namespace std::chrono_literals;

class PaymentAllocatorTest : public FulfillmentTest {
protected:
    void SetUp() override {
        FulfillmentTest::SetUp();
        AddProduct("A", "Alpha", 100.0, std::nullopt);
    }

    OrderRecord PlaceDated(std::int64_t quantity, TimePoint orderDate) {
        auto request = StandardOrder({Item("A", 100.0, quantity)});
        request.orderDate = orderDate;
        FulfillmentError error;
        auto result = service_->CreateOrder(request, &error);
        EXPECT_TRUE(result.has_value()) << error.message;
        return result ? result->order : OrderRecord{};
    }

    PaymentAllocator::ClientPaymentRequest ClientPayment(const std::string& clientId, double amount) const {
        PaymentAllocator::ClientPaymentRequest request;
        request.clientId = clientId;
        request.payment.amount = amount;
        request.payment.method = PaymentMethod::kBankTransfer;
        return request;
    }
};

TEST_F(PaymentAllocatorTest, OrderPaymentUpdatesOrderAndClient) {
    // Given
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});

    // When
    PaymentAllocator::PaymentInput input;
    input.amount = 400.0;
    input.method = PaymentMethod::kCard;
    auto result = payments_->RecordOrderPayment(order.orderId, input);

    // Then
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->payment.paymentNumber.substr(0, 3), "PAY");
    EXPECT_EQ(result->payment.type, PaymentType::kOrderPayment);
    EXPECT_DOUBLE_EQ(result->payment.allocatedAmount + result->payment.remainingAmount, result->payment.amount);
    ASSERT_EQ(result->orders.size(), 1u);
    EXPECT_DOUBLE_EQ(result->orders.front().balanceDue, 600.0);
    EXPECT_EQ(result->orders.front().paymentStatus, PaymentStatus::kPartial);

    ASSERT_TRUE(result->client.has_value());
    EXPECT_DOUBLE_EQ(result->client->totalPaid, 400.0);
    EXPECT_DOUBLE_EQ(result->client->totalDue, 600.0);
    ASSERT_TRUE(result->client->lastPaymentAmount > 0.0);
    EXPECT_EQ(events_->Count(events::kPaymentRecorded), 1);
}

TEST_F(PaymentAllocatorTest, OverpaymentOfOrderIsRejected) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)}, 900.0);
    FulfillmentError error;

    PaymentAllocator::PaymentInput input;
    input.amount = 100.01;
    auto result = payments_->RecordOrderPayment(order.orderId, input, &error);

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(error.code, ErrorCode::kInsufficientBalance);
    EXPECT_DOUBLE_EQ(store_->GetOrder(order.orderId)->advance, 900.0);
    EXPECT_TRUE(payments_->ListClientPayments(order.clientId).empty());

    input.amount = 0.0;
    EXPECT_FALSE(payments_->RecordOrderPayment(order.orderId, input, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
}

TEST_F(PaymentAllocatorTest, AutoAllocationPaysOldestOrdersFirst) {
    // Given: 两笔欠款 1000（两天前）与 300（一天前）
    const TimePoint now = Clock::now();
    const OrderRecord newer = PlaceDated(3, now - 24h);
    const OrderRecord older = PlaceDated(10, now - 48h);

    // When: 收到 1500
    auto result = payments_->RecordClientPayment(ClientPayment(older.clientId, 1500.0));

    // Then: 两单结清，多出的 200 记为预收款
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->payment.allocations.size(), 2u);
    EXPECT_EQ(result->payment.allocations[0].orderId, older.orderId);
    EXPECT_DOUBLE_EQ(result->payment.allocations[0].amount, 1000.0);
    EXPECT_DOUBLE_EQ(result->payment.allocations[1].amount, 300.0);
    EXPECT_DOUBLE_EQ(result->payment.allocatedAmount, 1300.0);
    EXPECT_DOUBLE_EQ(result->payment.remainingAmount, 200.0);
    EXPECT_DOUBLE_EQ(store_->GetOrder(older.orderId)->balanceDue, 0.0);
    EXPECT_DOUBLE_EQ(store_->GetOrder(newer.orderId)->balanceDue, 0.0);

    ASSERT_TRUE(result->client.has_value());
    EXPECT_DOUBLE_EQ(result->client->advanceBalance, 200.0);
    EXPECT_DOUBLE_EQ(result->client->totalPaid, 1500.0);
    EXPECT_DOUBLE_EQ(result->client->totalDue, 0.0);
    EXPECT_EQ(events_->Count(events::kClientAdvanceUpdated), 1);
}

TEST_F(PaymentAllocatorTest, PartialAutoAllocationStopsWhenAmountRunsOut) {
    const TimePoint now = Clock::now();
    const OrderRecord older = PlaceDated(10, now - 48h);
    const OrderRecord newer = PlaceDated(3, now - 24h);

    auto result = payments_->RecordClientPayment(ClientPayment(older.clientId, 1100.0));

    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(store_->GetOrder(older.orderId)->balanceDue, 0.0);
    EXPECT_DOUBLE_EQ(store_->GetOrder(newer.orderId)->balanceDue, 200.0);
    EXPECT_DOUBLE_EQ(result->payment.remainingAmount, 0.0);
}

TEST_F(PaymentAllocatorTest, PaymentWithNothingDueBecomesAdvance) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 1)}, 100.0);

    auto result = payments_->RecordClientPayment(ClientPayment(order.clientId, 250.0));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->payment.type, PaymentType::kAdvancePayment);
    EXPECT_TRUE(result->payment.allocations.empty());
    EXPECT_DOUBLE_EQ(result->client->advanceBalance, 250.0);
}

TEST_F(PaymentAllocatorTest, ExplicitAllocationsAreValidatedUpFront) {
    // Given
    const OrderRecord first = PlaceOrder({Item("A", 100.0, 5)});
    const OrderRecord second = PlaceOrder({Item("A", 100.0, 2)});
    FulfillmentError error;

    // When: 分摊总额超过收款金额
    auto tooMuch = ClientPayment(first.clientId, 300.0);
    tooMuch.allocations = {{first.orderId, 200.0}, {second.orderId, 200.0}};
    EXPECT_FALSE(payments_->RecordClientPayment(tooMuch, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);

    // When: 单笔分摊超过订单欠款
    auto overOrder = ClientPayment(first.clientId, 500.0);
    overOrder.allocations = {{first.orderId, 100.0}, {second.orderId, 250.0}};
    EXPECT_FALSE(payments_->RecordClientPayment(overOrder, &error));
    EXPECT_EQ(error.code, ErrorCode::kInsufficientBalance);

    // Then: 两次失败都没有动订单
    EXPECT_DOUBLE_EQ(store_->GetOrder(first.orderId)->advance, 0.0);
    EXPECT_DOUBLE_EQ(store_->GetOrder(second.orderId)->advance, 0.0);

    // When: 合法分摊，余下 50 记为预收款
    auto valid = ClientPayment(first.clientId, 350.0);
    valid.allocations = {{first.orderId, 100.0}, {second.orderId, 200.0}};
    auto result = payments_->RecordClientPayment(valid, &error);
    ASSERT_TRUE(result.has_value()) << error.message;
    EXPECT_DOUBLE_EQ(result->payment.remainingAmount, 50.0);
    EXPECT_DOUBLE_EQ(store_->GetOrder(second.orderId)->balanceDue, 0.0);
    EXPECT_DOUBLE_EQ(result->client->advanceBalance, 50.0);
}

TEST_F(PaymentAllocatorTest, AdvanceCanBeAppliedToAnOrder) {
    // Given: 预收款 500
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 3)});
    PaymentAllocator::PaymentInput input;
    input.amount = 500.0;
    ASSERT_TRUE(payments_->RecordAdvancePayment(order.clientId, input));

    // When
    auto result = payments_->UseAdvanceForOrder(order.orderId, 300.0);

    // Then
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->payment.type, PaymentType::kAdjustment);
    EXPECT_EQ(result->orders.front().paymentStatus, PaymentStatus::kPaid);
    EXPECT_DOUBLE_EQ(result->client->advanceBalance, 200.0);
    EXPECT_DOUBLE_EQ(result->client->totalPaid, 500.0);
}

TEST_F(PaymentAllocatorTest, UsingMoreAdvanceThanAvailableFails) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 3)});
    PaymentAllocator::PaymentInput input;
    input.amount = 100.0;
    ASSERT_TRUE(payments_->RecordAdvancePayment(order.clientId, input));
    FulfillmentError error;

    auto result = payments_->UseAdvanceForOrder(order.orderId, 150.0, &error);

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(error.code, ErrorCode::kInsufficientBalance);
    EXPECT_DOUBLE_EQ(store_->GetOrder(order.orderId)->advance, 0.0);
    EXPECT_DOUBLE_EQ(store_->GetClient(order.clientId)->advanceBalance, 100.0);
}

TEST_F(PaymentAllocatorTest, FinancialSummaryNetsAdvanceAgainstOutstanding) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 4)}, 100.0);
    PaymentAllocator::PaymentInput input;
    input.amount = 50.0;
    ASSERT_TRUE(payments_->RecordAdvancePayment(order.clientId, input));

    auto summary = payments_->ClientFinancialSummary(order.clientId);

    ASSERT_TRUE(summary.has_value());
    ASSERT_EQ(summary->ordersWithDue.size(), 1u);
    EXPECT_DOUBLE_EQ(summary->outstanding, 300.0);
    EXPECT_DOUBLE_EQ(summary->netDue, 250.0);
    EXPECT_EQ(payments_->ListClientPayments(order.clientId).size(), 1u);

    FulfillmentError error;
    EXPECT_FALSE(payments_->ClientFinancialSummary("cli-missing", &error));
    EXPECT_EQ(error.code, ErrorCode::kNotFound);
}
