#include "test_support.h"

class CreateOrderTest : public FulfillmentTest {
protected:
    void SetUp() override {
        FulfillmentTest::SetUp();
        AddProduct("A", "Alpha", 100.0, 10);
        AddProduct("B", "Beta", 50.0, 3);
    }
};

TEST_F(CreateOrderTest, StandardOrderReservesStockAndRegistersClient) {
    // When
    FulfillmentError error;
    auto result = service_->CreateOrder(StandardOrder({Item("A", 100.0, 10)}, 250.0), &error);

    // Then
    ASSERT_TRUE(result.has_value()) << error.message;
    const OrderRecord& order = result->order;
    EXPECT_EQ(order.orderNumber.substr(0, 3), "ORD");
    EXPECT_EQ(order.status, OrderStatus::kOpen);
    EXPECT_EQ(order.paymentStatus, PaymentStatus::kPartial);
    EXPECT_DOUBLE_EQ(order.pricing.grandTotal, 1000.0);
    EXPECT_DOUBLE_EQ(order.balanceDue, 750.0);
    ASSERT_EQ(order.items.size(), 1u);
    EXPECT_EQ(order.items.front().lineId, "L1");
    EXPECT_EQ(order.items.front().productName, "Alpha");
    EXPECT_EQ(StockOf("A"), 0);

    const auto client = store_->GetClient(order.clientId);
    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(client->partyName, "Acme Traders");
    EXPECT_EQ(client->totalOrders, 1);
    EXPECT_EQ(client->openOrders, 1);
    EXPECT_DOUBLE_EQ(client->totalSpent, 1000.0);
    EXPECT_DOUBLE_EQ(client->totalPaid, 250.0);
    EXPECT_DOUBLE_EQ(client->totalDue, 750.0);

    EXPECT_EQ(store_->GetEmployeeStats("emp-1")->totalOrders, 1);
    EXPECT_TRUE(cache_->Contains(order.orderId));
    EXPECT_EQ(events_->Count(events::kOrderCreated), 1);
}

TEST_F(CreateOrderTest, RepeatOrderReusesClientCaseInsensitively) {
    const OrderRecord first = PlaceOrder({Item("A", 100.0, 1)});

    auto request = StandardOrder({Item("A", 100.0, 1)});
    request.client.partyName = "ACME traders";
    auto second = service_->CreateOrder(request);

    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->order.clientId, first.clientId);
    EXPECT_EQ(store_->GetClient(first.clientId)->totalOrders, 2);
    EXPECT_NE(second->order.orderNumber, first.orderNumber);
}

TEST_F(CreateOrderTest, InsufficientStockCreatesNothing) {
    // Given: B 只有 3 件
    FulfillmentError error;

    // When
    auto result = service_->CreateOrder(StandardOrder({Item("A", 100.0, 2), Item("B", 50.0, 5)}), &error);

    // Then
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(error.code, ErrorCode::kInsufficientStock);
    ASSERT_TRUE(error.shortage.has_value());
    EXPECT_EQ(error.shortage->productName, "Beta");
    EXPECT_EQ(StockOf("A"), 10);
    EXPECT_EQ(StockOf("B"), 3);
    EXPECT_FALSE(store_->FindHighestNumber(DocumentKind::kOrder, "ORD").has_value());
    EXPECT_EQ(events_->Count(events::kOrderCreated), 0);
}

TEST_F(CreateOrderTest, ValidationErrorsAreRejectedBeforeAnyWrite) {
    FulfillmentError error;

    EXPECT_FALSE(service_->CreateOrder(StandardOrder({}), &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);

    EXPECT_FALSE(service_->CreateOrder(StandardOrder({Item("A", 100.0, 0)}), &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);

    EXPECT_FALSE(service_->CreateOrder(StandardOrder({Item("A", -1.0, 1)}), &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);

    EXPECT_FALSE(service_->CreateOrder(StandardOrder({Item("A", 100.0, 1)}, 500.0), &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);

    auto anonymous = StandardOrder({Item("A", 100.0, 1)});
    anonymous.client = {};
    EXPECT_FALSE(service_->CreateOrder(anonymous, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);

    EXPECT_EQ(StockOf("A"), 10);
}

TEST_F(CreateOrderTest, UnknownProductOrClientIsNotFound) {
    FulfillmentError error;

    EXPECT_FALSE(service_->CreateOrder(StandardOrder({Item("missing", 10.0, 1)}), &error));
    EXPECT_EQ(error.code, ErrorCode::kNotFound);

    auto request = StandardOrder({Item("A", 100.0, 1)});
    request.client.clientId = "cli-missing";
    EXPECT_FALSE(service_->CreateOrder(request, &error));
    EXPECT_EQ(error.code, ErrorCode::kNotFound);
    EXPECT_EQ(StockOf("A"), 10);
}

TEST_F(CreateOrderTest, NameOnlyLinesLinkActiveProducts) {
    // Given: 按名称录入一行已有商品、一行手工商品
    FulfillmentService::ItemInput byName;
    byName.productName = "beta";
    byName.unitPrice = 50.0;
    byName.quantity = 1;
    FulfillmentService::ItemInput manual;
    manual.productName = "Installation";
    manual.unitPrice = 300.0;
    manual.quantity = 1;

    // When
    const OrderRecord order = PlaceOrder({byName, manual});

    // Then
    ASSERT_EQ(order.items.size(), 2u);
    EXPECT_EQ(order.items[0].productId, "B");
    EXPECT_TRUE(order.items[1].productId.empty());
    EXPECT_EQ(order.items[1].lineId, "L2");
    EXPECT_EQ(StockOf("B"), 2);
    EXPECT_DOUBLE_EQ(order.pricing.grandTotal, 350.0);
}

TEST_F(CreateOrderTest, ChargesFeedIntoGrandTotal) {
    auto request = StandardOrder({Item("A", 100.0, 2)});
    request.charges = Charges{20.0, 10.0, 5.0};

    auto result = service_->CreateOrder(request);

    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->order.pricing.taxAmount, 20.0);
    EXPECT_DOUBLE_EQ(result->order.pricing.grandTotal, 235.0);
}

TEST_F(CreateOrderTest, CounterSaleIsDeliveredAndPaidAtOnce) {
    // Given
    FulfillmentService::CreateOrderRequest request;
    request.kind = OrderKind::kCounterSale;
    request.items = {Item("A", 100.0, 3)};
    request.employeeId = "emp-2";

    // When
    auto result = service_->CreateOrder(request);

    // Then: 不登记客户，订单直接完成
    ASSERT_TRUE(result.has_value());
    const OrderRecord& order = result->order;
    EXPECT_TRUE(order.clientId.empty());
    EXPECT_EQ(order.kind, OrderKind::kCounterSale);
    EXPECT_EQ(order.status, OrderStatus::kCompleted);
    EXPECT_EQ(order.paymentStatus, PaymentStatus::kPaid);
    EXPECT_TRUE(order.isLocked);
    EXPECT_DOUBLE_EQ(order.advance, 300.0);
    EXPECT_EQ(order.items.front().deliveredQty, 3);
    EXPECT_EQ(StockOf("A"), 7);
}

TEST_F(CreateOrderTest, LowStockAfterOrderRaisesAlert) {
    PlaceOrder({Item("A", 100.0, 5)});

    EXPECT_EQ(events_->Count(events::kLowStockAlert), 1);
    const auto low = service_->ListLowStock();
    ASSERT_EQ(low.size(), 2u);
}
