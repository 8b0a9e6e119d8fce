#include <atomic>
#include <thread>

#include "test_support.h"

using namespace std::chrono_literals;

class DeliveryTest : public FulfillmentTest {
protected:
    void SetUp() override {
        FulfillmentTest::SetUp();
        AddProduct("A", "Alpha", 100.0, 20);
        AddProduct("B", "Beta", 50.0, 20);
    }
};

TEST_F(DeliveryTest, PartialDeliveryAdvancesProgress) {
    // Given
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});

    // When
    const DeliveryRecord delivery = Deliver(order.orderId, "L1", 4);

    // Then
    EXPECT_EQ(delivery.deliveryNumber.substr(0, 3), "DEL");
    EXPECT_EQ(delivery.status, DeliveryStatus::kPending);
    EXPECT_DOUBLE_EQ(delivery.pricing.grandTotal, 400.0);
    EXPECT_EQ(delivery.employeeId, "emp-1");

    const auto saved = store_->GetOrder(order.orderId);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->progress, 40);
    EXPECT_EQ(saved->status, OrderStatus::kPartialDelivered);
    EXPECT_EQ(saved->items.front().remainingQty, 6);
    EXPECT_EQ(saved->totalDeliveries, 1);
    EXPECT_FALSE(saved->actualDeliveryDate.has_value());
    EXPECT_EQ(store_->GetEmployeeStats("emp-1")->totalDeliveries, 1);
    EXPECT_EQ(events_->Count(events::kDeliveryCreated), 1);
    EXPECT_FALSE(locks_->IsHeld(order.orderId));
}

TEST_F(DeliveryTest, DeliverAllShipsOnlyRemainingQuantities) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10), Item("B", 50.0, 2)});
    Deliver(order.orderId, "L1", 4);

    const DeliveryRecord delivery = DeliverAll(order.orderId);

    ASSERT_EQ(delivery.items.size(), 2u);
    EXPECT_EQ(delivery.items[0].quantity, 6);
    EXPECT_EQ(delivery.items[1].quantity, 2);
    const auto saved = store_->GetOrder(order.orderId);
    EXPECT_EQ(saved->progress, 100);
    EXPECT_EQ(saved->status, OrderStatus::kDelivered);
    EXPECT_TRUE(saved->actualDeliveryDate.has_value());

    // 再次整单发货没有可发的数量
    FulfillmentService::CreateDeliveryRequest again;
    again.orderId = order.orderId;
    again.deliverAll = true;
    FulfillmentError error;
    EXPECT_FALSE(service_->CreateDelivery(again, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
}

TEST_F(DeliveryTest, OverDeliveryIsRejectedWithoutSideEffects) {
    // Given
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});
    Deliver(order.orderId, "L1", 8);

    // When: 同一请求中同一行累计超出剩余
    FulfillmentService::CreateDeliveryRequest request;
    request.orderId = order.orderId;
    FulfillmentService::DeliveryItemInput item;
    item.lineId = "L1";
    item.quantity = 2;
    request.items = {item, item};
    FulfillmentError error;
    auto result = service_->CreateDelivery(request, &error);

    // Then
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(error.code, ErrorCode::kValidation);
    EXPECT_EQ(service_->ListDeliveries(order.orderId).size(), 1u);
    EXPECT_EQ(store_->GetOrder(order.orderId)->items.front().deliveredQty, 8);
}

TEST_F(DeliveryTest, LinesCanBeMatchedByProductName) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10), Item("B", 50.0, 5)});

    FulfillmentService::CreateDeliveryRequest request;
    request.orderId = order.orderId;
    FulfillmentService::DeliveryItemInput item;
    item.productName = " BETA";
    item.quantity = 5;
    request.items.push_back(item);
    auto result = service_->CreateDelivery(request);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->delivery.items.front().lineId, "L2");
    EXPECT_EQ(result->order.items[1].deliveredQty, 5);
}

TEST_F(DeliveryTest, HeldOrderLockRejectsDelivery) {
    // Given: 另一操作持有订单锁
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});
    auto token = locks_->TryAcquire(order.orderId, 30s);
    ASSERT_TRUE(token.has_value());

    // When
    FulfillmentService::CreateDeliveryRequest request;
    request.orderId = order.orderId;
    request.deliverAll = true;
    FulfillmentError error;
    auto result = service_->CreateDelivery(request, &error);

    // Then
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(error.code, ErrorCode::kLockContention);
    EXPECT_TRUE(error.retryable());
    EXPECT_TRUE(service_->ListDeliveries(order.orderId).empty());

    locks_->Release(order.orderId, *token);
    EXPECT_TRUE(service_->CreateDelivery(request).has_value());
}

TEST_F(DeliveryTest, ConcurrentDeliveriesShipRemainingQuantityOnce) {
    // Given: 10 件未发，多个线程同时整行发货
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});
    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::atomic<int> unexpected{0};
    std::vector<std::thread> threads;

    // When
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            FulfillmentService::CreateDeliveryRequest request;
            request.orderId = order.orderId;
            FulfillmentService::DeliveryItemInput item;
            item.lineId = "L1";
            item.quantity = 10;
            request.items.push_back(item);
            FulfillmentError error;
            if (service_->CreateDelivery(request, &error))
                ++succeeded;
            else if (error.code == ErrorCode::kLockContention || error.code == ErrorCode::kValidation || error.code == ErrorCode::kConflict)
                ++rejected;
            else
                ++unexpected;
        });
    }
    for (auto& t : threads)
        t.join();

    // Then: 只有一次发货生效，已发数量不超过订购数量
    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(rejected.load(), 7);
    EXPECT_EQ(unexpected.load(), 0);
    const auto saved = store_->GetOrder(order.orderId);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->items.front().deliveredQty, 10);
    EXPECT_EQ(saved->items.front().remainingQty, 0);
    EXPECT_EQ(saved->totalDeliveries, 1);
    EXPECT_EQ(service_->ListDeliveries(order.orderId).size(), 1u);
    EXPECT_EQ(store_->GetEmployeeStats("emp-1")->totalDeliveries, 1);
    EXPECT_FALSE(locks_->IsHeld(order.orderId));
}

TEST_F(DeliveryTest, CancelledOrderCannotBeDelivered) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});
    ASSERT_TRUE(service_->CancelOrder(order.orderId, "customer changed mind"));

    FulfillmentService::CreateDeliveryRequest request;
    request.orderId = order.orderId;
    request.deliverAll = true;
    FulfillmentError error;
    EXPECT_FALSE(service_->CreateDelivery(request, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
}

TEST_F(DeliveryTest, PerformanceUsesDeliveryDateAgainstExpectedDate) {
    // Given: 预计 5 天后交付
    auto request = StandardOrder({Item("A", 100.0, 2)});
    request.expectedDeliveryDate = Clock::now() + 5 * 24h;
    auto created = service_->CreateOrder(request);
    ASSERT_TRUE(created.has_value());

    // When: 今天发完
    FulfillmentService::CreateDeliveryRequest delivery;
    delivery.orderId = created->order.orderId;
    delivery.deliverAll = true;
    auto result = service_->CreateDelivery(delivery);

    // Then
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->delivery.performance, DeliveryPerformance::kEarly);
    EXPECT_EQ(result->order.deliveryPerformance, DeliveryPerformance::kEarly);
    EXPECT_EQ(store_->GetEmployeeStats("emp-1")->earlyDeliveries, 1);
}

TEST_F(DeliveryTest, StatusUpdateIsMirroredOnInvoice) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 4)});
    const DeliveryRecord delivery = DeliverAll(order.orderId);
    FulfillmentService::GenerateInvoiceRequest invoiceRequest;
    invoiceRequest.deliveryId = delivery.deliveryId;
    auto invoice = service_->GenerateDeliveryInvoice(invoiceRequest);
    ASSERT_TRUE(invoice.has_value());

    auto updated = service_->UpdateDeliveryStatus(delivery.deliveryId, DeliveryStatus::kInTransit);

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->status, DeliveryStatus::kInTransit);
    EXPECT_EQ(store_->GetInvoice(invoice->invoice.invoiceId)->deliveryStatus, DeliveryStatus::kInTransit);
    EXPECT_EQ(events_->Count(events::kDeliveryStatusUpdated), 1);

    FulfillmentError error;
    EXPECT_FALSE(service_->UpdateDeliveryStatus("del-missing", DeliveryStatus::kDelivered, &error));
    EXPECT_EQ(error.code, ErrorCode::kNotFound);
}

TEST_F(DeliveryTest, InvoiceAdvanceIsRecordedAsInvoicePayment) {
    // Given: 订单 1000，发货 4 件
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)});
    const DeliveryRecord delivery = Deliver(order.orderId, "L1", 4);

    // When: 开票并随票收取 300
    FulfillmentService::GenerateInvoiceRequest request;
    request.deliveryId = delivery.deliveryId;
    request.advance = 300.0;
    request.method = PaymentMethod::kUpi;
    auto result = service_->GenerateDeliveryInvoice(request);

    // Then
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->invoice.pricing.grandTotal, 400.0);
    EXPECT_DOUBLE_EQ(result->invoice.balanceDue, 100.0);
    EXPECT_EQ(result->invoice.paymentStatus, PaymentStatus::kPartial);
    ASSERT_TRUE(result->payment.has_value());
    EXPECT_EQ(result->payment->type, PaymentType::kInvoicePayment);
    EXPECT_EQ(result->payment->invoiceId, result->invoice.invoiceId);
    ASSERT_TRUE(result->order.has_value());
    EXPECT_DOUBLE_EQ(result->order->balanceDue, 700.0);
    EXPECT_EQ(store_->GetDelivery(delivery.deliveryId)->invoiceId, result->invoice.invoiceId);

    // 同一发货单不能再开票
    FulfillmentError error;
    EXPECT_FALSE(service_->GenerateDeliveryInvoice(request, &error));
    EXPECT_EQ(error.code, ErrorCode::kValidation);
}

TEST_F(DeliveryTest, InvoiceAdvanceBeyondBalanceDueIsRejected) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 10)}, 900.0);
    const DeliveryRecord delivery = Deliver(order.orderId, "L1", 4);

    FulfillmentService::GenerateInvoiceRequest request;
    request.deliveryId = delivery.deliveryId;
    request.advance = 150.0;
    FulfillmentError error;
    auto result = service_->GenerateDeliveryInvoice(request, &error);

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(error.code, ErrorCode::kInsufficientBalance);
    EXPECT_TRUE(store_->GetDelivery(delivery.deliveryId)->invoiceId.empty());
    EXPECT_TRUE(store_->ListInvoicesForOrder(order.orderId).empty());
}

TEST_F(DeliveryTest, OrderInvoiceCopiesOrderTotals) {
    const OrderRecord order = PlaceOrder({Item("A", 100.0, 3), Item("B", 50.0, 2)}, 100.0);

    auto invoice = service_->GenerateOrderInvoice(order.orderId);

    ASSERT_TRUE(invoice.has_value());
    EXPECT_EQ(invoice->source, InvoiceSource::kOrder);
    EXPECT_EQ(invoice->items.size(), 2u);
    EXPECT_DOUBLE_EQ(invoice->pricing.grandTotal, 400.0);
    EXPECT_DOUBLE_EQ(invoice->balanceDue, 300.0);
    EXPECT_EQ(invoice->deliveryStatus, DeliveryStatus::kPending);
}
