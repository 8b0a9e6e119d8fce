#include "test_support.h"

#include <utility>

// ========== RecordingEventSink ==========

void RecordingEventSink::Publish(const std::string& event, const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back({event, payload});
}

std::vector<RecordingEventSink::Event> RecordingEventSink::Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

int RecordingEventSink::Count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for (const auto& e : events_) {
        if (e.name == name)
            ++n;
    }
    return n;
}

void RecordingEventSink::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

// ========== RecordingOrderCache ==========

std::optional<OrderRecord> RecordingOrderCache::GetOrder(const std::string& orderId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(orderId);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

void RecordingOrderCache::PutOrder(const OrderRecord& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[order.orderId] = order;
}

void RecordingOrderCache::Invalidate(const std::string& orderId) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(orderId);
    ++invalidations_[orderId];
}

int RecordingOrderCache::InvalidationsFor(const std::string& orderId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invalidations_.find(orderId);
    return it == invalidations_.end() ? 0 : it->second;
}

bool RecordingOrderCache::Contains(const std::string& orderId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(orderId) > 0;
}

// ========== FulfillmentTest ==========

std::unique_ptr<InMemoryFulfillmentStore> FulfillmentTest::MakeStore() {
    return std::make_unique<InMemoryFulfillmentStore>();
}

void FulfillmentTest::SetUp() {
    store_ = MakeStore();
    locks_ = std::make_unique<InMemoryOrderLock>();
    events_ = std::make_unique<RecordingEventSink>();
    cache_ = std::make_unique<RecordingOrderCache>();

    sequences_ = std::make_unique<SequenceAllocator>(store_.get());
    ledger_ = std::make_unique<InventoryLedger>(InventoryLedger::Dependencies{store_.get(), events_.get()});
    writer_ = std::make_unique<OrderWriter>(OrderWriter::Dependencies{store_.get(), cache_.get()});

    PaymentAllocator::Dependencies paymentDeps;
    paymentDeps.store = store_.get();
    paymentDeps.writer = writer_.get();
    paymentDeps.sequences = sequences_.get();
    paymentDeps.events = events_.get();
    payments_ = std::make_unique<PaymentAllocator>(paymentDeps);

    FulfillmentService::Dependencies serviceDeps;
    serviceDeps.store = store_.get();
    serviceDeps.ledger = ledger_.get();
    serviceDeps.writer = writer_.get();
    serviceDeps.sequences = sequences_.get();
    serviceDeps.payments = payments_.get();
    serviceDeps.locks = locks_.get();
    serviceDeps.cache = cache_.get();
    serviceDeps.events = events_.get();
    service_ = std::make_unique<FulfillmentService>(serviceDeps);

    ReturnReconciler::Dependencies returnDeps;
    returnDeps.store = store_.get();
    returnDeps.ledger = ledger_.get();
    returnDeps.writer = writer_.get();
    returnDeps.sequences = sequences_.get();
    returnDeps.locks = locks_.get();
    returnDeps.events = events_.get();
    returns_ = std::make_unique<ReturnReconciler>(returnDeps);
}

void FulfillmentTest::AddProduct(const std::string& productId, const std::string& name, double price, std::optional<std::int64_t> stock) {
    ProductRecord product;
    product.productId = productId;
    product.name = name;
    product.price = price;
    product.stock = stock;
    product.updatedAt = Clock::now();
    ASSERT_EQ(store_->InsertProduct(product), StoreStatus::kOk);
}

std::int64_t FulfillmentTest::StockOf(const std::string& productId) {
    auto product = store_->GetProduct(productId);
    EXPECT_TRUE(product.has_value());
    EXPECT_TRUE(product && product->stock.has_value());
    return product && product->stock ? *product->stock : -1;
}

FulfillmentService::ItemInput FulfillmentTest::Item(const std::string& productId, double unitPrice, std::int64_t quantity) const {
    FulfillmentService::ItemInput item;
    item.productId = productId;
    item.unitPrice = unitPrice;
    item.quantity = quantity;
    return item;
}

FulfillmentService::CreateOrderRequest FulfillmentTest::StandardOrder(std::vector<FulfillmentService::ItemInput> items, double advance) const {
    FulfillmentService::CreateOrderRequest request;
    request.kind = OrderKind::kStandard;
    request.client.partyName = "Acme Traders";
    request.client.mobile = "9800000001";
    request.items = std::move(items);
    request.advance = advance;
    request.employeeId = "emp-1";
    return request;
}

OrderRecord FulfillmentTest::PlaceOrder(std::vector<FulfillmentService::ItemInput> items, double advance) {
    FulfillmentError error;
    auto result = service_->CreateOrder(StandardOrder(std::move(items), advance), &error);
    EXPECT_TRUE(result.has_value()) << error.message;
    return result ? result->order : OrderRecord{};
}

DeliveryRecord FulfillmentTest::DeliverAll(const std::string& orderId) {
    FulfillmentService::CreateDeliveryRequest request;
    request.orderId = orderId;
    request.deliverAll = true;
    FulfillmentError error;
    auto result = service_->CreateDelivery(request, &error);
    EXPECT_TRUE(result.has_value()) << error.message;
    return result ? result->delivery : DeliveryRecord{};
}

DeliveryRecord FulfillmentTest::Deliver(const std::string& orderId, const std::string& lineId, std::int64_t quantity) {
    FulfillmentService::CreateDeliveryRequest request;
    request.orderId = orderId;
    FulfillmentService::DeliveryItemInput item;
    item.lineId = lineId;
    item.quantity = quantity;
    request.items.push_back(item);
    FulfillmentError error;
    auto result = service_->CreateDelivery(request, &error);
    EXPECT_TRUE(result.has_value()) << error.message;
    return result ? result->delivery : DeliveryRecord{};
}

OrderRecord FulfillmentTest::Pay(const std::string& orderId, double amount) {
    PaymentAllocator::PaymentInput input;
    input.amount = amount;
    FulfillmentError error;
    auto result = payments_->RecordOrderPayment(orderId, input, &error);
    EXPECT_TRUE(result.has_value()) << error.message;
    return result && !result->orders.empty() ? result->orders.front() : OrderRecord{};
}
