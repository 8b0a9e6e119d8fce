#include <ctime>
#include <set>
#include <thread>

#include "test_support.h"

namespace {

TimePoint LocalDate(int year, int month, int day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

}  // namespace

class SequenceAllocatorTest : public FulfillmentTest {};

TEST_F(SequenceAllocatorTest, MonthPrefixUsesKindAndLocalYearMonth) {
    const TimePoint date = LocalDate(2026, 10, 15);

    EXPECT_EQ(SequenceAllocator::MonthPrefix(DocumentKind::kOrder, date), "ORD2610");
    EXPECT_EQ(SequenceAllocator::MonthPrefix(DocumentKind::kDelivery, date), "DEL2610");
    EXPECT_EQ(SequenceAllocator::MonthPrefix(DocumentKind::kInvoice, date), "INV2610");
    EXPECT_EQ(SequenceAllocator::MonthPrefix(DocumentKind::kPayment, date), "PAY2610");
    EXPECT_EQ(SequenceAllocator::MonthPrefix(DocumentKind::kReturn, LocalDate(2027, 1, 3)), "RET2701");
}

TEST_F(SequenceAllocatorTest, ParseSequenceReadsNumericSuffix) {
    EXPECT_EQ(SequenceAllocator::ParseSequence("ORD26100007", "ORD2610"), 7);
    EXPECT_EQ(SequenceAllocator::ParseSequence("ORD26100012_123456", "ORD2610"), 12);
    EXPECT_EQ(SequenceAllocator::ParseSequence("DEL26100007", "ORD2610"), 0);
    EXPECT_EQ(SequenceAllocator::ParseSequence("ORD2610", "ORD2610"), 0);
}

TEST_F(SequenceAllocatorTest, NextStartsAtOneAndFollowsHighestExisting) {
    // Given: 本月还没有任何订单
    const TimePoint date = LocalDate(2026, 10, 15);
    EXPECT_EQ(sequences_->Next(DocumentKind::kOrder, date), "ORD26100001");

    // When: 已存在 0001 与 0007
    for (const char* number : {"ORD26100001", "ORD26100007"}) {
        OrderRecord order;
        order.orderId = std::string("id-") + number;
        order.orderNumber = number;
        ASSERT_EQ(store_->InsertOrder(order), StoreStatus::kOk);
    }

    // Then: 下一个号接在最大号之后，其他月份与种类不受影响
    EXPECT_EQ(sequences_->Next(DocumentKind::kOrder, date), "ORD26100008");
    EXPECT_EQ(sequences_->Next(DocumentKind::kOrder, LocalDate(2026, 11, 2)), "ORD26110001");
    EXPECT_EQ(sequences_->Next(DocumentKind::kDelivery, date), "DEL26100001");
}

TEST_F(SequenceAllocatorTest, SequencePastFourDigitsKeepsIncreasing) {
    // Given: 本月已经用到第 10000 号，字典序上 "ORD261010000" < "ORD26109999"
    const TimePoint date = LocalDate(2026, 10, 15);
    for (const char* number : {"ORD26109998", "ORD26109999", "ORD261010000"}) {
        OrderRecord order;
        order.orderId = std::string("id-") + number;
        order.orderNumber = number;
        ASSERT_EQ(store_->InsertOrder(order), StoreStatus::kOk);
    }

    // When
    auto highest = store_->FindHighestNumber(DocumentKind::kOrder, "ORD2610");
    auto allocation = sequences_->AllocateAndPersist(DocumentKind::kOrder, date, [&](const std::string& number) {
        OrderRecord order;
        order.orderId = "id-next";
        order.orderNumber = number;
        return store_->InsertOrder(order);
    });

    // Then: 按数值取最大号，不发生冲突也不走后缀兜底
    ASSERT_TRUE(highest.has_value());
    EXPECT_EQ(*highest, "ORD261010000");
    EXPECT_EQ(allocation.status, StoreStatus::kOk);
    EXPECT_EQ(allocation.number, "ORD261010001");
    EXPECT_EQ(allocation.attempts, 1);
    EXPECT_FALSE(allocation.fallback);
}

TEST_F(SequenceAllocatorTest, DuplicateKeyRetriesWithNextSequence) {
    // Given: 前两个候选号都被并发方占用
    const TimePoint date = LocalDate(2026, 10, 15);
    int calls = 0;

    // When
    auto allocation = sequences_->AllocateAndPersist(DocumentKind::kInvoice, date, [&](const std::string&) {
        return ++calls <= 2 ? StoreStatus::kDuplicateKey : StoreStatus::kOk;
    });

    // Then
    EXPECT_EQ(allocation.status, StoreStatus::kOk);
    EXPECT_EQ(allocation.number, "INV26100003");
    EXPECT_EQ(allocation.attempts, 3);
    EXPECT_FALSE(allocation.fallback);
}

TEST_F(SequenceAllocatorTest, ExhaustedRetriesFallBackToSuffixedNumber) {
    // Given: 所有普通编号都冲突，只有带后缀的编号能写入
    const TimePoint date = LocalDate(2026, 10, 15);
    std::vector<std::string> tried;

    // When
    auto allocation = sequences_->AllocateAndPersist(DocumentKind::kOrder, date, [&](const std::string& number) {
        tried.push_back(number);
        return number.find('_') == std::string::npos ? StoreStatus::kDuplicateKey : StoreStatus::kOk;
    });

    // Then: 调用方从不因为编号冲突收到错误
    EXPECT_EQ(allocation.status, StoreStatus::kOk);
    EXPECT_TRUE(allocation.fallback);
    EXPECT_EQ(allocation.number.rfind("ORD26100006_", 0), 0u) << allocation.number;
    EXPECT_EQ(allocation.number.size(), std::string("ORD26100006_123456").size());
    EXPECT_EQ(tried.size(), 6u);
}

TEST_F(SequenceAllocatorTest, NonDuplicateFailureIsReturnedWithoutRetry) {
    int calls = 0;
    auto allocation = sequences_->AllocateAndPersist(DocumentKind::kPayment, Clock::now(), [&](const std::string&) {
        ++calls;
        return StoreStatus::kUnavailable;
    });

    EXPECT_EQ(allocation.status, StoreStatus::kUnavailable);
    EXPECT_EQ(calls, 1);
}

TEST_F(SequenceAllocatorTest, ConcurrentOrdersReceiveDistinctNumbers) {
    // Given: 不跟踪库存的商品，8 个线程同时下单
    AddProduct("P-SVC", "Service", 10.0, std::nullopt);
    constexpr int kThreads = 8;
    std::vector<std::string> numbers(kThreads);
    std::vector<std::thread> threads;

    // When
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            auto result = service_->CreateOrder(StandardOrder({Item("P-SVC", 10.0, 1)}));
            if (result)
                numbers[i] = result->order.orderNumber;
        });
    }
    for (auto& t : threads)
        t.join();

    // Then
    std::set<std::string> unique(numbers.begin(), numbers.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads));
    EXPECT_EQ(unique.count(""), 0u);
}
