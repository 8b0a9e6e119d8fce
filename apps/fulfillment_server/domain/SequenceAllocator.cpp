#include "domain/SequenceAllocator.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>

#include "LogMacros.h"

namespace {

constexpr int kFallbackAttempts = 100;

std::string FormatSequence(const std::string& monthPrefix, int sequence) {
    return std::format("{}{:04d}", monthPrefix, sequence);
}

}  // namespace

SequenceAllocator::SequenceAllocator(FulfillmentStore* store) : SequenceAllocator(store, Options{}) {}

SequenceAllocator::SequenceAllocator(FulfillmentStore* store, Options options) : store_(store), options_(options) {}

std::string_view SequenceAllocator::KindPrefix(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::kOrder:    return "ORD";
        case DocumentKind::kDelivery: return "DEL";
        case DocumentKind::kInvoice:  return "INV";
        case DocumentKind::kPayment:  return "PAY";
        case DocumentKind::kReturn:   return "RET";
    }
    return "DOC";
}

std::string SequenceAllocator::MonthPrefix(DocumentKind kind, TimePoint date) {
    std::time_t tt = Clock::to_time_t(date);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return std::format("{}{:02d}{:02d}", KindPrefix(kind), (tm.tm_year + 1900) % 100, tm.tm_mon + 1);
}

int SequenceAllocator::ParseSequence(const std::string& number, const std::string& monthPrefix) {
    if (number.compare(0, monthPrefix.size(), monthPrefix) != 0)
        return 0;
    int value = 0;
    std::size_t digits = 0;
    for (std::size_t i = monthPrefix.size(); i < number.size() && std::isdigit(static_cast<unsigned char>(number[i])); ++i) {
        value = value * 10 + (number[i] - '0');
        ++digits;
    }
    return digits == 0 ? 0 : value;
}

int SequenceAllocator::highestSequence(DocumentKind kind, const std::string& monthPrefix) const {
    if (!store_)
        return 0;
    auto highest = store_->FindHighestNumber(kind, monthPrefix);
    return highest ? ParseSequence(*highest, monthPrefix) : 0;
}

std::string SequenceAllocator::Next(DocumentKind kind, TimePoint date) const {
    const std::string prefix = MonthPrefix(kind, date);
    return FormatSequence(prefix, highestSequence(kind, prefix) + 1);
}

SequenceAllocator::Allocation SequenceAllocator::AllocateAndPersist(DocumentKind kind, TimePoint date, const PersistFn& persist) const {
    const std::string prefix = MonthPrefix(kind, date);
    Allocation result;
    int sequence = highestSequence(kind, prefix) + 1;

    for (int attempt = 1; attempt <= options_.maxAttempts; ++attempt) {
        result.number = FormatSequence(prefix, sequence);
        result.attempts = attempt;
        result.status = persist(result.number);
        if (result.status != StoreStatus::kDuplicateKey)
            return result;

        LOG_DEBUG("{} number {} taken (attempt {}/{})", ToString(kind), result.number, attempt, options_.maxAttempts);
        // 并发方可能已经跳过多个号，取两者较大者继续
        sequence = std::max(sequence + 1, highestSequence(kind, prefix) + 1);
    }

    // 重试耗尽：<prefix><seq>_<毫秒后缀>
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now().time_since_epoch()).count();
    long long suffix = epochMs % 1000000;
    result.fallback = true;
    for (int i = 0; i < kFallbackAttempts; ++i) {
        result.number = std::format("{}_{:06d}", FormatSequence(prefix, sequence), (suffix + i) % 1000000);
        ++result.attempts;
        result.status = persist(result.number);
        if (result.status != StoreStatus::kDuplicateKey) {
            LOG_WARN("{} numbering fell back to {} after {} collisions", ToString(kind), result.number, options_.maxAttempts);
            return result;
        }
    }
    LOG_ERROR("{} numbering exhausted fallback space for {}", ToString(kind), prefix);
    return result;
}

std::string GenerateDocumentId(std::string_view prefix) {
    static std::atomic<std::uint32_t> counter{0};
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now().time_since_epoch()).count();
    return std::format("{}-{:x}-{:04x}", prefix, micros, counter.fetch_add(1, std::memory_order_relaxed) & 0xffff);
}
