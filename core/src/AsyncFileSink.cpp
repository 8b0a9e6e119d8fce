#include "AsyncFileSink.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <stdexcept>

AsyncFileSink::AsyncFileSink(const std::string& path) : AsyncFileSink(path, Options{}) {}

AsyncFileSink::AsyncFileSink(const std::string& path, Options options) : options_(options), queue_(std::make_unique<MPSCQueue<std::string>>()) {
    fd_ = ::open(path.c_str(), O_CREAT | O_APPEND | O_WRONLY | O_CLOEXEC, 0644);
    if (fd_ < 0)
        throw std::runtime_error("AsyncFileSink: failed to open " + path);
    running_.store(true, std::memory_order_relaxed);
    worker_ = std::thread(&AsyncFileSink::run, this);
}

AsyncFileSink::~AsyncFileSink() {
    stop();
}

void AsyncFileSink::submit(std::string&& line) {
    queue_->enqueue(std::move(line));
    { std::lock_guard<std::mutex> lk(cvMutex_); }
    cv_.notify_one();
}

void AsyncFileSink::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false))
        return;
    cv_.notify_one();
    if (worker_.joinable())
        worker_.join();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void AsyncFileSink::flushNow() {
    std::string pending;
    queue_->drain([&pending](std::string&& s) { pending.append(s); });
    std::lock_guard<std::mutex> lock(writeMutex_);
    writeAll(pending);
    if (fd_ >= 0)
        ::fdatasync(fd_);
}

void AsyncFileSink::writeAll(const std::string& data) {
    std::size_t offset = 0;
    while (fd_ >= 0 && offset < data.size()) {
        ssize_t n = ::write(fd_, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return;  // 磁盘错误时丢弃本批，不阻塞业务线程
        }
        offset += static_cast<std::size_t>(n);
    }
}

void AsyncFileSink::run() {
    using Clock = std::chrono::steady_clock;
    auto nextSync = Clock::now() + std::chrono::milliseconds(options_.syncIntervalMs);

    std::string batch;
    batch.reserve(options_.batchBytes);
    std::size_t bytesSinceSync = 0;

    auto flushBatch = [&](bool sync) {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (!batch.empty()) {
            writeAll(batch);
            bytesSinceSync += batch.size();
            batch.clear();
        }
        if (sync && fd_ >= 0) {
            ::fdatasync(fd_);
            bytesSinceSync = 0;
        }
    };

    while (running_.load(std::memory_order_relaxed)) {
        std::string line;
        if (queue_->dequeue(line)) {
            batch.append(line);
        } else {
            if (!batch.empty())
                flushBatch(false);
            std::unique_lock<std::mutex> lk(cvMutex_);
            cv_.wait_until(lk, nextSync);
        }

        const auto now = Clock::now();
        if (batch.size() >= options_.batchBytes)
            flushBatch(false);
        if (bytesSinceSync >= options_.syncBytes || now >= nextSync) {
            flushBatch(true);
            nextSync = now + std::chrono::milliseconds(options_.syncIntervalMs);
        }
    }

    // 最后一轮排空
    queue_->drain([&batch](std::string&& s) { batch.append(s); });
    flushBatch(true);
}
