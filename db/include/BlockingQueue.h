#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

// 有界之外的简单阻塞队列：多生产者多消费者，Close 之后不再接收新元素，已入队元素仍可取出
template <typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;
    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    // 队列已关闭时返回 false，元素被丢弃
    bool Push(T value) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_)
                return false;
            items_.push_back(std::move(value));
        }
        notEmpty_.notify_one();
        return true;
    }

    // 阻塞出队；队列关闭且为空时返回 false
    bool Pop(T& value) {
        std::unique_lock<std::mutex> lock(mtx_);
        notEmpty_.wait(lock, [this]() { return !items_.empty() || closed_; });
        if (items_.empty())
            return false;
        value = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        notEmpty_.notify_all();
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable notEmpty_;
    std::deque<T> items_;
    bool closed_{false};
};
