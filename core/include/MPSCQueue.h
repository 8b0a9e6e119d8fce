#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>

// 多生产者 / 单消费者无锁链表队列（Vyukov 风格，带哨兵节点）
// enqueue 可被任意线程并发调用；dequeue / drain 只允许一个消费线程调用
template <typename T>
class MPSCQueue {
    struct Node {
        T value;
        std::atomic<Node*> next{nullptr};
        Node() = default;
        explicit Node(T&& v) : value(std::move(v)) {}
    };

public:
    MPSCQueue() {
        Node* stub = new Node();
        head_ = stub;
        tail_.store(stub, std::memory_order_relaxed);
    }

    ~MPSCQueue() {
        T tmp;
        while (dequeue(tmp)) {
        }
        delete head_;
    }

    MPSCQueue(const MPSCQueue&) = delete;
    MPSCQueue& operator=(const MPSCQueue&) = delete;

    void enqueue(T&& value) {
        Node* node = new Node(std::move(value));
        Node* prev = tail_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);
    }

    bool dequeue(T& out) {
        Node* next = head_->next.load(std::memory_order_acquire);
        if (!next)
            return false;
        out = std::move(next->value);
        delete head_;
        head_ = next;
        return true;
    }

    template <typename F>
    std::size_t drain(F&& fn, std::size_t maxItems = SIZE_MAX) {
        std::size_t n = 0;
        T item;
        while (n < maxItems && dequeue(item)) {
            fn(std::move(item));
            ++n;
        }
        return n;
    }

private:
    std::atomic<Node*> tail_;
    Node* head_;
};
