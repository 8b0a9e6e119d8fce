#include "RedisPool.h"
#include "LogMacros.h"

RedisPool::RedisPool(const std::string& host, int port, size_t pool_size, const std::string& password, int timeout_ms) :
    host_(host), port_(port), password_(password), acquireTimeout_(timeout_ms) {
    timeout_.tv_sec = timeout_ms / 1000;
    timeout_.tv_usec = (timeout_ms % 1000) * 1000;

    for (size_t i = 0; i < pool_size; ++i) {
        auto client = std::make_unique<RedisClient>(host_, port_, password_, timeout_);
        // 连接失败的客户端也入池，借出时由 RedisClient::EnsureConnected 惰性重连
        if (!client->Connect())
            LOG_WARN("[RedisPool] Client {} not connected yet", i);
        clients_.push(std::move(client));
    }
    LOG_INFO("[RedisPool] Pool ready -> {}:{} (size = {})", host_, port_, pool_size);
}

RedisPool::~RedisPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!clients_.empty())
        clients_.pop();
}

std::shared_ptr<RedisClient> RedisPool::GetClient() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cond_.wait_for(lock, acquireTimeout_, [this]() { return !clients_.empty(); })) {
        LOG_WARN("[RedisPool] No client available within {} ms", acquireTimeout_.count());
        return nullptr;
    }

    auto client = std::move(clients_.front());
    clients_.pop();

    std::weak_ptr<RedisPool> weakSelf = shared_from_this();
    return std::shared_ptr<RedisClient>(client.release(), [weakSelf](RedisClient* ptr) {
        if (auto self = weakSelf.lock())
            self->Release(ptr);
        else
            delete ptr;  // pool 已销毁，直接释放
    });
}

size_t RedisPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

void RedisPool::Release(RedisClient* client) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients_.push(std::unique_ptr<RedisClient>(client));
    }
    cond_.notify_one();
}
