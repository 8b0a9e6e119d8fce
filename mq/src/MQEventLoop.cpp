#include "MQEventLoop.h"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "LogMacros.h"

namespace {

constexpr int kMaxEvents = 16;
constexpr int kPollTimeoutMs = 1000;

std::uint32_t ToEpollEvents(int interest) {
    std::uint32_t events = 0;
    if (interest & MQEventLoop::kReadable)
        events |= EPOLLIN | EPOLLPRI;
    if (interest & MQEventLoop::kWritable)
        events |= EPOLLOUT;
    return events;
}

}  // namespace

MQEventLoop::MQEventLoop() : epollFd_(::epoll_create1(EPOLL_CLOEXEC)), wakeupFd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
    if (epollFd_ < 0 || wakeupFd_ < 0)
        throw std::runtime_error(std::string("MQEventLoop: epoll/eventfd creation failed: ") + std::strerror(errno));

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wakeupFd_;
    if (::epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeupFd_, &ev) < 0)
        throw std::runtime_error("MQEventLoop: failed to register wakeup fd");
}

MQEventLoop::~MQEventLoop() {
    quit();
    if (thread_.joinable())
        thread_.join();
    ::close(wakeupFd_);
    ::close(epollFd_);
}

void MQEventLoop::startThread() {
    if (thread_.joinable())
        return;
    thread_ = std::thread([this]() { loop(); });
}

void MQEventLoop::loop() {
    looping_.store(true);
    loopThreadId_.store(std::this_thread::get_id());
    LOG_DEBUG("MQEventLoop started");

    epoll_event events[kMaxEvents];
    while (!quit_.load(std::memory_order_acquire)) {
        int n = ::epoll_wait(epollFd_, events, kMaxEvents, kPollTimeoutMs);
        if (n < 0) {
            if (errno != EINTR)
                LOG_ERROR("MQEventLoop epoll_wait error: {}", std::strerror(errno));
            continue;
        }
        for (int i = 0; i < n; ++i) {
            const int fd = events[i].data.fd;
            if (fd == wakeupFd_) {
                drainWakeup();
                continue;
            }
            int ready = kNone;
            if (events[i].events & (EPOLLIN | EPOLLPRI | EPOLLHUP | EPOLLERR))
                ready |= kReadable;
            if (events[i].events & EPOLLOUT)
                ready |= kWritable;
            auto it = callbacks_.find(fd);
            if (it != callbacks_.end()) {
                // 回调内部可能 unwatch 自己，先拷贝
                IoCallback cb = it->second;
                cb(ready);
            }
        }
        runPendingTasks();
    }
    runPendingTasks();
    looping_.store(false);
    LOG_DEBUG("MQEventLoop stopped");
}

void MQEventLoop::quit() {
    quit_.store(true, std::memory_order_release);
    wakeup();
}

bool MQEventLoop::isInLoopThread() const {
    return loopThreadId_.load() == std::this_thread::get_id();
}

void MQEventLoop::runInLoop(Task task) {
    if (isInLoopThread())
        task();
    else
        queueInLoop(std::move(task));
}

void MQEventLoop::queueInLoop(Task task) {
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        pendingTasks_.push_back(std::move(task));
    }
    wakeup();
}

void MQEventLoop::watch(int fd, int interest, IoCallback cb) {
    epoll_event ev{};
    ev.events = ToEpollEvents(interest);
    ev.data.fd = fd;
    const bool known = callbacks_.count(fd) > 0;
    callbacks_[fd] = std::move(cb);
    if (::epoll_ctl(epollFd_, known ? EPOLL_CTL_MOD : EPOLL_CTL_ADD, fd, &ev) < 0)
        LOG_ERROR("MQEventLoop epoll_ctl({}) fd={} failed: {}", known ? "MOD" : "ADD", fd, std::strerror(errno));
}

void MQEventLoop::unwatch(int fd) {
    if (callbacks_.erase(fd) == 0)
        return;
    // fd 可能已被 AMQP-CPP 关闭，EBADF / ENOENT 属正常
    if (::epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr) < 0 && errno != EBADF && errno != ENOENT)
        LOG_WARN("MQEventLoop epoll_ctl(DEL) fd={} failed: {}", fd, std::strerror(errno));
}

void MQEventLoop::wakeup() {
    std::uint64_t one = 1;
    ssize_t n = ::write(wakeupFd_, &one, sizeof(one));
    if (n != sizeof(one) && errno != EAGAIN)
        LOG_WARN("MQEventLoop wakeup write failed: {}", std::strerror(errno));
}

void MQEventLoop::drainWakeup() {
    std::uint64_t value = 0;
    while (::read(wakeupFd_, &value, sizeof(value)) > 0) {
    }
}

void MQEventLoop::runPendingTasks() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        tasks.swap(pendingTasks_);
    }
    for (auto& task : tasks)
        task();
}
