#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "NonCopyable.h"

/**
 * @brief MQEventLoop：驱动 AMQP-CPP TcpConnection 的 epoll 事件循环
 *
 * 单线程 reactor：fd 读写就绪时回调，跨线程任务经 eventfd 唤醒后在循环线程执行。
 * AMQP-CPP 的连接 / channel 非线程安全，所有 AMQP 调用都必须经 runInLoop 投递。
 */
class MQEventLoop : NonCopyable {
public:
    enum Interest : int { kNone = 0, kReadable = 1, kWritable = 2 };

    using Task = std::function<void()>;
    using IoCallback = std::function<void(int readyFlags)>;

    MQEventLoop();
    ~MQEventLoop();

    // 在后台线程启动循环；重复调用无副作用
    void startThread();
    // 阻塞运行，直到 quit()
    void loop();
    void quit();

    bool isInLoopThread() const;
    void runInLoop(Task task);
    void queueInLoop(Task task);

    // 仅能在循环线程调用
    void watch(int fd, int interest, IoCallback cb);
    void unwatch(int fd);

private:
    void wakeup();
    void drainWakeup();
    void runPendingTasks();

    int epollFd_{-1};
    int wakeupFd_{-1};
    std::atomic<bool> quit_{false};
    std::atomic<bool> looping_{false};
    std::thread thread_;
    std::atomic<std::thread::id> loopThreadId_{};

    std::mutex taskMutex_;
    std::vector<Task> pendingTasks_;

    std::unordered_map<int, IoCallback> callbacks_;
};
