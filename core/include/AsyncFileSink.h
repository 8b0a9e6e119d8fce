#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "MPSCQueue.h"
#include "NonCopyable.h"

/**
 * @brief AsyncFileSink：异步文件日志通道
 *
 * 日志线程只负责入队；后台线程攒批写入，按字节阈值或时间间隔 fdatasync。
 */
class AsyncFileSink : NonCopyable {
public:
    struct Options {
        std::size_t syncBytes{4 * 1024 * 1024};  // 累计写入达到该值即刷盘
        std::size_t batchBytes{64 * 1024};  // 单次 write 的攒批上限
        int syncIntervalMs{1000};  // 定时刷盘间隔
    };

    explicit AsyncFileSink(const std::string& path);
    AsyncFileSink(const std::string& path, Options options);
    ~AsyncFileSink();

    // 提交一条完整日志（调用方保证以 '\n' 结尾）
    void submit(std::string&& line);

    // 停止后台线程，剩余日志写盘后关闭文件
    void stop();

    // FATAL 场景：在调用线程上立即排空并同步
    void flushNow();

private:
    void run();
    void writeAll(const std::string& data);

    int fd_{-1};
    Options options_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex writeMutex_;  // 后台线程与 flushNow 互斥写 fd

    std::unique_ptr<MPSCQueue<std::string>> queue_;
    std::condition_variable cv_;
    std::mutex cvMutex_;
};
