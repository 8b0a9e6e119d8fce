#pragma once

#include <atomic>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>

#include "NonCopyable.h"

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// "info" / "WARN" / "Error" 均可；无法识别时返回 fallback
LogLevel ParseLogLevel(std::string_view text, LogLevel fallback = LogLevel::INFO);

class AsyncFileSink;

/**
 * @brief Logger：进程级日志单例
 *
 * 输出通道：控制台、同步文件、异步文件（后台线程批量落盘）。
 * 调用方通过 LogMacros.h 中的 LOG_* 宏使用，宏负责注入调用点位置。
 */
class Logger : NonCopyable {
public:
    static Logger& instance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    void setOutputToConsole(bool enable);
    void setOutputToFile(const std::string& filename);
    void setOutputToFileAsync(const std::string& filename);

    // 刷新并关闭文件通道（进程退出前调用）
    void shutdown();

    // 供宏调用：必须显式传 loc 才能拿到真实调用点
    template <typename... Args>
    void logWithLocation(LogLevel level, const std::source_location& loc, std::format_string<Args...> fmt, Args&&... args) {
        if (level < logLevel_.load(std::memory_order_relaxed))
            return;

        std::string body = std::format(fmt, std::forward<Args>(args)...);
        write(level, std::format("{} {}", formatLocCompact(loc), body));
    }

private:
    Logger();
    ~Logger();

    void write(LogLevel level, std::string_view msg);

    static const char* levelToString(LogLevel level);

    // 将 [绝对路径/参数展开] → [短文件名:短函数名:行]
    static std::string formatLocCompact(const std::source_location& loc);

    std::atomic<LogLevel> logLevel_{LogLevel::INFO};
    mutable std::mutex mutex_;
    bool consoleOutput_{true};
    std::unique_ptr<std::ofstream> fileOutput_;
    std::unique_ptr<AsyncFileSink> asyncSink_;
};
