#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

#include "AsyncFileSink.h"

namespace {

std::string_view BaseName(std::string_view path) {
    const size_t pos = path.find_last_of("/\\");
    return (pos == std::string_view::npos) ? path : path.substr(pos + 1);
}

std::string_view ShortFunction(std::string_view fn) {
    // 先去参数列表，再去返回类型与类/命名空间限定
    const size_t paren = fn.find('(');
    if (paren != std::string_view::npos)
        fn = fn.substr(0, paren);
    const size_t space = fn.rfind(' ');
    if (space != std::string_view::npos)
        fn = fn.substr(space + 1);
    const size_t scope = fn.rfind("::");
    if (scope != std::string_view::npos)
        fn = fn.substr(scope + 2);
    const size_t angle = fn.find('<');
    if (angle != std::string_view::npos)
        fn = fn.substr(0, angle);
    return fn;
}

}  // namespace

LogLevel ParseLogLevel(std::string_view text, LogLevel fallback) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "TRACE")
        return LogLevel::TRACE;
    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "INFO")
        return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::WARN;
    if (upper == "ERROR")
        return LogLevel::ERROR;
    if (upper == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

Logger& Logger::instance() {
    static Logger globalLogger;
    return globalLogger;
}

Logger::Logger() = default;

Logger::~Logger() {
    shutdown();
}

void Logger::setLogLevel(LogLevel level) {
    logLevel_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::getLogLevel() const {
    return logLevel_.load(std::memory_order_relaxed);
}

void Logger::setOutputToConsole(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enable;
}

void Logger::setOutputToFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    asyncSink_.reset();

    fileOutput_ = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!fileOutput_->good()) {
        fileOutput_.reset();
        consoleOutput_ = true;
        std::cerr << "Logger: failed to open " << filename << ", fallback to console\n";
    }
}

void Logger::setOutputToFileAsync(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    fileOutput_.reset();

    try {
        asyncSink_ = std::make_unique<AsyncFileSink>(filename);
    } catch (const std::exception& e) {
        asyncSink_.reset();
        consoleOutput_ = true;
        std::cerr << "Logger: failed to open async file (" << e.what() << "), fallback to console\n";
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (asyncSink_) {
        asyncSink_->stop();
        asyncSink_.reset();
    }
    if (fileOutput_) {
        fileOutput_->flush();
        fileOutput_.reset();
    }
}

std::string Logger::formatLocCompact(const std::source_location& loc) {
    return std::format("[{}:{}:{}]", BaseName(loc.file_name()), ShortFunction(loc.function_name()), loc.line());
}

void Logger::write(LogLevel level, std::string_view msg) {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count() << " [tid:" << std::this_thread::get_id() << "] ["
        << levelToString(level) << "] " << msg << '\n';
    std::string line = oss.str();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (consoleOutput_)
            std::cout << line;
        if (asyncSink_) {
            asyncSink_->submit(std::move(line));
        } else if (fileOutput_) {
            *fileOutput_ << line;
            fileOutput_->flush();
        }
        if (level == LogLevel::FATAL && asyncSink_)
            asyncSink_->flushNow();
    }

    if (level == LogLevel::FATAL)
        std::abort();
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::FATAL:
        return "FATAL";
    }
    return "UNKNOWN";
}
