#pragma once
#include <source_location>

#include "Logger.h"

// 先比较级别再求值参数：被过滤的日志不会触发 std::format 与参数构造
#define FULFILLMENT_LOG_AT(level, fmt, ...)                                                                  \
    do {                                                                                                     \
        if ((level) >= ::Logger::instance().getLogLevel())                                                   \
            ::Logger::instance().logWithLocation((level), std::source_location::current(), fmt, ##__VA_ARGS__); \
    } while (0)

#define LOG_TRACE(fmt, ...) FULFILLMENT_LOG_AT(LogLevel::TRACE, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) FULFILLMENT_LOG_AT(LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) FULFILLMENT_LOG_AT(LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) FULFILLMENT_LOG_AT(LogLevel::WARN, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) FULFILLMENT_LOG_AT(LogLevel::ERROR, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) FULFILLMENT_LOG_AT(LogLevel::FATAL, fmt, ##__VA_ARGS__)
