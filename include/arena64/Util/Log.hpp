#pragma once

#include <cstdarg>

namespace arena64 {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Off   = 5
};

// 当前阈值。首次调用时从环境变量 ARENA64_LOG_LEVEL 读取（默认 warn）。
LogLevel GetLogLevel() noexcept;
void     SetLogLevel(LogLevel level) noexcept;

// 解析 "trace|debug|info|warn|error|off"（大小写不敏感）；无法识别时返回 fallback
LogLevel ParseLogLevel(const char* text, LogLevel fallback) noexcept;
const char* LogLevelName(LogLevel level) noexcept;

inline bool ShouldLog(LogLevel level) noexcept {
    return level != LogLevel::Off &&
           static_cast<int>(level) >= static_cast<int>(GetLogLevel());
}

// 输出一行到 stderr：[arena64][LEVEL] message
void LogMessage(LogLevel level, const char* fmt, ...) noexcept
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

void LogMessageV(LogLevel level, const char* fmt, std::va_list args) noexcept;

} // namespace arena64

// 先判断阈值再格式化，关闭时不产生格式化开销
#define ARENA64_LOG(level, ...)                                  \
    do {                                                         \
        if (::arena64::ShouldLog(level)) {                       \
            ::arena64::LogMessage((level), __VA_ARGS__);         \
        }                                                        \
    } while (0)

#define ARENA64_LOG_TRACE(...) ARENA64_LOG(::arena64::LogLevel::Trace, __VA_ARGS__)
#define ARENA64_LOG_DEBUG(...) ARENA64_LOG(::arena64::LogLevel::Debug, __VA_ARGS__)
#define ARENA64_LOG_INFO(...)  ARENA64_LOG(::arena64::LogLevel::Info,  __VA_ARGS__)
#define ARENA64_LOG_WARN(...)  ARENA64_LOG(::arena64::LogLevel::Warn,  __VA_ARGS__)
#define ARENA64_LOG_ERROR(...) ARENA64_LOG(::arena64::LogLevel::Error, __VA_ARGS__)
