#include "arena64/Util/Log.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace arena64 {

namespace {

constexpr int kUnset = -1;
constexpr LogLevel kDefaultLevel = LogLevel::Warn;

std::atomic<int> g_log_level{kUnset};

bool EqualsIgnoreCase(const char* a, const char* b) noexcept {
    for (; *a && *b; ++a, ++b) {
        if (std::tolower(static_cast<unsigned char>(*a)) !=
            std::tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
    }
    return *a == *b;
}

LogLevel LevelFromEnvironment() noexcept {
    return ParseLogLevel(std::getenv("ARENA64_LOG_LEVEL"), kDefaultLevel);
}

} // namespace

// ===================== 阈值 =====================

LogLevel GetLogLevel() noexcept {
    int level = g_log_level.load(std::memory_order_relaxed);
    if (level == kUnset) {
        // 多个线程同时初始化时结果相同，谁写入都可以
        int expected = kUnset;
        g_log_level.compare_exchange_strong(expected,
                                            static_cast<int>(LevelFromEnvironment()),
                                            std::memory_order_relaxed);
        level = g_log_level.load(std::memory_order_relaxed);
    }
    return static_cast<LogLevel>(level);
}

void SetLogLevel(LogLevel level) noexcept {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel ParseLogLevel(const char* text, LogLevel fallback) noexcept {
    if (!text || !*text) return fallback;

    static const struct {
        const char* name;
        LogLevel    level;
    } kNames[] = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info",  LogLevel::Info},
        {"warn",  LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"off",   LogLevel::Off},
    };

    for (const auto& entry : kNames) {
        if (EqualsIgnoreCase(text, entry.name)) return entry.level;
    }
    return fallback;
}

const char* LogLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

// ===================== 输出 =====================

void LogMessage(LogLevel level, const char* fmt, ...) noexcept {
    std::va_list args;
    va_start(args, fmt);
    LogMessageV(level, fmt, args);
    va_end(args);
}

void LogMessageV(LogLevel level, const char* fmt, std::va_list args) noexcept {
    // 先整行格式化到栈缓冲区，再一次性写出，避免多线程输出交错
    char line[512];
    int prefix = std::snprintf(line, sizeof(line), "[arena64][%s] ", LogLevelName(level));
    if (prefix < 0) return;

    std::size_t used = static_cast<std::size_t>(prefix);
    if (used < sizeof(line)) {
        int body = std::vsnprintf(line + used, sizeof(line) - used, fmt, args);
        if (body > 0) used += static_cast<std::size_t>(body);
    }
    if (used >= sizeof(line) - 1) used = sizeof(line) - 2;  // 截断

    line[used]     = '\n';
    line[used + 1] = '\0';
    std::fputs(line, stderr);
}

} // namespace arena64
