// =============================================================================
// PrinterHub - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: PHLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <algorithm>
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>
#include <atomic>
#include <thread>
#include <functional>
#include <cstring>
#include <strings.h>

namespace printerhub::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;
inline bool g_log_to_console = true;

inline const char* levelStr(Level l) {
    static const char* const kTags[] = {"TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};
    const auto i = static_cast<size_t>(l);
    return i < sizeof(kTags) / sizeof(kTags[0]) ? kTags[i] : "?????";
}

// "trace" / "debug" / "info" / "warn" / "error" / "fatal" (case-insensitive).
// Unknown names fall back to Info.
inline Level parseLevel(const std::string& name) {
    static const struct { const char* name; Level level; } kNames[] = {
        {"trace", Level::Trace}, {"debug", Level::Debug}, {"info", Level::Info},
        {"warn", Level::Warn}, {"warning", Level::Warn}, {"error", Level::Error},
        {"fatal", Level::Fatal},
    };
    for (const auto& n : kNames) {
        if (strcasecmp(name.c_str(), n.name) == 0) return n.level;
    }
    return Level::Info;
}

inline void setLogLevel(Level l) { g_min_level = l; }
inline Level logLevel() { return g_min_level.load(std::memory_order_relaxed); }

inline void setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_to_console = enabled;
}

// Truncates: one log per process run
inline bool openLogFile(const char* path) {
    FILE* file = std::fopen(path, "w");
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) std::fclose(g_log_file);
    g_log_file = file;
    return file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_log_file) return;
    std::fclose(g_log_file);
    g_log_file = nullptr;
}

inline void write(Level level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

// "2026-10-18 14:03:07.512 [INFO ] [Polling] (T4821) message"
inline size_t formatPrefix(char* out, size_t size, Level level, const char* tag) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const int millis = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm local{};
    localtime_r(&secs, &local);

    // std::thread::id has no portable integer form
    const unsigned long thread_tag = static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);

    size_t n = std::strftime(out, size, "%Y-%m-%d %H:%M:%S", &local);
    int w = std::snprintf(out + n, size - n, ".%03d [%s] [%s] (T%lu) ",
                          millis, levelStr(level), tag, thread_tag);
    if (w > 0) n += static_cast<size_t>(w);
    return n < size ? n : size - 1;
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < logLevel()) return;

    char line[2304];
    size_t n = formatPrefix(line, sizeof(line) - 1, level, tag);
    va_list args;
    va_start(args, fmt);
    int w = std::vsnprintf(line + n, sizeof(line) - 1 - n, fmt, args);
    va_end(args);
    if (w > 0) n = std::min(n + static_cast<size_t>(w), sizeof(line) - 2);
    line[n++] = '\n';
    line[n] = '\0';

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_to_console) std::fputs(line, stderr);
    if (g_log_file) {
        std::fputs(line, g_log_file);
        std::fflush(g_log_file);
    }
}

} // namespace printerhub::log

#define PHLOG_TRACE(tag, fmt, ...) printerhub::log::write(printerhub::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define PHLOG_DEBUG(tag, fmt, ...) printerhub::log::write(printerhub::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define PHLOG_INFO(tag, fmt, ...)  printerhub::log::write(printerhub::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define PHLOG_WARN(tag, fmt, ...)  printerhub::log::write(printerhub::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define PHLOG_ERROR(tag, fmt, ...) printerhub::log::write(printerhub::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define PHLOG_FATAL(tag, fmt, ...) printerhub::log::write(printerhub::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
