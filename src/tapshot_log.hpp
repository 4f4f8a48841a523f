// =============================================================================
// Tapshot - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional size-rotated file output.
// Usage: TLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <algorithm>
#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>
#include <atomic>

#include <pthread.h>

namespace tapshot::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;
inline std::string g_log_path;
inline long g_max_bytes = 0;   // 0 = never rotate
inline int g_backups = 0;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

inline void setLogLevel(Level l) { g_min_level = l; }

// "trace" / "debug" / "info" / "warn" / "error" / "fatal"; unknown -> Info
inline Level parseLevel(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// Caller holds g_log_mutex.
inline void rotateLocked() {
    if (!g_log_file || g_log_path.empty()) return;
    fclose(g_log_file);
    g_log_file = nullptr;
    if (g_backups > 0) {
        std::string oldest = g_log_path + "." + std::to_string(g_backups);
        std::remove(oldest.c_str());
        for (int i = g_backups - 1; i >= 1; --i) {
            std::string from = g_log_path + "." + std::to_string(i);
            std::string to = g_log_path + "." + std::to_string(i + 1);
            std::rename(from.c_str(), to.c_str());
        }
        std::string first = g_log_path + ".1";
        std::rename(g_log_path.c_str(), first.c_str());
    }
    g_log_file = fopen(g_log_path.c_str(), "w");
}

inline bool openLogFile(const char* path, long max_bytes = 0, int backups = 0) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_path = path;
    g_max_bytes = max_bytes;
    g_backups = backups;
    g_log_file = fopen(path, "a");
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
    g_log_path.clear();
}

// "HH:MM:SS.mmm [LEVEL] [tag] (Tnnnnn) "
inline int formatPrefix(char* buf, size_t size, Level level, const char* tag) {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    int ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);
    std::tm local{};
    localtime_r(&secs, &local);
    unsigned long tid = static_cast<unsigned long>(pthread_self()) % 100000;
    return snprintf(buf, size, "%02d:%02d:%02d.%03d [%s] [%s] (T%lu) ",
                    local.tm_hour, local.tm_min, local.tm_sec, ms, levelStr(level), tag, tid);
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;

    char line[2304];
    int n = formatPrefix(line, sizeof(line), level, tag);
    if (n < 0) return;
    size_t used = std::min(static_cast<size_t>(n), sizeof(line) - 1);

    va_list args;
    va_start(args, fmt);
    vsnprintf(line + used, sizeof(line) - used, fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "%s\n", line);
    if (!g_log_file) return;
    fprintf(g_log_file, "%s\n", line);
    fflush(g_log_file);
    if (g_max_bytes > 0 && ftell(g_log_file) >= g_max_bytes) rotateLocked();
}

} // namespace tapshot::log

#define TLOG_TRACE(tag, fmt, ...) tapshot::log::write(tapshot::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define TLOG_DEBUG(tag, fmt, ...) tapshot::log::write(tapshot::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define TLOG_INFO(tag, fmt, ...)  tapshot::log::write(tapshot::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define TLOG_WARN(tag, fmt, ...)  tapshot::log::write(tapshot::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define TLOG_ERROR(tag, fmt, ...) tapshot::log::write(tapshot::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define TLOG_FATAL(tag, fmt, ...) tapshot::log::write(tapshot::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
