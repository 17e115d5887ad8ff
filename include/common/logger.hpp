#pragma once

#include "containers/lock_free_queue.hpp"
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>

namespace dexbook {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

/// Parses "debug" / "info" / "warn" / "error"; anything else yields fallback.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::Info);

struct LogEntry {
    char message[240];
    LogLevel level;
    uint64_t timestamp_ns;
};

/// Asynchronous logger. Callers format into a fixed-size LogEntry and push it
/// onto an SPSC ring; a drain thread writes lines to the output stream.
/// Producers from several threads take a spin flag before pushing.
/// Entries pushed while the drain thread is not running are written on stop().
class Logger {
public:
    static Logger& instance();

    void start();
    void stop();

    void log(LogLevel level, const char* msg);
    void logf(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    void set_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const { return min_level_.load(std::memory_order_relaxed); }

    /// Redirect output to a file (appending). Returns false and keeps the
    /// current stream if the file cannot be opened. Call while stopped.
    bool open_file(const std::string& path);

    uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    Logger();
    ~Logger();

    void push(const LogEntry& entry);
    void write(const LogEntry& entry);
    void drain_loop();

    LockFreeRingBuffer<LogEntry, 8192> queue_;
    std::atomic_flag producer_lock_ = ATOMIC_FLAG_INIT;
    std::atomic<bool> running_{false};
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    std::atomic<uint64_t> dropped_{0};
    std::thread drain_thread_;
    FILE* output_ = stderr;
    bool owns_output_ = false;
};

#ifdef NDEBUG
#define LOG_DEBUG(msg) ((void)0)
#define LOG_DEBUGF(...) ((void)0)
#else
#define LOG_DEBUG(msg) do { \
    if (::dexbook::Logger::instance().level() <= ::dexbook::LogLevel::Debug) \
        ::dexbook::Logger::instance().log(::dexbook::LogLevel::Debug, msg); \
} while(0)
#define LOG_DEBUGF(...) do { \
    if (::dexbook::Logger::instance().level() <= ::dexbook::LogLevel::Debug) \
        ::dexbook::Logger::instance().logf(::dexbook::LogLevel::Debug, __VA_ARGS__); \
} while(0)
#endif

#define LOG_INFO(msg)  do { ::dexbook::Logger::instance().log(::dexbook::LogLevel::Info, msg); } while(0)
#define LOG_WARN(msg)  do { ::dexbook::Logger::instance().log(::dexbook::LogLevel::Warn, msg); } while(0)
#define LOG_ERROR(msg) do { ::dexbook::Logger::instance().log(::dexbook::LogLevel::Error, msg); } while(0)

#define LOG_INFOF(...)  do { ::dexbook::Logger::instance().logf(::dexbook::LogLevel::Info, __VA_ARGS__); } while(0)
#define LOG_WARNF(...)  do { ::dexbook::Logger::instance().logf(::dexbook::LogLevel::Warn, __VA_ARGS__); } while(0)
#define LOG_ERRORF(...) do { ::dexbook::Logger::instance().logf(::dexbook::LogLevel::Error, __VA_ARGS__); } while(0)

} // namespace dexbook
