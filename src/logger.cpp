#include "common/logger.hpp"
#include "common/types.hpp"
#include <chrono>
#include <cstdarg>
#include <cstring>

namespace dexbook {

namespace {

const char* level_name(LogLevel level) {
    static const char* names[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};
    int idx = static_cast<int>(level);
    if (idx < 0 || idx > 3) idx = 1;
    return names[idx];
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return fallback;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() = default;

Logger::~Logger() {
    stop();
    if (owns_output_ && output_) {
        fclose(output_);
    }
}

bool Logger::open_file(const std::string& path) {
    FILE* f = fopen(path.c_str(), "a");
    if (!f) return false;
    if (owns_output_ && output_) {
        fclose(output_);
    }
    output_ = f;
    owns_output_ = true;
    return true;
}

void Logger::start() {
    if (running_.exchange(true)) return;
    drain_thread_ = std::thread(&Logger::drain_loop, this);
}

void Logger::stop() {
    if (running_.exchange(false)) {
        if (drain_thread_.joinable()) {
            drain_thread_.join();
        }
    }
    queue_.drain([this](const LogEntry& entry) { write(entry); });
    fflush(output_);
}

void Logger::log(LogLevel level, const char* msg) {
    if (level < this->level()) return;

    LogEntry entry;
    entry.level = level;
    entry.timestamp_ns = now_ns();
    strncpy(entry.message, msg, sizeof(entry.message) - 1);
    entry.message[sizeof(entry.message) - 1] = '\0';
    push(entry);
}

void Logger::logf(LogLevel level, const char* fmt, ...) {
    if (level < this->level()) return;

    LogEntry entry;
    entry.level = level;
    entry.timestamp_ns = now_ns();
    va_list args;
    va_start(args, fmt);
    vsnprintf(entry.message, sizeof(entry.message), fmt, args);
    va_end(args);
    push(entry);
}

void Logger::push(const LogEntry& entry) {
    while (producer_lock_.test_and_set(std::memory_order_acquire)) {
        std::this_thread::yield();
    }
    bool pushed = queue_.try_push(entry);
    producer_lock_.clear(std::memory_order_release);

    if (!pushed) {
        dropped_.fetch_add(1, std::memory_order_relaxed); // Full queue drops the line
    }
}

void Logger::write(const LogEntry& entry) {
    fprintf(output_, "[%s] [%lu] %s\n", level_name(entry.level),
            static_cast<unsigned long>(entry.timestamp_ns), entry.message);
}

void Logger::drain_loop() {
    LogEntry entry;
    while (running_.load(std::memory_order_relaxed)) {
        if (queue_.try_pop(entry)) {
            write(entry);
        } else {
            fflush(output_);
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }
}

} // namespace dexbook
