#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace cacheworker {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide line logger. Each record is formatted off-lock and written
// to stdout with a single call, so lines from IO and worker threads never interleave.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }

    // Case-insensitive; unknown names yield fallback.
    static LogLevel ParseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::mutex writeMutex_;
};

// Collects one record: LOG_INFO << "page=" << index;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, out_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        out_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream out_;
};

} // namespace common
} // namespace cacheworker

#define CACHEWORKER_LOG(lvl) \
    if (cacheworker::common::LogLevel::lvl >= cacheworker::common::Logger::Instance().GetLevel()) \
    cacheworker::common::LogStream(cacheworker::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG CACHEWORKER_LOG(DEBUG)
#define LOG_INFO  CACHEWORKER_LOG(INFO)
#define LOG_WARN  CACHEWORKER_LOG(WARN)
#define LOG_ERROR CACHEWORKER_LOG(ERROR)
#define LOG_FATAL CACHEWORKER_LOG(FATAL)
