#include "cacheworker/common/Logger.h"

#include <sys/syscall.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace cacheworker {
namespace common {

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "?????";
}

// "2026-01-31 23:59:59.123"
void FormatNow(char* buf, size_t len) {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tm;
    ::localtime_r(&secs, &tm);
    size_t n = std::strftime(buf, len, "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(buf + n, len - n, ".%03ld", millis);
}

int CurrentTid() {
    thread_local int tid = static_cast<int>(::syscall(SYS_gettid));
    return tid;
}

const char* BaseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

LogLevel Logger::ParseLevel(const std::string& name, LogLevel fallback) {
    std::string upper;
    for (char c : name) upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return fallback;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    char stamp[32];
    FormatNow(stamp, sizeof stamp);

    std::string record;
    record.reserve(msg.size() + 64);
    record.append(stamp).append(" ").append(LevelName(level));
    record.append(" [").append(std::to_string(CurrentTid())).append("] ");
    record.append(BaseName(file)).append(":").append(std::to_string(line)).append(" ");
    record.append(msg).push_back('\n');

    std::lock_guard<std::mutex> lock(writeMutex_);
    std::fwrite(record.data(), 1, record.size(), stdout);
    if (level >= LogLevel::WARN) std::fflush(stdout);
}

} // namespace common
} // namespace cacheworker
