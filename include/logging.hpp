
#pragma once
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>

namespace blobstream {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

std::optional<LogLevel> parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    bool enabled(LogLevel lvl) const { return lvl >= level_.load(std::memory_order_relaxed); }
    void log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    const char* level_str(LogLevel lvl);
};

} // namespace blobstream
