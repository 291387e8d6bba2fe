#pragma once
#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace zwlink {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

// Channel tags, matching the sections of a driver log.
constexpr const char* kLogSerial = "SERIAL";
constexpr const char* kLogController = "CNTRLR";
constexpr const char* kLogDriver = "DRIVER";

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return lvl >= level_.load(); }
    void log(LogLevel lvl, const char* fmt, ...);
    void log_tagged(LogLevel lvl, const char* tag, const char* fmt, ...);
private:
    Logger() = default;
    void vlog(LogLevel lvl, const char* tag, const char* fmt, va_list ap);
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    const char* level_str(LogLevel lvl);
};

bool parse_log_level(const std::string& s, LogLevel& out);

} // namespace zwlink
