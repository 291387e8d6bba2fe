#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace zwlink {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_.store(lvl); }
const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  va_list ap;
  va_start(ap, fmt);
  vlog(lvl, nullptr, fmt, ap);
  va_end(ap);
}

void Logger::log_tagged(LogLevel lvl, const char *tag, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  va_list ap;
  va_start(ap, fmt);
  vlog(lvl, tag, fmt, ap);
  va_end(ap);
}

void Logger::vlog(LogLevel lvl, const char *tag, const char *fmt, va_list ap) {
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  if (tag)
    std::fprintf(stderr, "%s.%03d [%s] %-6s ", ts, (int)ms, level_str(lvl),
                 tag);
  else
    std::fprintf(stderr, "%s.%03d [%s] ", ts, (int)ms, level_str(lvl));
  std::vfprintf(stderr, fmt, ap);
  std::fprintf(stderr, "\n");
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  std::string l = s;
  std::transform(l.begin(), l.end(), l.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (l == "trace")
    out = LogLevel::TRACE;
  else if (l == "debug")
    out = LogLevel::DEBUG;
  else if (l == "info")
    out = LogLevel::INFO;
  else if (l == "warn" || l == "warning")
    out = LogLevel::WARN;
  else if (l == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

} // namespace zwlink
