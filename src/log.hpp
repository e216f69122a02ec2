// log.hpp

#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace relay {

enum class LogLevel { debug, info, warn, error, off };

std::optional<LogLevel> parse_log_level(const std::string& name);

class Logger {
public:
  static Logger& instance();

  void set_level(LogLevel level) { level_ = level; }
  LogLevel level() const { return level_; }
  bool enabled(LogLevel level) const {
    return level != LogLevel::off && level >= level_;
  }

  void write(LogLevel level, const std::string& msg);

private:
  Logger() = default;

  std::atomic<LogLevel> level_{LogLevel::info};
  std::mutex mutex_;
};

// Collects one line and hands it to the logger when destroyed.
class LogLine {
public:
  explicit LogLine(LogLevel level) : level_(level) {}
  ~LogLine() { Logger::instance().write(level_, out_.str()); }

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <class T> LogLine& operator<<(const T& value) {
    out_ << value;
    return *this;
  }

private:
  LogLevel level_;
  std::ostringstream out_;
};

} // namespace relay

#define RELAY_LOG(lvl)                                                         \
  if (!::relay::Logger::instance().enabled(lvl)) {                             \
  } else                                                                       \
    ::relay::LogLine(lvl)

#define RELAY_LOG_DEBUG RELAY_LOG(::relay::LogLevel::debug)
#define RELAY_LOG_INFO RELAY_LOG(::relay::LogLevel::info)
#define RELAY_LOG_WARN RELAY_LOG(::relay::LogLevel::warn)
#define RELAY_LOG_ERROR RELAY_LOG(::relay::LogLevel::error)
