#include "log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace relay {

namespace {

const char* level_name(LogLevel level) {
  switch (level) {
  case LogLevel::debug:
    return "DEBUG";
  case LogLevel::info:
    return "INFO ";
  case LogLevel::warn:
    return "WARN ";
  case LogLevel::error:
    return "ERROR";
  default:
    return "";
  }
}

std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm{};
  localtime_r(&secs, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << ms.count();
  return out.str();
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& name) {
  if (name == "debug")
    return LogLevel::debug;
  if (name == "info")
    return LogLevel::info;
  if (name == "warn")
    return LogLevel::warn;
  if (name == "error")
    return LogLevel::error;
  if (name == "off")
    return LogLevel::off;
  return std::nullopt;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::write(LogLevel level, const std::string& msg) {
  std::string line = timestamp() + " " + level_name(level) + " " + msg;

  std::scoped_lock lock(mutex_);
  if (level >= LogLevel::warn) {
    std::cerr << line << std::endl;
  } else {
    std::cout << line << std::endl;
  }
}

} // namespace relay
