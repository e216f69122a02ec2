// config.hpp

#pragma once
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace relay {

using json = nlohmann::json;

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ProxyConfig {
  std::string bind = "0.0.0.0:1100";
  std::vector<std::string> upstreams;
  std::size_t active_health_check_interval = 10;
  std::string active_health_check_path = "/";
  std::size_t max_requests_per_minute = 0;
  std::string rate_limiter = "fixed_window";
  std::size_t threads = 1;
  std::uint32_t max_header_size = 8000;
  std::uint64_t max_body_size = 10000000;
  LogLevel log_level = LogLevel::info;

  bool health_checks_enabled() const {
    return active_health_check_interval > 0;
  }
};

struct CommandLine {
  bool show_help = false;
  std::optional<std::string> config_path;
  // Options given on the command line, keyed like the JSON config file.
  json overrides = json::object();
};

// Parses argv with getopt_long. Throws ConfigError on an unknown option or
// a malformed value.
CommandLine parse_command_line(int argc, char* argv[]);

// Layers the defaults, the config file (if any) and the command line, then
// validates the result. Throws ConfigError.
ProxyConfig load_config(const CommandLine& command_line);

ProxyConfig config_from_json(const json& j);

void validate(const ProxyConfig& config);

// Splits "host:port" at the last colon, dropping brackets around an IPv6
// host. Throws ConfigError when either half is missing.
std::pair<std::string, std::string> split_host_port(const std::string& address);

std::string usage(const std::string& program);

} // namespace relay
