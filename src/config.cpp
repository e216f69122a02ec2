#include "config.hpp"
#include "rate_limiter.hpp"

#include <getopt.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

namespace relay {

namespace {

enum LongOption {
  OPT_HEALTH_CHECK_INTERVAL = 256,
  OPT_HEALTH_CHECK_PATH,
  OPT_MAX_REQUESTS_PER_MINUTE,
  OPT_RATE_LIMITER,
  OPT_MAX_HEADER_SIZE,
  OPT_MAX_BODY_SIZE,
};

const option LONG_OPTIONS[] = {
    {"bind", required_argument, nullptr, 'b'},
    {"upstream", required_argument, nullptr, 'u'},
    {"active-health-check-interval", required_argument, nullptr,
     OPT_HEALTH_CHECK_INTERVAL},
    {"active-health-check-path", required_argument, nullptr,
     OPT_HEALTH_CHECK_PATH},
    {"max-requests-per-minute", required_argument, nullptr,
     OPT_MAX_REQUESTS_PER_MINUTE},
    {"rate-limiter", required_argument, nullptr, OPT_RATE_LIMITER},
    {"threads", required_argument, nullptr, 't'},
    {"max-header-size", required_argument, nullptr, OPT_MAX_HEADER_SIZE},
    {"max-body-size", required_argument, nullptr, OPT_MAX_BODY_SIZE},
    {"log-level", required_argument, nullptr, 'l'},
    {"config", required_argument, nullptr, 'c'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

std::uint64_t parse_number(const std::string& name, const std::string& text) {
  if (text.empty() ||
      text.find_first_not_of("0123456789") != std::string::npos)
    throw ConfigError("--" + name + " expects a number, got \"" + text + "\"");
  try {
    return std::stoull(text);
  } catch (std::out_of_range&) {
    throw ConfigError("--" + name + " is out of range: " + text);
  }
}

std::uint64_t read_unsigned(const json& j, const char* key,
                            std::uint64_t fallback) {
  auto it = j.find(key);
  if (it == j.end())
    return fallback;
  if (!it->is_number_unsigned())
    throw ConfigError(std::string(key) + " must be a non-negative integer");
  return it->get<std::uint64_t>();
}

std::size_t default_threads() {
  return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

CommandLine parse_command_line(int argc, char* argv[]) {
  CommandLine result;
  json& out = result.overrides;

  optind = 0;
  opterr = 0;
  int ch;
  while ((ch = getopt_long(argc, argv, "b:u:t:l:c:h", LONG_OPTIONS,
                           nullptr)) != -1) {
    switch (ch) {
    case 'b':
      out["bind"] = optarg;
      break;
    case 'u':
      out["upstreams"].push_back(std::string(optarg));
      break;
    case OPT_HEALTH_CHECK_INTERVAL:
      out["active_health_check_interval"] =
          parse_number("active-health-check-interval", optarg);
      break;
    case OPT_HEALTH_CHECK_PATH:
      out["active_health_check_path"] = optarg;
      break;
    case OPT_MAX_REQUESTS_PER_MINUTE:
      out["max_requests_per_minute"] =
          parse_number("max-requests-per-minute", optarg);
      break;
    case OPT_RATE_LIMITER:
      out["rate_limiter"] = optarg;
      break;
    case 't':
      out["threads"] = parse_number("threads", optarg);
      break;
    case OPT_MAX_HEADER_SIZE:
      out["max_header_size"] = parse_number("max-header-size", optarg);
      break;
    case OPT_MAX_BODY_SIZE:
      out["max_body_size"] = parse_number("max-body-size", optarg);
      break;
    case 'l':
      out["log_level"] = optarg;
      break;
    case 'c':
      result.config_path = optarg;
      break;
    case 'h':
      result.show_help = true;
      break;
    default:
      throw ConfigError(std::string("unrecognized option ") +
                        argv[optind - 1]);
    }
  }

  // The rate limiter algorithm may also be given as the only positional
  // argument.
  if (optind < argc) {
    if (argc - optind > 1)
      throw ConfigError(std::string("unexpected argument ") + argv[optind + 1]);
    out["rate_limiter"] = argv[optind];
  }
  return result;
}

ProxyConfig config_from_json(const json& j) {
  if (!j.is_object())
    throw ConfigError("configuration must be a JSON object");

  ProxyConfig config;
  try {
    config.bind = j.value("bind", config.bind);
    if (j.contains("upstreams"))
      config.upstreams = j.at("upstreams").get<std::vector<std::string>>();
    config.active_health_check_path =
        j.value("active_health_check_path", config.active_health_check_path);
    config.rate_limiter = j.value("rate_limiter", config.rate_limiter);
  } catch (json::exception& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }

  config.active_health_check_interval = read_unsigned(
      j, "active_health_check_interval", config.active_health_check_interval);
  config.max_requests_per_minute = read_unsigned(
      j, "max_requests_per_minute", config.max_requests_per_minute);
  config.threads = read_unsigned(j, "threads", default_threads());
  auto header_size =
      read_unsigned(j, "max_header_size", config.max_header_size);
  if (header_size > UINT32_MAX)
    throw ConfigError("max_header_size is out of range");
  config.max_header_size = static_cast<std::uint32_t>(header_size);
  config.max_body_size =
      read_unsigned(j, "max_body_size", config.max_body_size);

  std::optional<std::string> level_name;
  if (auto it = j.find("log_level"); it != j.end()) {
    if (!it->is_string())
      throw ConfigError("log_level must be a string");
    level_name = it->get<std::string>();
  } else if (const char* env = std::getenv("RELAY_LOG")) {
    level_name = env;
  }
  if (level_name) {
    auto level = parse_log_level(*level_name);
    if (!level)
      throw ConfigError("unknown log level: " + *level_name);
    config.log_level = *level;
  }
  return config;
}

std::pair<std::string, std::string>
split_host_port(const std::string& address) {
  auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 ||
      colon + 1 == address.size()) {
    throw ConfigError("expected host:port, got \"" + address + "\"");
  }
  std::string host = address.substr(0, colon);
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  return {host, address.substr(colon + 1)};
}

void validate(const ProxyConfig& config) {
  if (config.upstreams.empty()) {
    throw ConfigError("At least one upstream server must be specified using "
                      "the --upstream option.");
  }
  split_host_port(config.bind);
  for (const auto& upstream : config.upstreams)
    split_host_port(upstream);
  if (!is_known_rate_limiter(config.rate_limiter))
    throw ConfigError("unknown rate limiter: " + config.rate_limiter);
  if (config.threads == 0)
    throw ConfigError("threads must be at least 1");
  if (config.active_health_check_path.empty() ||
      config.active_health_check_path.front() != '/')
    throw ConfigError("active health check path must start with '/'");
  if (config.max_header_size == 0 || config.max_body_size == 0)
    throw ConfigError("size limits must be greater than zero");
}

ProxyConfig load_config(const CommandLine& command_line) {
  json merged = json::object();
  if (command_line.config_path) {
    std::ifstream in(*command_line.config_path);
    if (!in)
      throw ConfigError("cannot open config file " + *command_line.config_path);
    try {
      merged = json::parse(in);
    } catch (json::parse_error& e) {
      throw ConfigError("cannot parse config file " +
                        *command_line.config_path + ": " + e.what());
    }
    if (!merged.is_object())
      throw ConfigError("config file must hold a JSON object");
  }
  merged.update(command_line.overrides);

  ProxyConfig config = config_from_json(merged);
  validate(config);
  return config;
}

std::string usage(const std::string& program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options] [rate-limiter]\n"
      << "  -b, --bind ADDR                     IP/port to bind to "
         "(default 0.0.0.0:1100)\n"
      << "  -u, --upstream ADDR                 upstream host:port to forward "
         "to (repeatable)\n"
      << "      --active-health-check-interval SECS\n"
      << "                                      probe interval, 0 disables "
         "(default 10)\n"
      << "      --active-health-check-path PATH path to probe (default /)\n"
      << "      --max-requests-per-minute N     per-IP limit, 0 = unlimited "
         "(default 0)\n"
      << "      --rate-limiter NAME             fixed_window (default)\n"
      << "  -t, --threads N                     worker threads\n"
      << "      --max-header-size BYTES         (default 8000)\n"
      << "      --max-body-size BYTES           (default 10000000)\n"
      << "  -l, --log-level LEVEL               debug, info, warn, error, "
         "off\n"
      << "  -c, --config FILE                   JSON config file\n"
      << "  -h, --help                          show this help\n";
  return out.str();
}

} // namespace relay
