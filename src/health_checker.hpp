// health_checker.hpp

#pragma once
#include "http_framing.hpp"
#include "upstream_registry.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace relay {

class HealthChecker {
public:
  HealthChecker(UpstreamRegistry& registry, std::string path,
                std::chrono::seconds interval, FramingLimits limits = {})
      : registry_(registry), path_(std::move(path)), interval_(interval),
        limits_(limits) {}

  // Spawns the probe loop on executor. It sleeps for the interval, probes
  // every upstream and applies the results, forever.
  void start(const net::any_io_executor& executor);

  // Probes every upstream once, in index order, then applies all results
  // under one registry write.
  net::awaitable<std::vector<bool>> run_cycle();

  // True iff the upstream answered GET path with 200.
  net::awaitable<bool> probe(const std::string& address);

private:
  net::awaitable<void> loop();

  UpstreamRegistry& registry_;
  const std::string path_;
  const std::chrono::seconds interval_;
  const FramingLimits limits_;
};

} // namespace relay
