// upstream_registry.hpp

#pragma once
#include "log.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>

namespace relay {

// Fixed set of upstream addresses with a liveness flag per index. Every
// upstream starts alive. Readers share the lock, writers hold it
// exclusively; no method hands out a lock across a suspension point.
class UpstreamRegistry {
public:
  explicit UpstreamRegistry(std::vector<std::string> addresses)
      : addresses_(std::move(addresses)), alive_(addresses_.size(), true),
        live_count_(addresses_.size()) {}

  std::size_t size() const { return addresses_.size(); }
  const std::string& address(std::size_t idx) const { return addresses_[idx]; }

  bool is_alive(std::size_t idx) const {
    std::shared_lock lock(mutex_);
    return alive_[idx];
  }

  bool all_dead() const {
    std::shared_lock lock(mutex_);
    return live_count_ == 0;
  }

  std::size_t live_count() const {
    std::shared_lock lock(mutex_);
    return live_count_;
  }

  void set_dead(std::size_t idx) {
    std::unique_lock lock(mutex_);
    set_dead_locked(idx);
  }

  void set_alive(std::size_t idx) {
    std::unique_lock lock(mutex_);
    set_alive_locked(idx);
  }

  // Applies one health-check cycle under a single write lock, so readers
  // see either the previous state or the whole new one.
  void reset_from_probe_results(const std::vector<bool>& results) {
    std::unique_lock lock(mutex_);
    for (std::size_t idx = 0; idx < results.size() && idx < alive_.size();
         ++idx) {
      if (results[idx] == alive_[idx])
        continue;
      if (results[idx]) {
        set_alive_locked(idx);
        RELAY_LOG_INFO << "Upstream " << addresses_[idx] << " is back up";
      } else {
        set_dead_locked(idx);
        RELAY_LOG_WARN << "Upstream " << addresses_[idx]
                       << " failed its health check";
      }
    }
  }

  // Draws uniformly over the whole index range until a live index comes up.
  // Returns nullopt when nothing is alive.
  template <class Engine>
  std::optional<std::size_t> pick_live(Engine& engine) const {
    std::shared_lock lock(mutex_);
    if (live_count_ == 0)
      return std::nullopt;
    std::uniform_int_distribution<std::size_t> dist(0, alive_.size() - 1);
    while (true) {
      std::size_t idx = dist(engine);
      if (alive_[idx])
        return idx;
    }
  }

private:
  void set_dead_locked(std::size_t idx) {
    if (alive_[idx]) {
      alive_[idx] = false;
      --live_count_;
    }
  }

  void set_alive_locked(std::size_t idx) {
    if (!alive_[idx]) {
      alive_[idx] = true;
      ++live_count_;
    }
  }

  const std::vector<std::string> addresses_;
  std::vector<bool> alive_;
  std::size_t live_count_;
  mutable std::shared_mutex mutex_;
};

} // namespace relay
