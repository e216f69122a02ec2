// rate_limiter.hpp

#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace relay {

enum class RateDecision { allowed, denied };

class RateLimiter {
public:
  virtual ~RateLimiter() = default;

  // Counts one request for identity and says whether it may proceed.
  virtual RateDecision check_and_record(const std::string& identity) = 0;
};

// Counts requests per identity in fixed windows that start at the first
// request seen after the previous window ran out. A limit of 0 allows
// everything and keeps no state.
class FixedWindowRateLimiter : public RateLimiter {
public:
  using Clock = std::chrono::steady_clock;
  using TimeSource = std::function<Clock::time_point()>;

  static constexpr std::chrono::seconds DEFAULT_WINDOW{60};

  explicit FixedWindowRateLimiter(std::size_t limit,
                                  Clock::duration window = DEFAULT_WINDOW,
                                  TimeSource now = &Clock::now)
      : limit_(limit), window_(window), now_(std::move(now)) {}

  RateDecision check_and_record(const std::string& identity) override;

  std::size_t tracked_identities() const {
    std::scoped_lock lock(mutex_);
    return windows_.size();
  }

private:
  struct Window {
    Clock::time_point start;
    std::size_t count = 0;
  };

  const std::size_t limit_;
  const Clock::duration window_;
  TimeSource now_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Window> windows_;
};

// Builds the limiter named on the command line; throws ConfigError for an
// unknown name.
std::unique_ptr<RateLimiter> make_rate_limiter(const std::string& algorithm,
                                               std::size_t max_per_minute);

bool is_known_rate_limiter(const std::string& algorithm);

} // namespace relay
