#include "rate_limiter.hpp"
#include "config.hpp"

namespace relay {

namespace {
const char* const FIXED_WINDOW = "fixed_window";
}

RateDecision
FixedWindowRateLimiter::check_and_record(const std::string& identity) {
  if (limit_ == 0)
    return RateDecision::allowed;

  auto now = now_();
  std::scoped_lock lock(mutex_);
  auto [it, inserted] = windows_.try_emplace(identity, Window{now, 0});
  Window& window = it->second;
  if (!inserted && now - window.start >= window_) {
    window.start = now;
    window.count = 0;
  }
  ++window.count;
  return window.count > limit_ ? RateDecision::denied : RateDecision::allowed;
}

bool is_known_rate_limiter(const std::string& algorithm) {
  return algorithm == FIXED_WINDOW;
}

std::unique_ptr<RateLimiter> make_rate_limiter(const std::string& algorithm,
                                               std::size_t max_per_minute) {
  if (algorithm == FIXED_WINDOW)
    return std::make_unique<FixedWindowRateLimiter>(max_per_minute);
  throw ConfigError("unknown rate limiter: " + algorithm);
}

} // namespace relay
