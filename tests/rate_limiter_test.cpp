#include "config.hpp"
#include "rate_limiter.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using relay::FixedWindowRateLimiter;
using relay::RateDecision;

namespace {

// Hand-driven clock so window boundaries are exact.
struct ManualClock {
  FixedWindowRateLimiter::Clock::time_point now{};

  FixedWindowRateLimiter::TimeSource source() {
    return [this] { return now; };
  }
};

} // namespace

TEST(FixedWindowRateLimiter, DeniesRequestPastTheLimit) {
  ManualClock clock;
  FixedWindowRateLimiter limiter(3, 60s, clock.source());

  EXPECT_EQ(limiter.check_and_record("1.2.3.4"), RateDecision::allowed);
  EXPECT_EQ(limiter.check_and_record("1.2.3.4"), RateDecision::allowed);
  EXPECT_EQ(limiter.check_and_record("1.2.3.4"), RateDecision::allowed);
  EXPECT_EQ(limiter.check_and_record("1.2.3.4"), RateDecision::denied);
  EXPECT_EQ(limiter.check_and_record("1.2.3.4"), RateDecision::denied);
}

TEST(FixedWindowRateLimiter, IdentitiesAreCountedSeparately) {
  ManualClock clock;
  FixedWindowRateLimiter limiter(1, 60s, clock.source());

  EXPECT_EQ(limiter.check_and_record("1.2.3.4"), RateDecision::allowed);
  EXPECT_EQ(limiter.check_and_record("5.6.7.8"), RateDecision::allowed);
  EXPECT_EQ(limiter.check_and_record("1.2.3.4"), RateDecision::denied);
  EXPECT_EQ(limiter.tracked_identities(), 2u);
}

TEST(FixedWindowRateLimiter, NewWindowResetsTheCount) {
  ManualClock clock;
  FixedWindowRateLimiter limiter(2, 60s, clock.source());

  limiter.check_and_record("a");
  limiter.check_and_record("a");
  clock.now += 59s;
  EXPECT_EQ(limiter.check_and_record("a"), RateDecision::denied);

  clock.now += 1s;
  EXPECT_EQ(limiter.check_and_record("a"), RateDecision::allowed);
  EXPECT_EQ(limiter.check_and_record("a"), RateDecision::allowed);
  EXPECT_EQ(limiter.check_and_record("a"), RateDecision::denied);
}

TEST(FixedWindowRateLimiter, WindowStartsAtFirstRequestOfTheWindow) {
  ManualClock clock;
  FixedWindowRateLimiter limiter(1, 60s, clock.source());

  clock.now += 10s;
  EXPECT_EQ(limiter.check_and_record("a"), RateDecision::allowed);
  clock.now += 55s;
  EXPECT_EQ(limiter.check_and_record("a"), RateDecision::denied);
  clock.now += 5s;
  EXPECT_EQ(limiter.check_and_record("a"), RateDecision::allowed);
}

TEST(FixedWindowRateLimiter, ZeroLimitNeverDenies) {
  ManualClock clock;
  FixedWindowRateLimiter limiter(0, 60s, clock.source());

  for (int i = 0; i < 10000; ++i) {
    ASSERT_EQ(limiter.check_and_record("1.2.3.4"), RateDecision::allowed);
  }
  EXPECT_EQ(limiter.tracked_identities(), 0u);
}

TEST(RateLimiterFactory, BuildsFixedWindow) {
  auto limiter = relay::make_rate_limiter("fixed_window", 1);
  ASSERT_NE(limiter, nullptr);
  EXPECT_NE(dynamic_cast<FixedWindowRateLimiter*>(limiter.get()), nullptr);
  EXPECT_EQ(limiter->check_and_record("x"), RateDecision::allowed);
  EXPECT_EQ(limiter->check_and_record("x"), RateDecision::denied);
}

TEST(RateLimiterFactory, RejectsUnknownAlgorithm) {
  EXPECT_THROW(relay::make_rate_limiter("token_bucket", 10),
               relay::ConfigError);
  EXPECT_FALSE(relay::is_known_rate_limiter("sliding_window"));
}
