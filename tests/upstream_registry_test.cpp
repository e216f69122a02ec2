#include "upstream_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <random>
#include <thread>

using relay::UpstreamRegistry;

namespace {

UpstreamRegistry make_registry(std::size_t n) {
  std::vector<std::string> addresses;
  for (std::size_t i = 0; i < n; ++i)
    addresses.push_back("10.0.0." + std::to_string(i) + ":80");
  return UpstreamRegistry(std::move(addresses));
}

} // namespace

TEST(UpstreamRegistry, StartsWithEveryUpstreamAlive) {
  auto reg = make_registry(3);
  EXPECT_EQ(reg.size(), 3u);
  EXPECT_EQ(reg.live_count(), 3u);
  EXPECT_FALSE(reg.all_dead());
  EXPECT_EQ(reg.address(1), "10.0.0.1:80");
}

TEST(UpstreamRegistry, SetDeadThenAlive) {
  auto reg = make_registry(2);
  reg.set_dead(0);
  EXPECT_FALSE(reg.is_alive(0));
  EXPECT_TRUE(reg.is_alive(1));
  EXPECT_EQ(reg.live_count(), 1u);

  reg.set_alive(0);
  EXPECT_TRUE(reg.is_alive(0));
  EXPECT_EQ(reg.live_count(), 2u);
}

TEST(UpstreamRegistry, RepeatedTogglesAreNoOps) {
  auto reg = make_registry(2);
  reg.set_dead(1);
  reg.set_dead(1);
  EXPECT_EQ(reg.live_count(), 1u);
  reg.set_alive(1);
  reg.set_alive(1);
  EXPECT_EQ(reg.live_count(), 2u);
}

TEST(UpstreamRegistry, AllDeadOnlyWhenEveryIndexIsDead) {
  auto reg = make_registry(3);
  reg.set_dead(0);
  reg.set_dead(1);
  EXPECT_FALSE(reg.all_dead());
  reg.set_dead(2);
  EXPECT_TRUE(reg.all_dead());
  reg.set_alive(1);
  EXPECT_FALSE(reg.all_dead());
}

TEST(UpstreamRegistry, LiveCountTracksFlagsUnderRandomToggles) {
  auto reg = make_registry(8);
  std::vector<bool> model(8, true);
  std::mt19937 rng(1234);
  std::uniform_int_distribution<std::size_t> pick(0, 7);
  std::bernoulli_distribution kill(0.5);

  for (int step = 0; step < 2000; ++step) {
    auto idx = pick(rng);
    if (kill(rng)) {
      reg.set_dead(idx);
      model[idx] = false;
    } else {
      reg.set_alive(idx);
      model[idx] = true;
    }

    std::size_t expected = 0;
    for (std::size_t i = 0; i < model.size(); ++i) {
      ASSERT_EQ(reg.is_alive(i), model[i]) << "step " << step;
      expected += model[i] ? 1 : 0;
    }
    ASSERT_EQ(reg.live_count(), expected);
    ASSERT_EQ(reg.all_dead(), expected == 0);
  }
}

TEST(UpstreamRegistry, ApplyProbeResults) {
  auto reg = make_registry(3);
  reg.set_dead(2);

  reg.reset_from_probe_results({false, true, true});
  EXPECT_FALSE(reg.is_alive(0));
  EXPECT_TRUE(reg.is_alive(1));
  EXPECT_TRUE(reg.is_alive(2));
  EXPECT_EQ(reg.live_count(), 2u);

  reg.reset_from_probe_results({false, false, false});
  EXPECT_TRUE(reg.all_dead());
}

TEST(UpstreamRegistry, PickLiveNeverReturnsDeadIndex) {
  auto reg = make_registry(5);
  reg.set_dead(0);
  reg.set_dead(3);
  std::mt19937 rng(7);
  for (int i = 0; i < 500; ++i) {
    auto idx = reg.pick_live(rng);
    ASSERT_TRUE(idx.has_value());
    EXPECT_TRUE(*idx == 1 || *idx == 2 || *idx == 4) << *idx;
  }
}

TEST(UpstreamRegistry, PickLiveOnEmptyPool) {
  auto reg = make_registry(2);
  reg.set_dead(0);
  reg.set_dead(1);
  std::mt19937 rng(7);
  EXPECT_FALSE(reg.pick_live(rng).has_value());
}

TEST(UpstreamRegistry, ReadersSeeWholeProbeCycles) {
  auto reg = make_registry(4);
  auto level = relay::Logger::instance().level();
  relay::Logger::instance().set_level(relay::LogLevel::error);
  std::atomic<bool> done{false};

  // the writer only ever flips between all alive and all dead
  std::thread writer([&] {
    for (int i = 0; i < 2000; ++i) {
      reg.reset_from_probe_results(std::vector<bool>(4, i % 2 == 0));
    }
    done = true;
  });

  while (!done) {
    auto live = reg.live_count();
    EXPECT_TRUE(live == 0 || live == 4) << live;
  }
  writer.join();
  relay::Logger::instance().set_level(level);
}
