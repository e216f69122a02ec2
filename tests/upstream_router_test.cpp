#include "test_support.hpp"
#include "upstream_router.hpp"

#include <gtest/gtest.h>

using namespace relay;
using relay::test::FakeUpstream;
using relay::test::IoThread;

namespace {

// The returned socket belongs to ctx, so ctx must outlive it.
std::optional<UpstreamConnection> route_once(net::io_context& ctx,
                                             UpstreamRouter& router) {
  ctx.restart();
  auto fut = net::co_spawn(ctx, router.route(), net::use_future);
  ctx.run();
  return fut.get();
}

std::string ok_reply(const HttpRequest&) {
  return test::raw_response(200, "OK", "ok");
}

} // namespace

TEST(UpstreamRouter, PickSkipsDeadUpstreams) {
  UpstreamRegistry reg({"a:1", "b:2", "c:3"});
  UpstreamRouter router(reg);
  reg.set_dead(1);
  for (int i = 0; i < 300; ++i) {
    auto idx = router.pick();
    ASSERT_TRUE(idx.has_value());
    EXPECT_NE(*idx, 1u);
  }
}

TEST(UpstreamRouter, AllDeadFailsWithoutConnecting) {
  net::io_context upstream_ioc;
  FakeUpstream upstream(upstream_ioc, ok_reply);
  IoThread io(upstream_ioc);

  UpstreamRegistry reg({upstream.address()});
  reg.set_dead(0);
  UpstreamRouter router(reg);

  net::io_context ctx;
  EXPECT_FALSE(route_once(ctx, router).has_value());
  EXPECT_EQ(upstream.connections(), 0);
}

TEST(UpstreamRouter, ConnectsToLiveUpstream) {
  net::io_context upstream_ioc;
  FakeUpstream upstream(upstream_ioc, ok_reply);
  IoThread io(upstream_ioc);

  UpstreamRegistry reg({upstream.address()});
  UpstreamRouter router(reg);

  net::io_context ctx;
  auto conn = route_once(ctx, router);
  ASSERT_TRUE(conn.has_value());
  EXPECT_EQ(conn->index, 0u);
  EXPECT_EQ(conn->address, upstream.address());
  EXPECT_TRUE(conn->socket.is_open());
}

TEST(UpstreamRouter, FailsOverAndMarksRefusingUpstreamDead) {
  net::io_context upstream_ioc;
  FakeUpstream upstream(upstream_ioc, ok_reply);
  IoThread io(upstream_ioc);

  UpstreamRegistry reg({test::refused_address(), upstream.address()});
  UpstreamRouter router(reg);

  net::io_context ctx;
  for (int i = 0; i < 20; ++i) {
    auto conn = route_once(ctx, router);
    ASSERT_TRUE(conn.has_value());
    EXPECT_EQ(conn->index, 1u);
  }
  EXPECT_FALSE(reg.is_alive(0));
  EXPECT_TRUE(reg.is_alive(1));
}

TEST(UpstreamRouter, ExhaustsPoolWhenEveryUpstreamRefuses) {
  UpstreamRegistry reg({test::refused_address(), test::refused_address()});
  UpstreamRouter router(reg);

  net::io_context ctx;
  EXPECT_FALSE(route_once(ctx, router).has_value());
  EXPECT_TRUE(reg.all_dead());
}
