// connection_handler.hpp

#pragma once
#include "http_framing.hpp"
#include "rate_limiter.hpp"
#include "upstream_router.hpp"

namespace relay {

// Shared state a client session needs. Owned by ProxyServer and outlives
// every session it spawns.
struct SessionContext {
  UpstreamRouter& router;
  RateLimiter& rate_limiter;
  FramingLimits limits;
};

// Serves one client connection: routes it to an upstream once, then relays
// requests and responses one at a time until the client goes away or the
// upstream side breaks.
net::awaitable<void> handle_connection(tcp::socket client,
                                       SessionContext& context);

} // namespace relay
