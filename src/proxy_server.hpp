// proxy_server.hpp

#pragma once
#include "config.hpp"
#include "connection_handler.hpp"
#include "health_checker.hpp"
#include "rate_limiter.hpp"
#include "upstream_registry.hpp"
#include "upstream_router.hpp"

#include <memory>

namespace relay {

class ProxyServer {
public:
  // Binds the listening socket right away; throws
  // boost::system::system_error if that fails.
  ProxyServer(net::io_context& ioc, const ProxyConfig& config);

  // Spawns the health checker (unless disabled) and the accept loop.
  void start();

  tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }
  UpstreamRegistry& registry() { return registry_; }

private:
  net::awaitable<void> accept_loop();

  net::io_context& ioc_;
  ProxyConfig config_;
  UpstreamRegistry registry_;
  std::unique_ptr<RateLimiter> rate_limiter_;
  UpstreamRouter router_;
  HealthChecker health_checker_;
  SessionContext session_context_;
  tcp::acceptor acceptor_;
};

} // namespace relay
