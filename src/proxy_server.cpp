#include "proxy_server.hpp"
#include "log.hpp"

#include <chrono>
#include <exception>

namespace relay {

namespace {

// Pause after a failed accept (EMFILE and the like) so a pending
// connection that cannot be taken yet does not spin the loop.
constexpr std::chrono::milliseconds accept_retry_delay{100};

FramingLimits limits_from(const ProxyConfig& config) {
  return FramingLimits{config.max_header_size, config.max_body_size};
}

void log_task_failure(const char* task, std::exception_ptr e) {
  if (!e)
    return;
  try {
    std::rethrow_exception(e);
  } catch (std::exception& ex) {
    RELAY_LOG_ERROR << task << " stopped: " << ex.what();
  }
}

} // namespace

ProxyServer::ProxyServer(net::io_context& ioc, const ProxyConfig& config)
    : ioc_(ioc), config_(config), registry_(config.upstreams),
      rate_limiter_(make_rate_limiter(config.rate_limiter,
                                      config.max_requests_per_minute)),
      router_(registry_),
      health_checker_(registry_, config.active_health_check_path,
                      std::chrono::seconds(config.active_health_check_interval),
                      limits_from(config)),
      session_context_{router_, *rate_limiter_, limits_from(config)},
      acceptor_(ioc) {
  auto [host, port] = split_host_port(config_.bind);
  tcp::resolver resolver(ioc_);
  tcp::endpoint endpoint =
      resolver.resolve(host, port, tcp::resolver::passive)->endpoint();

  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
}

void ProxyServer::start() {
  if (config_.health_checks_enabled()) {
    health_checker_.start(ioc_.get_executor());
  } else {
    RELAY_LOG_INFO << "Active health checks disabled";
  }
  net::co_spawn(ioc_, accept_loop(), [](std::exception_ptr e) {
    log_task_failure("Accept loop", e);
  });
}

net::awaitable<void> ProxyServer::accept_loop() {
  RELAY_LOG_INFO << "Listening for requests on " << acceptor_.local_endpoint();

  while (true) {
    beast::error_code ec;
    tcp::socket socket = co_await acceptor_.async_accept(
        net::redirect_error(net::use_awaitable, ec));
    if (ec) {
      if (!acceptor_.is_open())
        co_return;
      RELAY_LOG_WARN << "Failed to accept connection: " << ec.message();
      net::steady_timer timer(acceptor_.get_executor(), accept_retry_delay);
      co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
      continue;
    }
    net::co_spawn(ioc_, handle_connection(std::move(socket), session_context_),
                  [](std::exception_ptr e) { log_task_failure("Session", e); });
  }
}

} // namespace relay
