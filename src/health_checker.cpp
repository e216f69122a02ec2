#include "health_checker.hpp"
#include "log.hpp"
#include "upstream_router.hpp"

namespace relay {

void HealthChecker::start(const net::any_io_executor& executor) {
  net::co_spawn(executor, loop(), net::detached);
}

net::awaitable<void> HealthChecker::loop() {
  net::steady_timer timer(co_await net::this_coro::executor);
  RELAY_LOG_INFO << "Active health checks every " << interval_.count()
                 << "s on " << path_;

  while (true) {
    timer.expires_after(interval_);
    co_await timer.async_wait(net::use_awaitable);
    co_await run_cycle();
  }
}

net::awaitable<std::vector<bool>> HealthChecker::run_cycle() {
  std::vector<bool> results(registry_.size(), false);
  for (std::size_t idx = 0; idx < registry_.size(); ++idx) {
    results[idx] = co_await probe(registry_.address(idx));
  }
  registry_.reset_from_probe_results(results);
  co_return results;
}

net::awaitable<bool> HealthChecker::probe(const std::string& address) {
  try {
    tcp::socket socket = co_await connect_upstream(address);

    HttpRequest req{http::verb::get, path_, 11};
    req.set(http::field::host, address);
    req.prepare_payload();
    co_await write_request(socket, req);

    beast::flat_buffer buffer;
    HttpResponse res =
        co_await read_response(socket, buffer, http::verb::get, limits_);

    beast::error_code ignored_ec;
    socket.shutdown(tcp::socket::shutdown_both, ignored_ec);

    if (res.result() != http::status::ok) {
      RELAY_LOG_DEBUG << "Health check of " << address << " returned "
                      << res.result_int();
      co_return false;
    }
    co_return true;
  } catch (std::exception& e) {
    RELAY_LOG_DEBUG << "Health check of " << address << " failed: "
                    << e.what();
    co_return false;
  }
}

} // namespace relay
