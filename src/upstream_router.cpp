#include "upstream_router.hpp"
#include "config.hpp"
#include "log.hpp"

#include <random>

namespace relay {

net::awaitable<tcp::socket> connect_upstream(const std::string& address) {
  auto host_port = split_host_port(address);

  auto executor = co_await net::this_coro::executor;
  tcp::resolver resolver(executor);
  auto endpoints = co_await resolver.async_resolve(
      host_port.first, host_port.second, net::use_awaitable);

  tcp::socket socket(executor);
  co_await net::async_connect(socket, endpoints, net::use_awaitable);
  co_return socket;
}

std::optional<std::size_t> UpstreamRouter::pick() {
  thread_local std::mt19937 engine{std::random_device{}()};
  return registry_.pick_live(engine);
}

net::awaitable<std::optional<UpstreamConnection>> UpstreamRouter::route() {
  while (true) {
    auto idx = pick();
    if (!idx) {
      RELAY_LOG_ERROR << "All upstream servers are dead";
      co_return std::nullopt;
    }

    const std::string& address = registry_.address(*idx);
    std::string failure;
    try {
      tcp::socket socket = co_await connect_upstream(address);
      co_return UpstreamConnection{std::move(socket), *idx, address};
    } catch (std::exception& e) {
      failure = e.what();
    }

    RELAY_LOG_WARN << "Failed to connect to upstream " << address << ": "
                   << failure;
    registry_.set_dead(*idx);
  }
}

} // namespace relay
