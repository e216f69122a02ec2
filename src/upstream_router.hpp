// upstream_router.hpp

#pragma once
#include "http_framing.hpp"
#include "upstream_registry.hpp"

#include <optional>
#include <string>

namespace relay {

// Resolves and connects to a "host:port" address. Throws
// boost::system::system_error on failure.
net::awaitable<tcp::socket> connect_upstream(const std::string& address);

struct UpstreamConnection {
  tcp::socket socket;
  std::size_t index;
  std::string address;
};

class UpstreamRouter {
public:
  explicit UpstreamRouter(UpstreamRegistry& registry) : registry_(registry) {}

  // Picks random live upstreams until one accepts a connection, marking
  // each one that refuses as dead. Returns nullopt once none are left.
  net::awaitable<std::optional<UpstreamConnection>> route();

  // One random live index, or nullopt when the pool is empty.
  std::optional<std::size_t> pick();

  UpstreamRegistry& registry() { return registry_; }

private:
  UpstreamRegistry& registry_;
};

} // namespace relay
