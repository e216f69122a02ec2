#include "connection_handler.hpp"
#include "log.hpp"

#include <optional>

namespace relay {

namespace {

// Returns false when the client can no longer be written to.
net::awaitable<bool> send_response(tcp::socket& client,
                                   const std::string& client_ip,
                                   HttpResponse& response) {
  RELAY_LOG_INFO << client_ip << " <- " << format_response_line(response);
  try {
    co_await write_response(client, response);
  } catch (std::exception& e) {
    RELAY_LOG_WARN << "Failed to send response to client " << client_ip
                   << ": " << e.what();
    co_return false;
  }
  co_return true;
}

net::awaitable<void> send_error(tcp::socket& client,
                                const std::string& client_ip,
                                http::status status) {
  auto response = make_error_response(status);
  co_await send_response(client, client_ip, response);
}

} // namespace

net::awaitable<void> handle_connection(tcp::socket client,
                                       SessionContext& context) {
  beast::error_code ec;
  auto peer = client.remote_endpoint(ec);
  if (ec) {
    RELAY_LOG_WARN << "Dropping connection with unknown peer: "
                   << ec.message();
    co_return;
  }
  const std::string client_ip = peer.address().to_string();
  RELAY_LOG_INFO << "Connection received from " << client_ip;

  auto upstream = co_await context.router.route();
  if (!upstream) {
    co_await send_error(client, client_ip, http::status::bad_gateway);
    co_return;
  }

  beast::flat_buffer client_buffer;
  beast::flat_buffer upstream_buffer;

  while (true) {
    std::optional<HttpRequest> request;
    std::optional<FramingError> framing_error;
    try {
      request = co_await read_request(client, client_buffer, context.limits);
    } catch (FramingError& e) {
      framing_error = e;
    }

    if (framing_error) {
      if (framing_error->is_clean_close()) {
        RELAY_LOG_DEBUG << "Client " << client_ip
                        << " finished sending requests, closing connection";
        co_return;
      }
      auto status = status_for(*framing_error);
      if (!status) {
        RELAY_LOG_INFO << "Error reading request from client " << client_ip
                       << ": " << framing_error->what();
        co_return;
      }
      RELAY_LOG_DEBUG << "Error parsing request from " << client_ip << ": "
                      << to_string(framing_error->kind()) << " ("
                      << framing_error->what() << ")";
      // whatever is left of the bad request cannot start a new one
      client_buffer.consume(client_buffer.size());
      auto response = make_error_response(*status);
      if (!co_await send_response(client, client_ip, response))
        co_return;
      continue;
    }

    RELAY_LOG_INFO << client_ip << " -> " << upstream->address << ": "
                   << format_request_line(*request);

    if (context.rate_limiter.check_and_record(client_ip) ==
        RateDecision::denied) {
      RELAY_LOG_INFO << "Rate limit exceeded for " << client_ip;
      auto response = make_error_response(http::status::too_many_requests);
      if (!co_await send_response(client, client_ip, response))
        co_return;
      continue;
    }

    extend_header(*request, "x-forwarded-for", client_ip);

    bool forwarded = true;
    try {
      co_await write_request(upstream->socket, *request);
    } catch (std::exception& e) {
      RELAY_LOG_ERROR << "Failed to send request to upstream "
                      << upstream->address << ": " << e.what();
      forwarded = false;
    }
    if (!forwarded) {
      co_await send_error(client, client_ip, http::status::bad_gateway);
      co_return;
    }
    RELAY_LOG_DEBUG << "Forwarded request to upstream " << upstream->address;

    std::optional<HttpResponse> response;
    try {
      response = co_await read_response(upstream->socket, upstream_buffer,
                                        request->method(), context.limits);
    } catch (std::exception& e) {
      RELAY_LOG_ERROR << "Error reading response from upstream "
                      << upstream->address << ": " << e.what();
    }
    if (!response) {
      co_await send_error(client, client_ip, http::status::bad_gateway);
      co_return;
    }

    if (!co_await send_response(client, client_ip, *response))
      co_return;
    RELAY_LOG_DEBUG << "Forwarded response to client " << client_ip;
  }
}

} // namespace relay
