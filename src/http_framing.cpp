#include "http_framing.hpp"

#include <sstream>

namespace relay {

namespace {

bool is_parse_error(const beast::error_code& ec) {
  return ec.category() ==
         http::make_error_code(http::error::bad_method).category();
}

std::string version_string(unsigned version) {
  return "HTTP/" + std::to_string(version / 10) + "." +
         std::to_string(version % 10);
}

// content_length() may only be queried once the header is complete.
template <bool isRequest>
bool has_content_length(const http::basic_parser<isRequest>& parser) {
  return parser.is_header_done() && parser.content_length().has_value();
}

} // namespace

FramingErrorKind classify_read_error(const beast::error_code& ec,
                                     bool header_done,
                                     bool has_content_length) {
  if (ec == http::error::end_of_stream)
    return FramingErrorKind::incomplete_request;
  if (ec == http::error::partial_message) {
    if (header_done && has_content_length)
      return FramingErrorKind::content_length_mismatch;
    return FramingErrorKind::incomplete_request;
  }
  if (ec == http::error::bad_content_length)
    return FramingErrorKind::invalid_content_length;
  if (ec == http::error::body_limit)
    return FramingErrorKind::request_body_too_large;
  if (is_parse_error(ec))
    return FramingErrorKind::malformed_request;
  return FramingErrorKind::connection_error;
}

std::optional<http::status> status_for(const FramingError& error) {
  switch (error.kind()) {
  case FramingErrorKind::incomplete_request:
    if (error.bytes_read() == 0)
      return std::nullopt;
    return http::status::bad_request;
  case FramingErrorKind::malformed_request:
  case FramingErrorKind::invalid_content_length:
  case FramingErrorKind::content_length_mismatch:
    return http::status::bad_request;
  case FramingErrorKind::request_body_too_large:
    return http::status::payload_too_large;
  case FramingErrorKind::connection_error:
    return std::nullopt;
  }
  return std::nullopt;
}

const char* to_string(FramingErrorKind kind) {
  switch (kind) {
  case FramingErrorKind::incomplete_request:
    return "incomplete request";
  case FramingErrorKind::malformed_request:
    return "malformed request";
  case FramingErrorKind::invalid_content_length:
    return "invalid content length";
  case FramingErrorKind::content_length_mismatch:
    return "content length mismatch";
  case FramingErrorKind::request_body_too_large:
    return "request body too large";
  case FramingErrorKind::connection_error:
    return "connection error";
  }
  return "unknown";
}

net::awaitable<HttpRequest> read_request(tcp::socket& stream,
                                         beast::flat_buffer& buffer,
                                         const FramingLimits& limits) {
  http::request_parser<http::string_body> parser;
  parser.header_limit(limits.max_header_size);
  parser.body_limit(limits.max_body_size);

  beast::error_code ec;
  std::size_t consumed = co_await http::async_read(
      stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    // end_of_stream is only reported when nothing at all arrived
    std::size_t seen =
        ec == http::error::end_of_stream ? 0 : consumed + buffer.size();
    throw FramingError(classify_read_error(ec, parser.is_header_done(),
                                           has_content_length(parser)),
                       seen, ec);
  }
  co_return parser.release();
}

net::awaitable<HttpResponse> read_response(tcp::socket& stream,
                                           beast::flat_buffer& buffer,
                                           http::verb request_method,
                                           const FramingLimits& limits) {
  http::response_parser<http::string_body> parser;
  parser.header_limit(limits.max_header_size);
  parser.body_limit(limits.max_body_size);
  if (request_method == http::verb::head)
    parser.skip(true);

  beast::error_code ec;
  std::size_t consumed = co_await http::async_read(
      stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    throw FramingError(classify_read_error(ec, parser.is_header_done(),
                                           has_content_length(parser)),
                       consumed, ec);
  }
  co_return parser.release();
}

net::awaitable<void> write_request(tcp::socket& stream, HttpRequest& request) {
  co_await http::async_write(stream, request, net::use_awaitable);
}

net::awaitable<void> write_response(tcp::socket& stream,
                                    HttpResponse& response) {
  co_await http::async_write(stream, response, net::use_awaitable);
}

void extend_header(HttpRequest& request, const std::string& name,
                   const std::string& value) {
  auto it = request.find(name);
  if (it == request.end()) {
    request.set(name, value);
    return;
  }
  auto existing = it->value();
  request.set(name, std::string(existing.data(), existing.size()) + ", " +
                        value);
}

HttpResponse make_error_response(http::status status) {
  HttpResponse res{status, 11};
  res.set(http::field::content_type, "text/plain");
  auto reason = http::obsolete_reason(status);
  res.body() = "HTTP " + std::to_string(static_cast<unsigned>(status)) + " " +
               std::string(reason.data(), reason.size());
  res.prepare_payload();
  return res;
}

std::string format_request_line(const HttpRequest& request) {
  std::ostringstream out;
  out << request.method_string() << " " << request.target() << " "
      << version_string(request.version());
  return out.str();
}

std::string format_response_line(const HttpResponse& response) {
  std::ostringstream out;
  out << version_string(response.version()) << " " << response.result_int()
      << " " << response.reason();
  return out.str();
}

} // namespace relay
