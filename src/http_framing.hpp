// http_framing.hpp

#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace relay {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

struct FramingLimits {
  std::uint32_t max_header_size = 8000;
  std::uint64_t max_body_size = 10000000;
};

enum class FramingErrorKind {
  incomplete_request,
  malformed_request,
  invalid_content_length,
  content_length_mismatch,
  request_body_too_large,
  connection_error,
};

class FramingError : public std::runtime_error {
public:
  FramingError(FramingErrorKind kind, std::size_t bytes_read,
               beast::error_code ec)
      : std::runtime_error(ec.message()), kind_(kind), bytes_read_(bytes_read),
        code_(ec) {}

  FramingErrorKind kind() const { return kind_; }
  std::size_t bytes_read() const { return bytes_read_; }
  beast::error_code code() const { return code_; }

  // The client hung up between requests.
  bool is_clean_close() const {
    return kind_ == FramingErrorKind::incomplete_request && bytes_read_ == 0;
  }

private:
  FramingErrorKind kind_;
  std::size_t bytes_read_;
  beast::error_code code_;
};

// Maps a failed read to an error kind. header_done says whether the parser
// got through the header, has_content_length whether it declared one.
FramingErrorKind classify_read_error(const beast::error_code& ec,
                                     bool header_done,
                                     bool has_content_length);

// Status to answer a request framing error with; nullopt means the session
// should end without a response.
std::optional<http::status> status_for(const FramingError& error);

const char* to_string(FramingErrorKind kind);

net::awaitable<HttpRequest> read_request(tcp::socket& stream,
                                         beast::flat_buffer& buffer,
                                         const FramingLimits& limits);

net::awaitable<HttpResponse> read_response(tcp::socket& stream,
                                           beast::flat_buffer& buffer,
                                           http::verb request_method,
                                           const FramingLimits& limits);

net::awaitable<void> write_request(tcp::socket& stream, HttpRequest& request);

net::awaitable<void> write_response(tcp::socket& stream,
                                    HttpResponse& response);

void extend_header(HttpRequest& request, const std::string& name,
                   const std::string& value);

HttpResponse make_error_response(http::status status);

std::string format_request_line(const HttpRequest& request);
std::string format_response_line(const HttpResponse& response);

} // namespace relay
