#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace conductor::net {

struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;   // empty when the URL names none
  std::string path;   // always starts with '/'
  std::string query;  // including the leading '?'

  static std::optional<ParsedUrl> parse(const std::string &url);

  std::string port_or_default() const {
    if (!port.empty()) return port;
    return is_https() ? "443" : "80";
  }

  bool is_https() const {
    return scheme == "https";
  }

  std::string target() const {
    return path + query;
  }
};

struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // lower-cased names
  std::string body;
  std::string error;  // transport-level failure; status_code stays 0

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }

  std::string header(const std::string &name) const;
};

// Decodes a chunked transfer-encoded body. Returns nullopt on malformed input.
std::optional<std::string> decode_chunked(const std::string &body);

// Parses a raw HTTP/1.x response (status line, headers, body)
HttpResponse parse_response(const std::string &raw);

// HTTP/1.1 client over plain TCP or TLS. Requests run asynchronously on the
// given io_context, which the caller must keep running.
class HttpClient {
 public:
  explicit HttpClient(asio::io_context &io_ctx);

  // Never throws for network failures: they are reported in HttpResponse::error
  std::future<HttpResponse> request(const std::string &url, const HttpOptions &opts = {});

 private:
  asio::io_context &io_ctx_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
};

}  // namespace conductor::net
