#include "net/http_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace conductor::net {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

// One request/response exchange. All handlers run on a strand, so the session
// state needs no locking even when several threads run the io_context.
class Session : public std::enable_shared_from_this<Session> {
 public:
  Session(asio::io_context &io, std::shared_ptr<asio::ssl::context> ssl_ctx, ParsedUrl url, HttpOptions opts)
      : strand_(asio::make_strand(io)),
        ssl_ctx_(std::move(ssl_ctx)),
        resolver_(strand_),
        stream_(strand_, *ssl_ctx_),
        timer_(strand_),
        url_(std::move(url)),
        opts_(std::move(opts)) {}

  std::future<HttpResponse> start() {
    auto future = promise_.get_future();
    request_ = build_request();

    auto self = shared_from_this();
    asio::post(strand_, [self]() {
      self->timer_.expires_after(self->opts_.timeout);
      self->timer_.async_wait([self](const asio::error_code &ec) {
        if (!ec) {
          self->fail("Request timed out after " + std::to_string(self->opts_.timeout.count()) + " ms");
        }
      });

      self->resolver_.async_resolve(
          self->url_.host, self->url_.port_or_default(),
          [self](const asio::error_code &ec, asio::ip::tcp::resolver::results_type results) {
            self->on_resolve(ec, std::move(results));
          });
    });
    return future;
  }

 private:
  std::string build_request() const {
    std::string host_header = url_.host;
    if (!url_.port.empty()) {
      host_header += ":" + url_.port;
    }

    std::string req = opts_.method + " " + url_.target() + " HTTP/1.1\r\n";
    req += "Host: " + host_header + "\r\n";

    bool has_user_agent = false;
    for (const auto &[name, value] : opts_.headers) {
      if (to_lower(name) == "user-agent") has_user_agent = true;
      req += name + ": " + value + "\r\n";
    }
    if (!has_user_agent) {
      req += "User-Agent: conductor/1.0\r\n";
    }
    if (!opts_.body.empty() || opts_.method == "POST" || opts_.method == "PUT") {
      req += "Content-Length: " + std::to_string(opts_.body.size()) + "\r\n";
    }
    req += "Connection: close\r\n\r\n";
    req += opts_.body;
    return req;
  }

  void on_resolve(const asio::error_code &ec, asio::ip::tcp::resolver::results_type results) {
    if (done_) return;
    if (ec) {
      return fail("Failed to resolve " + url_.host + ": " + ec.message());
    }
    auto self = shared_from_this();
    asio::async_connect(stream_.next_layer(), results,
                        [self](const asio::error_code &ec, const asio::ip::tcp::endpoint &) { self->on_connect(ec); });
  }

  void on_connect(const asio::error_code &ec) {
    if (done_) return;
    if (ec) {
      return fail("Failed to connect to " + url_.host + ":" + url_.port_or_default() + ": " + ec.message());
    }

    if (!url_.is_https()) {
      return write();
    }

    if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
      return fail("Failed to set TLS server name for " + url_.host);
    }
    stream_.set_verify_mode(asio::ssl::verify_peer);
    stream_.set_verify_callback(asio::ssl::host_name_verification(url_.host));

    auto self = shared_from_this();
    stream_.async_handshake(asio::ssl::stream_base::client, [self](const asio::error_code &ec) {
      if (self->done_) return;
      if (ec) {
        return self->fail("TLS handshake with " + self->url_.host + " failed: " + ec.message());
      }
      self->write();
    });
  }

  void write() {
    auto self = shared_from_this();
    auto handler = [self](const asio::error_code &ec, std::size_t) {
      if (self->done_) return;
      if (ec) {
        return self->fail("Failed to send request: " + ec.message());
      }
      self->read();
    };
    if (url_.is_https()) {
      asio::async_write(stream_, asio::buffer(request_), handler);
    } else {
      asio::async_write(stream_.next_layer(), asio::buffer(request_), handler);
    }
  }

  void read() {
    auto self = shared_from_this();
    auto handler = [self](const asio::error_code &ec, std::size_t n) { self->on_read(ec, n); };
    if (url_.is_https()) {
      stream_.async_read_some(asio::buffer(chunk_), handler);
    } else {
      stream_.next_layer().async_read_some(asio::buffer(chunk_), handler);
    }
  }

  void on_read(const asio::error_code &ec, std::size_t n) {
    if (done_) return;
    raw_.append(chunk_.data(), n);

    if (!ec) {
      if (complete()) {
        return finish();
      }
      return read();
    }
    if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
      return finish();
    }
    fail("Failed to read response: " + ec.message());
  }

  // True once the body is fully received according to the response headers
  bool complete() const {
    auto header_end = raw_.find("\r\n\r\n");
    if (header_end == std::string::npos) return false;

    std::string head = to_lower(raw_.substr(0, header_end));
    std::size_t body_size = raw_.size() - header_end - 4;

    if (head.find("transfer-encoding: chunked") != std::string::npos) {
      return raw_.size() >= 5 && raw_.compare(raw_.size() - 5, 5, "0\r\n\r\n") == 0;
    }

    auto pos = head.find("content-length:");
    if (pos == std::string::npos) return false;
    auto line_end = head.find("\r\n", pos);
    std::string value = trim(head.substr(pos + 15, line_end == std::string::npos ? std::string::npos : line_end - pos - 15));
    try {
      return body_size >= std::stoul(value);
    } catch (const std::exception &) {
      return false;
    }
  }

  void close() {
    asio::error_code ignored;
    timer_.cancel();
    resolver_.cancel();
    stream_.next_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    stream_.next_layer().close(ignored);
  }

  void finish() {
    done_ = true;
    close();

    HttpResponse resp = parse_response(raw_);
    if (resp.status_code == 0 && resp.error.empty()) {
      resp.error = "Malformed HTTP response";
    }
    promise_.set_value(std::move(resp));
  }

  void fail(const std::string &message) {
    if (done_) return;
    done_ = true;
    close();

    spdlog::debug("[HTTP] {} {}://{}{} failed: {}", opts_.method, url_.scheme, url_.host, url_.path, message);
    HttpResponse resp;
    resp.error = message;
    promise_.set_value(std::move(resp));
  }

  asio::strand<asio::io_context::executor_type> strand_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
  asio::ip::tcp::resolver resolver_;
  asio::ssl::stream<asio::ip::tcp::socket> stream_;
  asio::steady_timer timer_;

  ParsedUrl url_;
  HttpOptions opts_;
  std::string request_;
  std::string raw_;
  std::array<char, 8192> chunk_{};
  std::promise<HttpResponse> promise_;
  bool done_ = false;
};

}  // namespace

// ============================================================
// ParsedUrl
// ============================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = to_lower(url.substr(0, scheme_end));
  if (result.scheme != "http" && result.scheme != "https") {
    return std::nullopt;
  }

  std::string rest = url.substr(scheme_end + 3);
  auto fragment = rest.find('#');
  if (fragment != std::string::npos) {
    rest.erase(fragment);
  }

  auto authority_end = rest.find_first_of("/?");
  std::string authority = rest.substr(0, authority_end);
  std::string remainder = authority_end == std::string::npos ? "" : rest.substr(authority_end);

  if (!authority.empty() && authority.front() == '[') {
    auto bracket = authority.find(']');
    if (bracket == std::string::npos) return std::nullopt;
    result.host = authority.substr(1, bracket - 1);
    if (bracket + 1 < authority.size() && authority[bracket + 1] == ':') {
      result.port = authority.substr(bracket + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      result.host = authority.substr(0, colon);
      result.port = authority.substr(colon + 1);
    } else {
      result.host = authority;
    }
  }

  if (result.host.empty()) {
    return std::nullopt;
  }
  if (!result.port.empty() &&
      !std::all_of(result.port.begin(), result.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }

  auto query_start = remainder.find('?');
  if (query_start != std::string::npos) {
    result.query = remainder.substr(query_start);
    remainder.erase(query_start);
  }
  result.path = remainder.empty() ? "/" : remainder;
  return result;
}

// ============================================================
// HttpResponse
// ============================================================

std::string HttpResponse::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? "" : it->second;
}

std::optional<std::string> decode_chunked(const std::string &body) {
  std::string out;
  std::size_t pos = 0;

  while (true) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) {
      return std::nullopt;
    }

    std::string size_line = body.substr(pos, line_end - pos);
    auto ext = size_line.find(';');
    if (ext != std::string::npos) {
      size_line.erase(ext);
    }
    size_line = trim(size_line);
    if (size_line.empty()) {
      return std::nullopt;
    }

    std::size_t size = 0;
    try {
      std::size_t consumed = 0;
      size = std::stoul(size_line, &consumed, 16);
      if (consumed != size_line.size()) {
        return std::nullopt;
      }
    } catch (const std::exception &) {
      return std::nullopt;
    }

    pos = line_end + 2;
    if (size == 0) {
      return out;
    }
    if (pos + size + 2 > body.size() || body.compare(pos + size, 2, "\r\n") != 0) {
      return std::nullopt;
    }
    out.append(body, pos, size);
    pos += size + 2;
  }
}

HttpResponse parse_response(const std::string &raw) {
  HttpResponse resp;

  auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return resp;
  }

  auto status_end = raw.find("\r\n");
  std::string status_line = raw.substr(0, status_end);
  if (status_line.rfind("HTTP/", 0) != 0) {
    return resp;
  }
  auto code_start = status_line.find(' ');
  if (code_start == std::string::npos) {
    return resp;
  }
  try {
    resp.status_code = std::stoi(status_line.substr(code_start + 1, 3));
  } catch (const std::exception &) {
    return resp;
  }

  std::size_t pos = status_end + 2;
  while (pos < header_end) {
    auto line_end = raw.find("\r\n", pos);
    std::string line = raw.substr(pos, line_end - pos);
    pos = line_end + 2;

    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    resp.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }

  resp.body = raw.substr(header_end + 4);

  if (to_lower(resp.header("transfer-encoding")).find("chunked") != std::string::npos) {
    auto decoded = decode_chunked(resp.body);
    if (!decoded) {
      resp.status_code = 0;
      resp.error = "Malformed chunked response body";
      return resp;
    }
    resp.body = std::move(*decoded);
  }
  return resp;
}

// ============================================================
// HttpClient
// ============================================================

HttpClient::HttpClient(asio::io_context &io_ctx)
    : io_ctx_(io_ctx), ssl_ctx_(std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client)) {
  ssl_ctx_->set_default_verify_paths();
}

std::future<HttpResponse> HttpClient::request(const std::string &url, const HttpOptions &opts) {
  auto parsed = ParsedUrl::parse(url);
  if (!parsed) {
    std::promise<HttpResponse> promise;
    HttpResponse resp;
    resp.error = "Invalid URL: " + url;
    promise.set_value(std::move(resp));
    return promise.get_future();
  }

  spdlog::debug("[HTTP] {} {}", opts.method, url);
  auto session = std::make_shared<Session>(io_ctx_, ssl_ctx_, std::move(*parsed), opts);
  return session->start();
}

}  // namespace conductor::net
