#include "net/http_server.hpp"

#include <spdlog/spdlog.h>
#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <sstream>

namespace conductor::net {

namespace {

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

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

asio::ip::tcp::endpoint make_endpoint(asio::io_context &io_ctx, const std::string &host, uint16_t port) {
  asio::ip::tcp::resolver resolver(io_ctx);
  auto results = resolver.resolve(host, std::to_string(port), asio::ip::tcp::resolver::passive);
  return results.begin()->endpoint();
}

}  // namespace

// ============================================================
// HttpRequest
// ============================================================

std::string HttpRequest::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? "" : it->second;
}

std::optional<HttpRequest> HttpRequest::parse_head(const std::string &head) {
  auto line_end = head.find("\r\n");
  if (line_end == std::string::npos) {
    return std::nullopt;
  }

  HttpRequest req;
  std::istringstream request_line(head.substr(0, line_end));
  std::string version;
  if (!(request_line >> req.method >> req.target >> version) || version.rfind("HTTP/", 0) != 0) {
    return std::nullopt;
  }
  if (req.target.empty() || req.target.front() != '/') {
    return std::nullopt;
  }

  auto query_start = req.target.find('?');
  req.path = req.target.substr(0, query_start);
  if (query_start != std::string::npos) {
    req.query = req.target.substr(query_start);
  }

  std::size_t pos = line_end + 2;
  while (pos < head.size()) {
    auto next = head.find("\r\n", pos);
    if (next == std::string::npos) next = head.size();
    std::string line = head.substr(pos, next - pos);
    pos = next + 2;
    if (line.empty()) break;

    auto colon = line.find(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }
  return req;
}

std::string status_text(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 411:
      return "Length Required";
    case 413:
      return "Payload Too Large";
    case 431:
      return "Request Header Fields Too Large";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

// ============================================================
// ResponseWriter
// ============================================================

bool ResponseWriter::write(const std::string &data) {
  if (failed_) return false;
  asio::error_code ec;
  asio::write(socket_, asio::buffer(data), ec);
  if (ec) {
    spdlog::debug("[HTTP] Write failed: {}", ec.message());
    failed_ = true;
    return false;
  }
  return true;
}

bool ResponseWriter::send(int status, const std::string &content_type, const std::string &body) {
  headers_sent_ = true;
  std::string response = "HTTP/1.1 " + std::to_string(status) + " " + status_text(status) + "\r\n";
  response += "Content-Type: " + content_type + "\r\n";
  response += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  response += "Connection: close\r\n\r\n";
  response += body;
  return write(response);
}

bool ResponseWriter::send_json(int status, const json &body) {
  return send(status, "application/json", body.dump());
}

bool ResponseWriter::begin_stream(const std::string &content_type) {
  headers_sent_ = true;
  std::string response = "HTTP/1.1 200 OK\r\n";
  response += "Content-Type: " + content_type + "\r\n";
  response += "Cache-Control: no-cache\r\n";
  response += "X-Accel-Buffering: no\r\n";
  response += "Connection: close\r\n\r\n";
  return write(response);
}

bool ResponseWriter::write_event(const json &data) {
  return write("data: " + data.dump() + "\n\n");
}

// ============================================================
// HttpServer
// ============================================================

HttpServer::HttpServer(asio::io_context &io_ctx, const std::string &host, uint16_t port)
    : io_ctx_(io_ctx), acceptor_(io_ctx, make_endpoint(io_ctx, host, port)) {
  port_ = acceptor_.local_endpoint().port();
}

HttpServer::~HttpServer() {
  stop();
}

void HttpServer::route(const std::string &method, const std::string &path, Handler handler) {
  std::lock_guard<std::mutex> lock(routes_mutex_);
  routes_[{method, path}] = std::move(handler);
}

void HttpServer::start() {
  running_ = true;
  spdlog::info("[HTTP] Listening on {}:{}", acceptor_.local_endpoint().address().to_string(), port_);
  start_accept();
}

void HttpServer::start_accept() {
  auto socket = std::make_shared<asio::ip::tcp::socket>(io_ctx_);
  acceptor_.async_accept(*socket, [this, socket](std::error_code ec) {
    if (!running_) {
      return;
    }
    if (ec) {
      spdlog::warn("[HTTP] Accept failed: {}", ec.message());
    } else {
      reap_workers(false);
      auto done = std::make_shared<std::atomic<bool>>(false);
      std::lock_guard<std::mutex> lock(workers_mutex_);
      connections_.insert(socket);
      workers_.push_back(Worker{std::thread([this, socket, done]() {
                                  serve(socket);
                                  {
                                    std::lock_guard<std::mutex> lock(workers_mutex_);
                                    connections_.erase(socket);
                                  }
                                  *done = true;
                                }),
                                done});
    }
    start_accept();
  });
}

void HttpServer::serve(std::shared_ptr<asio::ip::tcp::socket> socket) {
  ResponseWriter writer(*socket);
  std::string buffer;
  asio::error_code ec;

  auto header_end = asio::read_until(*socket, asio::dynamic_buffer(buffer, kMaxHeaderBytes), "\r\n\r\n", ec);
  if (ec == asio::error::not_found) {
    writer.send_json(431, json{{"error", "Request headers too large"}});
  } else if (ec) {
    spdlog::debug("[HTTP] Connection closed before a request arrived: {}", ec.message());
  } else if (auto request = HttpRequest::parse_head(buffer.substr(0, header_end))) {
    std::string body = buffer.substr(header_end);
    std::size_t length = 0;
    bool valid = true;

    std::string content_length = request->header("content-length");
    if (!content_length.empty()) {
      try {
        length = std::stoul(content_length);
      } catch (const std::exception &) {
        valid = false;
      }
    } else if (!request->header("transfer-encoding").empty()) {
      writer.send_json(411, json{{"error", "Content-Length required"}});
      valid = false;
    }

    if (valid && length > kMaxRequestBodyBytes) {
      writer.send_json(413, json{{"error", "Request body too large"}});
      valid = false;
    }
    if (valid && body.size() < length) {
      asio::read(*socket, asio::dynamic_buffer(body), asio::transfer_exactly(length - body.size()), ec);
      if (ec) {
        spdlog::debug("[HTTP] Failed to read request body: {}", ec.message());
        valid = false;
      }
    }

    if (valid) {
      body.resize(length);
      request->body = std::move(body);
      spdlog::info("[HTTP] {} {}", request->method, request->target);

      Handler handler;
      {
        std::lock_guard<std::mutex> lock(routes_mutex_);
        auto it = routes_.find({request->method, request->path});
        if (it != routes_.end()) {
          handler = it->second;
        }
      }

      if (!handler) {
        writer.send_json(404, json{{"error", "Not found: " + request->method + " " + request->path}});
      } else {
        try {
          handler(*request, writer);
        } catch (const std::exception &e) {
          spdlog::error("[HTTP] Handler for {} {} failed: {}", request->method, request->path, e.what());
          if (!writer.headers_sent()) {
            writer.send_json(500, json{{"error", e.what()}});
          }
        }
      }
    } else if (!writer.headers_sent() && !ec) {
      writer.send_json(400, json{{"error", "Invalid Content-Length"}});
    }
  } else {
    writer.send_json(400, json{{"error", "Malformed request"}});
  }

  asio::error_code close_ec;
  socket->shutdown(asio::ip::tcp::socket::shutdown_both, close_ec);
  socket->close(close_ec);
}

void HttpServer::reap_workers(bool all) {
  std::list<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (all || *it->done) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

void HttpServer::close_acceptor() {
  asio::error_code ec;
  if (acceptor_.is_open()) {
    acceptor_.close(ec);
    if (ec) {
      spdlog::warn("[HTTP] Failed to close listener: {}", ec.message());
    }
  }
}

void HttpServer::stop() {
  running_ = false;

  // The acceptor belongs to the io thread; close it there unless that thread
  // is this one or no longer runs handlers
  if (io_ctx_.stopped() || io_ctx_.get_executor().running_in_this_thread()) {
    close_acceptor();
  } else {
    struct CloseState {
      std::mutex mutex;
      bool abandoned = false;
      std::promise<void> done;
    };
    auto state = std::make_shared<CloseState>();
    auto closed = state->done.get_future();
    asio::post(io_ctx_, [this, state]() {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (state->abandoned) return;
      close_acceptor();
      state->done.set_value();
    });
    if (closed.wait_for(std::chrono::seconds(1)) != std::future_status::ready) {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (!state->abandoned && closed.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        spdlog::warn("[HTTP] Event loop did not close the listener in time; closing it here");
        close_acceptor();
      }
      state->abandoned = true;
    }
  }

  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (const auto &socket : connections_) {
      // Unblocks a worker waiting on the peer
      ::shutdown(socket->native_handle(), SHUT_RDWR);
    }
  }
  reap_workers(true);
}

}  // namespace conductor::net
