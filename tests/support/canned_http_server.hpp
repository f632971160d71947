#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace conductor::test_support {

// Accepts a single connection on 127.0.0.1, records the request and answers
// with a fixed raw response. A positive delay holds the reply back, for
// exercising client timeouts.
class CannedHttpServer {
 public:
  explicit CannedHttpServer(std::string response, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
      : response_(std::move(response)),
        delay_(delay),
        acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this]() { serve(); });
  }

  ~CannedHttpServer() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();

    // Unblock a pending accept
    if (!accepted_) {
      asio::io_context io;
      asio::ip::tcp::socket poke(io);
      asio::error_code ec;
      poke.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port_), ec);
    }
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  CannedHttpServer(const CannedHttpServer &) = delete;
  CannedHttpServer &operator=(const CannedHttpServer &) = delete;

  uint16_t port() const {
    return port_;
  }

  std::string url(const std::string &path = "/") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  // Head and body of the received request, "" until one arrived
  std::string request() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::seconds(5), [this]() { return received_; });
    return request_;
  }

 private:
  void serve() {
    asio::ip::tcp::socket socket(io_);
    asio::error_code ec;
    acceptor_.accept(socket, ec);
    accepted_ = true;
    if (ec) return;

    asio::streambuf buf;
    asio::read_until(socket, buf, "\r\n\r\n", ec);
    if (ec) return;

    std::string data(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
    auto head_end = data.find("\r\n\r\n") + 4;
    std::size_t want = 0;
    auto pos = data.find("Content-Length: ");
    if (pos != std::string::npos && pos < head_end) {
      want = std::stoul(data.substr(pos + 16, data.find("\r\n", pos) - pos - 16));
    }
    while (data.size() - head_end < want) {
      char chunk[4096];
      auto n = socket.read_some(asio::buffer(chunk), ec);
      if (ec) break;
      data.append(chunk, n);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      request_ = data;
      received_ = true;
    }
    cv_.notify_all();

    if (delay_.count() > 0) {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, delay_, [this]() { return stopping_; });
    }

    asio::write(socket, asio::buffer(response_), ec);
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
  }

  std::string response_;
  std::chrono::milliseconds delay_;
  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  uint16_t port_ = 0;
  std::thread thread_;
  std::atomic<bool> accepted_{false};

  std::mutex mutex_;
  std::condition_variable cv_;
  std::string request_;
  bool received_ = false;
  bool stopping_ = false;
};

inline std::string http_response(int status, const std::string &body, const std::string &content_type = "application/json") {
  std::string reason = status == 200 ? "OK" : "Error";
  return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\nContent-Type: " + content_type +
         "\r\nContent-Length: " + std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
}

}  // namespace conductor::test_support
