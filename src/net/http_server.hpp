#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace conductor::net {

using json = nlohmann::json;

constexpr std::size_t kMaxRequestBodyBytes = 8 * 1024 * 1024;

struct HttpRequest {
  std::string method;
  std::string target;
  std::string path;
  std::string query;
  std::map<std::string, std::string> headers;  // lower-cased names
  std::string body;

  std::string header(const std::string &name) const;

  // Request line and headers, up to and including the blank line. nullopt
  // when malformed.
  static std::optional<HttpRequest> parse_head(const std::string &head);
};

std::string status_text(int status);

// Writes one response on a connection with blocking I/O. Every method returns
// false once the peer is gone.
class ResponseWriter {
 public:
  explicit ResponseWriter(asio::ip::tcp::socket &socket) : socket_(socket) {}

  bool send(int status, const std::string &content_type, const std::string &body);
  bool send_json(int status, const json &body);

  // Status line and headers for a body of unknown length, closed with the
  // connection
  bool begin_stream(const std::string &content_type = "text/event-stream");

  // "data: <json>\n\n"
  bool write_event(const json &data);

  bool headers_sent() const {
    return headers_sent_;
  }

 private:
  bool write(const std::string &data);

  asio::ip::tcp::socket &socket_;
  bool headers_sent_ = false;
  bool failed_ = false;
};

using Handler = std::function<void(const HttpRequest &, ResponseWriter &)>;

// Minimal HTTP/1.1 server. Connections are accepted on the io_context and each
// is served on its own worker thread, one request per connection.
class HttpServer {
 public:
  // Binds immediately; port 0 picks an ephemeral port. Throws
  // asio::system_error when the address cannot be bound.
  HttpServer(asio::io_context &io_ctx, const std::string &host, uint16_t port);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  void route(const std::string &method, const std::string &path, Handler handler);

  void start();

  // Stop accepting, shut down open connections and join the workers
  void stop();

  uint16_t port() const {
    return port_;
  }

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void start_accept();
  void serve(std::shared_ptr<asio::ip::tcp::socket> socket);
  void reap_workers(bool all);
  void close_acceptor();

  asio::io_context &io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  uint16_t port_ = 0;
  std::atomic<bool> running_{false};

  std::mutex routes_mutex_;
  std::map<std::pair<std::string, std::string>, Handler> routes_;

  std::mutex workers_mutex_;
  std::list<Worker> workers_;
  std::set<std::shared_ptr<asio::ip::tcp::socket>> connections_;
};

}  // namespace conductor::net
