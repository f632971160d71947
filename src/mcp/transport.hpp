#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "mcp/framing.hpp"

namespace conductor::mcp {

using json = nlohmann::json;

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string method;
  json params = json::object();
  int64_t id = 0;

  json to_json() const;
};

struct JsonRpcResponse {
  int64_t id = 0;
  std::optional<json> result;
  std::optional<json> error;

  bool ok() const {
    return !error.has_value();
  }

  std::string error_message() const;

  static JsonRpcResponse from_json(const json &j);
};

struct JsonRpcNotification {
  std::string method;
  json params = json::object();

  json to_json() const;
};

enum class TransportState { Disconnected, Connecting, Connected, Failed };

std::string to_string(TransportState state);

// Request/response channel to one provider. Responses are matched to requests
// by the JSON-RPC id.
class Transport {
 public:
  virtual ~Transport() = default;

  // The future throws TransportError if the channel is down or goes down
  // before the response arrives
  virtual std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) = 0;

  virtual void send_notification(const JsonRpcNotification &notification) = 0;

  // Forget a pending request whose caller stopped waiting for it
  virtual void abandon(int64_t id) = 0;

  using NotificationHandler = std::function<void(const std::string &method, const json &params)>;
  virtual void set_notification_handler(NotificationHandler handler) = 0;

  // Throws TransportError
  virtual void connect() = 0;
  virtual void disconnect() = 0;

  virtual TransportState state() const = 0;
  virtual bool is_connected() const {
    return state() == TransportState::Connected;
  }
};

struct StdioOptions {
  Framing framing = Framing::ContentLength;
  bool forward_stderr = true;
};

// Runs a provider as a child process and talks to it over its stdin/stdout
class StdioTransport : public Transport {
 public:
  StdioTransport(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env = {},
                 StdioOptions options = {});
  ~StdioTransport() override;

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) override;
  void send_notification(const JsonRpcNotification &notification) override;
  void abandon(int64_t id) override;
  void set_notification_handler(NotificationHandler handler) override;

  void connect() override;
  void disconnect() override;
  TransportState state() const override;

  // -1 when no child is running
  int pid() const;

  // Raw waitpid status once the child has been reaped
  std::optional<int> exit_status() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace conductor::mcp
