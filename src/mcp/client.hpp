#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "tool/tool.hpp"
#include "transport.hpp"

namespace conductor::mcp {

using json = nlohmann::json;

// MCP server capabilities (returned during initialize)
struct ServerCapabilities {
  bool supports_tools = false;
  bool supports_resources = false;
  bool supports_prompts = false;
  bool supports_logging = false;
};

enum class ClientState { Disconnected, Connecting, Initializing, Ready, Failed };

std::string to_string(ClientState state);

struct ClientOptions {
  // Applies to initialize and tools/list
  std::chrono::milliseconds request_timeout{10000};
  // Applies to tools/call; zero waits forever
  std::chrono::milliseconds call_timeout{0};
};

// Extracts the first text segment of a tools/call result, "" if there is none.
// Throws json::type_error when a text segment is not a string.
std::string first_text_segment(const json &result);

// MCP client: protocol semantics over one provider's transport.
//
// Calls are serialized: at most one tools/call is in flight per client, so
// concurrent turns using the same provider queue here.
class McpClient : public ToolProvider {
 public:
  McpClient(std::string name, std::unique_ptr<Transport> transport, ClientOptions options = {});

  // Spawns the configured command over a StdioTransport. Throws
  // std::invalid_argument for an unknown framing.
  explicit McpClient(const McpServerConfig &config, ClientOptions options = {});

  ~McpClient() override;

  // Connect the transport and perform the initialize handshake. Throws
  // TransportError or StartupError.
  void connect();
  void disconnect();

  ClientState state() const;
  bool is_ready() const {
    return state() == ClientState::Ready;
  }

  const std::string &name() const override {
    return name_;
  }

  // tools/list, following pagination cursors
  std::vector<ToolDescriptor> discover() override;

  // tools/call
  std::string invoke(const std::string &tool, const json &arguments) override;

  const ServerCapabilities &capabilities() const {
    return capabilities_;
  }

  Transport &transport() {
    return *transport_;
  }

 private:
  void initialize();

  // One tools/list page into `tools`; sets `cursor` when another page follows.
  // Throws StartupError for entries that are not tool objects.
  void parse_tool_page(const json &result, std::vector<ToolDescriptor> &tools, std::string &cursor) const;

  // Throws TransportError on channel failure or timeout
  JsonRpcResponse request(const std::string &method, json params, std::chrono::milliseconds timeout);

  std::string name_;
  std::unique_ptr<Transport> transport_;
  ClientOptions options_;
  ServerCapabilities capabilities_;
  std::atomic<ClientState> state_{ClientState::Disconnected};
  std::atomic<int64_t> next_request_id_{1};
  std::mutex call_mutex_;
};

}  // namespace conductor::mcp
