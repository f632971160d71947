#include "mcp/client.hpp"

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace conductor::mcp {

// ============================================================
// ClientState helpers
// ============================================================

std::string to_string(ClientState state) {
  switch (state) {
    case ClientState::Disconnected:
      return "Disconnected";
    case ClientState::Connecting:
      return "Connecting";
    case ClientState::Initializing:
      return "Initializing";
    case ClientState::Ready:
      return "Ready";
    case ClientState::Failed:
      return "Failed";
  }
  return "Unknown";
}

std::string first_text_segment(const json &result) {
  if (!result.is_object() || !result.contains("content") || !result["content"].is_array()) {
    return "";
  }
  for (const auto &content : result["content"]) {
    if (content.is_object() && content.value("type", "") == "text") {
      return content.value("text", "");
    }
  }
  return "";
}

// ============================================================
// McpClient
// ============================================================

McpClient::McpClient(std::string name, std::unique_ptr<Transport> transport, ClientOptions options)
    : name_(std::move(name)), transport_(std::move(transport)), options_(options) {}

McpClient::McpClient(const McpServerConfig &config, ClientOptions options)
    : McpClient(config.name,
                std::make_unique<StdioTransport>(config.command, config.args, config.env,
                                                 StdioOptions{framing_from_string(config.framing), config.forward_stderr}),
                options) {}

McpClient::~McpClient() {
  disconnect();
}

void McpClient::connect() {
  state_ = ClientState::Connecting;

  try {
    transport_->connect();
  } catch (const TransportError &e) {
    spdlog::error("[MCP] Failed to connect transport for server '{}': {}", name_, e.what());
    state_ = ClientState::Failed;
    throw;
  }

  transport_->set_notification_handler([this](const std::string &method, const json &params) {
    spdlog::debug("[MCP] Notification from '{}': {} {}", name_, method, params.dump());

    if (method == "notifications/tools/list_changed") {
      spdlog::warn("[MCP] Server '{}' changed its tool list; restart to pick up the change", name_);
    }
  });

  try {
    initialize();
  } catch (const Error &e) {
    spdlog::error("[MCP] Initialize handshake failed for server '{}': {}", name_, e.what());
    state_ = ClientState::Failed;
    throw;
  }

  state_ = ClientState::Ready;
  spdlog::info("[MCP] Server '{}' is ready", name_);
}

void McpClient::disconnect() {
  if (transport_) {
    transport_->disconnect();
  }
  state_ = ClientState::Disconnected;
}

ClientState McpClient::state() const {
  if (state_ == ClientState::Ready && transport_->state() == TransportState::Failed) {
    return ClientState::Failed;
  }
  return state_;
}

JsonRpcResponse McpClient::request(const std::string &method, json params, std::chrono::milliseconds timeout) {
  JsonRpcRequest req;
  req.method = method;
  req.id = next_request_id_++;
  req.params = std::move(params);

  auto future = transport_->send_request(req);

  if (timeout.count() > 0 && future.wait_for(timeout) != std::future_status::ready) {
    transport_->abandon(req.id);
    throw TransportError("Server '" + name_ + "' did not answer " + method + " within " + std::to_string(timeout.count()) +
                         " ms");
  }
  return future.get();
}

void McpClient::initialize() {
  state_ = ClientState::Initializing;

  json params{{"protocolVersion", "2024-11-05"},
              {"capabilities", json::object()},
              {"clientInfo", json{{"name", "conductor"}, {"version", "1.0.0"}}}};

  auto resp = request("initialize", std::move(params), options_.request_timeout);
  if (!resp.ok()) {
    throw StartupError("Initialize error from '" + name_ + "': " + resp.error_message());
  }

  if (resp.result.has_value()) {
    auto &result = resp.result.value();
    if (result.contains("capabilities")) {
      auto &caps = result["capabilities"];
      capabilities_.supports_tools = caps.contains("tools");
      capabilities_.supports_resources = caps.contains("resources");
      capabilities_.supports_prompts = caps.contains("prompts");
      capabilities_.supports_logging = caps.contains("logging");
    }

    if (result.contains("serverInfo")) {
      auto &info = result["serverInfo"];
      spdlog::info("[MCP] Server '{}' info: {} v{}", name_, info.value("name", "unknown"), info.value("version", "unknown"));
    }
  }

  JsonRpcNotification notif;
  notif.method = "notifications/initialized";
  transport_->send_notification(notif);
}

void McpClient::parse_tool_page(const json &result, std::vector<ToolDescriptor> &tools, std::string &cursor) const {
  if (result.contains("tools") && result["tools"].is_array()) {
    for (const auto &tool_json : result["tools"]) {
      if (!tool_json.is_object()) {
        throw StartupError("tools/list from '" + name_ + "' contains a non-object entry: " + tool_json.dump());
      }
      if (!tool_json.contains("name")) {
        spdlog::warn("[MCP] Server '{}' listed a tool without a name; skipping", name_);
        continue;
      }
      if (!tool_json["name"].is_string() || tool_json["name"].get<std::string>().empty()) {
        throw StartupError("tools/list from '" + name_ + "' contains a tool with an invalid name: " + tool_json.dump());
      }

      ToolDescriptor info;
      info.name = tool_json["name"].get<std::string>();
      if (tool_json.contains("description") && tool_json["description"].is_string()) {
        info.description = tool_json["description"].get<std::string>();
      }
      if (tool_json.contains("inputSchema") && tool_json["inputSchema"].is_object()) {
        info.input_schema = tool_json["inputSchema"];
      }
      tools.push_back(std::move(info));
    }
  }
  if (result.contains("nextCursor") && result["nextCursor"].is_string()) {
    cursor = result["nextCursor"].get<std::string>();
  }
}

std::vector<ToolDescriptor> McpClient::discover() {
  if (state() != ClientState::Ready) {
    throw TransportError("Server '" + name_ + "' is not ready (" + to_string(state()) + ")");
  }
  if (!capabilities_.supports_tools) {
    spdlog::warn("[MCP] Server '{}' did not advertise tools; listing anyway", name_);
  }

  std::vector<ToolDescriptor> tools;
  std::string cursor;
  do {
    json params = json::object();
    if (!cursor.empty()) {
      params["cursor"] = cursor;
    }

    auto resp = request("tools/list", std::move(params), options_.request_timeout);
    if (!resp.ok()) {
      throw StartupError("tools/list error from '" + name_ + "': " + resp.error_message());
    }

    cursor.clear();
    if (resp.result.has_value()) {
      try {
        parse_tool_page(*resp.result, tools, cursor);
      } catch (const json::exception &e) {
        throw StartupError("Malformed tools/list result from '" + name_ + "': " + e.what());
      }
    }
  } while (!cursor.empty());

  spdlog::info("[MCP] Server '{}' provides {} tools", name_, tools.size());
  return tools;
}

std::string McpClient::invoke(const std::string &tool, const json &arguments) {
  std::lock_guard<std::mutex> lock(call_mutex_);

  if (state() != ClientState::Ready) {
    throw TransportError("Server '" + name_ + "' is not available (" + to_string(state()) + ")");
  }

  json args = arguments.is_null() ? json::object() : arguments;
  spdlog::debug("[MCP] tools/call '{}' on '{}' args={}", tool, name_, args.dump());

  auto resp = request("tools/call", json{{"name", tool}, {"arguments", std::move(args)}}, options_.call_timeout);
  if (!resp.ok()) {
    throw ToolInvocationError(tool, resp.error_message());
  }

  json result = resp.result.value_or(json::object());
  std::string text;
  bool is_error = false;
  try {
    text = first_text_segment(result);
    is_error = result.is_object() && result.value("isError", false);
  } catch (const json::exception &e) {
    throw ToolInvocationError(tool, std::string("Malformed tools/call result: ") + e.what());
  }

  if (is_error) {
    throw ToolInvocationError(tool, text.empty() ? "Tool '" + tool + "' reported an error" : text);
  }
  return text;
}

}  // namespace conductor::mcp
