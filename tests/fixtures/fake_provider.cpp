// Scripted MCP server for tests. Speaks JSON-RPC over stdin/stdout.
//
//   fake_provider [--framing content-length|newline] [--tools a,b,...]
//                 [--page-size N] [--exit-on-start CODE] [--garbage]
//                 [--name NAME] [--bad-listing] [--close-stdout-on-call]
//
// Tools outside the default set, enabled through --tools: bad_text_tool and
// bad_flag_tool answer with wrongly typed result fields.

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

struct Options {
  bool newline = false;
  std::vector<std::string> tools = {"create_item", "list_items", "echo",      "fail_tool", "rpc_error_tool",
                                    "crash_tool",  "slow_tool",  "empty_tool", "image_then_text"};
  std::size_t page_size = 0;
  bool garbage = false;
  bool bad_listing = false;
  bool close_stdout_on_call = false;
  std::string name = "fake-provider";
};

Options g_options;
bool g_stdout_closed = false;
std::vector<std::string> g_items;

json schema_for(const std::string &tool) {
  if (tool == "create_item") {
    return json{{"type", "object"},
                {"properties", {{"title", {{"type", "string"}, {"description", "Short title"}}}}},
                {"required", {"title"}}};
  }
  if (tool == "slow_tool") {
    return json{{"type", "object"}, {"properties", {{"ms", {{"type", "integer"}}}}}};
  }
  return json{{"type", "object"}, {"properties", json::object()}};
}

json tool_entry(const std::string &tool) {
  json entry{{"name", tool}, {"description", "Fake " + tool}};
  // list_items deliberately omits inputSchema
  if (tool != "list_items") {
    entry["inputSchema"] = schema_for(tool);
  }
  return entry;
}

json text_result(const std::string &text, bool is_error = false) {
  json result{{"content", json::array({json{{"type", "text"}, {"text", text}}})}};
  if (is_error) {
    result["isError"] = true;
  }
  return result;
}

void write_message(const json &msg) {
  if (g_stdout_closed) return;
  std::string body = msg.dump();
  if (g_options.newline) {
    std::cout << body << "\n";
  } else {
    std::cout << "Content-Length: " << body.size() << "\r\n\r\n" << body;
  }
  std::cout.flush();
}

std::optional<std::string> read_message() {
  std::string line;
  if (g_options.newline) {
    while (std::getline(std::cin, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (!line.empty()) return line;
    }
    return std::nullopt;
  }

  std::size_t length = 0;
  bool have_length = false;
  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) {
      if (have_length) break;
      continue;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos && line.substr(0, colon) == "Content-Length") {
      length = std::stoul(line.substr(colon + 1));
      have_length = true;
    }
  }
  if (!have_length) return std::nullopt;

  std::string body(length, '\0');
  if (!std::cin.read(body.data(), static_cast<std::streamsize>(length))) return std::nullopt;
  return body;
}

bool advertised(const std::string &tool) {
  for (const auto &t : g_options.tools) {
    if (t == tool) return true;
  }
  return false;
}

json handle_call(const json &id, const std::string &tool, const json &args) {
  if (!advertised(tool)) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", -32602}, {"message", "Unknown tool: " + tool}}}};
  }

  json result;
  if (tool == "create_item") {
    std::string title = args.value("title", "");
    g_items.push_back(title);
    result = text_result("Created item \"" + title + "\" with ID " + std::to_string(1000 + g_items.size()));
  } else if (tool == "list_items") {
    if (g_items.empty()) {
      result = text_result("No items.");
    } else {
      std::ostringstream out;
      for (std::size_t i = 0; i < g_items.size(); ++i) {
        if (i) out << "\n";
        out << (1001 + i) << ": " << g_items[i];
      }
      result = text_result(out.str());
    }
  } else if (tool == "echo") {
    result = text_result(args.dump());
  } else if (tool == "fail_tool") {
    result = text_result("Item not found", true);
  } else if (tool == "rpc_error_tool") {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", -32000}, {"message", "Backend unavailable"}}}};
  } else if (tool == "crash_tool") {
    std::exit(7);
  } else if (tool == "slow_tool") {
    std::this_thread::sleep_for(std::chrono::milliseconds(args.value("ms", 500)));
    result = text_result("done");
  } else if (tool == "empty_tool") {
    result = json{{"content", json::array()}};
  } else if (tool == "bad_text_tool") {
    result = json{{"content", json::array({json{{"type", "text"}, {"text", json::array({"a"})}}})}};
  } else if (tool == "bad_flag_tool") {
    result = text_result("flagged");
    result["isError"] = "yes";
  } else if (tool == "image_then_text") {
    result = json{{"content", json::array({json{{"type", "image"}, {"data", ""}, {"mimeType", "image/png"}},
                                           json{{"type", "text"}, {"text", "caption"}},
                                           json{{"type", "text"}, {"text", "ignored"}}})}};
  }
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json handle_list(const json &id, const json &params) {
  if (g_options.bad_listing) {
    json tools = json::array({json{{"name", 7}}, nullptr, json{{"name", "ok_tool"}, {"description", nullptr}}});
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", {{"tools", tools}}}};
  }
  std::size_t start = 0;
  if (params.is_object() && params.contains("cursor")) {
    start = std::stoul(params["cursor"].get<std::string>());
  }
  std::size_t end = g_options.page_size == 0 ? g_options.tools.size()
                                             : std::min(g_options.tools.size(), start + g_options.page_size);

  json tools = json::array();
  for (std::size_t i = start; i < end; ++i) {
    tools.push_back(tool_entry(g_options.tools[i]));
  }
  json result{{"tools", tools}};
  if (end < g_options.tools.size()) {
    result["nextCursor"] = std::to_string(end);
  }
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

std::vector<std::string> split(const std::string &s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

}  // namespace

int main(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--framing" && i + 1 < argc) {
      g_options.newline = std::string(argv[++i]) == "newline";
    } else if (arg == "--tools" && i + 1 < argc) {
      g_options.tools = split(argv[++i]);
    } else if (arg == "--page-size" && i + 1 < argc) {
      g_options.page_size = std::stoul(argv[++i]);
    } else if (arg == "--exit-on-start" && i + 1 < argc) {
      return std::atoi(argv[++i]);
    } else if (arg == "--garbage") {
      g_options.garbage = true;
    } else if (arg == "--bad-listing") {
      g_options.bad_listing = true;
    } else if (arg == "--close-stdout-on-call") {
      g_options.close_stdout_on_call = true;
    } else if (arg == "--name" && i + 1 < argc) {
      g_options.name = argv[++i];
    }
  }

  std::cerr << g_options.name << " started" << std::endl;

  while (auto raw = read_message()) {
    json msg = json::parse(*raw, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) continue;

    std::string method = msg.value("method", "");
    if (!msg.contains("id")) {
      continue;  // notification
    }
    json id = msg["id"];
    json params = msg.value("params", json::object());

    if (g_options.garbage) {
      if (g_options.newline) {
        std::cout << "this is not json\n";
      } else {
        std::cout << "Content-Length: 5\r\n\r\n{oops";
      }
      // A notification and a response for an id nobody asked for
      write_message(json{{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"level", "info"}}}});
      write_message(json{{"jsonrpc", "2.0"}, {"id", 999999}, {"result", json::object()}});
    }

    if (method == "initialize") {
      write_message(json{{"jsonrpc", "2.0"},
                         {"id", id},
                         {"result",
                          {{"protocolVersion", "2024-11-05"},
                           {"capabilities", {{"tools", json::object()}}},
                           {"serverInfo", {{"name", g_options.name}, {"version", "1.0.0"}}}}}});
    } else if (method == "tools/list") {
      write_message(handle_list(id, params));
    } else if (method == "tools/call" && g_options.close_stdout_on_call) {
      // Stay alive with stdout closed; only stdin EOF ends the process
      std::cout.flush();
      ::close(STDOUT_FILENO);
      g_stdout_closed = true;
    } else if (method == "tools/call") {
      write_message(handle_call(id, params.value("name", ""), params.value("arguments", json::object())));
    } else if (method == "ping") {
      write_message(json{{"jsonrpc", "2.0"}, {"id", id}, {"result", json::object()}});
    } else {
      write_message(
          json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", -32601}, {"message", "Method not found: " + method}}}});
    }
  }
  return 0;
}
