#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>

#include "core/errors.hpp"

namespace conductor {

namespace fs = std::filesystem;

const char *const kDefaultSystemPrompt =
    "You are a helpful assistant connected to a set of external tool providers.\n"
    "Use the available tools whenever the user asks you to create, read, update or delete records,\n"
    "or to analyze them. Call tools rather than guessing at their results.\n"
    "Be concise in your final reply.";

Config::Config() {
  engine.system_prompt = kDefaultSystemPrompt;
}

// ============================================================
// JSON mapping
// ============================================================

namespace {

json server_to_json(const McpServerConfig &s) {
  json j;
  j["name"] = s.name;
  j["command"] = s.command;
  j["args"] = s.args;
  j["env"] = s.env;
  j["framing"] = s.framing;
  j["enabled"] = s.enabled;
  j["forward_stderr"] = s.forward_stderr;
  return j;
}

McpServerConfig server_from_json(const json &j) {
  McpServerConfig s;
  s.name = j.value("name", "");
  s.command = j.value("command", "");
  s.args = j.value("args", std::vector<std::string>{});
  s.env = j.value("env", std::map<std::string, std::string>{});
  s.framing = j.value("framing", s.framing);
  s.enabled = j.value("enabled", true);
  s.forward_stderr = j.value("forward_stderr", true);
  return s;
}

}  // namespace

json Config::to_json() const {
  json j;
  j["log_level"] = log_level;

  json e;
  e["provider"] = engine.provider;
  e["api_key"] = engine.api_key;
  e["base_url"] = engine.base_url;
  e["model"] = engine.model;
  e["max_tokens"] = engine.max_tokens;
  if (engine.temperature) {
    e["temperature"] = *engine.temperature;
  }
  e["system_prompt"] = engine.system_prompt;
  e["timeout_ms"] = engine.timeout_ms;
  j["engine"] = std::move(e);

  j["agent"] = json{{"max_rounds", agent.max_rounds}};
  j["server"] = json{{"host", server.host}, {"port", server.port}};
  j["discovery_timeout_ms"] = discovery_timeout_ms;
  j["call_timeout_ms"] = call_timeout_ms;

  json servers = json::array();
  for (const auto &s : mcp_servers) {
    servers.push_back(server_to_json(s));
  }
  j["mcp_servers"] = std::move(servers);
  return j;
}

Config Config::from_json(const json &j) {
  Config config;
  config.log_level = j.value("log_level", config.log_level);

  if (j.contains("engine")) {
    const auto &e = j["engine"];
    config.engine.provider = e.value("provider", config.engine.provider);
    config.engine.api_key = e.value("api_key", config.engine.api_key);
    config.engine.base_url = e.value("base_url", config.engine.base_url);
    config.engine.model = e.value("model", config.engine.model);
    config.engine.max_tokens = e.value("max_tokens", config.engine.max_tokens);
    if (e.contains("temperature") && e["temperature"].is_number()) {
      config.engine.temperature = e["temperature"].get<double>();
    }
    config.engine.system_prompt = e.value("system_prompt", config.engine.system_prompt);
    config.engine.timeout_ms = e.value("timeout_ms", config.engine.timeout_ms);
  }

  if (j.contains("agent")) {
    config.agent.max_rounds = j["agent"].value("max_rounds", config.agent.max_rounds);
    if (config.agent.max_rounds <= 0) {
      throw Error("agent.max_rounds must be positive, got " + std::to_string(config.agent.max_rounds));
    }
  }

  if (j.contains("server")) {
    config.server.host = j["server"].value("host", config.server.host);
    // Read wide so an out-of-range value is rejected instead of wrapped
    int64_t port = j["server"].value("port", static_cast<int64_t>(config.server.port));
    if (port < 0 || port > 65535) {
      throw Error("server.port must be within 0-65535, got " + std::to_string(port));
    }
    config.server.port = static_cast<uint16_t>(port);
  }

  config.discovery_timeout_ms = j.value("discovery_timeout_ms", config.discovery_timeout_ms);
  config.call_timeout_ms = j.value("call_timeout_ms", config.call_timeout_ms);

  if (j.contains("mcp_servers")) {
    for (const auto &s : j["mcp_servers"]) {
      config.mcp_servers.push_back(server_from_json(s));
    }
  }
  return config;
}

// ============================================================
// Load / save
// ============================================================

Config Config::load(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw Error("Cannot open config file: " + path.string());
  }

  json j;
  try {
    file >> j;
  } catch (const json::exception &e) {
    throw Error("Malformed config file " + path.string() + ": " + e.what());
  }

  Config config;
  try {
    config = from_json(j);
  } catch (const json::exception &e) {
    throw Error("Invalid config in " + path.string() + ": " + e.what());
  } catch (const Error &e) {
    throw Error("Invalid config in " + path.string() + ": " + e.what());
  }
  return config;
}

Config Config::load_default() {
  Config config;
  for (const auto &candidate : {fs::current_path() / "conductor.json", config_paths::config_dir() / "config.json"}) {
    std::error_code ec;
    if (fs::exists(candidate, ec)) {
      spdlog::debug("[Config] Loading {}", candidate.string());
      config = load(candidate);
      break;
    }
  }
  config.apply_env();
  return config;
}

void Config::save(const fs::path &path) const {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }
  std::ofstream file(path);
  if (!file.is_open()) {
    throw Error("Cannot write config file: " + path.string());
  }
  file << to_json().dump(2);
}

void Config::apply_env() {
  const char *api_key = std::getenv("ANTHROPIC_API_KEY");
  if (!api_key) api_key = std::getenv("ANTHROPIC_AUTH_TOKEN");
  if (api_key) engine.api_key = api_key;

  if (const char *base_url = std::getenv("ANTHROPIC_BASE_URL")) {
    engine.base_url = base_url;
  }
  if (const char *model = std::getenv("ANTHROPIC_MODEL")) {
    engine.model = model;
  }
  if (const char *port = std::getenv("PORT")) {
    try {
      int value = std::stoi(port);
      if (value > 0 && value < 65536) {
        server.port = static_cast<uint16_t>(value);
      } else {
        spdlog::warn("[Config] Ignoring out-of-range PORT value '{}'", port);
      }
    } catch (const std::exception &) {
      spdlog::warn("[Config] Ignoring invalid PORT value '{}'", port);
    }
  }
  if (const char *level = std::getenv("CONDUCTOR_LOG_LEVEL")) {
    log_level = level;
  }
}

// ============================================================
// config_paths
// ============================================================

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME")) {
    return home;
  }
  return fs::current_path();
}

fs::path config_dir() {
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return fs::path(xdg) / "conductor";
  }
  return home_dir() / ".config" / "conductor";
}

}  // namespace config_paths

}  // namespace conductor
