#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

using json = nlohmann::json;

// One tool provider subprocess, addressed by a fixed command line
struct McpServerConfig {
  std::string name;
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::string framing = "content-length";  // or "newline"
  bool enabled = true;
  bool forward_stderr = true;  // false sends the child's stderr to /dev/null
};

// Reasoning engine connection
struct EngineConfig {
  std::string provider = "anthropic";
  std::string api_key;
  std::string base_url = "https://api.anthropic.com";
  std::string model = "claude-sonnet-4-6";
  int max_tokens = 4096;
  std::optional<double> temperature;
  std::string system_prompt;
  int timeout_ms = 120000;
};

struct AgentSettings {
  int max_rounds = 25;
};

struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 3000;
};

extern const char *const kDefaultSystemPrompt;

struct Config {
  std::string log_level = "info";
  EngineConfig engine;
  AgentSettings agent;
  ServerConfig server;
  int discovery_timeout_ms = 10000;
  int call_timeout_ms = 0;  // 0 waits for the provider indefinitely
  std::vector<McpServerConfig> mcp_servers;

  Config();

  // Throws conductor::Error if the file is missing or malformed
  static Config load(const std::filesystem::path &path);

  // First existing of ./conductor.json, <config_dir>/config.json; defaults
  // otherwise. Environment overrides are applied in every case.
  static Config load_default();

  void save(const std::filesystem::path &path) const;

  // ANTHROPIC_API_KEY / ANTHROPIC_AUTH_TOKEN, ANTHROPIC_BASE_URL,
  // ANTHROPIC_MODEL, PORT, CONDUCTOR_LOG_LEVEL
  void apply_env();

  json to_json() const;
  static Config from_json(const json &j);
};

namespace config_paths {

std::filesystem::path home_dir();

// $XDG_CONFIG_HOME/conductor or ~/.config/conductor
std::filesystem::path config_dir();

}  // namespace config_paths

}  // namespace conductor
