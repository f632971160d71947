#pragma once

#include <asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "tool/tool.hpp"

namespace conductor::llm {

using json = nlohmann::json;

struct LlmRequest {
  std::string model;
  std::string system_prompt;
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  std::optional<std::vector<std::string>> stop_sequences;
  Conversation messages;
  std::vector<ToolDescriptor> tools;

  // Anthropic Messages API request body
  json to_anthropic_format() const;
};

struct LlmResponse {
  std::string id;
  std::vector<ContentBlock> blocks;
  StopReason stop_reason = StopReason::Unknown;
  TokenUsage usage;

  bool has_tool_calls() const;
  std::vector<ContentBlock> tool_calls() const;

  // Text blocks joined with '\n'
  std::string text() const;

  // The assistant message to append to the conversation, blocks unchanged
  Message to_message() const;

  // Throws EngineQueryError when the body is not a Messages API response
  static LlmResponse from_anthropic_json(const json &j);
};

// The reasoning engine. Implementations must be safe to call from several
// turns at once.
class Engine {
 public:
  virtual ~Engine() = default;

  virtual std::string name() const = 0;

  // Throws EngineQueryError on transport, HTTP status or parse failure
  virtual LlmResponse query(const LlmRequest &request) = 0;
};

// Creates engines by provider name ("anthropic")
class EngineFactory {
 public:
  using Creator = std::function<std::shared_ptr<Engine>(const EngineConfig &, asio::io_context &)>;

  static EngineFactory &instance();

  void register_engine(const std::string &name, Creator creator);

  // nullptr for an unknown provider name
  std::shared_ptr<Engine> create(const std::string &name, const EngineConfig &config, asio::io_context &io_ctx);

  bool has(const std::string &name) const;

 private:
  EngineFactory();

  mutable std::mutex mutex_;
  std::map<std::string, Creator> creators_;
};

}  // namespace conductor::llm
