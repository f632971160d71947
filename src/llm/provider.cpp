#include "llm/provider.hpp"

#include <stdexcept>

#include "core/errors.hpp"
#include "llm/anthropic.hpp"

namespace conductor::llm {

// ============================================================
// LlmRequest
// ============================================================

json LlmRequest::to_anthropic_format() const {
  json j;
  j["model"] = model;
  j["max_tokens"] = max_tokens.value_or(4096);

  if (!system_prompt.empty()) {
    j["system"] = system_prompt;
  }
  if (temperature) {
    j["temperature"] = *temperature;
  }
  if (stop_sequences && !stop_sequences->empty()) {
    j["stop_sequences"] = *stop_sequences;
  }

  j["messages"] = conversation_to_json(messages);

  if (!tools.empty()) {
    json tools_json = json::array();
    for (const auto &tool : tools) {
      tools_json.push_back(tool.to_json());
    }
    j["tools"] = std::move(tools_json);
  }
  return j;
}

// ============================================================
// LlmResponse
// ============================================================

bool LlmResponse::has_tool_calls() const {
  for (const auto &block : blocks) {
    if (block.type == BlockType::ToolUse) return true;
  }
  return false;
}

std::vector<ContentBlock> LlmResponse::tool_calls() const {
  std::vector<ContentBlock> calls;
  for (const auto &block : blocks) {
    if (block.type == BlockType::ToolUse) {
      calls.push_back(block);
    }
  }
  return calls;
}

std::string LlmResponse::text() const {
  return to_message().text();
}

Message LlmResponse::to_message() const {
  return Message::assistant(blocks);
}

LlmResponse LlmResponse::from_anthropic_json(const json &j) {
  if (!j.is_object()) {
    throw EngineQueryError("Malformed engine response: expected a JSON object");
  }
  if (j.value("type", "") == "error") {
    std::string message = "unknown error";
    if (j.contains("error") && j["error"].is_object()) {
      message = j["error"].value("message", message);
    }
    throw EngineQueryError("Engine error: " + message);
  }
  if (!j.contains("content") || !j["content"].is_array()) {
    throw EngineQueryError("Malformed engine response: missing content array");
  }

  LlmResponse resp;
  resp.id = j.value("id", "");

  try {
    for (const auto &block : j["content"]) {
      resp.blocks.push_back(ContentBlock::from_json(block));
    }
  } catch (const std::invalid_argument &e) {
    throw EngineQueryError(std::string("Malformed engine response: ") + e.what());
  } catch (const json::exception &e) {
    throw EngineQueryError(std::string("Malformed engine response: ") + e.what());
  }

  if (j.contains("stop_reason") && j["stop_reason"].is_string()) {
    resp.stop_reason = stop_reason_from_string(j["stop_reason"].get<std::string>());
  }

  if (j.contains("usage") && j["usage"].is_object()) {
    const auto &usage = j["usage"];
    resp.usage.input_tokens = usage.value("input_tokens", int64_t{0});
    resp.usage.output_tokens = usage.value("output_tokens", int64_t{0});
  }
  return resp;
}

// ============================================================
// EngineFactory
// ============================================================

EngineFactory &EngineFactory::instance() {
  static EngineFactory factory;
  return factory;
}

EngineFactory::EngineFactory() {
  creators_["anthropic"] = [](const EngineConfig &config, asio::io_context &io_ctx) {
    return std::make_shared<AnthropicEngine>(config, io_ctx);
  };
}

void EngineFactory::register_engine(const std::string &name, Creator creator) {
  std::lock_guard<std::mutex> lock(mutex_);
  creators_[name] = std::move(creator);
}

std::shared_ptr<Engine> EngineFactory::create(const std::string &name, const EngineConfig &config,
                                              asio::io_context &io_ctx) {
  Creator creator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = creators_.find(name);
    if (it == creators_.end()) {
      return nullptr;
    }
    creator = it->second;
  }
  return creator(config, io_ctx);
}

bool EngineFactory::has(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return creators_.count(name) > 0;
}

}  // namespace conductor::llm
