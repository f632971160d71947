#include "llm/anthropic.hpp"

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace conductor::llm {

std::string extract_api_error(const std::string &body) {
  auto j = json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object() && j.contains("error")) {
    const auto &error = j["error"];
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
      return error["message"].get<std::string>();
    }
    if (error.is_string()) {
      return error.get<std::string>();
    }
  }
  return body;
}

AnthropicEngine::AnthropicEngine(EngineConfig config, asio::io_context &io_ctx)
    : config_(std::move(config)), http_(io_ctx) {}

std::string AnthropicEngine::endpoint() const {
  std::string base = config_.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  if (base.size() >= 3 && base.compare(base.size() - 3, 3, "/v1") == 0) {
    return base + "/messages";
  }
  return base + "/v1/messages";
}

LlmResponse AnthropicEngine::query(const LlmRequest &request) {
  if (config_.api_key.empty()) {
    throw EngineQueryError("No API key configured for the anthropic engine");
  }

  net::HttpOptions opts;
  opts.method = "POST";
  opts.headers["Content-Type"] = "application/json";
  opts.headers["x-api-key"] = config_.api_key;
  opts.headers["anthropic-version"] = kApiVersion;
  opts.body = request.to_anthropic_format().dump();
  opts.timeout = std::chrono::milliseconds(config_.timeout_ms);

  spdlog::debug("[Engine] POST {} model={} messages={} tools={}", endpoint(), request.model, request.messages.size(),
                request.tools.size());

  auto resp = http_.request(endpoint(), opts).get();

  if (!resp.error.empty()) {
    throw EngineQueryError("Engine request failed: " + resp.error);
  }
  if (!resp.ok()) {
    throw EngineQueryError("Engine returned HTTP " + std::to_string(resp.status_code) + ": " +
                           extract_api_error(resp.body));
  }

  json body;
  try {
    body = json::parse(resp.body);
  } catch (const json::parse_error &e) {
    throw EngineQueryError(std::string("Engine returned invalid JSON: ") + e.what());
  }

  auto result = LlmResponse::from_anthropic_json(body);
  spdlog::debug("[Engine] Response {} stop_reason={} tokens in={} out={}", result.id, to_string(result.stop_reason),
                result.usage.input_tokens, result.usage.output_tokens);
  return result;
}

}  // namespace conductor::llm
