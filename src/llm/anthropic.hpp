#pragma once

#include "llm/provider.hpp"
#include "net/http_client.hpp"

namespace conductor::llm {

// Anthropic Messages API (non-streaming)
class AnthropicEngine : public Engine {
 public:
  static constexpr const char *kApiVersion = "2023-06-01";

  AnthropicEngine(EngineConfig config, asio::io_context &io_ctx);

  std::string name() const override {
    return "anthropic";
  }

  LlmResponse query(const LlmRequest &request) override;

  const EngineConfig &config() const {
    return config_;
  }

  // {base_url}/v1/messages, tolerating a trailing slash or /v1 in base_url
  std::string endpoint() const;

 private:
  EngineConfig config_;
  net::HttpClient http_;
};

// "message" of an {"error": {"message": ...}} body, else the raw body
std::string extract_api_error(const std::string &body);

}  // namespace conductor::llm
