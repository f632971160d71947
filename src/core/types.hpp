#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace conductor {

// Value-or-message result for operations that report failure as data
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(std::string message) {
    Result r;
    r.error = std::move(message);
    return r;
  }
};

// Why the reasoning engine stopped generating
enum class StopReason { EndTurn, ToolUse, MaxTokens, StopSequence, Unknown };

std::string to_string(StopReason reason);

// Accepts both the engine's native names and the OpenAI-style aliases
StopReason stop_reason_from_string(const std::string &s);

struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    return *this;
  }
};

}  // namespace conductor
