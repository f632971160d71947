#pragma once

#include <memory>
#include <optional>
#include <string>

#include "agent/event_stream.hpp"
#include "core/config.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "llm/provider.hpp"
#include "tool/registry.hpp"

namespace conductor {

enum class LoopState { AwaitingEngine, DispatchingTools, Done };

std::string to_string(LoopState state);

struct AgentOptions {
  std::string model = "claude-sonnet-4-6";
  std::string system_prompt;
  int max_tokens = 4096;
  std::optional<double> temperature;
  int max_rounds = 25;

  static AgentOptions from_config(const Config &config);
};

struct TurnResult {
  Conversation conversation;  // partial when the turn failed
  int rounds = 0;             // engine queries made
  bool completed = false;     // turn_complete was emitted
  std::string error;
  TokenUsage usage;
};

// Drives one turn: query the engine, dispatch the tool calls it asks for, feed
// the results back, until it answers without tools.
//
// Holds no per-turn state, so one loop serves any number of concurrent turns.
class AgentLoop {
 public:
  AgentLoop(std::shared_ptr<llm::Engine> engine, const ToolRegistry &registry, AgentOptions options = {});

  // Publishes every event of the turn to `events`, ending with exactly one
  // turn_complete or error event. Never throws for turn failures.
  TurnResult run_turn(const Conversation &history, const std::string &user_message, EventStream &events) const;

  const AgentOptions &options() const {
    return options_;
  }

 private:
  llm::LlmRequest build_request(const Conversation &conversation) const;

  // Route one tool call and fold any per-call failure into the result block
  ContentBlock dispatch(const ContentBlock &call, EventStream &events) const;

  std::shared_ptr<llm::Engine> engine_;
  const ToolRegistry &registry_;
  AgentOptions options_;
};

}  // namespace conductor
