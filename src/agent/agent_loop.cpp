#include "agent/agent_loop.hpp"

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace conductor {

std::string to_string(LoopState state) {
  switch (state) {
    case LoopState::AwaitingEngine:
      return "AwaitingEngine";
    case LoopState::DispatchingTools:
      return "DispatchingTools";
    case LoopState::Done:
      return "Done";
  }
  return "Unknown";
}

AgentOptions AgentOptions::from_config(const Config &config) {
  AgentOptions options;
  options.model = config.engine.model;
  options.system_prompt = config.engine.system_prompt;
  options.max_tokens = config.engine.max_tokens;
  options.temperature = config.engine.temperature;
  options.max_rounds = config.agent.max_rounds;
  return options;
}

AgentLoop::AgentLoop(std::shared_ptr<llm::Engine> engine, const ToolRegistry &registry, AgentOptions options)
    : engine_(std::move(engine)), registry_(registry), options_(std::move(options)) {}

llm::LlmRequest AgentLoop::build_request(const Conversation &conversation) const {
  llm::LlmRequest request;
  request.model = options_.model;
  request.system_prompt = options_.system_prompt;
  request.max_tokens = options_.max_tokens;
  request.temperature = options_.temperature;
  request.messages = conversation;
  request.tools = registry_.snapshot();
  return request;
}

ContentBlock AgentLoop::dispatch(const ContentBlock &call, EventStream &events) const {
  events.publish(ProgressEvent::tool_call(call.id, call.name, call.input));

  std::string result;
  bool is_error = false;
  try {
    result = registry_.invoke(call.name, call.input);
  } catch (const UnknownToolError &e) {
    spdlog::warn("[Agent] Engine requested unknown tool '{}'", call.name);
    result = std::string("Error: ") + e.what();
    is_error = true;
  } catch (const ToolInvocationError &e) {
    spdlog::warn("[Agent] Tool '{}' failed: {}", call.name, e.what());
    result = std::string("Error: ") + e.what();
    is_error = true;
  } catch (const TransportError &e) {
    spdlog::error("[Agent] Provider for tool '{}' is unavailable: {}", call.name, e.what());
    result = std::string("Error: ") + e.what();
    is_error = true;
  }

  events.publish(ProgressEvent::tool_result(call.id, call.name, result, is_error));
  return ContentBlock::tool_result(call.id, std::move(result), is_error);
}

TurnResult AgentLoop::run_turn(const Conversation &history, const std::string &user_message,
                               EventStream &events) const {
  TurnResult turn;
  turn.conversation = history;
  turn.conversation.push_back(Message::user(user_message));

  auto state = LoopState::AwaitingEngine;
  llm::LlmResponse response;

  try {
    while (state != LoopState::Done) {
      switch (state) {
        case LoopState::AwaitingEngine: {
          if (turn.rounds >= options_.max_rounds) {
            throw LoopBoundExceeded(options_.max_rounds);
          }
          ++turn.rounds;
          spdlog::debug("[Agent] Round {}: querying engine with {} messages", turn.rounds, turn.conversation.size());

          response = engine_->query(build_request(turn.conversation));
          turn.usage += response.usage;

          if (response.has_tool_calls()) {
            turn.conversation.push_back(response.to_message());
            state = LoopState::DispatchingTools;
          } else if (response.stop_reason == StopReason::ToolUse) {
            throw EngineQueryError("Engine stopped for tool use but requested no tools");
          } else {
            std::string text = response.text();
            turn.conversation.push_back(response.to_message());
            events.publish(ProgressEvent::final_response(text));
            events.publish(ProgressEvent::turn_complete(turn.conversation));
            turn.completed = true;
            state = LoopState::Done;
          }
          break;
        }

        case LoopState::DispatchingTools: {
          auto calls = response.tool_calls();
          spdlog::info("[Agent] Round {}: dispatching {} tool calls", turn.rounds, calls.size());

          std::vector<ContentBlock> results;
          results.reserve(calls.size());
          for (const auto &call : calls) {
            results.push_back(dispatch(call, events));
          }
          turn.conversation.push_back(Message::tool_results(std::move(results)));
          state = LoopState::AwaitingEngine;
          break;
        }

        case LoopState::Done:
          break;
      }
    }
  } catch (const LoopBoundExceeded &e) {
    spdlog::error("[Agent] {}", e.what());
    turn.error = e.what();
    events.publish(ProgressEvent::error(turn.error));
  } catch (const EngineQueryError &e) {
    spdlog::error("[Agent] Engine query failed: {}", e.what());
    turn.error = e.what();
    events.publish(ProgressEvent::error(turn.error));
  } catch (const std::exception &e) {
    spdlog::error("[Agent] Turn aborted: {}", e.what());
    turn.error = e.what();
    events.publish(ProgressEvent::error(turn.error));
  }

  if (turn.completed) {
    spdlog::info("[Agent] Turn complete after {} rounds ({} tokens)", turn.rounds, turn.usage.total());
  }
  return turn;
}

}  // namespace conductor
