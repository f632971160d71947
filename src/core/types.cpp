#include "core/types.hpp"

namespace conductor {

std::string to_string(StopReason reason) {
  switch (reason) {
    case StopReason::EndTurn:
      return "end_turn";
    case StopReason::ToolUse:
      return "tool_use";
    case StopReason::MaxTokens:
      return "max_tokens";
    case StopReason::StopSequence:
      return "stop_sequence";
    case StopReason::Unknown:
      return "unknown";
  }
  return "unknown";
}

StopReason stop_reason_from_string(const std::string &s) {
  if (s == "end_turn" || s == "stop") return StopReason::EndTurn;
  if (s == "tool_use" || s == "tool_calls") return StopReason::ToolUse;
  if (s == "max_tokens" || s == "length") return StopReason::MaxTokens;
  if (s == "stop_sequence") return StopReason::StopSequence;
  return StopReason::Unknown;
}

}  // namespace conductor
