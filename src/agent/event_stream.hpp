#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "core/message.hpp"

namespace conductor {

using json = nlohmann::json;

enum class EventType { ToolCall, ToolResult, FinalResponse, TurnComplete, Error };

// "tool_call", "tool_result", "final_response", "turn_complete", "error"
std::string to_string(EventType type);

// One observable step of a turn. Only the fields of the event's type are set.
struct ProgressEvent {
  EventType type = EventType::Error;

  std::string id;    // tool_call, tool_result
  std::string name;  // tool_call, tool_result
  json input;        // tool_call
  std::string result;  // tool_result
  bool is_error = false;  // tool_result
  std::string text;  // final_response
  Conversation conversation;  // turn_complete
  std::string message;  // error

  static ProgressEvent tool_call(std::string id, std::string name, json input);
  static ProgressEvent tool_result(std::string id, std::string name, std::string result, bool is_error = false);
  static ProgressEvent final_response(std::string text);
  static ProgressEvent turn_complete(Conversation conversation);
  static ProgressEvent error(std::string message);

  bool is_terminal() const {
    return type == EventType::TurnComplete || type == EventType::Error;
  }

  json to_json() const;
};

// Ordered per-turn event channel between one producer (the agent loop) and
// one consumer (e.g. an HTTP response writer).
class EventStream {
 public:
  // Never blocks. Ignored after close() or disconnect(). A terminal event
  // closes the stream.
  void publish(ProgressEvent event);

  // Blocks until an event is available; nullopt once the stream is closed and
  // drained, or the consumer disconnected
  std::optional<ProgressEvent> next();

  std::optional<ProgressEvent> try_next(std::chrono::milliseconds timeout);

  // Producer side: no more events
  void close();

  // Consumer side: drop the backlog and every later event. The producer is
  // not interrupted.
  void disconnect();

  bool closed() const;
  bool disconnected() const;
  std::size_t pending() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ProgressEvent> queue_;
  bool closed_ = false;
  bool disconnected_ = false;
};

}  // namespace conductor
