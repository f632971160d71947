#include "agent/event_stream.hpp"

namespace conductor {

std::string to_string(EventType type) {
  switch (type) {
    case EventType::ToolCall:
      return "tool_call";
    case EventType::ToolResult:
      return "tool_result";
    case EventType::FinalResponse:
      return "final_response";
    case EventType::TurnComplete:
      return "turn_complete";
    case EventType::Error:
      return "error";
  }
  return "error";
}

// ============================================================
// ProgressEvent
// ============================================================

ProgressEvent ProgressEvent::tool_call(std::string id, std::string name, json input) {
  ProgressEvent e;
  e.type = EventType::ToolCall;
  e.id = std::move(id);
  e.name = std::move(name);
  e.input = std::move(input);
  return e;
}

ProgressEvent ProgressEvent::tool_result(std::string id, std::string name, std::string result, bool is_error) {
  ProgressEvent e;
  e.type = EventType::ToolResult;
  e.id = std::move(id);
  e.name = std::move(name);
  e.result = std::move(result);
  e.is_error = is_error;
  return e;
}

ProgressEvent ProgressEvent::final_response(std::string text) {
  ProgressEvent e;
  e.type = EventType::FinalResponse;
  e.text = std::move(text);
  return e;
}

ProgressEvent ProgressEvent::turn_complete(Conversation conversation) {
  ProgressEvent e;
  e.type = EventType::TurnComplete;
  e.conversation = std::move(conversation);
  return e;
}

ProgressEvent ProgressEvent::error(std::string message) {
  ProgressEvent e;
  e.type = EventType::Error;
  e.message = std::move(message);
  return e;
}

json ProgressEvent::to_json() const {
  json j{{"type", to_string(type)}};
  switch (type) {
    case EventType::ToolCall:
      j["id"] = id;
      j["name"] = name;
      j["input"] = input.is_null() ? json::object() : input;
      break;
    case EventType::ToolResult:
      j["id"] = id;
      j["name"] = name;
      j["result"] = result;
      j["is_error"] = is_error;
      break;
    case EventType::FinalResponse:
      j["text"] = text;
      break;
    case EventType::TurnComplete:
      j["conversation"] = conversation_to_json(conversation);
      break;
    case EventType::Error:
      j["message"] = message;
      break;
  }
  return j;
}

// ============================================================
// EventStream
// ============================================================

void EventStream::publish(ProgressEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || disconnected_) {
      return;
    }
    bool terminal = event.is_terminal();
    queue_.push_back(std::move(event));
    if (terminal) {
      closed_ = true;
    }
  }
  cv_.notify_all();
}

std::optional<ProgressEvent> EventStream::next() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !queue_.empty() || closed_ || disconnected_; });
  if (disconnected_ || queue_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

std::optional<ProgressEvent> EventStream::try_next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_ || disconnected_; })) {
    return std::nullopt;
  }
  if (disconnected_ || queue_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

void EventStream::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

void EventStream::disconnect() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnected_ = true;
    queue_.clear();
  }
  cv_.notify_all();
}

bool EventStream::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool EventStream::disconnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return disconnected_;
}

std::size_t EventStream::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace conductor
