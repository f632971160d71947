#pragma once

#include <stdexcept>
#include <string>

namespace conductor {

// Base of every orchestrator error
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Channel or subprocess unusable. Never retried: the provider stays broken.
class TransportError : public Error {
 public:
  using Error::Error;
};

// The provider ran the tool and reported a failure
class ToolInvocationError : public Error {
 public:
  ToolInvocationError(std::string tool, const std::string &message)
      : Error(message), tool_(std::move(tool)) {}

  const std::string &tool() const {
    return tool_;
  }

 private:
  std::string tool_;
};

class UnknownToolError : public Error {
 public:
  explicit UnknownToolError(std::string tool)
      : Error("No provider registered for tool: " + tool), tool_(std::move(tool)) {}

  const std::string &tool() const {
    return tool_;
  }

 private:
  std::string tool_;
};

class LoopBoundExceeded : public Error {
 public:
  explicit LoopBoundExceeded(int max_rounds)
      : Error("Agent loop exceeded the maximum of " + std::to_string(max_rounds) + " engine rounds"),
        max_rounds_(max_rounds) {}

  int max_rounds() const {
    return max_rounds_;
  }

 private:
  int max_rounds_;
};

// Reasoning engine unreachable, rejected the request, or answered with garbage
class EngineQueryError : public Error {
 public:
  using Error::Error;
};

// Provider spawn, connect or discovery failed; fatal to the orchestrator
class StartupError : public Error {
 public:
  using Error::Error;
};

class ToolConflictError : public StartupError {
 public:
  ToolConflictError(const std::string &tool, const std::string &existing, const std::string &incoming)
      : StartupError("Tool '" + tool + "' from provider '" + incoming + "' is already registered by provider '" + existing + "'") {}
};

}  // namespace conductor
