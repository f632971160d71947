#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace conductor {

using json = nlohmann::json;

// A callable operation offered by a provider. Built once at discovery and
// never modified afterwards.
struct ToolDescriptor {
  std::string name;
  std::string description;
  json input_schema = json{{"type", "object"}, {"properties", json::object()}};

  // {name, description, input_schema}, the shape the engine declares tools in
  json to_json() const;
};

// Uniform discovery/invocation interface every provider kind implements
class ToolProvider {
 public:
  virtual ~ToolProvider() = default;

  virtual const std::string &name() const = 0;

  virtual std::vector<ToolDescriptor> discover() = 0;

  // Returns the textual result. Throws ToolInvocationError when the provider
  // reports a failure and TransportError when it cannot be reached.
  virtual std::string invoke(const std::string &tool, const json &arguments) = 0;
};

}  // namespace conductor
