#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "tool/tool.hpp"

namespace conductor {

// Identifies one connected provider for the lifetime of the process
struct ProviderHandle {
  uint32_t id = 0;
  std::string name;

  bool operator==(const ProviderHandle &other) const {
    return id == other.id;
  }
  bool operator!=(const ProviderHandle &other) const {
    return id != other.id;
  }
};

struct ToolRoute {
  ProviderHandle handle;
  ToolDescriptor descriptor;
};

// Merged tool namespace across all providers.
//
// Every registered name has exactly one route. Registration happens during
// startup; afterwards the registry is only read, from any number of turns.
class ToolRegistry {
 public:
  // Registers all of a provider's tools or none of them. Throws
  // ToolConflictError if any name is already taken or repeated in the list.
  void register_provider(const ProviderHandle &handle, std::shared_ptr<ToolProvider> provider,
                         const std::vector<ToolDescriptor> &descriptors);

  // Throws UnknownToolError
  ToolRoute resolve(const std::string &name) const;

  // nullptr for an unknown handle
  std::shared_ptr<ToolProvider> provider(const ProviderHandle &handle) const;

  // Resolve and call through the owning provider. The registry lock is not
  // held while the provider runs.
  std::string invoke(const std::string &name, const json &arguments) const;

  // Provider registration order, then each provider's declaration order
  std::vector<ToolDescriptor> snapshot() const;

  // snapshot() rendered as the engine's tool declaration array
  json to_engine_tools() const;

  bool has(const std::string &name) const;
  std::size_t size() const;
  std::vector<ProviderHandle> providers() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> order_;
  std::unordered_map<std::string, ToolDescriptor> descriptors_;
  std::unordered_map<std::string, ProviderHandle> routes_;
  std::vector<ProviderHandle> handles_;
  std::map<uint32_t, std::shared_ptr<ToolProvider>> providers_;
};

}  // namespace conductor
