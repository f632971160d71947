#include "tool/registry.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

#include "core/errors.hpp"

namespace conductor {

json ToolDescriptor::to_json() const {
  return json{{"name", name}, {"description", description}, {"input_schema", input_schema}};
}

void ToolRegistry::register_provider(const ProviderHandle &handle, std::shared_ptr<ToolProvider> provider,
                                     const std::vector<ToolDescriptor> &descriptors) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Validate the whole list first so a rejected provider leaves no trace
  std::unordered_set<std::string> incoming;
  for (const auto &d : descriptors) {
    auto it = routes_.find(d.name);
    if (it != routes_.end()) {
      throw ToolConflictError(d.name, it->second.name, handle.name);
    }
    if (!incoming.insert(d.name).second) {
      throw ToolConflictError(d.name, handle.name, handle.name);
    }
  }

  for (const auto &d : descriptors) {
    order_.push_back(d.name);
    descriptors_[d.name] = d;
    routes_[d.name] = handle;
  }

  if (providers_.find(handle.id) == providers_.end()) {
    handles_.push_back(handle);
  }
  providers_[handle.id] = std::move(provider);

  spdlog::info("[Registry] Provider '{}' registered {} tools", handle.name, descriptors.size());
}

ToolRoute ToolRegistry::resolve(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = routes_.find(name);
  if (it == routes_.end()) {
    throw UnknownToolError(name);
  }
  return ToolRoute{it->second, descriptors_.at(name)};
}

std::shared_ptr<ToolProvider> ToolRegistry::provider(const ProviderHandle &handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = providers_.find(handle.id);
  if (it == providers_.end()) {
    return nullptr;
  }
  return it->second;
}

std::string ToolRegistry::invoke(const std::string &name, const json &arguments) const {
  auto route = resolve(name);
  auto target = provider(route.handle);
  if (!target) {
    throw UnknownToolError(name);
  }
  spdlog::debug("[Registry] Routing '{}' to provider '{}'", name, route.handle.name);
  return target->invoke(name, arguments);
}

std::vector<ToolDescriptor> ToolRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ToolDescriptor> out;
  out.reserve(order_.size());
  for (const auto &name : order_) {
    out.push_back(descriptors_.at(name));
  }
  return out;
}

json ToolRegistry::to_engine_tools() const {
  json tools = json::array();
  for (const auto &d : snapshot()) {
    tools.push_back(d.to_json());
  }
  return tools;
}

bool ToolRegistry::has(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.find(name) != routes_.end();
}

std::size_t ToolRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_.size();
}

std::vector<ProviderHandle> ToolRegistry::providers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handles_;
}

}  // namespace conductor
