#include "mcp/supervisor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "core/errors.hpp"

namespace conductor::mcp {

ProcessSupervisor::ProcessSupervisor(ToolRegistry &registry, ClientOptions options)
    : registry_(registry), options_(options) {}

ProcessSupervisor::~ProcessSupervisor() {
  shutdown();
}

ProviderHandle ProcessSupervisor::start(const ProviderSpec &spec) {
  if (spec.name.empty()) {
    throw StartupError("Provider entry without a name (command '" + spec.command + "')");
  }
  if (spec.command.empty()) {
    throw StartupError("Provider '" + spec.name + "' has no command");
  }

  ProviderHandle handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handle.id = next_id_++;
  }
  handle.name = spec.name;

  spdlog::info("[Supervisor] Starting provider '{}': {}", spec.name, spec.command);

  std::shared_ptr<McpClient> client;
  try {
    client = std::make_shared<McpClient>(spec, options_);
  } catch (const std::invalid_argument &e) {
    throw StartupError("Provider '" + spec.name + "': " + e.what());
  }

  try {
    client->connect();
    auto tools = client->discover();
    registry_.register_provider(handle, client, tools);
  } catch (const ToolConflictError &) {
    client->disconnect();
    throw;
  } catch (const Error &e) {
    client->disconnect();
    throw StartupError("Provider '" + spec.name + "' failed to start: " + e.what());
  } catch (const std::exception &e) {
    client->disconnect();
    throw StartupError("Provider '" + spec.name + "' failed to start: " + e.what());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{handle, client});
  }
  return handle;
}

std::vector<ProviderHandle> ProcessSupervisor::start_all(const std::vector<ProviderSpec> &specs) {
  std::vector<ProviderHandle> handles;
  for (const auto &spec : specs) {
    if (!spec.enabled) {
      spdlog::info("[Supervisor] Provider '{}' is disabled, skipping", spec.name);
      continue;
    }
    try {
      handles.push_back(start(spec));
    } catch (const StartupError &e) {
      spdlog::error("[Supervisor] {}", e.what());
      shutdown();
      throw;
    }
  }
  spdlog::info("[Supervisor] {} providers running, {} tools registered", handles.size(), registry_.size());
  return handles;
}

void ProcessSupervisor::shutdown() {
  std::vector<Entry> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.swap(entries_);
  }
  for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
    spdlog::info("[Supervisor] Stopping provider '{}'", it->handle.name);
    it->client->disconnect();
  }
}

std::size_t ProcessSupervisor::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::shared_ptr<McpClient> ProcessSupervisor::client(const ProviderHandle &handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : entries_) {
    if (entry.handle == handle) {
      return entry.client;
    }
  }
  return nullptr;
}

}  // namespace conductor::mcp
