#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "mcp/client.hpp"
#include "tool/registry.hpp"

namespace conductor::mcp {

using ProviderSpec = McpServerConfig;

// Owns the provider subprocesses for the lifetime of the orchestrator and
// registers what they offer with the tool registry.
class ProcessSupervisor {
 public:
  ProcessSupervisor(ToolRegistry &registry, ClientOptions options = {});
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor &) = delete;
  ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

  // Spawn, connect, discover and register one provider. Throws StartupError;
  // ToolConflictError passes through as is.
  ProviderHandle start(const ProviderSpec &spec);

  // Strictly sequential in the given order. Disabled entries are skipped. On
  // the first failure every provider started so far is torn down and the
  // error is rethrown.
  std::vector<ProviderHandle> start_all(const std::vector<ProviderSpec> &specs);

  // Disconnect every client: SIGTERM, SIGKILL after 100 ms, reap
  void shutdown();

  std::size_t size() const;

  // nullptr for a handle this supervisor did not start
  std::shared_ptr<McpClient> client(const ProviderHandle &handle) const;

 private:
  struct Entry {
    ProviderHandle handle;
    std::shared_ptr<McpClient> client;
  };

  ToolRegistry &registry_;
  ClientOptions options_;
  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  uint32_t next_id_ = 1;
};

}  // namespace conductor::mcp
