#include "conductor.hpp"

#include <spdlog/spdlog.h>

namespace conductor {

void init(const Config &config) {
  log::init(config.log_level);
  spdlog::debug("conductor {} starting, {} providers configured", version(), config.mcp_servers.size());
}

std::string version() {
  return "0.1.0";
}

}  // namespace conductor
