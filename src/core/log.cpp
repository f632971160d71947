#include "core/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace conductor::log {

void init(const std::string &level) {
  auto logger = spdlog::get("conductor");
  if (!logger) {
    logger = spdlog::stderr_color_mt("conductor");
  }
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(logger);
  set_level(level);
}

void set_level(const std::string &level) {
  auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::warn("Unknown log level '{}', using info", level);
    parsed = spdlog::level::info;
  }
  spdlog::set_level(parsed);
}

}  // namespace conductor::log
