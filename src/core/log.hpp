#pragma once

#include <string>

namespace conductor::log {

// Installs a stderr spdlog logger as the default one. Unknown level names fall
// back to info.
void init(const std::string &level);

void set_level(const std::string &level);

}  // namespace conductor::log
