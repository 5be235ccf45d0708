#pragma once

#include <string>
#include "config.hpp"

namespace imitatus {

// Server command
bool serve_command(const Config& config);

// Print the effective configuration as JSON
bool config_command(const Config& config);

} // namespace imitatus
