#pragma once

#include <string>
#include <string_view>

#include "launchpad/core/environment.hpp"

namespace launchpad {

// Startup summary: port, host, database type and enterprise flag, with
// the image defaults standing in for unset or empty values
std::string render_banner(std::string_view title, const Environment& environment);

} // namespace launchpad
