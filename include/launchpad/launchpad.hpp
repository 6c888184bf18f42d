#pragma once

// Main include file for launchpad

// Utilities
#include "launchpad/util/expected.hpp"

// Core
#include "launchpad/core/banner.hpp"
#include "launchpad/core/bootstrap.hpp"
#include "launchpad/core/codec.hpp"
#include "launchpad/core/config.hpp"
#include "launchpad/core/environment.hpp"
#include "launchpad/core/error.hpp"
#include "launchpad/core/keys.hpp"
#include "launchpad/core/logging.hpp"
#include "launchpad/core/trust.hpp"

// Platform
#include "launchpad/platform/cert_index.hpp"
#include "launchpad/platform/filesystem.hpp"
#include "launchpad/platform/process.hpp"
#include "launchpad/platform/random.hpp"

// Network
#include "launchpad/net/healthcheck.hpp"

namespace launchpad {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_STRING = "1.0.0";

} // namespace launchpad
