#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "launchpad/core/config.hpp"
#include "launchpad/core/environment.hpp"
#include "launchpad/core/error.hpp"
#include "launchpad/core/keys.hpp"
#include "launchpad/core/logging.hpp"
#include "launchpad/core/trust.hpp"
#include "launchpad/platform/cert_index.hpp"
#include "launchpad/platform/filesystem.hpp"
#include "launchpad/platform/process.hpp"
#include "launchpad/platform/random.hpp"
#include "launchpad/util/expected.hpp"

namespace launchpad {

// Platform services the bootstrap sequence runs against. Not owned.
struct Capabilities {
    platform::FileSystem& fs;
    platform::RandomSource& random;
    platform::CertificateIndexer& indexer;
    platform::ProcessLauncher& launcher;
};

// What a successful prepare() did
struct BootReport {
    size_t defaults_applied = 0;
    bool port_overridden = false;
    KeyOutcome key;
    TrustOutcome trust;
};

// ============================================================================
// Bootstrapper
// ============================================================================

// Container entrypoint sequence, strictly in order:
//   1. image defaults fill absent variables, then PORT overrides N8N_PORT
//   2. data directory is created if absent        (fatal on failure)
//   3. encryption key is provisioned              (fatal on failure)
//   4. custom certificates are trusted            (warning on failure)
//   5. the banner is printed
//   6. the server replaces this process
// The process environment is never touched; all changes go to a private
// copy that becomes the server's environment.
class Bootstrapper {
public:
    Bootstrapper(LauncherConfig config,
                 Environment environment,
                 Capabilities capabilities,
                 const Logger& logger,
                 std::ostream& banner_out);

    // Steps 1-5. `args` are the operator's arguments, without argv[0].
    expected<platform::LaunchPlan, Error> prepare(const std::vector<std::string>& args);

    // Steps 1-6. Returns only when something failed.
    Error bootstrap_and_launch(const std::vector<std::string>& args);

    const Environment& environment() const noexcept { return environment_; }
    const LauncherConfig& config() const noexcept { return config_; }

    // Set once prepare() succeeded
    const std::optional<BootReport>& report() const noexcept { return report_; }

private:
    bool apply_port_override();
    expected<void, Error> ensure_directories();

    LauncherConfig config_;
    Environment environment_;
    Capabilities caps_;
    const Logger& logger_;
    std::ostream& banner_out_;
    std::optional<BootReport> report_;
};

// Process exit status for a failed boot
int exit_code_for(const Error& error) noexcept;

} // namespace launchpad
