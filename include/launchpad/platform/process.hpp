#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "launchpad/core/error.hpp"

namespace launchpad::platform {

// Everything needed to start the server process
struct LaunchPlan {
    // Program name (PATH lookup) or path
    std::string binary;

    // Arguments after argv[0]
    std::vector<std::string> args;

    // Complete environment as NAME=value strings
    std::vector<std::string> envp;
};

// Replaces the current process image. The server keeps the launcher's PID,
// so it receives the container's signals directly.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Returns only on failure, with a LaunchError
    virtual Error replace_image(const LaunchPlan& plan) = 0;
};

class ExecProcessLauncher : public ProcessLauncher {
public:
    // execvpe, searching search_path(plan, getenv("PATH"))
    Error replace_image(const LaunchPlan& plan) override;
};

// Container image search path, used when neither the plan nor the launcher
// has a PATH
inline constexpr std::string_view DEFAULT_SEARCH_PATH =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

// PATH for locating plan.binary: the plan's own PATH, else the inherited
// one, else DEFAULT_SEARCH_PATH. Empty values count as unset.
std::string search_path(const LaunchPlan& plan, const char* inherited);

// Shell convention: 126 found but not executable, 127 not found
int launch_exit_code(const Error& error) noexcept;

} // namespace launchpad::platform
