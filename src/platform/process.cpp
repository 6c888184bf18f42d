#include "launchpad/platform/process.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include <unistd.h>

namespace launchpad::platform {

namespace {

std::vector<char*> to_c_array(const std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (const auto& item : items) {
        out.push_back(const_cast<char*>(item.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

} // anonymous namespace

Error ExecProcessLauncher::replace_image(const LaunchPlan& plan) {
    if (plan.binary.empty()) {
        return Error(BootError::LaunchError, "no server binary configured");
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(plan.args.size() + 1);
    argv_storage.push_back(plan.binary);
    argv_storage.insert(argv_storage.end(), plan.args.begin(), plan.args.end());

    auto argv = to_c_array(argv_storage);
    auto envp = to_c_array(plan.envp);

    // glibc's execvpe searches the caller's PATH, not the one in envp
    auto path = search_path(plan, std::getenv("PATH"));
    if (::setenv("PATH", path.c_str(), 1) != 0) {
        return Error::from_errno(BootError::LaunchError, "cannot set PATH");
    }

    // Buffered output would be lost with the old image
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    ::execvpe(plan.binary.c_str(), argv.data(), envp.data());

    return Error::from_errno(BootError::LaunchError, "exec " + plan.binary);
}

std::string search_path(const LaunchPlan& plan, const char* inherited) {
    for (const auto& entry : plan.envp) {
        if (entry.compare(0, 5, "PATH=") == 0 && entry.size() > 5) {
            return entry.substr(5);
        }
    }
    if (inherited && *inherited) return inherited;
    return std::string(DEFAULT_SEARCH_PATH);
}

int launch_exit_code(const Error& error) noexcept {
    auto cause = error.system_error();
    if (cause == std::errc::permission_denied || cause == std::errc::executable_format_error) {
        return 126;
    }
    return 127;
}

} // namespace launchpad::platform
