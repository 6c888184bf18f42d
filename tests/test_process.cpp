#include <catch2/catch.hpp>
#include <launchpad/platform/process.hpp>

using namespace launchpad;
using platform::LaunchPlan;

TEST_CASE("search_path prefers the plan's PATH", "[process]") {
    LaunchPlan plan;
    plan.binary = "n8n";
    plan.envp = {"HOME=/home/node", "PATH=/app/bin:/usr/bin"};

    CHECK(platform::search_path(plan, "/inherited") == "/app/bin:/usr/bin");
}

TEST_CASE("search_path keeps the inherited PATH when the plan has none", "[process]") {
    LaunchPlan plan;
    plan.binary = "n8n";
    plan.envp = {"HOME=/home/node", "PATHEXT=.exe"};

    CHECK(platform::search_path(plan, "/usr/local/bin:/usr/bin") == "/usr/local/bin:/usr/bin");

    SECTION("empty plan PATH counts as unset") {
        plan.envp.push_back("PATH=");
        CHECK(platform::search_path(plan, "/usr/local/bin") == "/usr/local/bin");
    }
}

TEST_CASE("search_path falls back to the image default", "[process]") {
    LaunchPlan plan;
    plan.binary = "n8n";

    auto path = platform::search_path(plan, nullptr);
    CHECK(path == platform::DEFAULT_SEARCH_PATH);
    CHECK(path.find("/usr/local/bin") != std::string::npos);
    CHECK(platform::search_path(plan, "") == platform::DEFAULT_SEARCH_PATH);
}

TEST_CASE("Exec of a missing binary comes back as LaunchError", "[process]") {
    LaunchPlan plan;
    plan.binary = "/nonexistent/launchpad/server";
    plan.envp = {"PATH=/usr/bin:/bin"};

    platform::ExecProcessLauncher launcher;
    Error err = launcher.replace_image(plan);

    CHECK(err.kind() == BootError::LaunchError);
    CHECK(err.system_error() == std::errc::no_such_file_or_directory);
    CHECK(platform::launch_exit_code(err) == 127);
}

TEST_CASE("Empty binary is rejected before exec", "[process]") {
    platform::ExecProcessLauncher launcher;
    Error err = launcher.replace_image(LaunchPlan{});
    CHECK(err.kind() == BootError::LaunchError);
}
