// launchpad - container entrypoint for the workflow automation server
//
// Prepares the server environment and encryption key, then execs the server
// with the container's arguments.

#include <launchpad/launchpad.hpp>

#include <iostream>
#include <string>
#include <vector>

extern char** environ;

int main(int argc, char* argv[]) {
    using namespace launchpad;

    try {
        auto environment = Environment::from_process(environ);

        auto config = LauncherConfig::from_env(environment);
        if (!config) {
            log_error(config.error().to_string());
            return 1;
        }
        configure_default_logger(config->log_level, config->log_format);

        platform::LocalFileSystem fs;
        platform::OpenSslRandomSource random;
        platform::OpenSslCertificateIndexer indexer;
        platform::ExecProcessLauncher launcher;

        Bootstrapper bootstrapper(*config, std::move(environment),
                                  Capabilities{fs, random, indexer, launcher},
                                  default_logger(), std::cout);

        std::vector<std::string> args(argv + 1, argv + argc);
        Error error = bootstrapper.bootstrap_and_launch(args);

        default_logger().log(default_logger().entry(LogLevel::Fatal, "Bootstrap failed")
            .field("error", error.to_string()));
        return exit_code_for(error);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
