// launchpad-healthcheck - container liveness probe
//
// Exits 0 when the server answers its health endpoint with a 2xx status.

#include <launchpad/launchpad.hpp>

#include <iostream>

extern char** environ;

int main() {
    using namespace launchpad;

    try {
        auto environment = Environment::from_process(environ);
        auto config = HealthCheckConfig::from_env(environment);
        if (!config) {
            std::cerr << config.error().to_string() << "\n";
            return 1;
        }

        auto status = net::probe(*config);
        if (!status) {
            std::cerr << status.error().to_string() << "\n";
            return 1;
        }
        if (!net::is_healthy_status(*status)) {
            std::cerr << "unhealthy: HTTP " << *status << " from " << config->path << "\n";
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
