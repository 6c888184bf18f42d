#pragma once

#include <string>
#include <string_view>

#include "launchpad/core/config.hpp"
#include "launchpad/core/error.hpp"
#include "launchpad/util/expected.hpp"

namespace launchpad::net {

// "HTTP/1.1 200 OK" -> 200. HealthCheckFailed when the line is not an HTTP
// status line.
expected<int, Error> parse_status_line(std::string_view line);

// GET request for the probe, with Connection: close
std::string build_probe_request(const HealthCheckConfig& config);

// One HTTP request against the server's liveness endpoint. Connect, send and
// receive share the configured timeout. Returns the response status code.
expected<int, Error> probe(const HealthCheckConfig& config);

inline bool is_healthy_status(int status) noexcept {
    return status >= 200 && status < 300;
}

} // namespace launchpad::net
