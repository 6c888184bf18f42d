#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "launchpad/core/environment.hpp"
#include "launchpad/core/error.hpp"
#include "launchpad/core/logging.hpp"
#include "launchpad/util/expected.hpp"

namespace launchpad {

// ============================================================================
// Value parsing
// ============================================================================

// Decimal TCP port, 1..65535
expected<uint16_t, Error> parse_port(std::string_view s);

// 1/0, true/false, yes/no, on/off (any case)
expected<bool, Error> parse_bool(std::string_view s);

// Non-negative decimal milliseconds
expected<std::chrono::milliseconds, Error> parse_millis(std::string_view s);

// ============================================================================
// Launcher Configuration
// ============================================================================

struct LauncherConfig {
    static constexpr std::string_view DEFAULT_DATA_DIR = "/app/data";
    static constexpr std::string_view DEFAULT_KEY_FILE_NAME = "encryption.key";
    static constexpr std::string_view DEFAULT_CERT_DIR = "/opt/custom-certificates";
    static constexpr std::string_view DEFAULT_SERVER_BINARY = "n8n";
    static constexpr std::string_view DEFAULT_BANNER_TITLE = "SPAIK n8n Enterprise Evaluation Instance";

    std::filesystem::path data_dir{std::string(DEFAULT_DATA_DIR)};
    std::filesystem::path key_file{std::string(DEFAULT_DATA_DIR) + "/" + std::string(DEFAULT_KEY_FILE_NAME)};
    std::filesystem::path cert_dir{std::string(DEFAULT_CERT_DIR)};

    // Resolved through PATH when it has no slash
    std::string server_binary{DEFAULT_SERVER_BINARY};

    std::string banner_title{DEFAULT_BANNER_TITLE};

    // Launcher's own diagnostics, independent of the server's log level
    LogLevel log_level = LogLevel::Info;
    LogFormat log_format = LogFormat::Text;

    // Fill in image defaults for absent variables before bootstrapping
    bool apply_image_defaults = true;

    // Reads the LAUNCHPAD_* variables; empty values count as unset
    static expected<LauncherConfig, Error> from_env(const Environment& environment);
};

// ============================================================================
// Health Probe Configuration
// ============================================================================

struct HealthCheckConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 5678;
    std::string path = "/healthz";
    std::chrono::milliseconds timeout{10000};

    static expected<HealthCheckConfig, Error> from_env(const Environment& environment);
};

} // namespace launchpad
