#include "launchpad/core/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace launchpad {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template<typename T>
expected<T, Error> parse_unsigned(std::string_view s, std::string_view what) {
    if (s.empty()) {
        return unexpected(Error(BootError::ConfigError, "Empty " + std::string(what)));
    }

    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return unexpected(Error(BootError::ConfigError,
            std::string(what) + " out of range: " + std::string(s)));
    }
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return unexpected(Error(BootError::ConfigError,
            "Invalid " + std::string(what) + ": " + std::string(s)));
    }
    return value;
}

} // anonymous namespace

expected<uint16_t, Error> parse_port(std::string_view s) {
    auto value = parse_unsigned<uint32_t>(s, "port");
    if (!value) return unexpected(value.error());

    if (*value == 0 || *value > 65535) {
        return unexpected(Error(BootError::ConfigError, "Port out of range: " + std::string(s)));
    }
    return static_cast<uint16_t>(*value);
}

expected<bool, Error> parse_bool(std::string_view s) {
    auto v = to_lower(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return unexpected(Error(BootError::ConfigError, "Invalid boolean: " + std::string(s)));
}

expected<std::chrono::milliseconds, Error> parse_millis(std::string_view s) {
    auto value = parse_unsigned<uint64_t>(s, "duration");
    if (!value) return unexpected(value.error());
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*value));
}

expected<LauncherConfig, Error> LauncherConfig::from_env(const Environment& environment) {
    LauncherConfig config;

    if (auto dir = environment.get("LAUNCHPAD_DATA_DIR"); dir && !dir->empty()) {
        config.data_dir = *dir;
    }

    // Key file follows the data directory unless pinned explicitly
    config.key_file = config.data_dir / std::string(DEFAULT_KEY_FILE_NAME);
    if (auto key = environment.get("LAUNCHPAD_KEY_FILE"); key && !key->empty()) {
        config.key_file = *key;
    }

    if (auto certs = environment.get("LAUNCHPAD_CERT_DIR"); certs && !certs->empty()) {
        config.cert_dir = *certs;
    }

    config.server_binary = environment.get_or("LAUNCHPAD_SERVER_BINARY", DEFAULT_SERVER_BINARY);
    config.banner_title = environment.get_or("LAUNCHPAD_BANNER_TITLE", DEFAULT_BANNER_TITLE);

    if (auto level = environment.get("LAUNCHPAD_LOG_LEVEL"); level && !level->empty()) {
        config.log_level = parse_log_level(*level);
    }
    if (auto format = environment.get("LAUNCHPAD_LOG_FORMAT"); format && !format->empty()) {
        config.log_format = parse_log_format(*format);
    }

    if (auto flag = environment.get("LAUNCHPAD_APPLY_DEFAULTS"); flag && !flag->empty()) {
        auto parsed = parse_bool(*flag);
        if (!parsed) {
            return unexpected(Error(BootError::ConfigError,
                "LAUNCHPAD_APPLY_DEFAULTS: " + std::string(parsed.error().message())));
        }
        config.apply_image_defaults = *parsed;
    }

    return config;
}

expected<HealthCheckConfig, Error> HealthCheckConfig::from_env(const Environment& environment) {
    HealthCheckConfig config;

    // The probe runs with the container's environment, where PORT has not
    // been copied into N8N_PORT
    std::string_view source = env::PORT;
    auto port = environment.get_or(env::PORT, "");
    if (port.empty()) {
        source = env::N8N_PORT;
        port = environment.get_or(env::N8N_PORT, "5678");
    }

    auto parsed_port = parse_port(port);
    if (!parsed_port) {
        return unexpected(Error(BootError::ConfigError,
            std::string(source) + ": " + std::string(parsed_port.error().message())));
    }
    config.port = *parsed_port;

    config.path = environment.get_or("LAUNCHPAD_HEALTH_PATH", "/healthz");
    if (config.path.front() != '/') {
        config.path.insert(config.path.begin(), '/');
    }

    if (auto timeout = environment.get("LAUNCHPAD_HEALTH_TIMEOUT_MS"); timeout && !timeout->empty()) {
        auto parsed = parse_millis(*timeout);
        if (!parsed) {
            return unexpected(Error(BootError::ConfigError,
                "LAUNCHPAD_HEALTH_TIMEOUT_MS: " + std::string(parsed.error().message())));
        }
        if (parsed->count() == 0) {
            return unexpected(Error(BootError::ConfigError,
                "LAUNCHPAD_HEALTH_TIMEOUT_MS must be positive"));
        }
        config.timeout = *parsed;
    }

    return config;
}

} // namespace launchpad
