#include "launchpad/core/bootstrap.hpp"

#include <ostream>

#include "launchpad/core/banner.hpp"

namespace launchpad {

Bootstrapper::Bootstrapper(LauncherConfig config,
                           Environment environment,
                           Capabilities capabilities,
                           const Logger& logger,
                           std::ostream& banner_out)
    : config_(std::move(config))
    , environment_(std::move(environment))
    , caps_(capabilities)
    , logger_(logger)
    , banner_out_(banner_out)
{
}

bool Bootstrapper::apply_port_override() {
    auto port = environment_.get(env::PORT);
    if (!port || port->empty()) return false;

    if (auto parsed = parse_port(*port); !parsed) {
        logger_.warn("PORT=" + *port + " is not a valid TCP port; passing it on unchanged");
    }

    environment_.set(env::N8N_PORT, *port);
    logger_.log(logger_.entry(LogLevel::Debug, "Platform port override").field("port", *port));
    return true;
}

expected<void, Error> Bootstrapper::ensure_directories() {
    if (auto created = caps_.fs.create_directories(config_.data_dir); !created) {
        return unexpected(created.error());
    }
    // An existing directory on a read-only mount passes create_directories
    if (auto writable = caps_.fs.check_writable(config_.data_dir); !writable) {
        return unexpected(writable.error());
    }

    auto key_dir = config_.key_file.parent_path();
    if (key_dir.empty() || key_dir == config_.data_dir) return {};

    if (auto created = caps_.fs.create_directories(key_dir); !created) {
        return unexpected(created.error());
    }

    // A separate key directory only has to take writes for a new key
    if (!caps_.fs.exists(config_.key_file) &&
        !environment_.is_set_nonempty(env::N8N_ENCRYPTION_KEY)) {
        if (auto writable = caps_.fs.check_writable(key_dir); !writable) {
            return unexpected(writable.error());
        }
    }
    return {};
}

expected<platform::LaunchPlan, Error> Bootstrapper::prepare(const std::vector<std::string>& args) {
    BootReport report;

    if (config_.apply_image_defaults) {
        report.defaults_applied = apply_defaults(environment_, image_defaults());
    }

    report.port_overridden = apply_port_override();

    if (auto dirs = ensure_directories(); !dirs) {
        return unexpected(dirs.error());
    }

    auto key = provision_key(environment_, caps_.fs, caps_.random, config_.key_file, logger_);
    if (!key) return unexpected(key.error());
    report.key = *key;

    report.trust = extend_trust_store(environment_, caps_.fs, caps_.indexer, config_.cert_dir, logger_);

    banner_out_ << render_banner(config_.banner_title, environment_);
    banner_out_.flush();

    platform::LaunchPlan plan;
    plan.binary = config_.server_binary;
    plan.args = args;
    plan.envp = environment_.to_envp();

    report_ = std::move(report);
    return plan;
}

Error Bootstrapper::bootstrap_and_launch(const std::vector<std::string>& args) {
    auto plan = prepare(args);
    if (!plan) return plan.error();

    logger_.log(logger_.entry(LogLevel::Debug, "Starting server")
        .field("binary", plan->binary)
        .field("args", plan->args.size()));

    return caps_.launcher.replace_image(*plan);
}

int exit_code_for(const Error& error) noexcept {
    if (error.kind() == BootError::LaunchError) {
        return platform::launch_exit_code(error);
    }
    return 1;
}

} // namespace launchpad
