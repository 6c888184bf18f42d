#include "launchpad/core/environment.hpp"

#include <cstring>

namespace launchpad {

Environment Environment::from_process(const char* const* envp) {
    Environment result;
    if (!envp) return result;

    for (auto p = envp; *p; ++p) {
        const char* eq = std::strchr(*p, '=');
        if (!eq || eq == *p) continue;

        std::string name(*p, static_cast<size_t>(eq - *p));
        result.vars_.emplace(std::move(name), std::string(eq + 1));
    }
    return result;
}

std::optional<std::string> Environment::get(std::string_view name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

std::string Environment::get_or(std::string_view name, std::string_view fallback) const {
    auto it = vars_.find(name);
    if (it == vars_.end() || it->second.empty()) return std::string(fallback);
    return it->second;
}

bool Environment::has(std::string_view name) const {
    return vars_.find(name) != vars_.end();
}

bool Environment::is_set_nonempty(std::string_view name) const {
    auto it = vars_.find(name);
    return it != vars_.end() && !it->second.empty();
}

void Environment::set(std::string_view name, std::string value) {
    auto it = vars_.find(name);
    if (it != vars_.end()) {
        it->second = std::move(value);
    } else {
        vars_.emplace(std::string(name), std::move(value));
    }
}

void Environment::unset(std::string_view name) {
    auto it = vars_.find(name);
    if (it != vars_.end()) vars_.erase(it);
}

std::vector<std::string> Environment::to_envp() const {
    std::vector<std::string> out;
    out.reserve(vars_.size());
    for (const auto& [name, value] : vars_) {
        out.push_back(name + "=" + value);
    }
    return out;
}

size_t apply_defaults(Environment& environment, const EnvDefaults& defaults) {
    size_t applied = 0;
    for (const auto& [name, value] : defaults) {
        if (environment.has(name)) continue;
        environment.set(name, value);
        ++applied;
    }
    return applied;
}

const EnvDefaults& image_defaults() {
    static const EnvDefaults defaults = {
        {"NODE_ENV", "production"},
        {"NODE_ICU_DATA", "/usr/local/lib/node_modules/full-icu"},
        {"SHELL", "/bin/sh"},
        {"N8N_ENTERPRISE_EVALUATION", "true"},
        {"N8N_PORT", "5678"},
        {"N8N_HOST", "0.0.0.0"},
        {"N8N_PROTOCOL", "https"},
        {"N8N_SECURE_COOKIE", "true"},
        {"DB_TYPE", "sqlite"},
        {"DB_SQLITE_VACUUM_ON_STARTUP", "true"},
        {"N8N_RUNNERS_MODE", "internal"},
        {"N8N_LOG_LEVEL", "info"},
    };
    return defaults;
}

} // namespace launchpad
