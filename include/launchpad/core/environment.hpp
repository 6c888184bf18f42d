#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace launchpad {

// Well-known variable names
namespace env {
inline constexpr std::string_view PORT = "PORT";
inline constexpr std::string_view N8N_PORT = "N8N_PORT";
inline constexpr std::string_view N8N_HOST = "N8N_HOST";
inline constexpr std::string_view DB_TYPE = "DB_TYPE";
inline constexpr std::string_view N8N_ENCRYPTION_KEY = "N8N_ENCRYPTION_KEY";
inline constexpr std::string_view N8N_ENTERPRISE_EVALUATION = "N8N_ENTERPRISE_EVALUATION";
inline constexpr std::string_view SSL_CERT_DIR = "SSL_CERT_DIR";
inline constexpr std::string_view NODE_OPTIONS = "NODE_OPTIONS";
} // namespace env

// ============================================================================
// Environment
// ============================================================================

// A detached copy of a process environment. Nothing here touches the real
// environment; the launcher hands the final copy to the server process.
class Environment {
    std::map<std::string, std::string, std::less<>> vars_;

public:
    Environment() = default;
    Environment(std::initializer_list<std::pair<const std::string, std::string>> vars)
        : vars_(vars) {}

    // Captures a NAME=value array such as environ. Entries without '=' are
    // ignored; the first occurrence of a duplicated name wins.
    static Environment from_process(const char* const* envp);

    std::optional<std::string> get(std::string_view name) const;
    std::string get_or(std::string_view name, std::string_view fallback) const;

    bool has(std::string_view name) const;

    // Shell-style "-n $VAR"
    bool is_set_nonempty(std::string_view name) const;

    void set(std::string_view name, std::string value);
    void unset(std::string_view name);

    // NAME=value strings, sorted by name
    std::vector<std::string> to_envp() const;

    size_t size() const noexcept { return vars_.size(); }
};

using EnvDefaults = std::vector<std::pair<std::string, std::string>>;

// Sets every default whose key is absent. Returns how many were applied.
size_t apply_defaults(Environment& environment, const EnvDefaults& defaults);

// Defaults baked into the runtime image
const EnvDefaults& image_defaults();

} // namespace launchpad
