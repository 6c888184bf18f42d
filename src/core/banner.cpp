#include "launchpad/core/banner.hpp"

#include <sstream>

namespace launchpad {

std::string render_banner(std::string_view title, const Environment& environment) {
    constexpr std::string_view rule = "=============================================";

    std::ostringstream oss;
    oss << rule << "\n";
    oss << "  " << title << "\n";
    oss << rule << "\n";
    oss << "  Port: " << environment.get_or(env::N8N_PORT, "5678") << "\n";
    oss << "  Host: " << environment.get_or(env::N8N_HOST, "0.0.0.0") << "\n";
    oss << "  DB Type: " << environment.get_or(env::DB_TYPE, "sqlite") << "\n";
    oss << "  Enterprise Mode: " << environment.get_or(env::N8N_ENTERPRISE_EVALUATION, "false") << "\n";
    oss << rule << "\n";
    return oss.str();
}

} // namespace launchpad
