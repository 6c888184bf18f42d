#include "launchpad/core/error.hpp"

#include <cerrno>
#include <sstream>

namespace launchpad {

// ============================================================================
// BootError Category
// ============================================================================

namespace {

class BootErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "launchpad.boot";
    }

    std::string message(int ev) const override {
        switch (static_cast<BootError>(ev)) {
            case BootError::Success: return "Success";
            case BootError::DirectoryError: return "Data directory unavailable";
            case BootError::RandomSourceError: return "Secure random source unavailable";
            case BootError::KeyWriteError: return "Encryption key could not be written";
            case BootError::KeyReadError: return "Encryption key could not be read";
            case BootError::InvalidKey: return "Invalid encryption key";
            case BootError::LaunchError: return "Server process could not be started";
            case BootError::CertTrustWarning: return "Custom certificates could not be indexed";
            case BootError::ConfigError: return "Invalid configuration";
            case BootError::HealthCheckFailed: return "Health check failed";
            default: return "Unknown boot error";
        }
    }
};

const BootErrorCategory boot_category_instance{};

} // anonymous namespace

const std::error_category& boot_error_category() noexcept {
    return boot_category_instance;
}

std::error_code make_error_code(BootError e) noexcept {
    return {static_cast<int>(e), boot_error_category()};
}

// ============================================================================
// Error Implementation
// ============================================================================

Error Error::from_errno(BootError kind, std::string message) {
    return Error(kind, std::error_code(errno, std::generic_category()), std::move(message));
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "BootError::" << boot_error_category().message(static_cast<int>(kind_));

    if (!message_.empty()) {
        oss << " - " << message_;
    }
    if (cause_) {
        oss << " (" << cause_.message() << ")";
    }

    return oss.str();
}

} // namespace launchpad
