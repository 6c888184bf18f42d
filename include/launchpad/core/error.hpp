#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace launchpad {

// ============================================================================
// Boot Errors
// ============================================================================

enum class BootError {
    Success = 0,
    DirectoryError,      // data directory cannot be created
    RandomSourceError,   // secure random generation unavailable
    KeyWriteError,       // key file could not be written
    KeyReadError,        // existing key file could not be read
    InvalidKey,          // key material is empty or malformed
    LaunchError,         // process image replacement failed
    CertTrustWarning,    // certificate hash index could not be rebuilt
    ConfigError,         // launcher configuration is invalid
    HealthCheckFailed    // liveness probe did not get a healthy answer
};

} // namespace launchpad

template<>
struct std::is_error_code_enum<launchpad::BootError> : std::true_type {};

namespace launchpad {

const std::error_category& boot_error_category() noexcept;
std::error_code make_error_code(BootError e) noexcept;

// ============================================================================
// Error
// ============================================================================

class Error {
    BootError kind_ = BootError::Success;
    std::error_code cause_;
    std::string message_;

public:
    Error() = default;

    Error(BootError kind, std::string message = "")
        : kind_(kind), message_(std::move(message)) {}

    Error(BootError kind, std::error_code cause, std::string message = "")
        : kind_(kind), cause_(cause), message_(std::move(message)) {}

    // Wraps the current errno
    static Error from_errno(BootError kind, std::string message);

    BootError kind() const noexcept { return kind_; }
    std::error_code code() const noexcept { return make_error_code(kind_); }

    // Underlying OS error, empty when the failure did not come from the OS
    std::error_code system_error() const noexcept { return cause_; }

    std::string_view message() const noexcept { return message_; }

    // Everything except a failed trust-store rebuild aborts the boot
    bool is_fatal() const noexcept {
        return kind_ != BootError::Success && kind_ != BootError::CertTrustWarning;
    }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return kind_ == other.kind_ && cause_ == other.cause_;
    }

    explicit operator bool() const noexcept {
        return kind_ != BootError::Success;
    }
};

} // namespace launchpad
