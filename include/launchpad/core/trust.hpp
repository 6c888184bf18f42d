#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "launchpad/core/environment.hpp"
#include "launchpad/core/error.hpp"
#include "launchpad/core/logging.hpp"
#include "launchpad/platform/cert_index.hpp"
#include "launchpad/platform/filesystem.hpp"

namespace launchpad {

// Node.js flag that makes the runtime honour SSL_CERT_DIR
inline constexpr std::string_view USE_OPENSSL_CA_FLAG = "--use-openssl-ca";

enum class TrustStatus {
    Skipped,            // no custom certificate directory
    Trusted,
    TrustedWithWarning  // environment points at the directory, rehash failed
};

struct TrustOutcome {
    TrustStatus status = TrustStatus::Skipped;
    std::optional<platform::RehashReport> report;
    std::optional<Error> warning;
};

// Prepends the flag unless it is already one of the options
std::string prepend_node_option(std::string_view options, std::string_view flag);

// Points the server's TLS stack at `cert_dir` when it exists and rebuilds its
// hash index. Never fails the boot: a rehash error becomes a warning.
TrustOutcome extend_trust_store(Environment& environment,
                                const platform::FileSystem& fs,
                                platform::CertificateIndexer& indexer,
                                const std::filesystem::path& cert_dir,
                                const Logger& logger);

} // namespace launchpad
