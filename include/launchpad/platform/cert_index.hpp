#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "launchpad/core/error.hpp"
#include "launchpad/util/expected.hpp"

namespace launchpad::platform {

struct RehashReport {
    size_t certificates = 0;
    size_t crls = 0;
    size_t duplicates = 0;

    // Files holding zero or several PEM objects, or none we could parse
    size_t skipped = 0;

    // Link names created, e.g. "9d66eef0.0" or "9d66eef0.r0"
    std::vector<std::string> links;
};

// Rebuilds the subject-hash symlink index OpenSSL uses to look up CA
// certificates in a directory (CApath / SSL_CERT_DIR).
class CertificateIndexer {
public:
    virtual ~CertificateIndexer() = default;

    // CertTrustWarning on failure
    virtual expected<RehashReport, Error> rehash(const std::filesystem::path& dir) = 0;
};

// Native equivalent of `openssl rehash` / c_rehash
class OpenSslCertificateIndexer : public CertificateIndexer {
public:
    expected<RehashReport, Error> rehash(const std::filesystem::path& dir) override;

    // True for names of the form 01234abc.N and 01234abc.rN
    static bool is_hash_link_name(const std::string& name);
};

} // namespace launchpad::platform
