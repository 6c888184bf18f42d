#include "launchpad/core/trust.hpp"

#include <sstream>

namespace launchpad {

std::string prepend_node_option(std::string_view options, std::string_view flag) {
    std::istringstream iss{std::string(options)};
    std::string token;
    while (iss >> token) {
        if (token == flag) return std::string(options);
    }

    if (options.empty()) return std::string(flag);
    return std::string(flag) + " " + std::string(options);
}

TrustOutcome extend_trust_store(Environment& environment,
                                const platform::FileSystem& fs,
                                platform::CertificateIndexer& indexer,
                                const std::filesystem::path& cert_dir,
                                const Logger& logger) {
    TrustOutcome outcome;
    if (!fs.is_directory(cert_dir)) {
        return outcome;
    }

    logger.info("Trusting custom certificates from " + cert_dir.string());

    environment.set(env::NODE_OPTIONS,
        prepend_node_option(environment.get_or(env::NODE_OPTIONS, ""), USE_OPENSSL_CA_FLAG));
    environment.set(env::SSL_CERT_DIR, cert_dir.string());

    auto report = indexer.rehash(cert_dir);
    if (!report) {
        logger.log(logger.entry(LogLevel::Warn, "Custom certificates could not be indexed")
            .field("error", report.error().to_string()));
        outcome.status = TrustStatus::TrustedWithWarning;
        outcome.warning = report.error();
        return outcome;
    }

    logger.log(logger.entry(LogLevel::Debug, "Certificate index rebuilt")
        .field("certificates", report->certificates)
        .field("crls", report->crls)
        .field("skipped", report->skipped));

    outcome.status = TrustStatus::Trusted;
    outcome.report = std::move(*report);
    return outcome;
}

} // namespace launchpad
