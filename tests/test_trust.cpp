#include <catch2/catch.hpp>
#include <launchpad/core/trust.hpp>

#include "fakes.hpp"

using namespace launchpad;
using namespace launchpad::testing;

TEST_CASE("prepend_node_option", "[trust]") {
    CHECK(prepend_node_option("", "--use-openssl-ca") == "--use-openssl-ca");
    CHECK(prepend_node_option("--max-old-space-size=4096", "--use-openssl-ca") ==
          "--use-openssl-ca --max-old-space-size=4096");
    CHECK(prepend_node_option("--a --use-openssl-ca", "--use-openssl-ca") == "--a --use-openssl-ca");
}

TEST_CASE("extend_trust_store", "[trust]") {
    FakeFileSystem fs;
    FakeCertificateIndexer indexer;
    auto sink = std::make_shared<MemorySink>();
    Logger logger;
    logger.set_level(LogLevel::Trace).add_sink(sink);
    const std::filesystem::path cert_dir = "/opt/custom-certificates";

    SECTION("no directory: nothing changes") {
        Environment environment;
        auto outcome = extend_trust_store(environment, fs, indexer, cert_dir, logger);

        CHECK(outcome.status == TrustStatus::Skipped);
        CHECK(environment.size() == 0);
        CHECK(indexer.rehashed.empty());
    }

    SECTION("directory present: environment points at it") {
        fs.directories.insert(cert_dir);
        Environment environment{{"NODE_OPTIONS", "--max-old-space-size=2048"}};

        auto outcome = extend_trust_store(environment, fs, indexer, cert_dir, logger);

        CHECK(outcome.status == TrustStatus::Trusted);
        REQUIRE(outcome.report.has_value());
        CHECK(outcome.report->certificates == 1);
        CHECK(environment.get("SSL_CERT_DIR") == std::string("/opt/custom-certificates"));
        CHECK(environment.get("NODE_OPTIONS") == std::string("--use-openssl-ca --max-old-space-size=2048"));
        REQUIRE(indexer.rehashed.size() == 1);
        CHECK(indexer.rehashed[0].string() == cert_dir.string());
    }

    SECTION("rehash failure is only a warning") {
        fs.directories.insert(cert_dir);
        indexer.fail = true;
        Environment environment;

        auto outcome = extend_trust_store(environment, fs, indexer, cert_dir, logger);

        CHECK(outcome.status == TrustStatus::TrustedWithWarning);
        REQUIRE(outcome.warning.has_value());
        CHECK(outcome.warning->kind() == BootError::CertTrustWarning);
        CHECK_FALSE(outcome.warning->is_fatal());
        CHECK(environment.get("SSL_CERT_DIR") == std::string("/opt/custom-certificates"));
        CHECK(environment.get("NODE_OPTIONS") == std::string("--use-openssl-ca"));
        CHECK(sink->count(LogLevel::Warn) == 1);
    }

    SECTION("a plain file is not a certificate directory") {
        fs.files[cert_dir] = "not a directory";
        Environment environment;

        auto outcome = extend_trust_store(environment, fs, indexer, cert_dir, logger);
        CHECK(outcome.status == TrustStatus::Skipped);
    }
}
