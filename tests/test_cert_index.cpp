#include <catch2/catch.hpp>
#include <launchpad/platform/cert_index.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <unistd.h>

using namespace launchpad;
namespace fs = std::filesystem;

namespace {

struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct X509Deleter { void operator()(X509* x) const { X509_free(x); } };
struct CrlDeleter { void operator()(X509_CRL* c) const { X509_CRL_free(c); } };

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using CrlPtr = std::unique_ptr<X509_CRL, CrlDeleter>;

PkeyPtr make_key() {
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    REQUIRE(ctx != nullptr);
    REQUIRE(EVP_PKEY_keygen_init(ctx) == 1);
    REQUIRE(EVP_PKEY_keygen(ctx, &pkey) == 1);
    EVP_PKEY_CTX_free(ctx);
    return PkeyPtr(pkey);
}

// Self-signed CA certificate with the given common name
X509Ptr make_cert(EVP_PKEY* pkey, const std::string& cn, long serial) {
    X509Ptr cert(X509_new());
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), serial);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24);
    X509_set_pubkey(cert.get(), pkey);

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    REQUIRE(X509_sign(cert.get(), pkey, nullptr) > 0);
    return cert;
}

CrlPtr make_crl(EVP_PKEY* pkey, X509* issuer) {
    CrlPtr crl(X509_CRL_new());
    X509_CRL_set_version(crl.get(), 1);
    X509_CRL_set_issuer_name(crl.get(), X509_get_subject_name(issuer));

    ASN1_TIME* now = ASN1_TIME_new();
    X509_gmtime_adj(now, 0);
    X509_CRL_set1_lastUpdate(crl.get(), now);
    ASN1_TIME_free(now);

    REQUIRE(X509_CRL_sign(crl.get(), pkey, nullptr) > 0);
    return crl;
}

void write_pem(const fs::path& path, std::initializer_list<X509*> certs) {
    BIO* bio = BIO_new_file(path.c_str(), "w");
    REQUIRE(bio != nullptr);
    for (X509* cert : certs) {
        PEM_write_bio_X509(bio, cert);
    }
    BIO_free(bio);
}

void write_crl(const fs::path& path, X509_CRL* crl) {
    BIO* bio = BIO_new_file(path.c_str(), "w");
    REQUIRE(bio != nullptr);
    PEM_write_bio_X509_CRL(bio, crl);
    BIO_free(bio);
}

std::string hash_name(unsigned long hash, const char* suffix) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%08lx.%s", hash, suffix);
    return buf;
}

struct CertDir {
    fs::path path;

    CertDir() {
        path = fs::temp_directory_path() / ("launchpad_certs_" + std::to_string(::getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~CertDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // anonymous namespace

TEST_CASE("Hash link names", "[cert_index]") {
    using platform::OpenSslCertificateIndexer;

    CHECK(OpenSslCertificateIndexer::is_hash_link_name("9d66eef0.0"));
    CHECK(OpenSslCertificateIndexer::is_hash_link_name("9d66eef0.12"));
    CHECK(OpenSslCertificateIndexer::is_hash_link_name("9d66eef0.r0"));

    CHECK_FALSE(OpenSslCertificateIndexer::is_hash_link_name("9D66EEF0.0"));
    CHECK_FALSE(OpenSslCertificateIndexer::is_hash_link_name("9d66eef0."));
    CHECK_FALSE(OpenSslCertificateIndexer::is_hash_link_name("9d66eef0.r"));
    CHECK_FALSE(OpenSslCertificateIndexer::is_hash_link_name("9d66eef.0"));
    CHECK_FALSE(OpenSslCertificateIndexer::is_hash_link_name("ca.pem"));
}

TEST_CASE("Rehash links certificates and CRLs by subject hash", "[cert_index]") {
    CertDir dir;
    auto key = make_key();
    auto root = make_cert(key.get(), "Corp Root CA", 1);
    auto rollover = make_cert(key.get(), "Corp Root CA", 2);
    auto other = make_cert(key.get(), "Partner CA", 3);
    auto crl = make_crl(key.get(), root.get());

    write_pem(dir.path / "corp-root.pem", {root.get()});
    write_pem(dir.path / "corp-root-copy.crt", {root.get()});
    write_pem(dir.path / "corp-rollover.pem", {rollover.get()});
    write_pem(dir.path / "partner.cer", {other.get()});
    write_pem(dir.path / "bundle.pem", {root.get(), other.get()});
    write_crl(dir.path / "corp-root.crl", crl.get());
    std::ofstream(dir.path / "garbage.pem") << "not a certificate\n";
    std::ofstream(dir.path / "README.txt") << "drop CA files here\n";

    // Left over from a previous boot
    fs::create_symlink("gone.pem", dir.path / "0badc0de.0");

    platform::OpenSslCertificateIndexer indexer;
    auto report = indexer.rehash(dir.path);
    REQUIRE(report.has_value());

    auto root_hash = X509_subject_name_hash(root.get());
    auto other_hash = X509_subject_name_hash(other.get());

    CHECK(report->certificates == 3);
    CHECK(report->crls == 1);
    CHECK(report->duplicates == 1);
    CHECK(report->skipped == 2);   // bundle.pem, garbage.pem

    CHECK(contains(report->links, hash_name(root_hash, "0")));
    CHECK(contains(report->links, hash_name(root_hash, "1")));
    CHECK(contains(report->links, hash_name(other_hash, "0")));
    CHECK(contains(report->links, hash_name(root_hash, "r0")));

    CHECK(fs::is_symlink(dir.path / hash_name(other_hash, "0")));
    CHECK(fs::read_symlink(dir.path / hash_name(other_hash, "0")).string() == "partner.cer");
    CHECK(fs::read_symlink(dir.path / hash_name(root_hash, "r0")).string() == "corp-root.crl");
    CHECK_FALSE(fs::exists(fs::symlink_status(dir.path / "0badc0de.0")));
}

TEST_CASE("Rehash is repeatable", "[cert_index]") {
    CertDir dir;
    auto key = make_key();
    auto root = make_cert(key.get(), "Corp Root CA", 1);
    write_pem(dir.path / "corp-root.pem", {root.get()});

    platform::OpenSslCertificateIndexer indexer;
    REQUIRE(indexer.rehash(dir.path).has_value());

    auto again = indexer.rehash(dir.path);
    REQUIRE(again.has_value());
    CHECK(again->certificates == 1);
    CHECK(again->links == std::vector<std::string>{hash_name(X509_subject_name_hash(root.get()), "0")});
}

TEST_CASE("Rehash of a missing directory is a trust warning", "[cert_index]") {
    platform::OpenSslCertificateIndexer indexer;
    auto report = indexer.rehash("/nonexistent/launchpad/certs");

    REQUIRE_FALSE(report.has_value());
    CHECK(report.error().kind() == BootError::CertTrustWarning);
    CHECK_FALSE(report.error().is_fatal());
}
