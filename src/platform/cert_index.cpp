#include "launchpad/platform/cert_index.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <map>
#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace launchpad::platform {

namespace {

namespace fs = std::filesystem;

using Fingerprint = std::array<unsigned char, EVP_MAX_MD_SIZE>;

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

struct InfoStackDeleter {
    void operator()(STACK_OF(X509_INFO)* infos) const {
        sk_X509_INFO_pop_free(infos, X509_INFO_free);
    }
};

bool has_pem_extension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".pem" || ext == ".crt" || ext == ".cer" || ext == ".crl";
}

// A parsed PEM file reduced to what the index needs
struct HashedObject {
    bool is_crl = false;
    unsigned long hash = 0;
    Fingerprint fingerprint{};
};

// Exactly one certificate or CRL per file, as `openssl rehash` requires
bool load_single_object(const fs::path& path, HashedObject& out) {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_file(path.c_str(), "r"));
    if (!bio) return false;

    std::unique_ptr<STACK_OF(X509_INFO), InfoStackDeleter> infos(
        PEM_X509_INFO_read_bio(bio.get(), nullptr, nullptr, nullptr));

    // Unparsable files are expected; keep their errors off the queue
    ERR_clear_error();
    if (!infos || sk_X509_INFO_num(infos.get()) != 1) return false;

    X509_INFO* info = sk_X509_INFO_value(infos.get(), 0);
    unsigned int len = 0;

    if (info->x509) {
        out.is_crl = false;
        out.hash = X509_subject_name_hash(info->x509);
        return X509_digest(info->x509, EVP_sha256(), out.fingerprint.data(), &len) == 1;
    }
    if (info->crl) {
        out.is_crl = true;
        out.hash = X509_NAME_hash(X509_CRL_get_issuer(info->crl));
        return X509_CRL_digest(info->crl, EVP_sha256(), out.fingerprint.data(), &len) == 1;
    }
    return false;
}

std::string link_name(unsigned long hash, bool is_crl, int index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), is_crl ? "%08lx.r%d" : "%08lx.%d", hash, index);
    return buf;
}

} // anonymous namespace

bool OpenSslCertificateIndexer::is_hash_link_name(const std::string& name) {
    if (name.size() < 10 || name[8] != '.') return false;

    for (size_t i = 0; i < 8; ++i) {
        char c = name[i];
        if (!std::isdigit(static_cast<unsigned char>(c)) && (c < 'a' || c > 'f')) return false;
    }

    size_t pos = 9;
    if (name[pos] == 'r') ++pos;
    if (pos == name.size()) return false;

    for (; pos < name.size(); ++pos) {
        if (!std::isdigit(static_cast<unsigned char>(name[pos]))) return false;
    }
    return true;
}

expected<RehashReport, Error> OpenSslCertificateIndexer::rehash(const fs::path& dir) {
    RehashReport report;
    std::error_code ec;

    std::vector<fs::path> stale_links;
    std::vector<fs::path> candidates;

    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        auto name = entry.path().filename().string();
        std::error_code entry_ec;

        if (entry.is_symlink(entry_ec) && is_hash_link_name(name)) {
            stale_links.push_back(entry.path());
        } else if (entry.is_regular_file(entry_ec) && has_pem_extension(entry.path())) {
            candidates.push_back(entry.path());
        }
    }
    if (ec) {
        return unexpected(Error(BootError::CertTrustWarning, ec, "cannot list " + dir.string()));
    }

    for (const auto& link : stale_links) {
        if (!fs::remove(link, ec) && ec) {
            return unexpected(Error(BootError::CertTrustWarning, ec,
                "cannot remove stale link " + link.string()));
        }
    }

    // Directory order is unspecified; sort so link indices are stable
    std::sort(candidates.begin(), candidates.end());

    std::map<std::pair<bool, unsigned long>, std::vector<Fingerprint>> seen;

    for (const auto& path : candidates) {
        HashedObject object;
        if (!load_single_object(path, object)) {
            ++report.skipped;
            continue;
        }

        auto& bucket = seen[{object.is_crl, object.hash}];
        if (std::find(bucket.begin(), bucket.end(), object.fingerprint) != bucket.end()) {
            ++report.duplicates;
            continue;
        }

        auto name = link_name(object.hash, object.is_crl, static_cast<int>(bucket.size()));
        fs::create_symlink(path.filename(), dir / name, ec);
        if (ec) {
            return unexpected(Error(BootError::CertTrustWarning, ec,
                "cannot create link " + (dir / name).string()));
        }

        bucket.push_back(object.fingerprint);
        report.links.push_back(name);
        if (object.is_crl) {
            ++report.crls;
        } else {
            ++report.certificates;
        }
    }

    return report;
}

} // namespace launchpad::platform
