#include "launchpad/platform/random.hpp"

#include <climits>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace launchpad::platform {

namespace {

std::string get_openssl_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "unknown OpenSSL error";

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

} // anonymous namespace

expected<std::vector<uint8_t>, Error> OpenSslRandomSource::bytes(size_t count) {
    if (count > static_cast<size_t>(INT_MAX)) {
        return unexpected(Error(BootError::RandomSourceError, "request too large"));
    }

    std::vector<uint8_t> out(count);
    if (count == 0) return out;

    if (RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        return unexpected(Error(BootError::RandomSourceError, "RAND_bytes: " + get_openssl_error()));
    }
    return out;
}

} // namespace launchpad::platform
