#include "launchpad/core/codec.hpp"

#include <cctype>

#include <openssl/evp.h>

namespace launchpad {

namespace {

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

} // anonymous namespace

std::string base64_encode(const uint8_t* data, size_t len) {
    if (len == 0) return {};

    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a NUL
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

expected<std::vector<uint8_t>, Error> base64_decode(std::string_view text) {
    if (text.empty()) return std::vector<uint8_t>{};

    if (text.size() % 4 != 0) {
        return unexpected(Error(BootError::InvalidKey, "base64 length is not a multiple of 4"));
    }

    size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;

    for (size_t i = 0; i < text.size() - padding; ++i) {
        if (!is_base64_char(text[i])) {
            return unexpected(Error(BootError::InvalidKey, "invalid base64 character"));
        }
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (decoded < 0) {
        return unexpected(Error(BootError::InvalidKey, "malformed base64"));
    }

    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace launchpad
