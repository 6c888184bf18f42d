#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "launchpad/core/error.hpp"
#include "launchpad/util/expected.hpp"

namespace launchpad {

// Standard alphabet, padded, no line breaks
std::string base64_encode(const uint8_t* data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

// Strict decode: length must be a multiple of four and padding may only
// appear at the end. Anything else is InvalidKey.
expected<std::vector<uint8_t>, Error> base64_decode(std::string_view text);

} // namespace launchpad
