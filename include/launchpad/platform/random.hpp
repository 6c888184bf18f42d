#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "launchpad/core/error.hpp"
#include "launchpad/util/expected.hpp"

namespace launchpad::platform {

// Cryptographically secure bytes. RandomSourceError when the platform
// cannot provide them.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual expected<std::vector<uint8_t>, Error> bytes(size_t count) = 0;
};

// OpenSSL's CSPRNG (seeded from getrandom/urandom)
class OpenSslRandomSource : public RandomSource {
public:
    expected<std::vector<uint8_t>, Error> bytes(size_t count) override;
};

} // namespace launchpad::platform
