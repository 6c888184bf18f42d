#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "launchpad/core/environment.hpp"
#include "launchpad/core/error.hpp"
#include "launchpad/core/logging.hpp"
#include "launchpad/platform/filesystem.hpp"
#include "launchpad/platform/random.hpp"
#include "launchpad/util/expected.hpp"

namespace launchpad {

// Raw key size before encoding
inline constexpr size_t ENCRYPTION_KEY_BYTES = 32;

// 32 secure random bytes, base64-encoded (44 characters)
expected<std::string, Error> generate_key(platform::RandomSource& random);

// Key file content minus trailing whitespace and line breaks
std::string normalize_key_text(std::string_view content);

// InvalidKey when empty
expected<void, Error> validate_key(std::string_view key);

// True when the key is base64 of exactly ENCRYPTION_KEY_BYTES bytes
bool is_generated_key_format(std::string_view key);

enum class KeySource {
    Generated,        // first boot: new key written to the key file
    LoadedFromFile,   // key file existed, variable was unset
    FromEnvironment   // operator-supplied variable stands
};

std::string_view key_source_name(KeySource source) noexcept;

struct KeyOutcome {
    KeySource source = KeySource::Generated;
    std::filesystem::path key_file;
};

// Makes sure N8N_ENCRYPTION_KEY is set in `environment`, generating and
// persisting a key only when neither the file nor the variable exists.
// An existing key file is never written.
expected<KeyOutcome, Error> provision_key(Environment& environment,
                                          platform::FileSystem& fs,
                                          platform::RandomSource& random,
                                          const std::filesystem::path& key_file,
                                          const Logger& logger);

} // namespace launchpad
