#include "launchpad/core/keys.hpp"

#include "launchpad/core/codec.hpp"

namespace launchpad {

expected<std::string, Error> generate_key(platform::RandomSource& random) {
    auto bytes = random.bytes(ENCRYPTION_KEY_BYTES);
    if (!bytes) return unexpected(bytes.error());

    if (bytes->size() != ENCRYPTION_KEY_BYTES) {
        return unexpected(Error(BootError::RandomSourceError, "short read from random source"));
    }
    return base64_encode(*bytes);
}

std::string normalize_key_text(std::string_view content) {
    auto end = content.find_last_not_of(" \t\r\n");
    if (end == std::string_view::npos) return {};
    return std::string(content.substr(0, end + 1));
}

expected<void, Error> validate_key(std::string_view key) {
    if (key.empty()) {
        return unexpected(Error(BootError::InvalidKey, "encryption key is empty"));
    }
    return {};
}

bool is_generated_key_format(std::string_view key) {
    auto decoded = base64_decode(key);
    return decoded && decoded->size() == ENCRYPTION_KEY_BYTES;
}

std::string_view key_source_name(KeySource source) noexcept {
    switch (source) {
        case KeySource::Generated: return "generated";
        case KeySource::LoadedFromFile: return "file";
        case KeySource::FromEnvironment: return "environment";
        default: return "unknown";
    }
}

expected<KeyOutcome, Error> provision_key(Environment& environment,
                                          platform::FileSystem& fs,
                                          platform::RandomSource& random,
                                          const std::filesystem::path& key_file,
                                          const Logger& logger) {
    const bool file_exists = fs.exists(key_file);
    const bool env_set = environment.is_set_nonempty(env::N8N_ENCRYPTION_KEY);

    if (env_set) {
        // The operator's value stands; only compare against the file
        if (file_exists) {
            auto content = fs.read_file(key_file);
            if (content && normalize_key_text(*content) != *environment.get(env::N8N_ENCRYPTION_KEY)) {
                logger.log(logger.entry(LogLevel::Warn,
                        "N8N_ENCRYPTION_KEY differs from the key file; using the environment value")
                    .field("key_file", key_file.string()));
            }
        }
        return KeyOutcome{KeySource::FromEnvironment, key_file};
    }

    if (file_exists) {
        auto content = fs.read_file(key_file);
        if (!content) return unexpected(content.error());

        auto key = normalize_key_text(*content);
        if (auto valid = validate_key(key); !valid) {
            return unexpected(Error(BootError::InvalidKey, key_file.string() + " is empty"));
        }
        if (!is_generated_key_format(key)) {
            logger.warn("Key file " + key_file.string() + " does not hold a base64 32-byte key");
        }

        environment.set(env::N8N_ENCRYPTION_KEY, std::move(key));
        logger.log(logger.entry(LogLevel::Debug, "Loaded encryption key")
            .field("key_file", key_file.string()));
        return KeyOutcome{KeySource::LoadedFromFile, key_file};
    }

    auto key = generate_key(random);
    if (!key) return unexpected(key.error());

    if (auto written = fs.write_atomic(key_file, *key + "\n"); !written) {
        return unexpected(written.error());
    }

    environment.set(env::N8N_ENCRYPTION_KEY, std::move(*key));
    logger.log(logger.entry(LogLevel::Info, "Generated new encryption key")
        .field("key_file", key_file.string()));
    return KeyOutcome{KeySource::Generated, key_file};
}

} // namespace launchpad
