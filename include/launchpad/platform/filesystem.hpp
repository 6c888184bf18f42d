#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "launchpad/core/error.hpp"
#include "launchpad/util/expected.hpp"

namespace launchpad::platform {

// ============================================================================
// FileSystem - the filesystem operations the bootstrap sequence needs
// ============================================================================

class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual bool is_directory(const std::filesystem::path& path) const = 0;

    // Create-if-absent, including parents. DirectoryError when the path
    // cannot be created or exists as something other than a directory.
    virtual expected<void, Error> create_directories(const std::filesystem::path& path) = 0;

    // DirectoryError unless a new file can be created in the directory.
    // Catches directories that exist on a read-only mount.
    virtual expected<void, Error> check_writable(const std::filesystem::path& dir) = 0;

    // KeyReadError on failure
    virtual expected<std::string, Error> read_file(const std::filesystem::path& path) const = 0;

    // All-or-nothing publish of a new file. Never replaces an existing one.
    // KeyWriteError on failure, in which case the target is left untouched.
    virtual expected<void, Error> write_atomic(const std::filesystem::path& path,
                                               std::string_view bytes) = 0;
};

// ============================================================================
// LocalFileSystem
// ============================================================================

class LocalFileSystem : public FileSystem {
public:
    // Permission bits for files published by write_atomic
    explicit LocalFileSystem(unsigned file_mode = 0600) : file_mode_(file_mode) {}

    bool exists(const std::filesystem::path& path) const override;
    bool is_directory(const std::filesystem::path& path) const override;
    expected<void, Error> create_directories(const std::filesystem::path& path) override;
    expected<void, Error> check_writable(const std::filesystem::path& dir) override;
    expected<std::string, Error> read_file(const std::filesystem::path& path) const override;
    expected<void, Error> write_atomic(const std::filesystem::path& path,
                                       std::string_view bytes) override;

private:
    unsigned file_mode_;
};

} // namespace launchpad::platform
