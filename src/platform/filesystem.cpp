#include "launchpad/platform/filesystem.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace launchpad::platform {

namespace {

// Closes the descriptor on scope exit
class FdGuard {
    int fd_;

public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const noexcept { return fd_; }

    // Close explicitly so the error can be reported
    int close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }
};

bool write_all(int fd, std::string_view bytes) {
    const char* p = bytes.data();
    size_t remaining = bytes.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

// Best effort: makes the new directory entry durable
void sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return;
    ::fsync(fd);
    ::close(fd);
}

} // anonymous namespace

bool LocalFileSystem::exists(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool LocalFileSystem::is_directory(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

expected<void, Error> LocalFileSystem::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return unexpected(Error(BootError::DirectoryError, ec,
            "cannot create " + path.string()));
    }

    // create_directories reports success when a non-directory already sits there
    if (!std::filesystem::is_directory(path, ec)) {
        return unexpected(Error(BootError::DirectoryError,
            std::make_error_code(std::errc::not_a_directory),
            path.string() + " exists and is not a directory"));
    }
    return {};
}

expected<void, Error> LocalFileSystem::check_writable(const std::filesystem::path& dir) {
    std::string tmpl = (dir / ".launchpad-write-test.XXXXXX").string();
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    int fd = ::mkostemp(name.data(), O_CLOEXEC);
    if (fd < 0) {
        return unexpected(Error::from_errno(BootError::DirectoryError,
            dir.string() + " is not writable"));
    }
    ::close(fd);
    ::unlink(name.data());
    return {};
}

expected<std::string, Error> LocalFileSystem::read_file(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(Error::from_errno(BootError::KeyReadError, "cannot open " + path.string()));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return unexpected(Error(BootError::KeyReadError, "cannot read " + path.string()));
    }
    return ss.str();
}

expected<void, Error> LocalFileSystem::write_atomic(const std::filesystem::path& path,
                                                    std::string_view bytes) {
    auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");

    std::string tmpl = (dir / ("." + path.filename().string() + ".XXXXXX")).string();
    std::vector<char> tmp_name(tmpl.begin(), tmpl.end());
    tmp_name.push_back('\0');

    FdGuard fd(::mkostemp(tmp_name.data(), O_CLOEXEC));
    if (fd.get() < 0) {
        return unexpected(Error::from_errno(BootError::KeyWriteError,
            "cannot create temporary file in " + dir.string()));
    }
    std::filesystem::path tmp_path(tmp_name.data());

    auto fail = [&](std::string what) {
        auto err = Error::from_errno(BootError::KeyWriteError, std::move(what));
        ::unlink(tmp_path.c_str());
        return unexpected(std::move(err));
    };

    if (::fchmod(fd.get(), static_cast<mode_t>(file_mode_)) != 0) {
        return fail("cannot set permissions on " + tmp_path.string());
    }
    if (!write_all(fd.get(), bytes)) {
        return fail("cannot write " + tmp_path.string());
    }
    if (::fsync(fd.get()) != 0) {
        return fail("cannot sync " + tmp_path.string());
    }
    if (fd.close() != 0) {
        return fail("cannot close " + tmp_path.string());
    }

    // link(2) refuses to replace an existing target, rename(2) would not
    if (::link(tmp_path.c_str(), path.c_str()) != 0) {
        return fail("cannot publish " + path.string());
    }

    ::unlink(tmp_path.c_str());
    sync_directory(dir);
    return {};
}

} // namespace launchpad::platform
