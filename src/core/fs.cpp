#include "core/fs.h"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace core::fs {

namespace {

std::atomic<int> g_dir_sync_failures{0};
std::atomic<int> g_dir_sync_errno{EIO};

core::Error io_error(const char* step, const path& p, int err) {
    return core::Error(core::ErrorCode::STORAGE_WRITE,
        std::string(step) + " " + p.string() + ": " + std::strerror(err));
}

/// Write all of @p data to @p fd, retrying short writes and EINTR.
bool write_all(int fd, const uint8_t* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

/// fsync the directory holding @p p so a rename into it is durable.
bool sync_parent(const path& p) {
    if (g_dir_sync_failures.load() > 0 &&
        g_dir_sync_failures.fetch_sub(1) > 0) {
        errno = g_dir_sync_errno.load();
        return false;
    }
    path dir = p.has_parent_path() ? p.parent_path() : path(".");
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Paths
// ---------------------------------------------------------------------------

path get_default_data_dir() {
    const char* home = std::getenv("HOME");
    path base = (home && home[0] != '\0') ? path(home) : path("/tmp");
#if defined(__APPLE__)
    return base / "Library" / "Application Support" / "FeeTier";
#else
    return base / ".feetier";
#endif
}

bool ensure_directory(const path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return std::filesystem::is_directory(dir, ec);
}

bool file_exists(const path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

std::optional<uint64_t> file_size(const path& p) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(sz);
}

bool rename_replace(const path& src, const path& dst) {
    return ::rename(src.c_str(), dst.c_str()) == 0;
}

// ---------------------------------------------------------------------------
// Read / write
// ---------------------------------------------------------------------------

std::optional<std::string> read_file(const path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) return std::nullopt;

    std::string content{std::istreambuf_iterator<char>(in),
                        std::istreambuf_iterator<char>()};
    if (in.bad()) return std::nullopt;
    return content;
}

core::Result<void> write_file(const path& p,
                              std::span<const uint8_t> content) {
    if (p.has_parent_path() && !ensure_directory(p.parent_path())) {
        return core::Error(core::ErrorCode::STORAGE_WRITE,
            "cannot create directory " + p.parent_path().string());
    }

    path tmp = p;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                    0644);
    if (fd < 0) return io_error("create", tmp, errno);

    if (!write_all(fd, content.data(), content.size())) {
        int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        return io_error("write", tmp, err);
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        return io_error("fsync", tmp, err);
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return io_error("close", tmp, err);
    }

    // Keep the current image reachable as "<p>.bak" until the new one is
    // durable, so a failed directory sync can put it back.
    path bak = p;
    bak += ".bak";
    ::unlink(bak.c_str());
    bool had_old = ::link(p.c_str(), bak.c_str()) == 0;
    if (!had_old && errno != ENOENT) {
        int err = errno;
        ::unlink(tmp.c_str());
        return io_error("back up", p, err);
    }

    if (!rename_replace(tmp, p)) {
        int err = errno;
        ::unlink(tmp.c_str());
        if (had_old) ::unlink(bak.c_str());
        return io_error("rename onto", p, err);
    }
    if (!sync_parent(p)) {
        int err = errno;
        bool restored = had_old ? rename_replace(bak, p)
                                : ::unlink(p.c_str()) == 0;
        if (!restored) {
            return core::Error(core::ErrorCode::STORAGE_WRITE,
                "fsync directory of " + p.string() + ": " +
                std::strerror(err) + (had_old
                    ? "; previous contents left in " + bak.string()
                    : std::string("; new file could not be removed")));
        }
        sync_parent(p);
        return io_error("fsync directory of", p, err);
    }

    if (had_old) ::unlink(bak.c_str());
    return core::make_ok();
}

core::Result<void> write_file(const path& p, std::string_view content) {
    return write_file(p, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(content.data()), content.size()));
}

namespace testing {

void inject_dir_sync_failure(int count, int err) {
    g_dir_sync_errno.store(err);
    g_dir_sync_failures.store(count);
}

} // namespace testing

// ---------------------------------------------------------------------------
// FileLock
// ---------------------------------------------------------------------------

FileLock::FileLock(path lock_path)
    : lock_path_(std::move(lock_path)) {}

FileLock::~FileLock() {
    unlock();
}

FileLock::FileLock(FileLock&& other) noexcept
    : lock_path_(std::move(other.lock_path_))
    , fd_(std::exchange(other.fd_, -1)) {}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        unlock();
        lock_path_ = std::move(other.lock_path_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

bool FileLock::try_lock() {
    if (fd_ >= 0) return true;

    int fd = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) return false;

    // Each open() is a separate open file description, so flock() also
    // refuses a second holder inside this process.
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        ::close(fd);
        return false;
    }
    fd_ = fd;
    return true;
}

void FileLock::unlock() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace core::fs
