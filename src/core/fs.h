#pragma once

#include "core/error.h"

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// core::fs -- the filesystem operations the estimator depends on.
//
// POSIX only (Linux, macOS).  write_file() is the single primitive that
// makes persisted state crash-safe: after it returns ok the new contents
// are durable, and after any failure (or a crash part way through) the
// previous contents are still in place.
// ---------------------------------------------------------------------------

namespace core::fs {

using path = std::filesystem::path;

/// ~/Library/Application Support/FeeTier on macOS, ~/.feetier elsewhere.
path get_default_data_dir();

/// Creates @p dir and its parents.  True if the directory exists afterwards.
bool ensure_directory(const path& dir);

bool file_exists(const path& p);

std::optional<uint64_t> file_size(const path& p);

/// rename(2): atomic replacement of @p dst within one filesystem.
bool rename_replace(const path& src, const path& dst);

/// Entire contents of @p p, or std::nullopt if it cannot be read.
std::optional<std::string> read_file(const path& p);

/// Replace the contents of @p p durably.
///
/// Writes "<p>.tmp", fsyncs it, renames it over @p p, then fsyncs the
/// parent directory so the rename itself survives a power loss.  The old
/// file is hard-linked to "<p>.bak" across the rename; if the directory
/// sync fails it is moved back, so on any error @p p holds its previous
/// contents (or is absent if it was before).  Parent directories are
/// created as needed.  STORAGE_WRITE with the failing step and errno text
/// on failure; the temporary is removed.
core::Result<void> write_file(const path& p,
                              std::span<const uint8_t> content);

core::Result<void> write_file(const path& p, std::string_view content);

namespace testing {

/// Make the next @p count parent-directory syncs in write_file() fail
/// with @p err.
void inject_dir_sync_failure(int count, int err = EIO);

} // namespace testing

// ---------------------------------------------------------------------------
// FileLock -- exclusive advisory lock (flock) on a lock file, released on
// destruction.  A second FileLock on the same path fails to lock even in
// the same process.
// ---------------------------------------------------------------------------

class FileLock {
public:
    /// Does not lock; call try_lock().
    explicit FileLock(path lock_path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    /// Non-blocking.  Creates the lock file if needed.
    bool try_lock();

    void unlock();

    [[nodiscard]] bool locked() const noexcept { return fd_ >= 0; }

    [[nodiscard]] const path& lock_path() const noexcept { return lock_path_; }

private:
    path lock_path_;
    int  fd_{-1};   // open and locked, or -1
};

} // namespace core::fs
