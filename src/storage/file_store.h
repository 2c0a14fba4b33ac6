#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/fs.h"
#include "storage/record_store.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace storage {

// ---------------------------------------------------------------------------
// FileRecordStore -- RecordStore over one flat binary file
// ---------------------------------------------------------------------------
// File format:
//   [8-byte magic "FTIERDB\x01"]
//   [u32 format version]
//   [CompactSize record count]
//   [record]...                 -- length-prefixed key, length-prefixed value
//   [u32 checksum]              -- keccak256 of everything before it
//
// Every upsert rewrites the whole image through core::fs::write_file, so the
// file on disk is always either the previous image or the new one.  An
// advisory lock on "<path>.lock" keeps a second store (in this process or
// another) from opening the same file.
// ---------------------------------------------------------------------------
class FileRecordStore final : public RecordStore {
    /// Restricts construction to open().
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static constexpr uint32_t FORMAT_VERSION = 1;

    using RecordMap = std::map<std::string, std::vector<uint8_t>, std::less<>>;

    /// Open the store at @p path, creating the parent directory and an
    /// empty image if none exists.  Fails with STORAGE_LOCKED when the
    /// file is held by another store, STORAGE_CORRUPT on a bad image, and
    /// STORAGE_OPEN on any other I/O failure.
    [[nodiscard]] static core::Result<std::unique_ptr<FileRecordStore>> open(
        const std::filesystem::path& path);

    FileRecordStore(PrivateTag, std::filesystem::path path,
                    core::fs::FileLock lock, RecordMap records);

    ~FileRecordStore() override = default;

    FileRecordStore(const FileRecordStore&) = delete;
    FileRecordStore& operator=(const FileRecordStore&) = delete;

    /// Re-reads the image from disk so that on-disk damage is reported.
    [[nodiscard]] core::Result<std::optional<std::vector<uint8_t>>>
    read(std::string_view key) const override;

    [[nodiscard]] core::Result<void> upsert(
        std::string_view key, std::span<const uint8_t> record) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }

    /// Number of records in the last image loaded or written.
    [[nodiscard]] size_t size() const;

    /// Serialize @p records into a complete file image.
    [[nodiscard]] static std::vector<uint8_t> encode_image(
        const RecordMap& records);

    /// Parse and verify a complete file image.
    [[nodiscard]] static core::Result<RecordMap> decode_image(
        std::span<const uint8_t> image);

private:
    /// Read and decode the image currently on disk.
    core::Result<RecordMap> load_image() const;

    std::filesystem::path path_;
    core::fs::FileLock    lock_;

    mutable std::mutex mutex_;
    RecordMap          records_;
};

} // namespace storage
