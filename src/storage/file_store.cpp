// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "storage/file_store.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "crypto/keccak.h"

#include <algorithm>
#include <cstring>
#include <string_view>
#include <system_error>
#include <utility>

namespace storage {

static constexpr size_t MAGIC_SIZE = 8;
static constexpr uint8_t MAGIC[MAGIC_SIZE] = {
    'F', 'T', 'I', 'E', 'R', 'D', 'B', 0x01
};
static constexpr size_t CHECKSUM_SIZE = 4;

// ===========================================================================
// Image encoding
// ===========================================================================

std::vector<uint8_t> FileRecordStore::encode_image(const RecordMap& records) {
    core::ByteWriter stream;
    stream.write(std::span<const uint8_t>(MAGIC, MAGIC_SIZE));
    core::ser_write_u32(stream, FORMAT_VERSION);
    core::ser_write_compact_size(stream, records.size());

    for (const auto& [key, value] : records) {
        core::ser_write_string(stream, key);
        core::ser_write_bytes(stream, std::span<const uint8_t>(value));
    }

    uint32_t checksum = crypto::keccak256_checksum(stream.bytes());
    core::ser_write_u32(stream, checksum);
    return stream.release();
}

core::Result<FileRecordStore::RecordMap> FileRecordStore::decode_image(
    std::span<const uint8_t> image) {

    if (image.size() < MAGIC_SIZE + 4 + 1 + CHECKSUM_SIZE) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
            "record store image too short (" +
            std::to_string(image.size()) + " bytes)");
    }

    if (std::memcmp(image.data(), MAGIC, MAGIC_SIZE) != 0) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
            "record store image has invalid magic");
    }

    auto body = image.first(image.size() - CHECKSUM_SIZE);
    core::ByteReader tail(image.last(CHECKSUM_SIZE));
    uint32_t stored_checksum = core::ser_read_u32(tail);
    uint32_t actual_checksum = crypto::keccak256_checksum(body);
    if (stored_checksum != actual_checksum) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
            "record store checksum mismatch");
    }

    RecordMap records;
    try {
        core::ByteReader reader(body.subspan(MAGIC_SIZE));

        uint32_t version = core::ser_read_u32(reader);
        if (version != FORMAT_VERSION) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "unsupported record store version " +
                std::to_string(version));
        }

        uint64_t count = core::ser_read_compact_size(reader);
        if (count > reader.remaining()) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "record count " + std::to_string(count) +
                " exceeds image size");
        }

        for (uint64_t i = 0; i < count; ++i) {
            std::string key = core::ser_read_string(reader);
            std::vector<uint8_t> value = core::ser_read_bytes(reader);
            if (!records.emplace(std::move(key), std::move(value)).second) {
                return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                    "duplicate key in record store image");
            }
        }

        if (!reader.eof()) {
            return core::Error(core::ErrorCode::STORAGE_CORRUPT,
                "trailing bytes after last record (" +
                std::to_string(reader.remaining()) + ")");
        }
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
            std::string("failed to parse record store image: ") + e.what());
    }

    return records;
}

// ===========================================================================
// FileRecordStore
// ===========================================================================

FileRecordStore::FileRecordStore(PrivateTag,
                                 std::filesystem::path path,
                                 core::fs::FileLock lock,
                                 RecordMap records)
    : path_(std::move(path))
    , lock_(std::move(lock))
    , records_(std::move(records)) {}

core::Result<std::unique_ptr<FileRecordStore>> FileRecordStore::open(
    const std::filesystem::path& path) {

    if (path.has_parent_path() &&
        !core::fs::ensure_directory(path.parent_path())) {
        return core::Error(core::ErrorCode::STORAGE_OPEN,
            "cannot create directory " + path.parent_path().string());
    }

    core::fs::FileLock lock(std::filesystem::path(path.string() + ".lock"));
    if (!lock.try_lock()) {
        return core::Error(core::ErrorCode::STORAGE_LOCKED,
            "record store " + path.string() +
            " is in use by another instance");
    }

    RecordMap records;
    if (core::fs::file_exists(path)) {
        auto content = core::fs::read_file(path);
        if (!content) {
            return core::Error(core::ErrorCode::STORAGE_OPEN,
                "cannot read record store " + path.string());
        }
        auto decoded = decode_image(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(content->data()),
            content->size()));
        if (!decoded.ok()) {
            return decoded.error().with_context(path.string());
        }
        records = std::move(decoded).value();
        LOG_DEBUG(core::LogCategory::STORAGE,
            "loaded " + std::to_string(records.size()) +
            " record(s) from " + path.string());
    } else {
        // Lay the file down now so a fresh store and a reopened one
        // behave the same.
        auto written = core::fs::write_file(path, encode_image(records));
        if (!written.ok()) {
            return core::Error(core::ErrorCode::STORAGE_OPEN,
                "cannot create record store: " + written.error().message());
        }
        LOG_INFO(core::LogCategory::STORAGE,
            "created record store " + path.string());
    }

    return std::make_unique<FileRecordStore>(
        PrivateTag{}, path, std::move(lock), std::move(records));
}

core::Result<FileRecordStore::RecordMap> FileRecordStore::load_image() const {
    auto content = core::fs::read_file(path_);
    if (!content) {
        return core::Error(core::ErrorCode::STORAGE_READ,
            "cannot read record store " + path_.string());
    }
    return decode_image(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(content->data()), content->size()));
}

core::Result<std::optional<std::vector<uint8_t>>> FileRecordStore::read(
    std::string_view key) const {

    std::lock_guard<std::mutex> lock(mutex_);

    auto loaded = load_image();
    if (!loaded.ok()) {
        LOG_ERROR(core::LogCategory::STORAGE, loaded.error().format());
        return loaded.error();
    }

    const RecordMap& records = loaded.value();
    auto it = records.find(key);
    if (it == records.end()) {
        return std::optional<std::vector<uint8_t>>{};
    }
    return std::optional<std::vector<uint8_t>>{it->second};
}

core::Result<void> FileRecordStore::upsert(
    std::string_view key, std::span<const uint8_t> record) {

    if (record.size() > core::MAX_BLOB_LENGTH) {
        return core::Error(core::ErrorCode::STORAGE_WRITE,
            "record for key '" + std::string(key) + "' too large");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    RecordMap next = records_;
    next.insert_or_assign(std::string(key),
                          std::vector<uint8_t>(record.begin(), record.end()));

    auto written = core::fs::write_file(path_, encode_image(next));
    if (!written.ok()) {
        return written.error();
    }

    records_ = std::move(next);
    LOG_TRACE(core::LogCategory::STORAGE,
        "upserted '" + std::string(key) + "' (" +
        std::to_string(record.size()) + " bytes)");
    return core::make_ok();
}

size_t FileRecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace storage
