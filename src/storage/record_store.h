#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace storage {

// ---------------------------------------------------------------------------
// RecordStore -- keyed single-record persistence
// ---------------------------------------------------------------------------
// A record is an opaque byte string addressed by a short key.  Both calls
// are atomic with respect to the durable state: after upsert() returns ok
// the new record survives a crash, and after it returns an error the old
// record (or its absence) is what a later read() sees.
// ---------------------------------------------------------------------------
class RecordStore {
public:
    virtual ~RecordStore() = default;

    /// Read the record stored under @p key.  std::nullopt if no record has
    /// been written yet; an error if the durable image cannot be read or
    /// fails its integrity check.
    [[nodiscard]] virtual core::Result<std::optional<std::vector<uint8_t>>>
    read(std::string_view key) const = 0;

    /// Insert or replace the record stored under @p key.
    [[nodiscard]] virtual core::Result<void> upsert(
        std::string_view key, std::span<const uint8_t> record) = 0;
};

} // namespace storage
