#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Little-endian serializers for the on-disk record formats.
//
// Readers throw (std::out_of_range from the stream on truncation,
// std::runtime_error on non-canonical or oversized input).  Storage code
// catches std::exception at its boundary and reports a core::Error.
// ---------------------------------------------------------------------------

#include "core/stream.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace core {

/// Upper bound on a length-prefixed field read back from disk (1 MiB).
inline constexpr size_t MAX_BLOB_LENGTH = 1u << 20;

// ===================================================================
// Fixed-width unsigned integers
// ===================================================================

template <typename T, typename Stream>
inline void ser_write_le(Stream& s, T v) {
    static_assert(std::is_unsigned_v<T>);
    std::array<uint8_t, sizeof(T)> buf{};
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    s.write(std::span<const uint8_t>(buf));
}

template <typename T, typename Stream>
inline T ser_read_le(Stream& s) {
    static_assert(std::is_unsigned_v<T>);
    std::array<uint8_t, sizeof(T)> buf{};
    s.read(std::span<uint8_t>(buf));
    T v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        v |= static_cast<T>(static_cast<T>(buf[i]) << (8 * i));
    }
    return v;
}

template <typename Stream>
inline void ser_write_u8(Stream& s, uint8_t v) { ser_write_le(s, v); }

template <typename Stream>
inline void ser_write_u32(Stream& s, uint32_t v) { ser_write_le(s, v); }

template <typename Stream>
inline void ser_write_u64(Stream& s, uint64_t v) { ser_write_le(s, v); }

template <typename Stream>
inline uint8_t ser_read_u8(Stream& s) { return ser_read_le<uint8_t>(s); }

template <typename Stream>
inline uint32_t ser_read_u32(Stream& s) { return ser_read_le<uint32_t>(s); }

template <typename Stream>
inline uint64_t ser_read_u64(Stream& s) { return ser_read_le<uint64_t>(s); }

// ===================================================================
// CompactSize
// ===================================================================
//   < 0xFD              one byte
//   <= 0xFFFF           0xFD, u16
//   <= 0xFFFFFFFF       0xFE, u32
//   otherwise           0xFF, u64
// ===================================================================

template <typename Stream>
void ser_write_compact_size(Stream& s, uint64_t n) {
    if (n < 0xFD) {
        ser_write_u8(s, static_cast<uint8_t>(n));
    } else if (n <= 0xFFFF) {
        ser_write_u8(s, 0xFD);
        ser_write_le(s, static_cast<uint16_t>(n));
    } else if (n <= 0xFFFFFFFFULL) {
        ser_write_u8(s, 0xFE);
        ser_write_le(s, static_cast<uint32_t>(n));
    } else {
        ser_write_u8(s, 0xFF);
        ser_write_le(s, n);
    }
}

template <typename Stream>
uint64_t ser_read_compact_size(Stream& s) {
    uint8_t tag = ser_read_u8(s);
    uint64_t n = 0;
    uint64_t floor = 0;
    switch (tag) {
        case 0xFD: n = ser_read_le<uint16_t>(s); floor = 0xFD;          break;
        case 0xFE: n = ser_read_le<uint32_t>(s); floor = 0x10000;       break;
        case 0xFF: n = ser_read_le<uint64_t>(s); floor = 0x100000000ULL; break;
        default:   return tag;
    }
    if (n < floor) {
        throw std::runtime_error(
            "ser_read_compact_size(): non-canonical encoding");
    }
    return n;
}

// ===================================================================
// Length-prefixed byte strings
// ===================================================================

template <typename Stream>
void ser_write_bytes(Stream& s, std::span<const uint8_t> data) {
    ser_write_compact_size(s, data.size());
    s.write(data);
}

template <typename Stream>
std::vector<uint8_t> ser_read_bytes(Stream& s) {
    uint64_t len = ser_read_compact_size(s);
    if (len > MAX_BLOB_LENGTH) {
        throw std::runtime_error(
            "ser_read_bytes(): field of " + std::to_string(len) +
            " bytes exceeds MAX_BLOB_LENGTH");
    }
    std::vector<uint8_t> out(static_cast<size_t>(len));
    s.read(std::span<uint8_t>(out));
    return out;
}

template <typename Stream>
void ser_write_string(Stream& s, std::string_view str) {
    ser_write_bytes(s, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

template <typename Stream>
std::string ser_read_string(Stream& s) {
    auto bytes = ser_read_bytes(s);
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace core
