#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Keccak-256 (SHA3-256) wrapper around the OpenSSL 3.0+ EVP API.
//
// The "keccak256" naming follows the node's convention; the underlying
// primitive is NIST SHA3-256 (FIPS 202).  Used to checksum persisted
// record images.
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace crypto {

using Digest256 = std::array<uint8_t, 32>;

/// Compute Keccak-256 (SHA3-256) of a byte span.
/// Throws std::runtime_error if the OpenSSL digest context fails.
[[nodiscard]] Digest256 keccak256(std::span<const uint8_t> data);

/// First four digest bytes read as a little-endian integer.
[[nodiscard]] uint32_t keccak256_checksum(std::span<const uint8_t> data);

}  // namespace crypto
