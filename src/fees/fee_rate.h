#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/receipt.h"
#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace fees {

// ---------------------------------------------------------------------------
// FeeRateEstimate -- the three pricing tiers, in fee units per unit cost
// ---------------------------------------------------------------------------
// No ordering is enforced between the tiers: blending each tier against its
// own history can leave medium above fast for a while.
// ---------------------------------------------------------------------------
struct FeeRateEstimate {
    uint64_t fast   = 0;
    uint64_t medium = 0;
    uint64_t slow   = 0;

    /// Persisted record layout version.
    static constexpr uint8_t RECORD_VERSION = 1;

    /// 1 (version) + 3 * 8 (fast, medium, slow; little-endian).
    static constexpr size_t RECORD_SIZE = 1 + 3 * 8;

    /// "fast=9 medium=9 slow=1"
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::vector<uint8_t> encode() const;

    /// Fails with PARSE_BAD_FORMAT on a wrong size or unknown version.
    [[nodiscard]] static core::Result<FeeRateEstimate> decode(
        std::span<const uint8_t> data);

    bool operator==(const FeeRateEstimate&) const = default;
};

// ---------------------------------------------------------------------------
// FeeRateEstimator -- capability implemented by every estimator
// ---------------------------------------------------------------------------
class FeeRateEstimator {
public:
    virtual ~FeeRateEstimator() = default;

    /// Feed one confirmed block.  Blocks without eligible transactions are
    /// accepted and leave the estimate untouched.
    [[nodiscard]] virtual core::Result<void> notify_block(
        const chain::BlockReceipt& receipt) = 0;

    /// Current estimate, or ESTIMATE_UNAVAILABLE before the first block
    /// with an eligible transaction.
    [[nodiscard]] virtual core::Result<FeeRateEstimate>
    get_rate_estimates() const = 0;
};

} // namespace fees
