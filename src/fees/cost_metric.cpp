// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fees/cost_metric.h"

#include <limits>

namespace fees {

ProportionalDotProduct::ProportionalDotProduct(
    uint64_t block_size_limit, const chain::ExecutionCost& block_limit)
    : block_size_limit_(block_size_limit)
    , block_limit_(block_limit) {}

ProportionalDotProduct ProportionalDotProduct::mainnet() {
    return ProportionalDotProduct(chain::MAX_BLOCK_LEN,
                                  chain::ExecutionCost::block_limit_mainnet());
}

uint64_t ProportionalDotProduct::from_usage_and_length(
    const chain::ExecutionCost& usage, uint64_t byte_length) const {
    uint64_t exec = usage.proportion_dot_product(block_limit_, RESOLUTION);
    uint64_t len  = from_length(byte_length);
    if (exec > std::numeric_limits<uint64_t>::max() - len) {
        return std::numeric_limits<uint64_t>::max();
    }
    return exec + len;
}

uint64_t ProportionalDotProduct::from_length(uint64_t byte_length) const {
    if (block_size_limit_ == 0) return 0;
    unsigned __int128 scaled =
        static_cast<unsigned __int128>(byte_length) * RESOLUTION /
        block_size_limit_;
    if (scaled > std::numeric_limits<uint64_t>::max()) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(scaled);
}

} // namespace fees
