// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/receipt.h"

#include <limits>
#include <sstream>

namespace chain {

namespace {

constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

uint64_t saturating_add(uint64_t a, uint64_t b) {
    return (a > U64_MAX - b) ? U64_MAX : a + b;
}

/// resolution * value / limit without intermediate overflow.
uint64_t proportion(uint64_t value, uint64_t limit, uint64_t resolution) {
    if (limit == 0) return 0;
    unsigned __int128 scaled =
        static_cast<unsigned __int128>(value) * resolution / limit;
    return scaled > U64_MAX ? U64_MAX : static_cast<uint64_t>(scaled);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ExecutionCost
// ---------------------------------------------------------------------------

ExecutionCost ExecutionCost::block_limit_mainnet() {
    ExecutionCost limit;
    limit.write_length = 15'000'000;
    limit.write_count  = 15'000;
    limit.read_length  = 100'000'000;
    limit.read_count   = 15'000;
    limit.runtime      = 5'000'000'000;
    return limit;
}

uint64_t ExecutionCost::proportion_dot_product(
    const ExecutionCost& limit, uint64_t resolution) const {
    uint64_t total = 0;
    total = saturating_add(total,
        proportion(write_length, limit.write_length, resolution));
    total = saturating_add(total,
        proportion(write_count, limit.write_count, resolution));
    total = saturating_add(total,
        proportion(read_length, limit.read_length, resolution));
    total = saturating_add(total,
        proportion(read_count, limit.read_count, resolution));
    total = saturating_add(total,
        proportion(runtime, limit.runtime, resolution));
    return total;
}

std::string ExecutionCost::to_string() const {
    std::ostringstream oss;
    oss << "{write_length=" << write_length
        << ", write_count=" << write_count
        << ", read_length=" << read_length
        << ", read_count=" << read_count
        << ", runtime=" << runtime << '}';
    return oss.str();
}

// ---------------------------------------------------------------------------
// PayloadKind helpers
// ---------------------------------------------------------------------------

std::string_view payload_kind_name(PayloadKind kind) noexcept {
    switch (kind) {
        case PayloadKind::REWARD:          return "reward";
        case PayloadKind::TRANSFER:        return "transfer";
        case PayloadKind::CONTRACT_CALL:   return "contract-call";
        case PayloadKind::CONTRACT_DEPLOY: return "contract-deploy";
    }
    return "unknown";
}

bool is_fee_market_payload(PayloadKind kind) noexcept {
    return kind != PayloadKind::REWARD;
}

bool has_execution_profile(PayloadKind kind) noexcept {
    return kind == PayloadKind::CONTRACT_CALL ||
           kind == PayloadKind::CONTRACT_DEPLOY;
}

} // namespace chain
