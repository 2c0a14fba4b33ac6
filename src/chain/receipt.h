#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Block receipts as handed over by the chain-state coordinator once a block
// is confirmed.  The execution engine fills in the ExecutionCost of each
// transaction; this module only carries it.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chain {

// ---------------------------------------------------------------------------
// ExecutionCost -- resource-usage vector of one transaction (or a limit)
// ---------------------------------------------------------------------------
struct ExecutionCost {
    uint64_t write_length = 0;
    uint64_t write_count  = 0;
    uint64_t read_length  = 0;
    uint64_t read_count   = 0;
    uint64_t runtime      = 0;

    /// Mainnet per-block execution budget.
    [[nodiscard]] static ExecutionCost block_limit_mainnet();

    /// Sum over all dimensions of `resolution * self / limit`, skipping
    /// dimensions whose limit is zero.  Saturates at UINT64_MAX.
    [[nodiscard]] uint64_t proportion_dot_product(
        const ExecutionCost& limit, uint64_t resolution) const;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ExecutionCost&) const = default;
};

/// Mainnet maximum anchored block length in bytes (2 MiB).
inline constexpr uint64_t MAX_BLOCK_LEN = 2 * 1024 * 1024;

// ---------------------------------------------------------------------------
// PayloadKind -- what a transaction does
// ---------------------------------------------------------------------------
enum class PayloadKind : uint8_t {
    REWARD          = 0,   // block reward / coinbase
    TRANSFER        = 1,   // plain value transfer, no execution profile
    CONTRACT_CALL   = 2,
    CONTRACT_DEPLOY = 3,
};

[[nodiscard]] std::string_view payload_kind_name(PayloadKind kind) noexcept;

/// True for kinds that take part in the fee market.  Reward payloads are
/// minted by the block producer and pay no fee.
[[nodiscard]] bool is_fee_market_payload(PayloadKind kind) noexcept;

/// True for kinds that run through the execution engine and therefore
/// carry a meaningful ExecutionCost.
[[nodiscard]] bool has_execution_profile(PayloadKind kind) noexcept;

// ---------------------------------------------------------------------------
// TxReceipt / BlockReceipt
// ---------------------------------------------------------------------------
struct TxReceipt {
    PayloadKind   kind = PayloadKind::TRANSFER;
    uint64_t      fee_paid = 0;
    uint64_t      byte_length = 0;
    ExecutionCost execution_cost;
};

struct BlockReceipt {
    int64_t                height = -1;
    std::vector<TxReceipt> tx_receipts;
};

} // namespace chain
