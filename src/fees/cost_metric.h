#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// CostMetric -- reduces a transaction's resource profile to one unit cost
// ---------------------------------------------------------------------------
// The fee estimator divides the fee a transaction paid by its unit cost to
// obtain a fee rate, so the metric decides what "expensive" means.  Metrics
// are stateless after construction: both calls are pure, total and safe to
// invoke from any thread.
// ---------------------------------------------------------------------------

#include "chain/receipt.h"

#include <cstdint>
#include <string_view>

namespace fees {

class CostMetric {
public:
    virtual ~CostMetric() = default;

    /// Unit cost of a transaction that ran through the execution engine.
    [[nodiscard]] virtual uint64_t from_usage_and_length(
        const chain::ExecutionCost& usage, uint64_t byte_length) const = 0;

    /// Unit cost of a transaction with no execution profile (transfers).
    [[nodiscard]] virtual uint64_t from_length(uint64_t byte_length) const = 0;

    /// Short name used in logs and configuration ("proportional", "unit").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ---------------------------------------------------------------------------
// ProportionalDotProduct
// ---------------------------------------------------------------------------
// Measures each resource dimension as a fraction of the block budget, scaled
// by RESOLUTION, and sums the fractions:
//
//   cost = sum_d RESOLUTION * usage[d] / limit[d]
//        + RESOLUTION * byte_length / block_size_limit
//
// A transaction that fills a whole block on one dimension therefore costs
// RESOLUTION.  Dimensions with a zero limit contribute nothing.
// ---------------------------------------------------------------------------
class ProportionalDotProduct final : public CostMetric {
public:
    static constexpr uint64_t RESOLUTION = 10'000;

    ProportionalDotProduct(uint64_t block_size_limit,
                           const chain::ExecutionCost& block_limit);

    /// Mainnet block budget and MAX_BLOCK_LEN.
    [[nodiscard]] static ProportionalDotProduct mainnet();

    [[nodiscard]] uint64_t from_usage_and_length(
        const chain::ExecutionCost& usage,
        uint64_t byte_length) const override;

    [[nodiscard]] uint64_t from_length(uint64_t byte_length) const override;

    [[nodiscard]] std::string_view name() const noexcept override {
        return "proportional";
    }

    [[nodiscard]] uint64_t block_size_limit() const noexcept {
        return block_size_limit_;
    }
    [[nodiscard]] const chain::ExecutionCost& block_limit() const noexcept {
        return block_limit_;
    }

private:
    uint64_t             block_size_limit_;
    chain::ExecutionCost block_limit_;
};

// ---------------------------------------------------------------------------
// UnitCostMetric -- every transaction costs 1, so fee rate == fee paid
// ---------------------------------------------------------------------------
class UnitCostMetric final : public CostMetric {
public:
    [[nodiscard]] uint64_t from_usage_and_length(
        const chain::ExecutionCost&, uint64_t) const override {
        return 1;
    }

    [[nodiscard]] uint64_t from_length(uint64_t) const override { return 1; }

    [[nodiscard]] std::string_view name() const noexcept override {
        return "unit";
    }
};

} // namespace fees
