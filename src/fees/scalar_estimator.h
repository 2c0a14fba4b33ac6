#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// ScalarFeeRateEstimator -- percentile tiers smoothed over block history
// ---------------------------------------------------------------------------
// For every confirmed block the estimator:
//   1. drops reward payloads and prices each remaining transaction as
//      fee_paid / max(unit_cost, 1), transfers costed by length only;
//   2. sorts the rates and samples the slow / medium / fast percentiles at
//      index min(N - 1, floor(p * N));
//   3. blends each sample into the previous estimate,
//        new = floor((prior * prior_weight + sample * sample_weight)
//                    / (prior_weight + sample_weight)),
//      or takes the samples as-is on the first observation;
//   4. persists the result and then publishes it to readers.
//
// Thread safety: notify_block() and reload() are serialised internally and
// are expected to come from the single chain-state thread.
// get_rate_estimates() may be called from any thread at any time and always
// returns an estimate that was persisted as a whole.
// ---------------------------------------------------------------------------

#include "chain/receipt.h"
#include "core/error.h"
#include "fees/cost_metric.h"
#include "fees/fee_rate.h"
#include "storage/record_store.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace fees {

// ---------------------------------------------------------------------------
// Constants
// ---------------------------------------------------------------------------

/// Default percentile sampled for the slow tier.
static constexpr double DEFAULT_SLOW_PERCENTILE = 0.05;

/// Default percentile sampled for the medium tier.
static constexpr double DEFAULT_MEDIUM_PERCENTILE = 0.50;

/// Default percentile sampled for the fast tier.
static constexpr double DEFAULT_FAST_PERCENTILE = 0.95;

/// Key of the single persisted estimate record.
static constexpr std::string_view FEE_ESTIMATE_KEY = "fee_estimate";

// ---------------------------------------------------------------------------
// EstimatorParams
// ---------------------------------------------------------------------------
struct EstimatorParams {
    double   fast_percentile   = DEFAULT_FAST_PERCENTILE;
    double   medium_percentile = DEFAULT_MEDIUM_PERCENTILE;
    double   slow_percentile   = DEFAULT_SLOW_PERCENTILE;

    /// Blending weights; the default 1:1 is a plain floor average.
    uint64_t prior_weight  = 1;
    uint64_t sample_weight = 1;

    /// VALIDATION_RANGE when a percentile lies outside [0, 1] or a weight
    /// is zero.
    [[nodiscard]] core::Result<void> validate() const;
};

// ---------------------------------------------------------------------------
// Sampling helpers (exposed for testing)
// ---------------------------------------------------------------------------

/// fee_paid / max(unit_cost, 1) under @p metric.
[[nodiscard]] uint64_t fee_rate_for(const chain::TxReceipt& tx,
                                    const CostMetric& metric);

/// Index sampled for percentile @p p out of @p n sorted values.
/// Requires n > 0.
[[nodiscard]] size_t percentile_index(size_t n, double p);

/// Value at percentile @p p of the ascending @p sorted_rates.
/// Requires a non-empty input.
[[nodiscard]] uint64_t sample_percentile(
    const std::vector<uint64_t>& sorted_rates, double p);

/// Weighted floor average of a prior value and a new sample.
[[nodiscard]] uint64_t blend(uint64_t prior, uint64_t sample,
                             uint64_t prior_weight, uint64_t sample_weight);

/// Ascending fee rates of the eligible transactions in @p receipt.
[[nodiscard]] std::vector<uint64_t> collect_fee_rates(
    const chain::BlockReceipt& receipt, const CostMetric& metric);

/// Percentile samples of one block, or std::nullopt when the block has no
/// eligible transaction.
[[nodiscard]] std::optional<FeeRateEstimate> sample_block(
    const chain::BlockReceipt& receipt, const CostMetric& metric,
    const EstimatorParams& params);

// ---------------------------------------------------------------------------
// ScalarFeeRateEstimator
// ---------------------------------------------------------------------------
class ScalarFeeRateEstimator final : public FeeRateEstimator {
    /// Restricts construction to open().
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Open (or create) the estimate store at @p path and load any estimate
    /// it holds.  VALIDATION_RANGE for bad @p params, checked before the
    /// store is touched; every store failure
    /// is reported as STORAGE_OPEN, including a store that is already held
    /// by another estimator.
    [[nodiscard]] static core::Result<std::unique_ptr<ScalarFeeRateEstimator>>
    open(const std::filesystem::path& path,
         std::unique_ptr<CostMetric> metric,
         EstimatorParams params = {});

    /// Same, over an already-opened store.
    [[nodiscard]] static core::Result<std::unique_ptr<ScalarFeeRateEstimator>>
    open(std::unique_ptr<storage::RecordStore> store,
         std::unique_ptr<CostMetric> metric,
         EstimatorParams params = {});

    ScalarFeeRateEstimator(PrivateTag,
                           std::unique_ptr<storage::RecordStore> store,
                           std::unique_ptr<CostMetric> metric,
                           EstimatorParams params);

    ScalarFeeRateEstimator(const ScalarFeeRateEstimator&) = delete;
    ScalarFeeRateEstimator& operator=(const ScalarFeeRateEstimator&) = delete;

    [[nodiscard]] core::Result<void> notify_block(
        const chain::BlockReceipt& receipt) override;

    [[nodiscard]] core::Result<FeeRateEstimate>
    get_rate_estimates() const override;

    /// Re-read the persisted estimate into the cache.  STORAGE_READ when the
    /// store cannot be read or the record is malformed; the cache is left
    /// as it was in that case.
    [[nodiscard]] core::Result<void> reload();

    [[nodiscard]] const CostMetric& metric() const noexcept { return *metric_; }
    [[nodiscard]] const EstimatorParams& params() const noexcept {
        return params_;
    }

private:
    /// Read and decode the persisted record.
    core::Result<std::optional<FeeRateEstimate>> read_persisted() const;

    std::unique_ptr<storage::RecordStore> store_;
    std::unique_ptr<CostMetric>           metric_;
    EstimatorParams                       params_;

    /// Serialises notify_block() and reload().
    std::mutex writer_mutex_;

    /// Guards cache_ only for the copy / swap.
    mutable std::shared_mutex        cache_mutex_;
    std::optional<FeeRateEstimate>   cache_;
};

} // namespace fees
