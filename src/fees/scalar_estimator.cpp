// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fees/scalar_estimator.h"

#include "core/logging.h"
#include "storage/file_store.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace fees {

// ===========================================================================
// EstimatorParams
// ===========================================================================

core::Result<void> EstimatorParams::validate() const {
    auto check_pct = [](double p, const char* name) -> core::Result<void> {
        if (!(p >= 0.0 && p <= 1.0)) {
            return core::Error(core::ErrorCode::VALIDATION_RANGE,
                std::string(name) + " percentile " + std::to_string(p) +
                " outside [0, 1]");
        }
        return core::make_ok();
    };

    FEETIER_TRY_VOID(check_pct(fast_percentile, "fast"));
    FEETIER_TRY_VOID(check_pct(medium_percentile, "medium"));
    FEETIER_TRY_VOID(check_pct(slow_percentile, "slow"));

    if (prior_weight == 0 || sample_weight == 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
            "blending weights must be non-zero");
    }
    return core::make_ok();
}

// ===========================================================================
// Sampling helpers
// ===========================================================================

uint64_t fee_rate_for(const chain::TxReceipt& tx, const CostMetric& metric) {
    uint64_t cost = chain::has_execution_profile(tx.kind)
        ? metric.from_usage_and_length(tx.execution_cost, tx.byte_length)
        : metric.from_length(tx.byte_length);
    return tx.fee_paid / std::max<uint64_t>(cost, 1);
}

size_t percentile_index(size_t n, double p) {
    if (n == 0 || !(p > 0.0)) return 0;
    double raw = std::floor(p * static_cast<double>(n));
    if (raw >= static_cast<double>(n - 1)) return n - 1;
    return static_cast<size_t>(raw);
}

uint64_t sample_percentile(const std::vector<uint64_t>& sorted_rates,
                           double p) {
    return sorted_rates[percentile_index(sorted_rates.size(), p)];
}

uint64_t blend(uint64_t prior, uint64_t sample,
               uint64_t prior_weight, uint64_t sample_weight) {
    using u128 = unsigned __int128;
    u128 num = static_cast<u128>(prior) * prior_weight +
               static_cast<u128>(sample) * sample_weight;
    u128 den = static_cast<u128>(prior_weight) + sample_weight;
    // The result lies between prior and sample, so it fits in 64 bits.
    return static_cast<uint64_t>(num / den);
}

std::vector<uint64_t> collect_fee_rates(const chain::BlockReceipt& receipt,
                                        const CostMetric& metric) {
    std::vector<uint64_t> rates;
    rates.reserve(receipt.tx_receipts.size());
    for (const auto& tx : receipt.tx_receipts) {
        if (!chain::is_fee_market_payload(tx.kind)) continue;
        rates.push_back(fee_rate_for(tx, metric));
        LOG_TRACE(core::LogCategory::FEES,
            std::string(chain::payload_kind_name(tx.kind)) + " fee=" +
            std::to_string(tx.fee_paid) + " len=" +
            std::to_string(tx.byte_length) + " usage=" +
            tx.execution_cost.to_string() + " rate=" +
            std::to_string(rates.back()));
    }
    std::sort(rates.begin(), rates.end());
    return rates;
}

std::optional<FeeRateEstimate> sample_block(
    const chain::BlockReceipt& receipt, const CostMetric& metric,
    const EstimatorParams& params) {

    std::vector<uint64_t> rates = collect_fee_rates(receipt, metric);
    if (rates.empty()) return std::nullopt;

    FeeRateEstimate sampled;
    sampled.fast   = sample_percentile(rates, params.fast_percentile);
    sampled.medium = sample_percentile(rates, params.medium_percentile);
    sampled.slow   = sample_percentile(rates, params.slow_percentile);
    return sampled;
}

// ===========================================================================
// ScalarFeeRateEstimator
// ===========================================================================

ScalarFeeRateEstimator::ScalarFeeRateEstimator(
    PrivateTag,
    std::unique_ptr<storage::RecordStore> store,
    std::unique_ptr<CostMetric> metric,
    EstimatorParams params)
    : store_(std::move(store))
    , metric_(std::move(metric))
    , params_(params) {}

core::Result<std::unique_ptr<ScalarFeeRateEstimator>>
ScalarFeeRateEstimator::open(const std::filesystem::path& path,
                             std::unique_ptr<CostMetric> metric,
                             EstimatorParams params) {
    // Reject bad parameters before anything is created on disk.
    FEETIER_TRY_VOID(params.validate());

    auto store = storage::FileRecordStore::open(path);
    if (!store.ok()) {
        LOG_ERROR(core::LogCategory::FEES,
            "cannot open fee estimate store: " + store.error().format());
        return core::Error(core::ErrorCode::STORAGE_OPEN,
            "fee estimate store " + path.string() + ": " +
            store.error().message());
    }
    LOG_DEBUG(core::LogCategory::FEES,
        "fee estimate store " + store.value()->path().string() + " holds " +
        std::to_string(store.value()->size()) + " record(s)");
    return open(std::unique_ptr<storage::RecordStore>(
                    std::move(store).value()),
                std::move(metric), params);
}

core::Result<std::unique_ptr<ScalarFeeRateEstimator>>
ScalarFeeRateEstimator::open(std::unique_ptr<storage::RecordStore> store,
                             std::unique_ptr<CostMetric> metric,
                             EstimatorParams params) {
    if (!store || !metric) {
        return core::Error(core::ErrorCode::STORAGE_OPEN,
            "fee estimator requires a store and a cost metric");
    }

    FEETIER_TRY_VOID(params.validate());

    auto est = std::make_unique<ScalarFeeRateEstimator>(
        PrivateTag{}, std::move(store), std::move(metric), params);

    auto persisted = est->read_persisted();
    if (!persisted.ok()) {
        LOG_ERROR(core::LogCategory::FEES,
            "cannot load fee estimate: " + persisted.error().format());
        return core::Error(core::ErrorCode::STORAGE_OPEN,
            "cannot load fee estimate: " + persisted.error().message());
    }
    est->cache_ = persisted.value();

    LOG_INFO(core::LogCategory::FEES,
        "fee estimator opened (metric=" + std::string(est->metric_->name()) +
        ", " + (est->cache_ ? "estimate " + est->cache_->to_string()
                            : std::string("no estimate yet")) + ")");
    return std::move(est);
}

core::Result<std::optional<FeeRateEstimate>>
ScalarFeeRateEstimator::read_persisted() const {
    auto record = store_->read(FEE_ESTIMATE_KEY);
    if (!record.ok()) {
        return record.error();
    }
    if (!record.value().has_value()) {
        return std::optional<FeeRateEstimate>{};
    }

    auto decoded = FeeRateEstimate::decode(*record.value());
    if (!decoded.ok()) {
        return decoded.error();
    }
    return std::optional<FeeRateEstimate>{decoded.value()};
}

core::Result<void> ScalarFeeRateEstimator::notify_block(
    const chain::BlockReceipt& receipt) {

    std::lock_guard<std::mutex> writer(writer_mutex_);

    std::optional<FeeRateEstimate> block_sample =
        sample_block(receipt, *metric_, params_);
    if (!block_sample) {
        LOG_TRACE(core::LogCategory::FEES,
            "block " + std::to_string(receipt.height) +
            " has no eligible transactions, estimate unchanged");
        return core::make_ok();
    }
    const FeeRateEstimate& sampled = *block_sample;

    std::optional<FeeRateEstimate> prior;
    {
        std::shared_lock<std::shared_mutex> lock(cache_mutex_);
        prior = cache_;
    }

    FeeRateEstimate next = sampled;
    if (prior) {
        next.fast   = blend(prior->fast, sampled.fast,
                            params_.prior_weight, params_.sample_weight);
        next.medium = blend(prior->medium, sampled.medium,
                            params_.prior_weight, params_.sample_weight);
        next.slow   = blend(prior->slow, sampled.slow,
                            params_.prior_weight, params_.sample_weight);
    }

    auto record = next.encode();
    auto written = store_->upsert(FEE_ESTIMATE_KEY, record);
    if (!written.ok()) {
        LOG_ERROR(core::LogCategory::FEES,
            "failed to persist fee estimate for block " +
            std::to_string(receipt.height) + ": " +
            written.error().format());
        return core::Error(core::ErrorCode::STORAGE_WRITE,
            written.error().message());
    }

    {
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        cache_ = next;
    }

    LOG_DEBUG(core::LogCategory::FEES,
        "block " + std::to_string(receipt.height) + ": " +
        std::to_string(std::count_if(
            receipt.tx_receipts.begin(), receipt.tx_receipts.end(),
            [](const chain::TxReceipt& tx) {
                return chain::is_fee_market_payload(tx.kind);
            })) + " tx, sampled {" +
        sampled.to_string() + "}, estimate {" + next.to_string() + "}");
    return core::make_ok();
}

core::Result<FeeRateEstimate> ScalarFeeRateEstimator::get_rate_estimates() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    if (!cache_) {
        return core::Error(core::ErrorCode::ESTIMATE_UNAVAILABLE,
            "no fee estimate available yet");
    }
    return *cache_;
}

core::Result<void> ScalarFeeRateEstimator::reload() {
    std::lock_guard<std::mutex> writer(writer_mutex_);

    auto persisted = read_persisted();
    if (!persisted.ok()) {
        LOG_ERROR(core::LogCategory::FEES,
            "cannot reload fee estimate: " + persisted.error().format());
        return core::Error(core::ErrorCode::STORAGE_READ,
            persisted.error().message());
    }

    {
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        cache_ = persisted.value();
    }
    return core::make_ok();
}

} // namespace fees
