// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for cost metrics, sampling helpers and the scalar estimator.

#include "test_framework.h"

#include "chain/receipt.h"
#include "core/fs.h"
#include "fees/cost_metric.h"
#include "fees/fee_rate.h"
#include "fees/scalar_estimator.h"
#include "storage/file_store.h"
#include "storage/record_store.h"

#include <algorithm>
#include <cerrno>
#include <atomic>
#include <cstdint>
#include <fstream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

chain::TxReceipt make_tx(chain::PayloadKind kind, uint64_t fee,
                         uint64_t byte_length = 0,
                         chain::ExecutionCost cost = {}) {
    chain::TxReceipt tx;
    tx.kind = kind;
    tx.fee_paid = fee;
    tx.byte_length = byte_length;
    tx.execution_cost = cost;
    return tx;
}

chain::TxReceipt reward_tx() {
    return make_tx(chain::PayloadKind::REWARD, 0);
}

chain::TxReceipt call_tx(uint64_t fee) {
    return make_tx(chain::PayloadKind::CONTRACT_CALL, fee);
}

chain::TxReceipt transfer_tx(uint64_t fee) {
    return make_tx(chain::PayloadKind::TRANSFER, fee);
}

chain::BlockReceipt make_block(std::vector<chain::TxReceipt> txs,
                               int64_t height = 1) {
    chain::BlockReceipt block;
    block.height = height;
    block.tx_receipts = std::move(txs);
    return block;
}

/// In-memory RecordStore whose reads and writes can be made to fail.
class ScriptedStore final : public storage::RecordStore {
public:
    core::Result<std::optional<std::vector<uint8_t>>>
    read(std::string_view key) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_reads) {
            return core::Error(core::ErrorCode::STORAGE_ERROR,
                               "scripted read failure");
        }
        auto it = records.find(std::string(key));
        if (it == records.end()) {
            return std::optional<std::vector<uint8_t>>{};
        }
        return std::optional<std::vector<uint8_t>>{it->second};
    }

    core::Result<void> upsert(std::string_view key,
                              std::span<const uint8_t> record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes) {
            return core::Error(core::ErrorCode::STORAGE_ERROR,
                               "scripted write failure");
        }
        records[std::string(key)] =
            std::vector<uint8_t>(record.begin(), record.end());
        ++writes;
        return core::make_ok();
    }

    std::map<std::string, std::vector<uint8_t>> records;
    bool fail_reads = false;
    bool fail_writes = false;
    int writes = 0;

private:
    mutable std::mutex mutex_;
};

std::unique_ptr<fees::ScalarFeeRateEstimator> open_unit_estimator(
    const std::filesystem::path& path) {
    auto est = fees::ScalarFeeRateEstimator::open(
        path, std::make_unique<fees::UnitCostMetric>());
    if (!est.ok()) return nullptr;
    return std::move(est).value();
}

fees::FeeRateEstimate tiers(uint64_t fast, uint64_t medium, uint64_t slow) {
    fees::FeeRateEstimate e;
    e.fast = fast;
    e.medium = medium;
    e.slow = slow;
    return e;
}

} // namespace

// ============================================================================
// Cost metrics
// ============================================================================

TEST_CASE(CostMetric, unit_metric_is_always_one) {
    fees::UnitCostMetric m;
    chain::ExecutionCost big;
    big.runtime = 1'000'000'000;
    CHECK_EQ(m.from_usage_and_length(big, 5000), 1u);
    CHECK_EQ(m.from_length(0), 1u);
    CHECK_EQ(m.name(), "unit");
}

TEST_CASE(CostMetric, proportional_length_term) {
    auto m = fees::ProportionalDotProduct::mainnet();
    CHECK_EQ(m.from_length(chain::MAX_BLOCK_LEN), 10'000u);
    CHECK_EQ(m.from_length(chain::MAX_BLOCK_LEN / 2), 5'000u);
    CHECK_EQ(m.from_length(0), 0u);
    CHECK_EQ(m.name(), "proportional");
}

TEST_CASE(CostMetric, proportional_usage_and_length) {
    auto m = fees::ProportionalDotProduct::mainnet();
    chain::ExecutionCost used;
    used.runtime = 2'500'000'000;   // half the runtime budget
    used.write_count = 1'500;       // a tenth of the write_count budget
    CHECK_EQ(m.from_usage_and_length(used, chain::MAX_BLOCK_LEN / 4),
             5'000u + 1'000u + 2'500u);
}

TEST_CASE(CostMetric, proportional_zero_limits_contribute_nothing) {
    fees::ProportionalDotProduct m(0, chain::ExecutionCost{});
    chain::ExecutionCost used;
    used.read_length = 123;
    CHECK_EQ(m.from_usage_and_length(used, 999), 0u);
    CHECK_EQ(m.from_length(999), 0u);
}

TEST_CASE(CostMetric, proportional_saturates) {
    fees::ProportionalDotProduct m(1, chain::ExecutionCost::block_limit_mainnet());
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    chain::ExecutionCost used;
    used.runtime = MAX;
    CHECK_EQ(m.from_length(MAX), MAX);
    CHECK_EQ(m.from_usage_and_length(used, MAX), MAX);
}

// ============================================================================
// Sampling helpers
// ============================================================================

TEST_CASE(FeeSampling, percentile_index_bounds) {
    CHECK_EQ(fees::percentile_index(1, 0.05), 0u);
    CHECK_EQ(fees::percentile_index(1, 0.95), 0u);
    CHECK_EQ(fees::percentile_index(2, 0.05), 0u);
    CHECK_EQ(fees::percentile_index(2, 0.50), 1u);
    CHECK_EQ(fees::percentile_index(2, 0.95), 1u);
    CHECK_EQ(fees::percentile_index(100, 0.05), 5u);
    CHECK_EQ(fees::percentile_index(100, 0.50), 50u);
    CHECK_EQ(fees::percentile_index(100, 0.95), 95u);
    CHECK_EQ(fees::percentile_index(10, 1.0), 9u);
    CHECK_EQ(fees::percentile_index(10, 0.0), 0u);
}

TEST_CASE(FeeSampling, percentile_index_always_in_range) {
    const double ps[] = {0.0, 0.05, 0.33, 0.5, 0.95, 0.999, 1.0};
    for (size_t n = 1; n <= 257; ++n) {
        for (double p : ps) {
            CHECK(fees::percentile_index(n, p) < n);
        }
    }
}

TEST_CASE(FeeSampling, blend_is_weighted_floor_average) {
    CHECK_EQ(fees::blend(1, 10, 1, 1), 5u);
    CHECK_EQ(fees::blend(9, 10, 1, 1), 9u);   // truncation holds at 9
    CHECK_EQ(fees::blend(9, 950, 1, 1), 479u);
    CHECK_EQ(fees::blend(0, 100, 3, 1), 25u);
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    CHECK_EQ(fees::blend(MAX, MAX, 1, 1), MAX);
    CHECK_EQ(fees::blend(MAX, MAX - 1, 1, 1), MAX - 1);
}

TEST_CASE(FeeSampling, fee_rate_divides_by_cost) {
    auto m = fees::ProportionalDotProduct::mainnet();
    // Transfers are costed by length only: half a block costs 5000.
    chain::ExecutionCost ignored;
    ignored.runtime = 5'000'000'000;
    auto transfer = make_tx(chain::PayloadKind::TRANSFER, 50'000,
                            chain::MAX_BLOCK_LEN / 2, ignored);
    CHECK_EQ(fees::fee_rate_for(transfer, m), 10u);

    // Contract calls include the execution profile.
    auto call = make_tx(chain::PayloadKind::CONTRACT_CALL, 50'000,
                        chain::MAX_BLOCK_LEN / 2, ignored);
    CHECK_EQ(fees::fee_rate_for(call, m), 3u);  // 50000 / 15000

    // A zero cost is treated as one.
    auto free_call = make_tx(chain::PayloadKind::CONTRACT_DEPLOY, 77);
    CHECK_EQ(fees::fee_rate_for(free_call, m), 77u);
}

TEST_CASE(FeeSampling, collect_skips_rewards_and_sorts) {
    fees::UnitCostMetric m;
    auto block = make_block({reward_tx(), call_tx(30), transfer_tx(0),
                             reward_tx(), call_tx(10)});
    auto rates = fees::collect_fee_rates(block, m);
    CHECK_EQ(rates.size(), 3u);
    CHECK_EQ(rates[0], 0u);
    CHECK_EQ(rates[1], 10u);
    CHECK_EQ(rates[2], 30u);
}

TEST_CASE(FeeSampling, sample_block_empty_cases) {
    fees::UnitCostMetric m;
    fees::EstimatorParams params;
    CHECK(!fees::sample_block(make_block({}), m, params).has_value());
    CHECK(!fees::sample_block(make_block({reward_tx()}), m, params)
               .has_value());

    auto single = fees::sample_block(make_block({call_tx(42)}), m, params);
    CHECK(single.has_value());
    CHECK(*single == tiers(42, 42, 42));
}

TEST_CASE(FeeSampling, params_validation) {
    fees::EstimatorParams params;
    CHECK_OK(params.validate());

    params.fast_percentile = 1.5;
    CHECK_ERR_CODE(params.validate(), core::ErrorCode::VALIDATION_RANGE);

    params = fees::EstimatorParams{};
    params.slow_percentile = -0.1;
    CHECK_ERR_CODE(params.validate(), core::ErrorCode::VALIDATION_RANGE);

    params = fees::EstimatorParams{};
    params.sample_weight = 0;
    CHECK_ERR_CODE(params.validate(), core::ErrorCode::VALIDATION_RANGE);
}

// ============================================================================
// FeeRateEstimate record
// ============================================================================

TEST_CASE(FeeRateEstimate, record_layout) {
    auto rec = tiers(0x0102, 3, 4).encode();
    CHECK_EQ(rec.size(), fees::FeeRateEstimate::RECORD_SIZE);
    CHECK_EQ(rec[0], fees::FeeRateEstimate::RECORD_VERSION);
    CHECK_EQ(rec[1], 0x02);
    CHECK_EQ(rec[2], 0x01);
    CHECK_EQ(rec[9], 0x03);
    CHECK_EQ(rec[17], 0x04);

    auto decoded = fees::FeeRateEstimate::decode(rec);
    CHECK_OK(decoded);
    CHECK(decoded.value() == tiers(0x0102, 3, 4));
}

TEST_CASE(FeeRateEstimate, decode_rejects_bad_records) {
    auto rec = tiers(1, 2, 3).encode();

    auto wrong_version = rec;
    wrong_version[0] = 9;
    CHECK_ERR_CODE(fees::FeeRateEstimate::decode(wrong_version),
                   core::ErrorCode::PARSE_BAD_FORMAT);

    auto short_rec = rec;
    short_rec.pop_back();
    CHECK_ERR_CODE(fees::FeeRateEstimate::decode(short_rec),
                   core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(FeeRateEstimate, to_string_format) {
    CHECK_EQ(tiers(9, 9, 1).to_string(), "fast=9 medium=9 slow=1");
}

// ============================================================================
// ScalarFeeRateEstimator
// ============================================================================

TEST_CASE(ScalarEstimator, empty_estimator_has_no_estimate) {
    test::ScopedTempDir dir;
    auto est = open_unit_estimator(dir.file("fee_estimates.dat"));
    CHECK(est != nullptr);
    CHECK_ERR_CODE(est->get_rate_estimates(),
                   core::ErrorCode::ESTIMATE_UNAVAILABLE);
}

TEST_CASE(ScalarEstimator, block_history_scenario) {
    test::ScopedTempDir dir;
    auto est = open_unit_estimator(dir.file("fee_estimates.dat"));
    CHECK(est != nullptr);
    if (!est) return;

    // Empty and reward-only blocks are accepted and change nothing.
    CHECK_OK(est->notify_block(make_block({})));
    CHECK_ERR_CODE(est->get_rate_estimates(),
                   core::ErrorCode::ESTIMATE_UNAVAILABLE);
    CHECK_OK(est->notify_block(make_block({reward_tx()})));
    CHECK_ERR_CODE(est->get_rate_estimates(),
                   core::ErrorCode::ESTIMATE_UNAVAILABLE);

    // First observation is taken as-is.
    CHECK_OK(est->notify_block(make_block({reward_tx(), call_tx(1)})));
    CHECK(est->get_rate_estimates().value() == tiers(1, 1, 1));

    // Rates {1, 10}: fast and medium sample 10, slow samples 1.
    auto pair = make_block({reward_tx(), call_tx(1), transfer_tx(10)});
    const fees::FeeRateEstimate expected[] = {
        tiers(5, 5, 1), tiers(7, 7, 1), tiers(8, 8, 1),
        tiers(9, 9, 1), tiers(9, 9, 1),
    };
    for (const auto& e : expected) {
        CHECK_OK(est->notify_block(pair));
        CHECK(est->get_rate_estimates().value() == e);
    }

    // 100 contract calls paying 0, 10, ..., 990 in random order sample
    // 950 / 500 / 50.
    std::vector<chain::TxReceipt> txs;
    for (uint64_t i = 0; i < 100; ++i) {
        txs.push_back(call_tx(i * 10));
    }
    std::mt19937 rng(20260203);
    std::shuffle(txs.begin(), txs.end(), rng);
    CHECK_OK(est->notify_block(make_block(std::move(txs))));
    CHECK(est->get_rate_estimates().value() == tiers(479, 254, 25));
}

TEST_CASE(ScalarEstimator, empty_blocks_are_idempotent) {
    test::ScopedTempDir dir;
    auto est = open_unit_estimator(dir.file("fee_estimates.dat"));
    CHECK(est != nullptr);
    if (!est) return;

    CHECK_OK(est->notify_block(make_block({call_tx(100), call_tx(200)})));
    auto before = est->get_rate_estimates().value();
    for (int i = 0; i < 5; ++i) {
        CHECK_OK(est->notify_block(make_block({})));
        CHECK_OK(est->notify_block(make_block({reward_tx(), reward_tx()})));
    }
    CHECK(est->get_rate_estimates().value() == before);
}

TEST_CASE(ScalarEstimator, zero_fee_transactions_count) {
    test::ScopedTempDir dir;
    auto est = open_unit_estimator(dir.file("fee_estimates.dat"));
    CHECK(est != nullptr);
    if (!est) return;

    CHECK_OK(est->notify_block(make_block({transfer_tx(0)})));
    CHECK(est->get_rate_estimates().value() == tiers(0, 0, 0));
}

TEST_CASE(ScalarEstimator, estimate_survives_reopen) {
    test::ScopedTempDir dir;
    auto path = dir.file("fee_estimates.dat");
    {
        auto est = open_unit_estimator(path);
        CHECK(est != nullptr);
        if (!est) return;
        CHECK_OK(est->notify_block(make_block({call_tx(1)})));
        CHECK_OK(est->notify_block(make_block({call_tx(1), call_tx(10)})));
        CHECK(est->get_rate_estimates().value() == tiers(5, 5, 1));
    }

    auto reopened = open_unit_estimator(path);
    CHECK(reopened != nullptr);
    if (!reopened) return;
    CHECK(reopened->get_rate_estimates().value() == tiers(5, 5, 1));

    // Blending continues from the persisted value.
    CHECK_OK(reopened->notify_block(make_block({call_tx(1), call_tx(10)})));
    CHECK(reopened->get_rate_estimates().value() == tiers(7, 7, 1));
}

TEST_CASE(ScalarEstimator, second_open_of_same_store_fails) {
    test::ScopedTempDir dir;
    auto path = dir.file("fee_estimates.dat");
    auto first = open_unit_estimator(path);
    CHECK(first != nullptr);

    CHECK_ERR_CODE(fees::ScalarFeeRateEstimator::open(
                       path, std::make_unique<fees::UnitCostMetric>()),
                   core::ErrorCode::STORAGE_OPEN);
}

TEST_CASE(ScalarEstimator, open_fails_on_unusable_location) {
    test::ScopedTempDir dir;
    // A regular file where the parent directory should be.
    auto blocker = dir.file("not_a_dir");
    { std::ofstream(blocker) << "x"; }
    CHECK_ERR_CODE(fees::ScalarFeeRateEstimator::open(
                       blocker / "fee_estimates.dat",
                       std::make_unique<fees::UnitCostMetric>()),
                   core::ErrorCode::STORAGE_OPEN);
}

TEST_CASE(ScalarEstimator, open_fails_on_corrupt_record) {
    auto store = std::make_unique<ScriptedStore>();
    store->records[std::string(fees::FEE_ESTIMATE_KEY)] = {1, 2, 3};
    CHECK_ERR_CODE(fees::ScalarFeeRateEstimator::open(
                       std::move(store),
                       std::make_unique<fees::UnitCostMetric>()),
                   core::ErrorCode::STORAGE_OPEN);
}

TEST_CASE(ScalarEstimator, open_rejects_invalid_params) {
    fees::EstimatorParams params;
    params.medium_percentile = 2.0;
    CHECK_ERR_CODE(fees::ScalarFeeRateEstimator::open(
                       std::make_unique<ScriptedStore>(),
                       std::make_unique<fees::UnitCostMetric>(), params),
                   core::ErrorCode::VALIDATION_RANGE);
}

TEST_CASE(ScalarEstimator, failed_write_leaves_estimate_unchanged) {
    auto owned = std::make_unique<ScriptedStore>();
    ScriptedStore* store = owned.get();
    auto opened = fees::ScalarFeeRateEstimator::open(
        std::move(owned), std::make_unique<fees::UnitCostMetric>());
    CHECK_OK(opened);
    if (!opened.ok()) return;
    auto& est = *opened.value();

    CHECK_OK(est.notify_block(make_block({call_tx(4)})));
    auto durable = store->records[std::string(fees::FEE_ESTIMATE_KEY)];

    store->fail_writes = true;
    CHECK_ERR_CODE(est.notify_block(make_block({call_tx(100)})),
                   core::ErrorCode::STORAGE_WRITE);
    CHECK(est.get_rate_estimates().value() == tiers(4, 4, 4));
    CHECK(store->records[std::string(fees::FEE_ESTIMATE_KEY)] == durable);

    // Empty blocks never touch the store, even when it is failing.
    CHECK_OK(est.notify_block(make_block({reward_tx()})));

    store->fail_writes = false;
    CHECK_OK(est.notify_block(make_block({call_tx(100)})));
    CHECK(est.get_rate_estimates().value() == tiers(52, 52, 52));
}

TEST_CASE(ScalarEstimator, unsynced_write_is_rolled_back_on_disk) {
    test::ScopedTempDir dir;
    auto path = dir.file("fee_estimates.dat");
    {
        auto est = open_unit_estimator(path);
        CHECK(est != nullptr);
        if (!est) return;
        CHECK_OK(est->notify_block(make_block({call_tx(4)})));

        // The new image reaches the directory but the directory sync fails.
        core::fs::testing::inject_dir_sync_failure(1, EIO);
        CHECK_ERR_CODE(est->notify_block(make_block({call_tx(100)})),
                       core::ErrorCode::STORAGE_WRITE);
        CHECK(est->get_rate_estimates().value() == tiers(4, 4, 4));

        CHECK_OK(est->reload());
        CHECK(est->get_rate_estimates().value() == tiers(4, 4, 4));
    }

    auto reopened = open_unit_estimator(path);
    CHECK(reopened != nullptr);
    if (!reopened) return;
    CHECK(reopened->get_rate_estimates().value() == tiers(4, 4, 4));
    CHECK(!core::fs::file_exists(dir.file("fee_estimates.dat.bak")));

    CHECK_OK(reopened->notify_block(make_block({call_tx(100)})));
    CHECK(reopened->get_rate_estimates().value() == tiers(52, 52, 52));
}

TEST_CASE(ScalarEstimator, invalid_params_create_nothing_on_disk) {
    test::ScopedTempDir dir;
    auto data_dir = dir.file("data");
    fees::EstimatorParams params;
    params.prior_weight = 0;
    CHECK_ERR_CODE(fees::ScalarFeeRateEstimator::open(
                       data_dir / "fee_estimates.dat",
                       std::make_unique<fees::UnitCostMetric>(), params),
                   core::ErrorCode::VALIDATION_RANGE);
    CHECK(!std::filesystem::exists(data_dir));
}

TEST_CASE(ScalarEstimator, store_written_once_per_eligible_block) {
    auto owned = std::make_unique<ScriptedStore>();
    ScriptedStore* store = owned.get();
    auto opened = fees::ScalarFeeRateEstimator::open(
        std::move(owned), std::make_unique<fees::UnitCostMetric>());
    CHECK_OK(opened);
    if (!opened.ok()) return;
    auto& est = *opened.value();

    CHECK_OK(est.notify_block(make_block({})));
    CHECK_OK(est.notify_block(make_block({call_tx(1), call_tx(2)})));
    CHECK_OK(est.notify_block(make_block({reward_tx()})));
    CHECK_OK(est.notify_block(make_block({call_tx(3)})));
    CHECK_EQ(store->writes, 2);
}

TEST_CASE(ScalarEstimator, reload_reports_read_failures) {
    auto owned = std::make_unique<ScriptedStore>();
    ScriptedStore* store = owned.get();
    auto opened = fees::ScalarFeeRateEstimator::open(
        std::move(owned), std::make_unique<fees::UnitCostMetric>());
    CHECK_OK(opened);
    if (!opened.ok()) return;
    auto& est = *opened.value();

    CHECK_OK(est.notify_block(make_block({call_tx(8)})));
    CHECK_OK(est.reload());
    CHECK(est.get_rate_estimates().value() == tiers(8, 8, 8));

    store->fail_reads = true;
    CHECK_ERR_CODE(est.reload(), core::ErrorCode::STORAGE_READ);
    CHECK(est.get_rate_estimates().value() == tiers(8, 8, 8));

    store->fail_reads = false;
    store->records[std::string(fees::FEE_ESTIMATE_KEY)] = {0xFF};
    CHECK_ERR_CODE(est.reload(), core::ErrorCode::STORAGE_READ);
    CHECK(est.get_rate_estimates().value() == tiers(8, 8, 8));
}

TEST_CASE(ScalarEstimator, reload_detects_damaged_file) {
    test::ScopedTempDir dir;
    auto path = dir.file("fee_estimates.dat");
    auto est = open_unit_estimator(path);
    CHECK(est != nullptr);
    if (!est) return;
    CHECK_OK(est->notify_block(make_block({call_tx(3)})));

    auto content = core::fs::read_file(path);
    CHECK(content.has_value());
    std::string damaged = content.value_or("");
    damaged[damaged.size() / 2] ^= 0x40;
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << damaged;
    }

    CHECK_ERR_CODE(est->reload(), core::ErrorCode::STORAGE_READ);
    CHECK(est->get_rate_estimates().value() == tiers(3, 3, 3));
}

TEST_CASE(ScalarEstimator, proportional_metric_end_to_end) {
    test::ScopedTempDir dir;
    auto opened = fees::ScalarFeeRateEstimator::open(
        dir.file("fee_estimates.dat"),
        std::make_unique<fees::ProportionalDotProduct>(
            fees::ProportionalDotProduct::mainnet()));
    CHECK_OK(opened);
    if (!opened.ok()) return;
    auto& est = *opened.value();
    CHECK_EQ(est.metric().name(), "proportional");

    // Quarter-block transfer: cost 2500, fee 25000 -> rate 10.
    auto tx = make_tx(chain::PayloadKind::TRANSFER, 25'000,
                      chain::MAX_BLOCK_LEN / 4);
    CHECK_OK(est.notify_block(make_block({reward_tx(), tx})));
    CHECK(est.get_rate_estimates().value() == tiers(10, 10, 10));
}

TEST_CASE(ScalarEstimator, custom_weights_and_percentiles) {
    fees::EstimatorParams params;
    params.fast_percentile = 1.0;
    params.medium_percentile = 0.5;
    params.slow_percentile = 0.0;
    params.prior_weight = 3;
    params.sample_weight = 1;

    auto opened = fees::ScalarFeeRateEstimator::open(
        std::make_unique<ScriptedStore>(),
        std::make_unique<fees::UnitCostMetric>(), params);
    CHECK_OK(opened);
    if (!opened.ok()) return;
    auto& est = *opened.value();

    CHECK_OK(est.notify_block(make_block({call_tx(4), call_tx(8),
                                          call_tx(12), call_tx(16)})));
    CHECK(est.get_rate_estimates().value() == tiers(16, 12, 4));

    // (16*3 + 100)/4 = 37, (12*3 + 100)/4 = 34, (4*3 + 100)/4 = 28
    CHECK_OK(est.notify_block(make_block({call_tx(100)})));
    CHECK(est.get_rate_estimates().value() == tiers(37, 34, 28));
}

TEST_CASE(ScalarEstimator, readers_never_see_torn_estimates) {
    auto opened = fees::ScalarFeeRateEstimator::open(
        std::make_unique<ScriptedStore>(),
        std::make_unique<fees::UnitCostMetric>());
    CHECK_OK(opened);
    if (!opened.ok()) return;
    auto& est = *opened.value();

    // Every block is uniform, so every published estimate has equal
    // tiers; a reader observing unequal tiers saw a partial update.
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> observed{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!done.load(std::memory_order_acquire)) {
                auto e = est.get_rate_estimates();
                if (!e.ok()) continue;
                const auto& v = e.value();
                if (v.fast != v.medium || v.medium != v.slow) {
                    torn.fetch_add(1);
                }
                observed.fetch_add(1);
            }
        });
    }

    bool all_ok = true;
    for (uint64_t h = 0; h < 500; ++h) {
        uint64_t fee = (h * 7919) % 1000;
        auto res = est.notify_block(
            make_block({call_tx(fee), call_tx(fee), transfer_tx(fee)},
                       static_cast<int64_t>(h)));
        all_ok = all_ok && res.ok();
    }
    done.store(true, std::memory_order_release);
    for (auto& t : readers) t.join();

    CHECK(all_ok);
    CHECK_EQ(torn.load(), 0);
    CHECK(est.get_rate_estimates().ok());
}
