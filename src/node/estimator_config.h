#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// EstimatorConfig -- runtime options of the fee estimation service.
//
// Built from a core::Config (command line over config file over defaults).
// load_estimator_config() rejects malformed or out-of-range values, so a
// typo never silently changes the pricing tiers.
// ---------------------------------------------------------------------------

#ifndef FEETIER_NODE_ESTIMATOR_CONFIG_H
#define FEETIER_NODE_ESTIMATOR_CONFIG_H

#include "chain/receipt.h"
#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "fees/cost_metric.h"
#include "fees/scalar_estimator.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace node {

// ---------------------------------------------------------------------------
// Version constants
// ---------------------------------------------------------------------------

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;
inline constexpr const char* VERSION_SUFFIX = "alpha";

/// Returns the full version string, e.g. "0.1.0-alpha".
std::string get_version_string();

/// Returns the full client name, e.g. "FeeTier v0.1.0-alpha".
std::string get_client_name();

// ---------------------------------------------------------------------------
// MetricKind
// ---------------------------------------------------------------------------

enum class MetricKind {
    PROPORTIONAL,   // ProportionalDotProduct against the block limits
    UNIT,           // UnitCostMetric
};

[[nodiscard]] std::string_view metric_kind_name(MetricKind kind) noexcept;

// ---------------------------------------------------------------------------
// EstimatorConfig
// ---------------------------------------------------------------------------

struct EstimatorConfig {
    // -- Data directory ------------------------------------------------------
    std::filesystem::path datadir;  // empty = platform default
    std::string network = "main";

    // -- Logging -------------------------------------------------------------
    core::LogLevel log_level = core::LogLevel::INFO;
    uint32_t log_categories = static_cast<uint32_t>(core::LogCategory::ALL);
    std::string log_file = "debug.log";
    bool print_to_console = false;

    // -- Estimator -----------------------------------------------------------
    std::string store_file = "fee_estimates.dat";
    MetricKind metric = MetricKind::PROPORTIONAL;
    fees::EstimatorParams params;

    // -- Cost metric limits --------------------------------------------------
    uint64_t block_size_limit = chain::MAX_BLOCK_LEN;
    chain::ExecutionCost block_limit =
        chain::ExecutionCost::block_limit_mainnet();

    // -- Derived helpers -----------------------------------------------------

    /// Data directory with the network subdirectory appended for
    /// testnet/regtest.
    [[nodiscard]] std::filesystem::path resolved_datadir() const;

    [[nodiscard]] std::filesystem::path log_file_path() const;

    /// Location of the persisted estimate.
    [[nodiscard]] std::filesystem::path store_path() const;
};

/// Build an EstimatorConfig from @p cfg.  VALIDATION_ERROR for values that
/// do not parse (numbers, log level, metric name); VALIDATION_RANGE for
/// values that parse but are out of range.
[[nodiscard]] core::Result<EstimatorConfig> load_estimator_config(
    const core::Config& cfg);

/// Instantiate the cost metric selected by @p config.
[[nodiscard]] std::unique_ptr<fees::CostMetric> make_cost_metric(
    const EstimatorConfig& config);

/// Open the estimator described by @p config in its data directory.
[[nodiscard]] core::Result<std::unique_ptr<fees::ScalarFeeRateEstimator>>
open_estimator(const EstimatorConfig& config);

/// Print a usage/help message to stdout.
void print_usage();

} // namespace node

#endif // FEETIER_NODE_ESTIMATOR_CONFIG_H
