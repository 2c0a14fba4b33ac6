// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/estimator_config.h"
#include "node/logging_init.h"

#include "core/fs.h"

#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace node {

// ---------------------------------------------------------------------------
// Version helpers
// ---------------------------------------------------------------------------

std::string get_version_string() {
    std::ostringstream ss;
    ss << VERSION_MAJOR << '.' << VERSION_MINOR << '.' << VERSION_PATCH;
    if (VERSION_SUFFIX[0] != '\0') {
        ss << '-' << VERSION_SUFFIX;
    }
    return ss.str();
}

std::string get_client_name() {
    return "FeeTier v" + get_version_string();
}

std::string_view metric_kind_name(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::PROPORTIONAL: return "proportional";
        case MetricKind::UNIT:         return "unit";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// EstimatorConfig -- derived helpers
// ---------------------------------------------------------------------------

std::filesystem::path EstimatorConfig::resolved_datadir() const {
    std::filesystem::path base = datadir;
    if (base.empty()) {
        base = core::fs::get_default_data_dir();
    }
    if (network == "testnet") {
        base /= "testnet";
    } else if (network == "regtest") {
        base /= "regtest";
    }
    return base;
}

std::filesystem::path EstimatorConfig::log_file_path() const {
    return resolved_datadir() / log_file;
}

std::filesystem::path EstimatorConfig::store_path() const {
    return resolved_datadir() / store_file;
}

// ---------------------------------------------------------------------------
// Internal: strict value parsing
// ---------------------------------------------------------------------------

namespace {

/// Case-insensitive equality.
bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// Overwrite @p out with the value of @p key when it is set.
core::Result<void> read_u64(const core::Config& cfg, const char* key,
                            uint64_t& out) {
    FEETIER_TRY_ASSIGN(value, cfg.get_u64(key));
    if (value) out = *value;
    return core::make_ok();
}

/// As read_u64, additionally requiring a value in [0, 1].
core::Result<void> read_percentile(const core::Config& cfg, const char* key,
                                   double& out) {
    FEETIER_TRY_ASSIGN(value, cfg.get_double(key));
    if (!value) return core::make_ok();
    if (*value < 0.0 || *value > 1.0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
            "-" + std::string(key) + "=" + std::to_string(*value) +
            " must lie in [0, 1]");
    }
    out = *value;
    return core::make_ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// load_estimator_config
// ---------------------------------------------------------------------------

core::Result<EstimatorConfig> load_estimator_config(const core::Config& cfg) {
    EstimatorConfig config;

    if (auto dd = cfg.get(core::CONF_DATADIR); dd.has_value() && !dd->empty()) {
        config.datadir = std::filesystem::path{*dd};
    }
    config.network = cfg.network();
    if (config.network != "main" && config.network != "testnet" &&
        config.network != "regtest") {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
            "unknown network '" + config.network + "'");
    }

    // -- Logging -------------------------------------------------------------
    if (auto lvl = cfg.get(core::CONF_LOGLEVEL); lvl.has_value()) {
        if (!core::parse_log_level(*lvl, config.log_level)) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                "unknown log level '" + *lvl + "'");
        }
    }
    if (cfg.has(core::CONF_DEBUG)) {
        std::string cats;
        for (const auto& item : cfg.get_list(core::CONF_DEBUG)) {
            // A bare -debug flag arrives as "1" and means everything.
            if (item == "1") {
                cats = "all";
                break;
            }
            if (!cats.empty()) cats += ',';
            cats += item;
        }
        config.log_categories = parse_log_categories(cats);
    }
    config.print_to_console =
        cfg.get_bool(core::CONF_PRINTTOCONSOLE, config.print_to_console);

    // -- Metric --------------------------------------------------------------
    if (auto m = cfg.get(core::CONF_FEEMETRIC); m.has_value()) {
        if (iequals(*m, "proportional")) {
            config.metric = MetricKind::PROPORTIONAL;
        } else if (iequals(*m, "unit")) {
            config.metric = MetricKind::UNIT;
        } else {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                "unknown fee metric '" + *m +
                "' (expected proportional or unit)");
        }
    }

    // -- Sampling / blending -------------------------------------------------
    FEETIER_TRY_VOID(read_percentile(cfg, core::CONF_FEEPCTFAST,
                                     config.params.fast_percentile));
    FEETIER_TRY_VOID(read_percentile(cfg, core::CONF_FEEPCTMEDIUM,
                                     config.params.medium_percentile));
    FEETIER_TRY_VOID(read_percentile(cfg, core::CONF_FEEPCTSLOW,
                                     config.params.slow_percentile));
    FEETIER_TRY_VOID(read_u64(cfg, core::CONF_FEEBLENDPRIOR,
                              config.params.prior_weight));
    FEETIER_TRY_VOID(read_u64(cfg, core::CONF_FEEBLENDSAMPLE,
                              config.params.sample_weight));
    FEETIER_TRY_VOID(config.params.validate());

    // -- Block limits --------------------------------------------------------
    FEETIER_TRY_VOID(read_u64(cfg, core::CONF_BLOCKSIZELIMIT,
                              config.block_size_limit));
    FEETIER_TRY_VOID(read_u64(cfg, core::CONF_BLOCKWRITELENGTH,
                              config.block_limit.write_length));
    FEETIER_TRY_VOID(read_u64(cfg, core::CONF_BLOCKWRITECOUNT,
                              config.block_limit.write_count));
    FEETIER_TRY_VOID(read_u64(cfg, core::CONF_BLOCKREADLENGTH,
                              config.block_limit.read_length));
    FEETIER_TRY_VOID(read_u64(cfg, core::CONF_BLOCKREADCOUNT,
                              config.block_limit.read_count));
    FEETIER_TRY_VOID(read_u64(cfg, core::CONF_BLOCKRUNTIME,
                              config.block_limit.runtime));

    if (config.block_size_limit == 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
            "-blocksizelimit must be non-zero");
    }

    return config;
}

// ---------------------------------------------------------------------------
// make_cost_metric / open_estimator
// ---------------------------------------------------------------------------

std::unique_ptr<fees::CostMetric> make_cost_metric(
    const EstimatorConfig& config) {
    switch (config.metric) {
        case MetricKind::UNIT:
            return std::make_unique<fees::UnitCostMetric>();
        case MetricKind::PROPORTIONAL:
            break;
    }
    return std::make_unique<fees::ProportionalDotProduct>(
        config.block_size_limit, config.block_limit);
}

core::Result<std::unique_ptr<fees::ScalarFeeRateEstimator>>
open_estimator(const EstimatorConfig& config) {
    return fees::ScalarFeeRateEstimator::open(
        config.store_path(), make_cost_metric(config), config.params);
}

// ---------------------------------------------------------------------------
// print_usage
// ---------------------------------------------------------------------------

void print_usage() {
    std::cout
        << get_client_name() << "\n"
        << "\n"
        << "Usage:\n"
        << "  feetier-cli [options]\n"
        << "\n"
        << "Options:\n"
        << "  -h, -help, -?             Show this help message and exit\n"
        << "  -version                  Show version information and exit\n"
        << "  -conf=<file>              Read options from <file> (default: <datadir>/feetier.conf)\n"
        << "\n"
        << "Data directory:\n"
        << "  -datadir=<dir>            Data directory path (default: platform-specific)\n"
        << "  -testnet                  Use the test network subdirectory\n"
        << "  -regtest                  Use the regression test network subdirectory\n"
        << "\n"
        << "Estimator:\n"
        << "  -feemetric=<name>         Cost metric: proportional, unit (default: proportional)\n"
        << "  -feepctfast=<p>           Fast tier percentile (default: 0.95)\n"
        << "  -feepctmedium=<p>         Medium tier percentile (default: 0.5)\n"
        << "  -feepctslow=<p>           Slow tier percentile (default: 0.05)\n"
        << "  -feeblendprior=<n>        Weight of the previous estimate (default: 1)\n"
        << "  -feeblendsample=<n>       Weight of the new block sample (default: 1)\n"
        << "\n"
        << "Cost metric limits:\n"
        << "  -blocksizelimit=<n>       Block length budget in bytes (default: 2097152)\n"
        << "  -blockwritelength=<n>     Block write_length budget\n"
        << "  -blockwritecount=<n>      Block write_count budget\n"
        << "  -blockreadlength=<n>      Block read_length budget\n"
        << "  -blockreadcount=<n>       Block read_count budget\n"
        << "  -blockruntime=<n>         Block runtime budget\n"
        << "\n"
        << "Logging:\n"
        << "  -loglevel=<level>         Log level: trace, debug, info, warn, error, fatal, off\n"
        << "  -debug=<cat>              Enable categories: fees, storage, chain, crypto, config, bench, all\n"
        << "  -printtoconsole           Also log to stderr\n"
        << "\n";
}

} // namespace node
