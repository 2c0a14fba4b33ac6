// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/logging_init.h"
#include "node/estimator_config.h"

#include "core/fs.h"
#include "core/logging.h"

#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace node {

namespace {

constexpr std::array<std::pair<std::string_view, core::LogCategory>, 7>
    CATEGORY_NAMES{{
        {"fees",    core::LogCategory::FEES},
        {"storage", core::LogCategory::STORAGE},
        {"chain",   core::LogCategory::CHAIN},
        {"crypto",  core::LogCategory::CRYPTO},
        {"config",  core::LogCategory::CONFIG},
        {"bench",   core::LogCategory::BENCH},
        {"all",     core::LogCategory::ALL},
    }};

std::string lowercase_trimmed(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    std::string out;
    out.reserve(sv.size());
    for (char c : sv) {
        out.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

/// "2026-02-03T12:00:00Z"
std::string format_utc_now() {
    std::time_t now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm tm_buf{};
    gmtime_r(&now, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // anonymous namespace

core::Result<void> init_logging(const EstimatorConfig& config) {
    auto& logger = core::Logger::instance();
    logger.set_level(config.log_level);
    set_log_categories(config.log_categories);

    std::filesystem::path log_path = config.log_file_path();
    if (log_path.has_parent_path() &&
        !core::fs::ensure_directory(log_path.parent_path())) {
        return core::Error(core::ErrorCode::STORAGE_OPEN,
            "cannot create log directory " + log_path.parent_path().string());
    }
    bool rotated = rotate_log_file(log_path);

    logger.set_log_file(log_path);
    logger.set_print_to_file(true);
    logger.set_print_to_console(config.print_to_console);

    LOG_INFO(core::LogCategory::NONE, get_startup_banner(config));
    if (rotated) {
        LOG_INFO(core::LogCategory::NONE,
                 "previous log moved to " + log_path.string() + ".1");
    }
    return core::make_ok();
}

bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size) {
    auto size = core::fs::file_size(log_path);
    if (!size || *size < max_size) return false;

    std::filesystem::path rotated = log_path;
    rotated += ".1";
    if (!core::fs::rename_replace(log_path, rotated)) {
        LOG_WARN(core::LogCategory::NONE,
                 "cannot rotate log file " + log_path.string());
        return false;
    }
    return true;
}

std::string get_startup_banner(const EstimatorConfig& config) {
    std::ostringstream ss;

    ss << "\n"
       << "============================================================\n"
       << "  " << get_client_name() << "\n"
       << "  Build: " << __DATE__ << " " << __TIME__ << "\n"
       << "  Compiler: "
#if defined(__clang__)
       << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
       << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
       << "Unknown"
#endif
       << " | C++ " << __cplusplus << "\n"
       << "  Network: " << config.network << "\n"
       << "  Data directory: " << config.resolved_datadir().string() << "\n"
       << "  Fee metric: " << metric_kind_name(config.metric) << "\n"
       << "  Percentiles: fast=" << config.params.fast_percentile
       << " medium=" << config.params.medium_percentile
       << " slow=" << config.params.slow_percentile << "\n"
       << "  Blend weights: prior=" << config.params.prior_weight
       << " sample=" << config.params.sample_weight << "\n"
       << "  Log level: " << core::log_level_string(config.log_level) << "\n"
       << "  Started: " << format_utc_now() << "\n"
       << "============================================================\n";

    return ss.str();
}

void set_log_categories(uint32_t categories) {
    auto& logger = core::Logger::instance();
    logger.disable_category(core::LogCategory::ALL);
    logger.enable_category(static_cast<core::LogCategory>(categories));
}

uint32_t parse_log_categories(std::string_view category_str) {
    uint32_t mask = 0;
    while (!category_str.empty()) {
        size_t comma = category_str.find(',');
        std::string name = lowercase_trimmed(category_str.substr(0, comma));
        for (const auto& [label, cat] : CATEGORY_NAMES) {
            if (name == label) mask |= static_cast<uint32_t>(cat);
        }
        if (comma == std::string_view::npos) break;
        category_str.remove_prefix(comma + 1);
    }
    return mask != 0 ? mask : static_cast<uint32_t>(core::LogCategory::ALL);
}

} // namespace node
