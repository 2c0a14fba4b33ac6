#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Process-wide logging setup from an EstimatorConfig: level, category
// mask, <datadir>/debug.log (rotated at startup once it grows past
// MAX_LOG_FILE_SIZE), optional stderr copy, and a startup banner.
// ---------------------------------------------------------------------------

#ifndef FEETIER_NODE_LOGGING_INIT_H
#define FEETIER_NODE_LOGGING_INIT_H

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace node {

struct EstimatorConfig;

/// Configure core::Logger from @p config and write the banner.
/// STORAGE_OPEN if the log directory cannot be created.
[[nodiscard]] core::Result<void> init_logging(const EstimatorConfig& config);

inline constexpr uint64_t MAX_LOG_FILE_SIZE = 10 * 1024 * 1024;

/// Move @p log_path to "<log_path>.1" (replacing any older one) when it is
/// at least @p max_size bytes.  True if the file was moved.
bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size = MAX_LOG_FILE_SIZE);

/// Multi-line banner: client version, build, network, data directory,
/// metric, percentiles, blend weights and log level.
[[nodiscard]] std::string get_startup_banner(const EstimatorConfig& config);

/// Enable exactly the categories in @p categories.
void set_log_categories(uint32_t categories);

/// Comma-separated, case-insensitive list of
///   fees, storage, chain, crypto, config, bench, all
/// to a bitmask.  Unknown names are skipped; if nothing is recognised the
/// result is ALL.
[[nodiscard]] uint32_t parse_log_categories(std::string_view category_str);

} // namespace node

#endif // FEETIER_NODE_LOGGING_INIT_H
