// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// feetier-cli -- print the current fee-rate tiers
//
// Opens the persisted estimate in the data directory and prints it.  The
// estimator holds an exclusive lock on its store, so this tool fails with
// a store-open error while a node owns the same data directory.
//
// Usage:
//   feetier-cli [options]
//
// Exit status: 0 on success (including "no estimate available"), 1 on a
// configuration or store-open error.
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "core/fs.h"
#include "core/logging.h"
#include "node/estimator_config.h"
#include "node/logging_init.h"

#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    core::Config cfg;
    cfg.parse_args(argc, argv);

    if (cfg.has("help") || cfg.has("h") || cfg.has("?")) {
        node::print_usage();
        return 0;
    }
    if (cfg.has("version")) {
        std::cout << node::get_client_name() << "\n";
        return 0;
    }

    // -conf=<path> must exist; the default <datadir>/feetier.conf is
    // optional.
    if (auto conf = cfg.get(core::CONF_CONF); conf.has_value() &&
                                              !conf->empty()) {
        auto loaded = cfg.parse_file(std::filesystem::path{*conf});
        if (!loaded.ok()) {
            std::cerr << "Error: " << loaded.error().message() << "\n";
            return 1;
        }
    } else {
        std::filesystem::path def = cfg.data_dir() / "feetier.conf";
        if (core::fs::file_exists(def)) {
            auto loaded = cfg.parse_file(def);
            if (!loaded.ok()) {
                std::cerr << "Error: " << loaded.error().message() << "\n";
                return 1;
            }
        }
    }

    auto config = node::load_estimator_config(cfg);
    if (!config.ok()) {
        std::cerr << "Error: " << config.error().message() << "\n";
        return 1;
    }

    auto logging = node::init_logging(config.value());
    if (!logging.ok()) {
        std::cerr << "Error: " << logging.error().message() << "\n";
        return 1;
    }

    auto estimator = node::open_estimator(config.value());
    if (!estimator.ok()) {
        std::cerr << "Error: " << estimator.error().message() << "\n";
        core::Logger::instance().flush();
        return 1;
    }

    auto estimate = estimator.value()->get_rate_estimates();
    if (estimate.ok()) {
        std::cout << estimate.value().to_string() << "\n";
    } else if (estimate.error().code() ==
               core::ErrorCode::ESTIMATE_UNAVAILABLE) {
        std::cout << "no estimate available\n";
    } else {
        std::cerr << "Error: " << estimate.error().message() << "\n";
        core::Logger::instance().flush();
        return 1;
    }

    core::Logger::instance().flush();
    return 0;
}
