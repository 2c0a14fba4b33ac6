// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/logging.h"

#include <iostream>
#include <string_view>

// Usage: feetier_tests [suite-filter]
int main(int argc, char* argv[]) {
    // Keep the console readable; failures are reported by the framework.
    core::Logger::instance().set_level(core::LogLevel::OFF);

    std::cout << "FeeTier Unit Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    std::string_view filter = argc > 1 ? std::string_view(argv[1])
                                       : std::string_view{};
    return test::run_all_tests(filter);
}
