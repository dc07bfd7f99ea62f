/**
 * @file cmd_selftest.cpp
 * @brief Self-test subcommand implementation for lsx CLI
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iomanip>
#include <iostream>
#include <string>

#include "lsx/core/selftest.h"

void print_selftest_help() {
    std::cout << "\nUsage: lsx selftest [-q]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -q                Only print failures\n";
    std::cout << "  --help            Show this help message\n\n";
}

/**
 * @brief Self-test subcommand handler
 * @return 0 when every known-answer test passes
 */
int cmd_selftest(int argc, char* argv[]) {
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-q") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            print_selftest_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_selftest_help();
            return 1;
        }
    }

    size_t failed = 0;
    const auto results = lsx::selftest::runAll();
    for (const auto& r : results) {
        if (!r.passed) {
            ++failed;
            std::cerr << "  [FAIL] " << std::left << std::setw(28) << r.name << r.detail << "\n";
        } else if (!quiet) {
            std::cout << "  [ OK ] " << r.name << "\n";
        }
    }

    if (!quiet || failed > 0) {
        std::cout << "\n" << (results.size() - failed) << "/" << results.size()
                  << " known-answer tests passed\n";
    }
    return failed == 0 ? 0 : 1;
}
