/**
 * @file benchmark_main.cpp
 * @brief lsx Performance Benchmark Suite
 *
 * Usage:
 *   lsx_benchmark [algorithm]
 *
 * Algorithms:
 *   all      - Run all benchmarks (default)
 *   hash     - SHA-256 vs OpenSSL
 *   twofish  - Twofish key setup and block throughput
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <string>

#include <openssl/crypto.h>

#include "lsx/lsx.h"

// Forward declarations for benchmark functions
void benchmark_hash_functions();
void benchmark_twofish();

void print_usage(const char* program_name) {
    std::cout << "\nUsage: " << program_name << " [algorithm]\n\n";
    std::cout << "Algorithms:\n";
    std::cout << "  all      - Run all benchmarks (default)\n";
    std::cout << "  hash     - SHA-256 vs OpenSSL\n";
    std::cout << "  twofish  - Twofish key setup and block throughput\n";
}

int main(int argc, char* argv[]) {
    std::string algorithm = "all";
    if (argc > 1) {
        algorithm = argv[1];
        std::transform(algorithm.begin(), algorithm.end(), algorithm.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    const std::set<std::string> valid_algorithms = {"all", "hash", "twofish", "help", "-h", "--help"};
    if (valid_algorithms.find(algorithm) == valid_algorithms.end()) {
        std::cerr << "Error: Unknown algorithm '" << algorithm << "'\n";
        print_usage(argv[0]);
        return 1;
    }
    if (algorithm == "help" || algorithm == "-h" || algorithm == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cout << "\nlsx " << lsx_version() << " Performance Benchmark Suite\n";
    std::cout << "OpenSSL Version: " << OpenSSL_version(OPENSSL_VERSION) << std::endl;

    // Refuse to time a broken build
    if (lsx_selftest() != LSX_SUCCESS) {
        std::cerr << "Self test failed; run `lsx selftest` for details" << std::endl;
        return 1;
    }

    if (algorithm == "all" || algorithm == "hash") {
        benchmark_hash_functions();
    }
    if (algorithm == "all" || algorithm == "twofish") {
        benchmark_twofish();
    }

    std::cout << "\nResults may vary based on CPU, memory, and compiler optimizations.\n";
    return 0;
}
