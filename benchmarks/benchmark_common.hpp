/**
 * @file benchmark_common.hpp
 * @brief Common utilities for lsx benchmarks with ratio comparison
 *
 * Provides unified benchmark output format with:
 * - Performance metrics (avg, min, throughput)
 * - OpenSSL vs lsx ratio comparison
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef LSX_BENCHMARK_COMMON_HPP
#define LSX_BENCHMARK_COMMON_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#include <openssl/rand.h>

namespace lsx_bench {

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

constexpr size_t WARMUP_ITERATIONS = 10;
constexpr size_t BENCHMARK_ITERATIONS = 100;

/**
 * @brief Benchmark result containing timing and throughput data
 */
struct BenchmarkResult {
    double avg_ms;          ///< Average time in milliseconds
    double min_ms;          ///< Minimum time in milliseconds
    double throughput;      ///< Throughput in ops/s or MB/s
    bool valid;             ///< Whether benchmark completed successfully

    BenchmarkResult() : avg_ms(0), min_ms(0), throughput(0), valid(false) {}
    BenchmarkResult(double avg, double min_t, double tp)
        : avg_ms(avg), min_ms(min_t), throughput(tp), valid(true) {}
};

/**
 * @brief Calculate throughput in MB/s
 */
inline double calculate_throughput(size_t bytes, double ms) {
    return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / (ms / 1000.0);
}

inline std::string format_size(size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

inline std::vector<uint8_t> generate_random_data(size_t size) {
    std::vector<uint8_t> data(size);
    if (RAND_bytes(data.data(), static_cast<int>(size)) != 1) {
        // Deterministic filler is fine for timing
        for (size_t i = 0; i < size; i++) {
            data[i] = static_cast<uint8_t>(i * 131 + 17);
        }
    }
    return data;
}

/**
 * @brief Run benchmark and return result with statistics
 *
 * @param warmup_iters Number of warmup iterations
 * @param bench_iters Number of benchmark iterations
 * @param benchmark_func Function returning execution time in ms (negative on error)
 */
inline BenchmarkResult run_benchmark_ex(
    size_t warmup_iters,
    size_t bench_iters,
    const std::function<double()>& benchmark_func
) {
    std::vector<double> times;
    times.reserve(bench_iters);

    for (size_t i = 0; i < warmup_iters; ++i) {
        if (benchmark_func() < 0) return BenchmarkResult();
    }

    for (size_t i = 0; i < bench_iters; ++i) {
        double t = benchmark_func();
        if (t < 0) return BenchmarkResult();
        times.push_back(t);
    }

    double avg = std::accumulate(times.begin(), times.end(), 0.0) /
                 static_cast<double>(times.size());
    double min_t = *std::min_element(times.begin(), times.end());
    return BenchmarkResult(avg, min_t, 1000.0 / avg);
}

/**
 * @brief Print ratio comparison between lsx and OpenSSL
 *
 * For throughput (higher is better) ratio = lsx / openssl;
 * ratio > 1.0 means lsx is FASTER.
 */
inline void print_ratio(double lsx_value, double openssl_value) {
    if (openssl_value <= 0 || lsx_value <= 0) {
        std::cout << std::left << std::setw(25) << "  ==> Ratio"
                  << std::setw(12) << ""
                  << "  (comparison not available)" << std::endl;
        return;
    }

    double ratio = lsx_value / openssl_value;
    const char* status = ratio >= 1.0 ? "FASTER" : "SLOWER";
    const char* symbol = ratio >= 1.0 ? "+" : "";
    double diff_percent = (ratio - 1.0) * 100.0;

    std::cout << std::left << std::setw(25) << "  ==> Ratio"
              << std::setw(12) << ""
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << ratio << "x"
              << "    (" << symbol << std::setprecision(1) << diff_percent << "% " << status << ")"
              << std::endl;
}

/**
 * @brief Print one result line
 * @param data_size Bytes processed per call; 0 prints op/s instead of MB/s
 */
inline void print_result(const std::string& name, const std::string& impl,
                         const BenchmarkResult& result, size_t data_size = 0) {
    if (!result.valid) {
        std::cout << std::left << std::setw(25) << name
                  << std::setw(12) << impl
                  << "  (benchmark failed)" << std::endl;
        return;
    }

    std::cout << std::left << std::setw(25) << name
              << std::setw(12) << impl
              << std::right << std::fixed << std::setprecision(3)
              << std::setw(10) << result.avg_ms << " ms"
              << std::setw(10) << result.min_ms << " ms";
    if (data_size > 0) {
        std::cout << std::setw(10) << std::setprecision(2)
                  << calculate_throughput(data_size, result.avg_ms) << " MB/s";
    } else {
        std::cout << std::setw(10) << std::setprecision(1) << result.throughput << " op/s";
    }
    std::cout << std::endl;
}

inline void print_section_header(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << std::left << std::setw(25) << "Operation"
              << std::setw(12) << "Impl"
              << std::right << std::setw(13) << "Avg"
              << std::setw(13) << "Min"
              << std::setw(15) << "Throughput"
              << std::endl;
    std::cout << std::string(70, '-') << std::endl;
}

} // namespace lsx_bench

#endif // LSX_BENCHMARK_COMMON_HPP
