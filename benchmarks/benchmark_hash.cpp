/**
 * @file benchmark_hash.cpp
 * @brief SHA-256 Performance Benchmark: lsx vs OpenSSL
 *
 * - One-shot hashing of 1 KB .. 10 MB buffers
 * - Buffered hasher fed in small uneven chunks
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <vector>

#include <openssl/evp.h>

#include "lsx/crypto/sha256.h"
#include "benchmark_common.hpp"

using namespace lsx_bench;

namespace {

const std::vector<size_t> TEST_SIZES = {
    1024,              // 1 KB
    64 * 1024,         // 64 KB
    1024 * 1024,       // 1 MB
    10 * 1024 * 1024   // 10 MB
};

double openssl_sha256(const uint8_t* data, size_t len, uint8_t* digest) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return -1.0;

    unsigned int digest_len = 0;
    auto start = Clock::now();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data, len);
    EVP_DigestFinal_ex(ctx, digest, &digest_len);
    auto end = Clock::now();

    EVP_MD_CTX_free(ctx);
    return Duration(end - start).count();
}

double lsx_sha256_oneshot(const uint8_t* data, size_t len, uint8_t* digest) {
    auto start = Clock::now();
    lsx_error_t err = lsx_sha256(data, len, digest);
    auto end = Clock::now();
    return err == LSX_SUCCESS ? Duration(end - start).count() : -1.0;
}

// 100-byte chunks keep the pending buffer busy on every call
double lsx_sha256_chunked(const uint8_t* data, size_t len, uint8_t* digest) {
    constexpr size_t CHUNK = 100;
    lsx_sha256_ctx_t ctx;
    auto start = Clock::now();
    lsx_sha256_init(&ctx);
    for (size_t off = 0; off < len; off += CHUNK) {
        size_t n = len - off < CHUNK ? len - off : CHUNK;
        if (lsx_sha256_update(&ctx, data + off, n) != LSX_SUCCESS) return -1.0;
    }
    if (lsx_sha256_final(&ctx, nullptr, 0, digest) != LSX_SUCCESS) return -1.0;
    return Duration(Clock::now() - start).count();
}

} // namespace

void benchmark_hash_functions() {
    print_section_header("SHA-256 (FIPS 180-4)");

    for (size_t size : TEST_SIZES) {
        auto data = generate_random_data(size);
        uint8_t digest[32];
        const std::string label = "SHA-256 " + format_size(size);

        auto ossl = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return openssl_sha256(data.data(), size, digest);
        });
        auto lsx = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return lsx_sha256_oneshot(data.data(), size, digest);
        });
        auto chunked = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return lsx_sha256_chunked(data.data(), size, digest);
        });

        print_result(label, "OpenSSL", ossl, size);
        print_result(label, "lsx", lsx, size);
        print_result(label, "lsx/100B", chunked, size);
        if (ossl.valid && lsx.valid) {
            print_ratio(calculate_throughput(size, lsx.avg_ms),
                        calculate_throughput(size, ossl.avg_ms));
        }
    }
}
