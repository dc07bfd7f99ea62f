/**
 * @file benchmark_twofish.cpp
 * @brief Twofish Performance Benchmark
 *
 * OpenSSL ships no Twofish, so AES-256-ECB from OpenSSL is printed as a
 * reference point for block throughput.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <vector>

#include <openssl/evp.h>

#include "lsx/crypto/twofish.h"
#include "benchmark_common.hpp"

using namespace lsx_bench;

namespace {

constexpr size_t BULK_SIZE = 1024 * 1024;   // 1 MB of independent blocks
constexpr size_t KEY_SETUPS = 1000;

double twofish_key_setup(const uint8_t* key, size_t key_len) {
    lsx_twofish_ctx_t ctx;
    auto start = Clock::now();
    for (size_t i = 0; i < KEY_SETUPS; i++) {
        if (lsx_twofish_init(&ctx, key, key_len) != LSX_SUCCESS) return -1.0;
    }
    auto end = Clock::now();
    lsx_twofish_clear(&ctx);
    return Duration(end - start).count();
}

double twofish_blocks(const lsx_twofish_ctx_t* ctx, const uint8_t* in, uint8_t* out,
                      size_t len, bool encrypt) {
    auto start = Clock::now();
    for (size_t off = 0; off + LSX_TWOFISH_BLOCK_SIZE <= len; off += LSX_TWOFISH_BLOCK_SIZE) {
        lsx_error_t err = encrypt ? lsx_twofish_encrypt_block(ctx, in + off, out + off)
                                  : lsx_twofish_decrypt_block(ctx, in + off, out + off);
        if (err != LSX_SUCCESS) return -1.0;
    }
    return Duration(Clock::now() - start).count();
}

double openssl_aes256_ecb(const uint8_t* key, const uint8_t* in, uint8_t* out, size_t len) {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) return -1.0;

    int out_len = 0;
    auto start = Clock::now();
    EVP_EncryptInit_ex(ctx, EVP_aes_256_ecb(), nullptr, key, nullptr);
    EVP_CIPHER_CTX_set_padding(ctx, 0);
    EVP_EncryptUpdate(ctx, out, &out_len, in, static_cast<int>(len));
    auto end = Clock::now();

    EVP_CIPHER_CTX_free(ctx);
    return Duration(end - start).count();
}

} // namespace

void benchmark_twofish() {
    print_section_header("Twofish key setup (x" + std::to_string(KEY_SETUPS) + ")");

    auto key = generate_random_data(32);
    for (size_t key_len : {16u, 24u, 32u}) {
        auto r = run_benchmark_ex(2, 20, [&]() {
            return twofish_key_setup(key.data(), key_len);
        });
        print_result("Twofish-" + std::to_string(key_len * 8) + " setup", "lsx", r);
    }

    print_section_header("Twofish block throughput (" + format_size(BULK_SIZE) + ")");

    auto data = generate_random_data(BULK_SIZE);
    std::vector<uint8_t> out(BULK_SIZE);

    for (size_t key_len : {16u, 32u}) {
        lsx_twofish_ctx_t ctx;
        if (lsx_twofish_init(&ctx, key.data(), key_len) != LSX_SUCCESS) {
            std::cerr << "Twofish key setup failed" << std::endl;
            return;
        }
        const std::string bits = std::to_string(key_len * 8);

        auto enc = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return twofish_blocks(&ctx, data.data(), out.data(), BULK_SIZE, true);
        });
        auto dec = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return twofish_blocks(&ctx, data.data(), out.data(), BULK_SIZE, false);
        });
        print_result("Twofish-" + bits + " encrypt", "lsx", enc, BULK_SIZE);
        print_result("Twofish-" + bits + " decrypt", "lsx", dec, BULK_SIZE);
        lsx_twofish_clear(&ctx);
    }

    auto aes = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
        return openssl_aes256_ecb(key.data(), data.data(), out.data(), BULK_SIZE);
    });
    print_result("AES-256-ECB (reference)", "OpenSSL", aes, BULK_SIZE);
}
