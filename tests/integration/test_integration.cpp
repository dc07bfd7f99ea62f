/**
 * @file test_integration.cpp
 * @brief Integration tests for the lsx library
 *
 * Tests cross-module interactions and real-world usage scenarios:
 * - Library metadata and built-in self tests
 * - Hashing through the C ABI and the C++ wrappers interchangeably
 * - Using a digest as Twofish key material
 * - Error codes surfacing through both API layers
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <vector>

#include "lsx/lsx.h"

// ============================================================================
// Library Metadata and Self Tests
// ============================================================================

TEST(IntegrationTest, LibraryMetadata) {
    const char* version = lsx_version();
    ASSERT_NE(version, nullptr);
    EXPECT_STREQ(version, "1.1.0");

    const char* platform = lsx_platform();
    EXPECT_NE(platform, nullptr);
}

TEST(IntegrationTest, SelfTestPasses) {
    EXPECT_EQ(lsx_selftest(), LSX_SUCCESS);

    const auto results = lsx::selftest::runAll();
    EXPECT_EQ(results.size(), 10u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.passed) << r.name << ": " << r.detail;
    }
}

// ============================================================================
// Hash Workflows
// ============================================================================

TEST(IntegrationTest, CAndCppHashAgree) {
    const std::string message = "The quick brown fox jumps over the lazy dog";

    lsx_sha256_ctx_t ctx;
    uint8_t c_digest[LSX_SHA256_DIGEST_SIZE];
    ASSERT_EQ(lsx_sha256_init(&ctx), LSX_SUCCESS);
    ASSERT_EQ(lsx_sha256_update(&ctx, reinterpret_cast<const uint8_t*>(message.data()), 10),
              LSX_SUCCESS);
    ASSERT_EQ(lsx_sha256_final(&ctx, reinterpret_cast<const uint8_t*>(message.data()) + 10,
                               message.size() - 10, c_digest),
              LSX_SUCCESS);

    lsx::Sha256Digest cpp_digest = lsx::sha256::hash(message);
    EXPECT_EQ(lsx_secure_compare(c_digest, cpp_digest.data(), LSX_SHA256_DIGEST_SIZE), 0);
    EXPECT_EQ(lsx::hexEncode(cpp_digest),
              "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST(IntegrationTest, HashChain) {
    // Iterated hashing: each round hashes the previous digest
    lsx::Sha256Digest digest = lsx::sha256::hash(std::string("seed"));
    for (int i = 0; i < 100; i++) {
        digest = lsx::sha256::hash(digest.data(), digest.size());
    }

    lsx::Sha256Digest again = lsx::sha256::hash(std::string("seed"));
    for (int i = 0; i < 100; i++) {
        lsx::RawSha256 raw;
        again = raw.finish(again.data(), again.size());
    }
    EXPECT_EQ(digest, again);
}

// ============================================================================
// Hash + Cipher
// ============================================================================

TEST(IntegrationTest, DigestAsTwofishKey) {
    lsx::Sha256Digest digest = lsx::sha256::hash(std::string("correct horse battery staple"));

    lsx::Twofish256Key key;
    std::memcpy(key.data(), digest.data(), key.size());
    lsx::Twofish cipher(key);
    EXPECT_EQ(cipher.keyBits(), 256);

    // Encrypt both digest halves as two independent blocks
    lsx::TwofishBlock lo{};
    lsx::TwofishBlock hi{};
    std::memcpy(lo.data(), digest.data(), 16);
    std::memcpy(hi.data(), digest.data() + 16, 16);

    auto c_lo = cipher.encryptBlock(lo);
    auto c_hi = cipher.encryptBlock(hi);
    EXPECT_NE(c_lo, c_hi);
    EXPECT_EQ(cipher.decryptBlock(c_lo), lo);
    EXPECT_EQ(cipher.decryptBlock(c_hi), hi);

    // Same key through the C ABI gives the same ciphertext
    lsx_twofish_ctx_t ctx;
    uint8_t out[16];
    ASSERT_EQ(lsx_twofish_init(&ctx, digest.data(), digest.size()), LSX_SUCCESS);
    ASSERT_EQ(lsx_twofish_encrypt_block(&ctx, lo.data(), out), LSX_SUCCESS);
    EXPECT_EQ(std::memcmp(out, c_lo.data(), 16), 0);
    lsx_twofish_clear(&ctx);
}

// ============================================================================
// Error Handling
// ============================================================================

TEST(IntegrationTest, ErrorCodesHaveMessages) {
    lsx_twofish_ctx_t ctx;
    uint8_t key[20] = {0};
    lsx_error_t err = lsx_twofish_init(&ctx, key, sizeof(key));
    EXPECT_EQ(err, LSX_ERROR_INVALID_KEY);
    EXPECT_NE(std::string(lsx_error_string(err)).find("16, 24, or 32"), std::string::npos);

    lsx_sha256_raw_ctx_t raw;
    ASSERT_EQ(lsx_sha256_raw_init(&raw), LSX_SUCCESS);
    err = lsx_sha256_raw_update(&raw, key, sizeof(key));
    EXPECT_EQ(err, LSX_ERROR_UNALIGNED_INPUT);
    EXPECT_STRNE(lsx_error_string(err), "Unknown error");
}
