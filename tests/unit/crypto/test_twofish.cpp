/**
 * @file test_twofish.cpp
 * @brief Twofish unit tests
 *
 * Known-answer vectors from the Twofish submission package (ECB_TBL.TXT),
 * plus key schedule, round-trip, error and threading checks.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <gtest/gtest.h>
#include "lsx/crypto/twofish.h"
#include "lsx/utils/encoding.h"
#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <vector>

class TwofishTest : public ::testing::Test {
protected:
    static lsx::TwofishBlock block(const std::string& hex) {
        lsx::ByteVec v = lsx::hexDecode(hex);
        lsx::TwofishBlock b{};
        std::copy(v.begin(), v.end(), b.begin());
        return b;
    }

    /**
     * @brief Run the ECB_TBL chain: each step encrypts the previous
     *        ciphertext under a key built from the two previous ones
     */
    static std::string ecb_table_chain(size_t key_len, int iterations) {
        lsx::ByteVec key(key_len, 0);
        lsx::TwofishBlock pt{};
        lsx::TwofishBlock ct{};
        for (int i = 0; i < iterations; i++) {
            lsx::Twofish cipher(key);
            ct = cipher.encryptBlock(pt);
            lsx::ByteVec next(pt.begin(), pt.end());
            next.insert(next.end(), key.begin(), key.end() - 16);
            key = next;
            pt = ct;
        }
        return lsx::hexEncodeUpper(ct.data(), ct.size());
    }
};

// ============================================================================
// Known-answer tests
// ============================================================================

TEST_F(TwofishTest, Twofish128_ZeroKey) {
    uint8_t key[16] = {0};
    uint8_t plaintext[16] = {0};
    uint8_t ciphertext[16];

    lsx_twofish_ctx_t ctx;
    ASSERT_EQ(lsx_twofish_init128(&ctx, key), LSX_SUCCESS);
    ASSERT_EQ(lsx_twofish_encrypt_block(&ctx, plaintext, ciphertext), LSX_SUCCESS);
    EXPECT_EQ(lsx::hexEncodeUpper(ciphertext, 16), "9F589F5CF6122C32B6BFEC2F2AE8C35A");

    uint8_t decrypted[16];
    ASSERT_EQ(lsx_twofish_decrypt_block(&ctx, ciphertext, decrypted), LSX_SUCCESS);
    EXPECT_EQ(memcmp(decrypted, plaintext, 16), 0);

    lsx_twofish_clear(&ctx);
}

TEST_F(TwofishTest, Twofish128_TableSteps) {
    // I=2 and I=3 of ECB_TBL
    lsx::Twofish zero_key(lsx::Twofish128Key{});
    EXPECT_EQ(lsx::hexEncodeUpper(zero_key.encryptBlock(block("9F589F5CF6122C32B6BFEC2F2AE8C35A")).data(), 16),
              "D491DB16E7B1C39E86CB086B789F5419");

    lsx::Twofish cipher(lsx::hexDecode("9F589F5CF6122C32B6BFEC2F2AE8C35A"));
    EXPECT_EQ(lsx::hexEncodeUpper(cipher.encryptBlock(block("D491DB16E7B1C39E86CB086B789F5419")).data(), 16),
              "019F9809DE1711858FAAC3A3BA20FBC3");
}

TEST_F(TwofishTest, Twofish192_ZeroKey) {
    lsx::Twofish cipher(lsx::Twofish192Key{});
    EXPECT_EQ(cipher.keyBits(), 192);
    EXPECT_EQ(lsx::hexEncodeUpper(cipher.encryptBlock(lsx::TwofishBlock{}).data(), 16),
              "EFA71F788965BD4453F860178FC19101");
}

TEST_F(TwofishTest, Twofish192_Vector) {
    lsx::Twofish cipher(lsx::hexDecode("0123456789ABCDEFFEDCBA98765432100011223344556677"));
    auto ct = cipher.encryptBlock(lsx::TwofishBlock{});
    EXPECT_EQ(lsx::hexEncodeUpper(ct.data(), 16), "CFD1D2E5A9BE9CDF501F13B892BD2248");
    EXPECT_EQ(cipher.decryptBlock(ct), lsx::TwofishBlock{});
}

TEST_F(TwofishTest, Twofish256_ZeroKey) {
    lsx::Twofish cipher(lsx::Twofish256Key{});
    EXPECT_EQ(cipher.keyBits(), 256);
    EXPECT_EQ(lsx::hexEncodeUpper(cipher.encryptBlock(lsx::TwofishBlock{}).data(), 16),
              "57FF739D4DC92C1BD7FC01700CC8216F");
}

TEST_F(TwofishTest, Twofish256_Vector) {
    lsx::Twofish cipher(lsx::hexDecode(
        "0123456789ABCDEFFEDCBA987654321000112233445566778899AABBCCDDEEFF"));
    auto ct = cipher.encryptBlock(lsx::TwofishBlock{});
    EXPECT_EQ(lsx::hexEncodeUpper(ct.data(), 16), "37527BE0052334B89F0CFCCAE87CFA20");
    EXPECT_EQ(cipher.decryptBlock(ct), lsx::TwofishBlock{});
}

TEST_F(TwofishTest, EcbTableFinalEntries) {
    // I=49 of ECB_TBL for each key size
    EXPECT_EQ(ecb_table_chain(16, 49), "5D9D4EEFFA9151575524F115815A12E0");
    EXPECT_EQ(ecb_table_chain(24, 49), "E75449212BEEF9F4A390BD860A640941");
    EXPECT_EQ(ecb_table_chain(32, 49), "37FE26FF1CF66175F5DDF4C33B97A205");
}

// ============================================================================
// Key schedule
// ============================================================================

TEST_F(TwofishTest, ZeroKeySubkeys) {
    // Intermediate values published with the 128-bit zero-key vector
    lsx::Twofish cipher(lsx::Twofish128Key{});
    const auto& ctx = cipher.context();
    EXPECT_EQ(ctx.whitening[0], 0x52C54DDEu);
    EXPECT_EQ(ctx.round_keys[0], 0xF98FFEF9u);
    EXPECT_EQ(ctx.key_bits, 128);
}

TEST_F(TwofishTest, DeterministicContext) {
    const lsx::ByteVec key = lsx::hexDecode("0123456789ABCDEFFEDCBA98765432100011223344556677");
    lsx_twofish_ctx_t a;
    lsx_twofish_ctx_t b;
    std::memset(&a, 0xAA, sizeof(a));
    std::memset(&b, 0x55, sizeof(b));
    ASSERT_EQ(lsx_twofish_init(&a, key.data(), key.size()), LSX_SUCCESS);
    ASSERT_EQ(lsx_twofish_init192(&b, key.data()), LSX_SUCCESS);
    EXPECT_EQ(memcmp(&a, &b, sizeof(a)), 0);
}

TEST_F(TwofishTest, InvalidKeyLengths) {
    uint8_t key[33] = {0};
    lsx_twofish_ctx_t ctx;
    for (size_t len : {0u, 1u, 15u, 17u, 20u, 23u, 25u, 31u, 33u}) {
        EXPECT_EQ(lsx_twofish_init(&ctx, key, len), LSX_ERROR_INVALID_KEY) << "length " << len;
        EXPECT_THROW({ lsx::Twofish cipher(key, len); }, std::invalid_argument) << "length " << len;
    }
    EXPECT_THROW({ lsx::Twofish cipher(lsx::ByteVec{}); }, std::invalid_argument);
    EXPECT_EQ(lsx_twofish_init(nullptr, key, 16), LSX_ERROR_INVALID_PARAM);
    EXPECT_EQ(lsx_twofish_init(&ctx, nullptr, 16), LSX_ERROR_INVALID_PARAM);
}

TEST_F(TwofishTest, ConstructorReportsUnderlyingError) {
    uint8_t key[20] = {0};
    try {
        lsx::Twofish cipher(key, sizeof(key));
        FAIL() << "20-byte key accepted";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), lsx_error_string(LSX_ERROR_INVALID_KEY));
    }

    try {
        lsx::Twofish cipher(nullptr, 16);
        FAIL() << "null key accepted";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), lsx_error_string(LSX_ERROR_INVALID_PARAM));
    }
}

// ============================================================================
// Block operations
// ============================================================================

TEST_F(TwofishTest, RoundTripAllKeySizes) {
    for (size_t key_len : {16u, 24u, 32u}) {
        lsx::ByteVec key(key_len);
        for (size_t i = 0; i < key_len; i++) {
            key[i] = static_cast<uint8_t>(i * 17 + key_len);
        }
        lsx::Twofish cipher(key);

        lsx::TwofishBlock pt{};
        for (int n = 0; n < 64; n++) {
            for (size_t i = 0; i < pt.size(); i++) {
                pt[i] = static_cast<uint8_t>(n * 31 + i * 7);
            }
            auto ct = cipher.encryptBlock(pt);
            EXPECT_NE(ct, pt);
            EXPECT_EQ(cipher.decryptBlock(ct), pt) << "key " << key_len << " block " << n;
        }
    }
}

TEST_F(TwofishTest, InPlaceOperation) {
    uint8_t key[32] = {0};
    lsx_twofish_ctx_t ctx;
    ASSERT_EQ(lsx_twofish_init256(&ctx, key), LSX_SUCCESS);

    uint8_t buf[16] = {0};
    ASSERT_EQ(lsx_twofish_encrypt_block(&ctx, buf, buf), LSX_SUCCESS);
    EXPECT_EQ(lsx::hexEncodeUpper(buf, 16), "57FF739D4DC92C1BD7FC01700CC8216F");
    ASSERT_EQ(lsx_twofish_decrypt_block(&ctx, buf, buf), LSX_SUCCESS);
    EXPECT_EQ(lsx::hexEncode(buf, 16), "00000000000000000000000000000000");

    lsx_twofish_clear(&ctx);
}

TEST_F(TwofishTest, ClearedContextRejected) {
    uint8_t key[16] = {0};
    uint8_t buf[16] = {0};
    lsx_twofish_ctx_t ctx;
    ASSERT_EQ(lsx_twofish_init128(&ctx, key), LSX_SUCCESS);
    lsx_twofish_clear(&ctx);

    EXPECT_EQ(ctx.key_bits, 0);
    EXPECT_EQ(lsx_twofish_encrypt_block(&ctx, buf, buf), LSX_ERROR_INVALID_PARAM);
    EXPECT_EQ(lsx_twofish_decrypt_block(&ctx, buf, buf), LSX_ERROR_INVALID_PARAM);
    EXPECT_EQ(lsx_twofish_encrypt_block(nullptr, buf, buf), LSX_ERROR_INVALID_PARAM);
}

TEST_F(TwofishTest, MoveTransfersKey) {
    lsx::Twofish a(lsx::Twofish256Key{});
    lsx::Twofish b(std::move(a));
    EXPECT_EQ(lsx::hexEncodeUpper(b.encryptBlock(lsx::TwofishBlock{}).data(), 16),
              "57FF739D4DC92C1BD7FC01700CC8216F");
    EXPECT_THROW(a.encryptBlock(lsx::TwofishBlock{}), std::logic_error);
}

TEST_F(TwofishTest, SharedContextAcrossThreads) {
    const lsx::Twofish cipher(lsx::hexDecode(
        "0123456789ABCDEFFEDCBA987654321000112233445566778899AABBCCDDEEFF"));
    const auto expected = cipher.encryptBlock(lsx::TwofishBlock{});

    constexpr int THREADS = 8;
    std::vector<int> mismatches(THREADS, 0);
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; t++) {
        workers.emplace_back([&cipher, &expected, &mismatches, t]() {
            for (int i = 0; i < 2000; i++) {
                auto ct = cipher.encryptBlock(lsx::TwofishBlock{});
                if (ct != expected || cipher.decryptBlock(ct) != lsx::TwofishBlock{}) {
                    mismatches[t]++;
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    for (int t = 0; t < THREADS; t++) {
        EXPECT_EQ(mismatches[t], 0) << "thread " << t;
    }
}
