/**
 * @file test_encoding.cpp
 * @brief Hex encoding unit tests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include "lsx/utils/encoding.h"

TEST(EncodingTest, HexEncode) {
    const uint8_t data[] = {0x00, 0x01, 0x7f, 0x80, 0xab, 0xff};
    EXPECT_EQ(lsx::hexEncode(data, sizeof(data)), "00017f80abff");
    EXPECT_EQ(lsx::hexEncodeUpper(data, sizeof(data)), "00017F80ABFF");
    EXPECT_EQ(lsx::hexEncode(lsx::ByteVec{}), "");

    lsx::ByteArray<2> arr = {0xde, 0xad};
    EXPECT_EQ(lsx::hexEncode(arr), "dead");
}

TEST(EncodingTest, HexDecode) {
    EXPECT_EQ(lsx::hexDecode("00017f80ABff"), (lsx::ByteVec{0x00, 0x01, 0x7f, 0x80, 0xab, 0xff}));
    EXPECT_EQ(lsx::hexDecode("0xCAFE"), (lsx::ByteVec{0xca, 0xfe}));
    EXPECT_TRUE(lsx::hexDecode("").empty());
}

TEST(EncodingTest, HexDecodeRejectsMalformed) {
    EXPECT_THROW(lsx::hexDecode("abc"), std::invalid_argument);
    EXPECT_THROW(lsx::hexDecode("zz"), std::invalid_argument);
    EXPECT_THROW(lsx::hexDecode("12 34"), std::invalid_argument);
}

TEST(EncodingTest, CApi) {
    const uint8_t data[] = {0x12, 0x34};
    char hex[5];
    EXPECT_EQ(lsx_hex_encode(data, 2, hex, sizeof(hex)), 4u);
    EXPECT_STREQ(hex, "1234");

    // Output buffer one byte short for the terminator
    EXPECT_EQ(lsx_hex_encode(data, 2, hex, 4), 0u);

    uint8_t out[2];
    EXPECT_EQ(lsx_hex_decode("0xbeef", 0, out, sizeof(out)), 2u);
    EXPECT_EQ(out[0], 0xbe);
    EXPECT_EQ(out[1], 0xef);
    EXPECT_EQ(lsx_hex_decode("beefee", 0, out, sizeof(out)), 0u);
    EXPECT_EQ(lsx_hex_char_value('g'), -1);
}
