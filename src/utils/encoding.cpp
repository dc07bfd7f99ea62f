/**
 * @file encoding.cpp
 * @brief Hexadecimal encoding implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "lsx/utils/encoding.h"
#include <cstring>
#include <stdexcept>

// ============================================================================
// Internal Constants
// ============================================================================

static const char HEX_LOWER[] = "0123456789abcdef";
static const char HEX_UPPER[] = "0123456789ABCDEF";

// ============================================================================
// C API: Hexadecimal Encoding/Decoding
// ============================================================================

extern "C" {

size_t lsx_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size) {
    if ((data == nullptr && len > 0) || hex == nullptr || hex_size < len * 2 + 1) {
        return 0;
    }

    for (size_t i = 0; i < len; i++) {
        hex[i * 2] = HEX_LOWER[data[i] >> 4];
        hex[i * 2 + 1] = HEX_LOWER[data[i] & 0x0F];
    }
    hex[len * 2] = '\0';

    return len * 2;
}

size_t lsx_hex_encode_upper(const uint8_t* data, size_t len, char* hex, size_t hex_size) {
    if ((data == nullptr && len > 0) || hex == nullptr || hex_size < len * 2 + 1) {
        return 0;
    }

    for (size_t i = 0; i < len; i++) {
        hex[i * 2] = HEX_UPPER[data[i] >> 4];
        hex[i * 2 + 1] = HEX_UPPER[data[i] & 0x0F];
    }
    hex[len * 2] = '\0';

    return len * 2;
}

int lsx_hex_char_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

size_t lsx_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size) {
    if (hex == nullptr || data == nullptr) {
        return 0;
    }

    // Calculate actual length if 0 passed
    if (hex_len == 0) {
        hex_len = strlen(hex);
    }

    // Skip 0x prefix if present
    if (hex_len >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex += 2;
        hex_len -= 2;
    }

    if (hex_len % 2 != 0) {
        return 0;
    }

    size_t out_len = hex_len / 2;
    if (data_size < out_len) {
        return 0;
    }

    for (size_t i = 0; i < out_len; i++) {
        int hi = lsx_hex_char_value(hex[i * 2]);
        int lo = lsx_hex_char_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return 0;
        }
        data[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return out_len;
}

} // extern "C"

// ============================================================================
// C++ API
// ============================================================================

namespace lsx {

std::string hexEncode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result.push_back(HEX_LOWER[data[i] >> 4]);
        result.push_back(HEX_LOWER[data[i] & 0x0F]);
    }
    return result;
}

std::string hexEncode(const ByteVec& data) {
    return hexEncode(data.data(), data.size());
}

std::string hexEncodeUpper(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result.push_back(HEX_UPPER[data[i] >> 4]);
        result.push_back(HEX_UPPER[data[i] & 0x0F]);
    }
    return result;
}

ByteVec hexDecode(const std::string& hex) {
    if (hex.empty()) {
        return {};
    }

    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if ((hex.size() - start) % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }

    ByteVec result;
    result.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = lsx_hex_char_value(hex[i]);
        int lo = lsx_hex_char_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character in: " + hex);
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

} // namespace lsx
