/**
 * @file encoding.h
 * @brief Hexadecimal encoding utilities for keys, blocks and digests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef LSX_UTILS_ENCODING_H
#define LSX_UTILS_ENCODING_H

#include "lsx/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Hexadecimal Encoding/Decoding (C API)
// ============================================================================

/**
 * @brief Encode binary data to hexadecimal string (lowercase)
 *
 * @param data Input binary data
 * @param len Length of input data
 * @param hex Output buffer (must be at least len*2+1 bytes)
 * @param hex_size Size of output buffer
 * @return Number of characters written (excluding null terminator), 0 on error
 */
LSX_API size_t lsx_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size);

/**
 * @brief Encode binary data to hexadecimal string (uppercase)
 */
LSX_API size_t lsx_hex_encode_upper(const uint8_t* data, size_t len, char* hex, size_t hex_size);

/**
 * @brief Decode hexadecimal string to binary data
 *
 * @param hex Input hex string (may contain 0x prefix)
 * @param hex_len Length of hex string (0 for null-terminated)
 * @param data Output buffer
 * @param data_size Size of output buffer
 * @return Number of bytes written, 0 on error
 */
LSX_API size_t lsx_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size);

/**
 * @brief Get hex character value (0-15), returns -1 for invalid
 */
LSX_API int lsx_hex_char_value(char c);

#ifdef __cplusplus
}

#include <string>
#include "lsx/core/types.h"

namespace lsx {

std::string hexEncode(const uint8_t* data, size_t len);
std::string hexEncode(const ByteVec& data);
std::string hexEncodeUpper(const uint8_t* data, size_t len);

template<size_t N>
std::string hexEncode(const ByteArray<N>& data) {
    return hexEncode(data.data(), N);
}

/**
 * @brief Decode hex string (whitespace not allowed)
 * @throws std::invalid_argument on odd length or non-hex characters
 */
ByteVec hexDecode(const std::string& hex);

} // namespace lsx

#endif // __cplusplus

#endif // LSX_UTILS_ENCODING_H
