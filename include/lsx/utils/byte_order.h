/**
 * @file byte_order.h
 * @brief Byte order load/store helpers
 *
 * SHA-256 reads and writes its words big-endian (FIPS 180-4), Twofish
 * reads and writes little-endian. These helpers work on byte arrays so the
 * result is independent of host endianness and alignment.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef LSX_UTILS_BYTE_ORDER_H
#define LSX_UTILS_BYTE_ORDER_H

#include "lsx/core/common.h"
#include <cstdint>
#include <cstddef>

namespace lsx {
namespace byte_order {

inline uint32_t load_be32(const uint8_t* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

inline void store_be32(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

inline void store_be64(uint8_t* p, uint64_t v) noexcept {
    store_be32(p, static_cast<uint32_t>(v >> 32));
    store_be32(p + 4, static_cast<uint32_t>(v));
}

inline uint32_t load_le32(const uint8_t* p) noexcept {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline void store_le32(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

/**
 * @brief Extract byte n (0 = least significant) of a 32-bit word
 */
inline uint8_t get_byte(uint32_t v, unsigned n) noexcept {
    return static_cast<uint8_t>(v >> (8 * n));
}

} // namespace byte_order
} // namespace lsx

#endif // LSX_UTILS_BYTE_ORDER_H
