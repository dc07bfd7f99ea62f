/**
 * @file types.h
 * @brief Type definitions for lsx library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef LSX_CORE_TYPES_H
#define LSX_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus

#include <vector>
#include <array>

namespace lsx {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Twofish key sizes
using Twofish128Key = ByteArray<16>;
using Twofish192Key = ByteArray<24>;
using Twofish256Key = ByteArray<32>;

// Cipher block
using TwofishBlock = ByteArray<16>;

// Hash digests
using Sha256Digest = ByteArray<32>;

} // namespace lsx

#endif // __cplusplus

#endif // LSX_CORE_TYPES_H
