/**
 * @file security.h
 * @brief Security primitives for lsx - secure memory handling
 *
 * This header provides:
 * - Secure memory zeroing that survives dead-store elimination
 * - Constant-time comparison for digests and tags
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef LSX_CORE_SECURITY_H
#define LSX_CORE_SECURITY_H

#include "lsx/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Constant-time memory comparison
 *
 * Execution time depends only on len, never on the contents.
 *
 * @param a First memory region
 * @param b Second memory region
 * @param len Number of bytes to compare
 * @return 0 if equal, non-zero if different (but NOT the position of difference)
 */
LSX_API int lsx_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Secure memory zeroing
 *
 * Guaranteed not to be optimized away by the compiler.
 *
 * @param ptr Pointer to memory to zero
 * @param len Number of bytes to zero
 */
LSX_API void lsx_secure_zero(void* ptr, size_t len);

#ifdef __cplusplus
} // extern "C"

namespace lsx {
namespace internal {

void secure_zero(void* ptr, size_t len) noexcept;
bool secure_compare(const void* a, const void* b, size_t len) noexcept;

} // namespace internal
} // namespace lsx

#endif // __cplusplus

#endif // LSX_CORE_SECURITY_H
