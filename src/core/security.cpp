/**
 * @file security.cpp
 * @brief Security Primitives Implementation
 *
 * Secure zeroing for key schedules, hash states and scratch buffers, plus
 * constant-time comparison for digests.
 *
 * C++ Core + C ABI Architecture
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "lsx/core/security.h"
#include <cstring>
#include <cstdint>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace lsx {
namespace internal {

// ============================================================================
// Compiler Memory Barrier
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#elif defined(_MSC_VER)
#include <intrin.h>
#define COMPILER_BARRIER() _ReadWriteBarrier()
#else
#define COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Memory Operations
// ============================================================================

// Volatile function pointer to prevent optimization
using SecureZeroFn = void (*volatile)(void*, size_t);

static void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

static SecureZeroFn secure_zero_ptr = secure_zero_impl;

void secure_zero(void* ptr, size_t len) noexcept {
    if (!ptr || len == 0) return;

#ifdef _WIN32
    SecureZeroMemory(ptr, len);
#else
    secure_zero_ptr(ptr, len);
#endif

    COMPILER_BARRIER();
}

bool secure_compare(const void* a, const void* b, size_t len) noexcept {
    if (!a || !b) return false;

    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);

    volatile unsigned char diff = 0;

    // Always iterate through all bytes
    for (size_t i = 0; i < len; i++) {
        diff |= static_cast<unsigned char>(pa[i] ^ pb[i]);
    }

    COMPILER_BARRIER();

    return diff == 0;
}

} // namespace internal
} // namespace lsx

// ============================================================================
// C ABI Export
// ============================================================================

extern "C" {

void lsx_secure_zero(void* ptr, size_t len) {
    lsx::internal::secure_zero(ptr, len);
}

int lsx_secure_compare(const void* a, const void* b, size_t len) {
    return lsx::internal::secure_compare(a, b, len) ? 0 : 1;
}

}  // extern "C"
