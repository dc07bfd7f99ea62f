/**
 * @file common.h
 * @brief Common definitions and utility macros for lsx library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef LSX_CORE_COMMON_H
#define LSX_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define LSX_PLATFORM_WINDOWS 1
    #define LSX_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define LSX_PLATFORM_LINUX 1
    #define LSX_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define LSX_PLATFORM_MACOS 1
    #define LSX_PLATFORM_NAME "macOS"
#else
    #define LSX_PLATFORM_UNKNOWN 1
    #define LSX_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef LSX_PLATFORM_WINDOWS
    #ifdef LSX_SHARED_LIBRARY
        #ifdef LSX_BUILDING
            #define LSX_API __declspec(dllexport)
        #else
            #define LSX_API __declspec(dllimport)
        #endif
    #else
        #define LSX_API
    #endif
#else
    #ifdef LSX_SHARED_LIBRARY
        #define LSX_API __attribute__((visibility("default")))
    #else
        #define LSX_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    LSX_SUCCESS = 0,
    LSX_ERROR_INVALID_PARAM = -1,       // Null pointer or uninitialized context
    LSX_ERROR_INVALID_KEY = -2,         // Key length is not 16, 24 or 32 bytes
    LSX_ERROR_UNALIGNED_INPUT = -3,     // Raw hash input not a multiple of the block size
    LSX_ERROR_LIMIT_EXCEEDED = -4,      // Hashing ceiling (2^61 bytes) reached
    LSX_ERROR_CONTEXT_FINALIZED = -5,   // Hash state already consumed by finish
    LSX_ERROR_INTERNAL = -10
} lsx_error_t;

// Key sizes
#define LSX_TWOFISH_128_KEY_SIZE 16
#define LSX_TWOFISH_192_KEY_SIZE 24
#define LSX_TWOFISH_256_KEY_SIZE 32
#define LSX_TWOFISH_BLOCK_SIZE   16

// Hash sizes
#define LSX_SHA256_DIGEST_SIZE 32
#define LSX_SHA256_BLOCK_SIZE  64

// Rotate operations
#define LSX_ROTL32(x, n) ((uint32_t)(((x) << (n)) | ((x) >> (32 - (n)))))
#define LSX_ROTR32(x, n) ((uint32_t)(((x) >> (n)) | ((x) << (32 - (n)))))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
LSX_API const char* lsx_error_string(lsx_error_t error);

/**
 * @brief Library version string ("major.minor.patch")
 */
LSX_API const char* lsx_version(void);

/**
 * @brief Name of the platform the library was built for
 */
LSX_API const char* lsx_platform(void);

#ifdef __cplusplus
}
#endif

#endif // LSX_CORE_COMMON_H
