/**
 * @file sha256.h
 * @brief SHA-256 Hash Algorithm - Public C API and C++ wrappers
 *
 * FIPS 180-4 compliant SHA-256 in three layers:
 * - Raw engine: accepts whole 64-byte blocks only, pads on finish
 * - Buffered hasher: accepts input of any length in any chunking
 * - One-shot API for convenience
 *
 * A single state may absorb less than 2^61 bytes. Calls that would reach
 * the ceiling fail and leave the state untouched.
 *
 * @author knightc
 * @version 1.1.0
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef LSX_CRYPTO_SHA256_H
#define LSX_CRYPTO_SHA256_H

#include "lsx/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Constants
// ============================================================================

/** Maximum number of bytes one state may absorb (exclusive) */
#define LSX_SHA256_MAX_BYTES (1ULL << 61)

// ============================================================================
// Types
// ============================================================================

/**
 * @brief Raw SHA-256 state (block-aligned input only)
 */
typedef struct lsx_sha256_raw_ctx_s {
    uint32_t state[8];          /**< Chaining value */
    uint64_t count;             /**< Total bytes compressed */
    int finalized;              /**< Non-zero once finish has run */
} lsx_sha256_raw_ctx_t;

/**
 * @brief Buffered SHA-256 context
 */
typedef struct lsx_sha256_ctx_s {
    lsx_sha256_raw_ctx_t raw;   /**< Underlying engine */
    uint8_t buffer[64];         /**< Pending partial block */
    size_t buflen;              /**< Bytes pending in buffer (< 64) */
} lsx_sha256_ctx_t;

// ============================================================================
// C API Functions: Raw engine
// ============================================================================

/**
 * @brief Initialize raw SHA-256 state
 * @param ctx State to initialize
 * @return LSX_SUCCESS or LSX_ERROR_INVALID_PARAM
 */
LSX_API lsx_error_t lsx_sha256_raw_init(lsx_sha256_raw_ctx_t* ctx);

/**
 * @brief Compress whole blocks into the state
 * @param ctx Initialized state
 * @param data Input data
 * @param len Input length, must be a multiple of 64
 * @return LSX_SUCCESS, LSX_ERROR_UNALIGNED_INPUT, LSX_ERROR_LIMIT_EXCEEDED,
 *         LSX_ERROR_CONTEXT_FINALIZED or LSX_ERROR_INVALID_PARAM
 */
LSX_API lsx_error_t lsx_sha256_raw_update(lsx_sha256_raw_ctx_t* ctx,
                                          const uint8_t* data, size_t len);

/**
 * @brief Absorb trailing data of any length, pad, and produce digest
 *
 * The state is wiped and marked finalized on success.
 *
 * @param ctx Initialized state
 * @param data Trailing input (may be NULL when len is 0)
 * @param len Trailing input length
 * @param digest Output buffer (32 bytes)
 */
LSX_API lsx_error_t lsx_sha256_raw_final(lsx_sha256_raw_ctx_t* ctx,
                                         const uint8_t* data, size_t len,
                                         uint8_t digest[LSX_SHA256_DIGEST_SIZE]);

/**
 * @brief Securely clear raw state
 */
LSX_API void lsx_sha256_raw_clear(lsx_sha256_raw_ctx_t* ctx);

// ============================================================================
// C API Functions: Buffered hasher
// ============================================================================

/**
 * @brief Initialize SHA-256 context
 * @param ctx Context to initialize
 */
LSX_API lsx_error_t lsx_sha256_init(lsx_sha256_ctx_t* ctx);

/**
 * @brief Update SHA-256 context with data of any length
 * @param ctx Initialized context
 * @param data Input data
 * @param len Input length in bytes
 */
LSX_API lsx_error_t lsx_sha256_update(lsx_sha256_ctx_t* ctx,
                                      const uint8_t* data, size_t len);

/**
 * @brief Absorb optional trailing data and produce digest
 * @param ctx Context (wiped and marked finalized after)
 * @param data Trailing input (may be NULL when len is 0)
 * @param len Trailing input length
 * @param digest Output buffer (32 bytes)
 */
LSX_API lsx_error_t lsx_sha256_final(lsx_sha256_ctx_t* ctx,
                                     const uint8_t* data, size_t len,
                                     uint8_t digest[LSX_SHA256_DIGEST_SIZE]);

/**
 * @brief Compute SHA-256 hash in one call
 * @param data Input data
 * @param len Input length in bytes
 * @param digest Output buffer (32 bytes)
 */
LSX_API lsx_error_t lsx_sha256(const uint8_t* data, size_t len,
                               uint8_t digest[LSX_SHA256_DIGEST_SIZE]);

/**
 * @brief Securely clear SHA-256 context
 * @param ctx Context to clear
 */
LSX_API void lsx_sha256_clear(lsx_sha256_ctx_t* ctx);

#ifdef __cplusplus
}

#include <string>
#include "lsx/core/types.h"

namespace lsx {

/**
 * @brief Block-aligned SHA-256 engine
 *
 * Copyable: a copy taken after a shared prefix can be finished
 * independently of the original.
 */
class RawSha256 {
public:
    RawSha256();
    ~RawSha256();

    RawSha256(const RawSha256&) = default;
    RawSha256& operator=(const RawSha256&) = default;

    /**
     * @brief Compress whole blocks
     * @throws std::invalid_argument if len is not a multiple of 64
     * @throws std::length_error if the 2^61 byte ceiling would be reached
     * @throws std::logic_error after finish
     */
    void update(const uint8_t* data, size_t len);
    void update(const ByteVec& data);

    /**
     * @brief Absorb trailing data of any length and return the digest
     * @throws std::length_error if the 2^61 byte ceiling would be reached
     * @throws std::logic_error after finish
     */
    Sha256Digest finish(const uint8_t* data, size_t len);
    Sha256Digest finish(const ByteVec& data);
    Sha256Digest finish();

    uint64_t bytesProcessed() const noexcept { return ctx_.count; }
    bool finalized() const noexcept { return ctx_.finalized != 0; }

private:
    lsx_sha256_raw_ctx_t ctx_;
};

/**
 * @brief Buffered SHA-256 hasher accepting arbitrary chunking
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = default;
    Sha256& operator=(const Sha256&) = default;

    /**
     * @throws std::length_error if the 2^61 byte ceiling would be reached
     * @throws std::logic_error after finish
     */
    void update(const uint8_t* data, size_t len);
    void update(const ByteVec& data);
    void update(const std::string& data);

    Sha256Digest finish(const uint8_t* data, size_t len);
    Sha256Digest finish(const ByteVec& data);
    Sha256Digest finish(const std::string& data);
    Sha256Digest finish();

    uint64_t bytesProcessed() const noexcept { return ctx_.raw.count + ctx_.buflen; }
    bool finalized() const noexcept { return ctx_.raw.finalized != 0; }

private:
    lsx_sha256_ctx_t ctx_;
};

namespace sha256 {

constexpr size_t BLOCK_BYTES = LSX_SHA256_BLOCK_SIZE;
constexpr size_t DIGEST_BYTES = LSX_SHA256_DIGEST_SIZE;

Sha256Digest hash(const uint8_t* data, size_t len);
Sha256Digest hash(const ByteVec& data);
Sha256Digest hash(const std::string& data);

} // namespace sha256

} // namespace lsx

#endif // __cplusplus

#endif // LSX_CRYPTO_SHA256_H
