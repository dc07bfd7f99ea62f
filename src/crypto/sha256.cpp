/**
 * @file sha256.cpp
 * @brief SHA-256 Implementation - C++ Core + C ABI Export
 *
 * FIPS 180-4 compliant SHA-256.
 * Architecture: C++ internal implementation + extern "C" API export.
 *
 * Features:
 * - Block-aligned raw engine with padding on finish
 * - Buffered hasher for arbitrary chunking
 * - 2^61 byte ceiling checked before any state is touched
 * - Secure memory clearing on finalization
 *
 * Reference:
 * - [FIPS 180-4] https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "lsx/crypto/sha256.h"
#include "lsx/core/security.h"
#include "lsx/utils/byte_order.h"
#include <array>
#include <cstring>
#include <cstdint>
#include <stdexcept>

// ============================================================================
// C++ Internal Implementation
// ============================================================================

namespace lsx::internal {

/**
 * @brief SHA-256 round constants (cube roots of first 64 primes)
 */
alignas(16) constexpr std::array<uint32_t, 64> K256 = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

/**
 * @brief SHA-256 initial hash values (square roots of first 8 primes)
 */
constexpr std::array<uint32_t, 8> H256_INIT = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

constexpr size_t BLOCK = LSX_SHA256_BLOCK_SIZE;
constexpr uint64_t MAX_BYTES = LSX_SHA256_MAX_BYTES;

// Helper functions
#define ROR(x, n) (((x) >> (n)) | ((x) << (32 - (n))))
#define CH(x, y, z)  (((x) & (y)) ^ (~(x) & (z)))
#define MAJ(x, y, z) (((x) & (y)) ^ ((x) & (z)) ^ ((y) & (z)))
#define EP0(x) (ROR(x, 2) ^ ROR(x, 13) ^ ROR(x, 22))
#define EP1(x) (ROR(x, 6) ^ ROR(x, 11) ^ ROR(x, 25))
#define SIG0(x) (ROR(x, 7) ^ ROR(x, 18) ^ ((x) >> 3))
#define SIG1(x) (ROR(x, 17) ^ ROR(x, 19) ^ ((x) >> 10))

/**
 * @brief SHA-256 compression function
 */
class Sha256Compressor {
public:
    static void transform(uint32_t state[8], const uint8_t block[64]) noexcept {
        uint32_t W[64];
        uint32_t a, b, c, d, e, f, g, h;

        // Message schedule
        for (size_t i = 0; i < 16; i++) {
            W[i] = byte_order::load_be32(block + i * 4);
        }
        for (size_t i = 16; i < 64; i++) {
            W[i] = W[i - 16] + SIG0(W[i - 15]) + W[i - 7] + SIG1(W[i - 2]);
        }

        a = state[0]; b = state[1];
        c = state[2]; d = state[3];
        e = state[4]; f = state[5];
        g = state[6]; h = state[7];

        for (size_t i = 0; i < 64; i++) {
            uint32_t t1 = h + EP1(e) + CH(e, f, g) + K256[i] + W[i];
            uint32_t t2 = EP0(a) + MAJ(a, b, c);
            h = g; g = f; f = e; e = d + t1;
            d = c; c = b; b = a; a = t1 + t2;
        }

        state[0] += a; state[1] += b;
        state[2] += c; state[3] += d;
        state[4] += e; state[5] += f;
        state[6] += g; state[7] += h;

        secure_zero(W, sizeof(W));
    }

    /**
     * @brief Compress a run of whole blocks into the state
     * @note Caller validates alignment and the ceiling, and advances ctx->count
     */
    static void compress_blocks(lsx_sha256_raw_ctx_t* ctx,
                                const uint8_t* data, size_t len) noexcept {
        while (len >= BLOCK) {
            transform(ctx->state, data);
            data += BLOCK;
            len -= BLOCK;
        }
    }
};

#undef ROR
#undef CH
#undef MAJ
#undef EP0
#undef EP1
#undef SIG0
#undef SIG1

// True if absorbing `len` more bytes on top of `used` would reach 2^61
inline bool would_exceed(uint64_t used, size_t len) noexcept {
    return used >= MAX_BYTES || static_cast<uint64_t>(len) >= MAX_BYTES - used;
}

/**
 * @brief Pad the trailing bytes and emit the digest
 * @note Caller has already validated the ceiling; rem_len < 64
 */
void finish_tail(lsx_sha256_raw_ctx_t* ctx, const uint8_t* rem, size_t rem_len,
                 uint8_t digest[LSX_SHA256_DIGEST_SIZE]) noexcept {
    uint8_t block[2 * BLOCK] = {0};
    if (rem_len > 0) {
        std::memcpy(block, rem, rem_len);
    }
    block[rem_len] = 0x80;

    // Remainder of 56..63 bytes leaves no room for the length field
    size_t total = (rem_len > BLOCK - 9) ? 2 * BLOCK : BLOCK;
    uint64_t bit_len = (ctx->count + rem_len) << 3;
    byte_order::store_be64(block + total - 8, bit_len);

    Sha256Compressor::compress_blocks(ctx, block, total);

    for (size_t i = 0; i < 8; i++) {
        byte_order::store_be32(digest + i * 4, ctx->state[i]);
    }

    secure_zero(block, sizeof(block));
    secure_zero(ctx, sizeof(*ctx));
    ctx->finalized = 1;
}

} // namespace lsx::internal

// ============================================================================
// C ABI Export (extern "C")
// ============================================================================

extern "C" {

lsx_error_t lsx_sha256_raw_init(lsx_sha256_raw_ctx_t* ctx) {
    if (!ctx) {
        return LSX_ERROR_INVALID_PARAM;
    }

    std::memcpy(ctx->state, lsx::internal::H256_INIT.data(), sizeof(ctx->state));
    ctx->count = 0;
    ctx->finalized = 0;
    return LSX_SUCCESS;
}

lsx_error_t lsx_sha256_raw_update(lsx_sha256_raw_ctx_t* ctx,
                                  const uint8_t* data, size_t len) {
    if (!ctx || (!data && len > 0)) {
        return LSX_ERROR_INVALID_PARAM;
    }
    if (ctx->finalized) {
        return LSX_ERROR_CONTEXT_FINALIZED;
    }
    if (len % LSX_SHA256_BLOCK_SIZE != 0) {
        return LSX_ERROR_UNALIGNED_INPUT;
    }
    if (len == 0) {
        return LSX_SUCCESS;
    }
    if (lsx::internal::would_exceed(ctx->count, len)) {
        return LSX_ERROR_LIMIT_EXCEEDED;
    }

    lsx::internal::Sha256Compressor::compress_blocks(ctx, data, len);
    ctx->count += len;
    return LSX_SUCCESS;
}

lsx_error_t lsx_sha256_raw_final(lsx_sha256_raw_ctx_t* ctx,
                                 const uint8_t* data, size_t len,
                                 uint8_t digest[LSX_SHA256_DIGEST_SIZE]) {
    if (!ctx || !digest || (!data && len > 0)) {
        return LSX_ERROR_INVALID_PARAM;
    }
    if (ctx->finalized) {
        return LSX_ERROR_CONTEXT_FINALIZED;
    }
    if (lsx::internal::would_exceed(ctx->count, len)) {
        return LSX_ERROR_LIMIT_EXCEEDED;
    }

    size_t rem_len = len % LSX_SHA256_BLOCK_SIZE;
    size_t full = len - rem_len;
    if (full > 0) {
        lsx::internal::Sha256Compressor::compress_blocks(ctx, data, full);
        ctx->count += full;
    }

    lsx::internal::finish_tail(ctx, rem_len > 0 ? data + full : nullptr, rem_len, digest);
    return LSX_SUCCESS;
}

void lsx_sha256_raw_clear(lsx_sha256_raw_ctx_t* ctx) {
    if (ctx) {
        lsx::internal::secure_zero(ctx, sizeof(*ctx));
    }
}

lsx_error_t lsx_sha256_init(lsx_sha256_ctx_t* ctx) {
    if (!ctx) {
        return LSX_ERROR_INVALID_PARAM;
    }

    std::memset(ctx->buffer, 0, sizeof(ctx->buffer));
    ctx->buflen = 0;
    return lsx_sha256_raw_init(&ctx->raw);
}

lsx_error_t lsx_sha256_update(lsx_sha256_ctx_t* ctx,
                              const uint8_t* data, size_t len) {
    using lsx::internal::Sha256Compressor;

    if (!ctx || (!data && len > 0)) {
        return LSX_ERROR_INVALID_PARAM;
    }
    if (ctx->raw.finalized) {
        return LSX_ERROR_CONTEXT_FINALIZED;
    }
    if (len == 0) {
        return LSX_SUCCESS;
    }
    if (lsx::internal::would_exceed(ctx->raw.count + ctx->buflen, len)) {
        return LSX_ERROR_LIMIT_EXCEEDED;
    }

    // Top up a partial block first
    if (ctx->buflen > 0) {
        size_t space = LSX_SHA256_BLOCK_SIZE - ctx->buflen;
        if (len < space) {
            std::memcpy(ctx->buffer + ctx->buflen, data, len);
            ctx->buflen += len;
            return LSX_SUCCESS;
        }
        std::memcpy(ctx->buffer + ctx->buflen, data, space);
        Sha256Compressor::compress_blocks(&ctx->raw, ctx->buffer, LSX_SHA256_BLOCK_SIZE);
        ctx->raw.count += LSX_SHA256_BLOCK_SIZE;
        ctx->buflen = 0;
        data += space;
        len -= space;
    }

    size_t full = len - (len % LSX_SHA256_BLOCK_SIZE);
    if (full > 0) {
        Sha256Compressor::compress_blocks(&ctx->raw, data, full);
        ctx->raw.count += full;
        data += full;
        len -= full;
    }

    if (len > 0) {
        std::memcpy(ctx->buffer, data, len);
        ctx->buflen = len;
    }
    return LSX_SUCCESS;
}

lsx_error_t lsx_sha256_final(lsx_sha256_ctx_t* ctx,
                             const uint8_t* data, size_t len,
                             uint8_t digest[LSX_SHA256_DIGEST_SIZE]) {
    if (!ctx || !digest || (!data && len > 0)) {
        return LSX_ERROR_INVALID_PARAM;
    }
    if (ctx->raw.finalized) {
        return LSX_ERROR_CONTEXT_FINALIZED;
    }

    lsx_error_t err = lsx_sha256_update(ctx, data, len);
    if (err != LSX_SUCCESS) {
        return err;
    }

    err = lsx_sha256_raw_final(&ctx->raw, ctx->buffer, ctx->buflen, digest);
    lsx::internal::secure_zero(ctx->buffer, sizeof(ctx->buffer));
    ctx->buflen = 0;
    return err;
}

lsx_error_t lsx_sha256(const uint8_t* data, size_t len,
                       uint8_t digest[LSX_SHA256_DIGEST_SIZE]) {
    if (!digest || (!data && len > 0)) {
        return LSX_ERROR_INVALID_PARAM;
    }

    lsx_sha256_raw_ctx_t ctx;
    lsx_sha256_raw_init(&ctx);
    return lsx_sha256_raw_final(&ctx, data, len, digest);
}

void lsx_sha256_clear(lsx_sha256_ctx_t* ctx) {
    if (ctx) {
        lsx::internal::secure_zero(ctx, sizeof(*ctx));
    }
}

} // extern "C"

// ============================================================================
// C++ API
// ============================================================================

namespace lsx {

namespace {

void throw_if_error(lsx_error_t err) {
    switch (err) {
        case LSX_SUCCESS:
            return;
        case LSX_ERROR_UNALIGNED_INPUT:
        case LSX_ERROR_INVALID_PARAM:
            throw std::invalid_argument(lsx_error_string(err));
        case LSX_ERROR_LIMIT_EXCEEDED:
            throw std::length_error(lsx_error_string(err));
        case LSX_ERROR_CONTEXT_FINALIZED:
            throw std::logic_error(lsx_error_string(err));
        default:
            throw std::runtime_error(lsx_error_string(err));
    }
}

} // namespace

RawSha256::RawSha256() {
    lsx_sha256_raw_init(&ctx_);
}

RawSha256::~RawSha256() {
    lsx_sha256_raw_clear(&ctx_);
}

void RawSha256::update(const uint8_t* data, size_t len) {
    throw_if_error(lsx_sha256_raw_update(&ctx_, data, len));
}

void RawSha256::update(const ByteVec& data) {
    update(data.data(), data.size());
}

Sha256Digest RawSha256::finish(const uint8_t* data, size_t len) {
    Sha256Digest digest{};
    throw_if_error(lsx_sha256_raw_final(&ctx_, data, len, digest.data()));
    return digest;
}

Sha256Digest RawSha256::finish(const ByteVec& data) {
    return finish(data.data(), data.size());
}

Sha256Digest RawSha256::finish() {
    return finish(nullptr, 0);
}

Sha256::Sha256() {
    lsx_sha256_init(&ctx_);
}

Sha256::~Sha256() {
    lsx_sha256_clear(&ctx_);
}

void Sha256::update(const uint8_t* data, size_t len) {
    throw_if_error(lsx_sha256_update(&ctx_, data, len));
}

void Sha256::update(const ByteVec& data) {
    update(data.data(), data.size());
}

void Sha256::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Sha256Digest Sha256::finish(const uint8_t* data, size_t len) {
    Sha256Digest digest{};
    throw_if_error(lsx_sha256_final(&ctx_, data, len, digest.data()));
    return digest;
}

Sha256Digest Sha256::finish(const ByteVec& data) {
    return finish(data.data(), data.size());
}

Sha256Digest Sha256::finish(const std::string& data) {
    return finish(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Sha256Digest Sha256::finish() {
    return finish(nullptr, 0);
}

namespace sha256 {

Sha256Digest hash(const uint8_t* data, size_t len) {
    Sha256Digest digest{};
    throw_if_error(lsx_sha256(data, len, digest.data()));
    return digest;
}

Sha256Digest hash(const ByteVec& data) {
    return hash(data.data(), data.size());
}

Sha256Digest hash(const std::string& data) {
    return hash(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

} // namespace sha256

} // namespace lsx
