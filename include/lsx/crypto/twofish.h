/**
 * @file twofish.h
 * @brief Twofish block cipher
 *
 * Twofish with 128/192/256-bit keys and 128-bit blocks. Key setup builds
 * four fully keyed 256-entry S-box tables, so block operations are pure
 * table lookups. A derived context is read-only and may be shared between
 * threads.
 *
 * Only single-block (ECB) operation is provided; chaining modes are left
 * to the caller.
 *
 * Reference:
 * - Schneier et al., "Twofish: A 128-Bit Block Cipher", 1998
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef LSX_CRYPTO_TWOFISH_H
#define LSX_CRYPTO_TWOFISH_H

#include "lsx/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Twofish constants
#define LSX_TWOFISH_ROUNDS      16
#define LSX_TWOFISH_ROUND_KEYS  32

/**
 * @brief Twofish context structure
 */
typedef struct {
    uint32_t sbox[4][256];                      // Key-dependent S-boxes fused with MDS
    uint32_t whitening[8];                      // K0..K7
    uint32_t round_keys[LSX_TWOFISH_ROUND_KEYS]; // K8..K39
    int key_bits;                               // 128, 192 or 256; 0 if not set up
} lsx_twofish_ctx_t;

/**
 * @brief Initialize Twofish context with a key of runtime length
 * @param ctx Context to initialize
 * @param key Key bytes
 * @param key_len Key length (16, 24, or 32 bytes)
 * @return LSX_SUCCESS, LSX_ERROR_INVALID_KEY or LSX_ERROR_INVALID_PARAM
 */
LSX_API lsx_error_t lsx_twofish_init(lsx_twofish_ctx_t* ctx, const uint8_t* key, size_t key_len);

LSX_API lsx_error_t lsx_twofish_init128(lsx_twofish_ctx_t* ctx, const uint8_t key[LSX_TWOFISH_128_KEY_SIZE]);
LSX_API lsx_error_t lsx_twofish_init192(lsx_twofish_ctx_t* ctx, const uint8_t key[LSX_TWOFISH_192_KEY_SIZE]);
LSX_API lsx_error_t lsx_twofish_init256(lsx_twofish_ctx_t* ctx, const uint8_t key[LSX_TWOFISH_256_KEY_SIZE]);

/**
 * @brief Encrypt single 16-byte block
 * @note input and output may alias
 */
LSX_API lsx_error_t lsx_twofish_encrypt_block(const lsx_twofish_ctx_t* ctx,
                                              const uint8_t input[16], uint8_t output[16]);

/**
 * @brief Decrypt single 16-byte block
 * @note input and output may alias
 */
LSX_API lsx_error_t lsx_twofish_decrypt_block(const lsx_twofish_ctx_t* ctx,
                                              const uint8_t input[16], uint8_t output[16]);

/**
 * @brief Securely clear Twofish context
 */
LSX_API void lsx_twofish_clear(lsx_twofish_ctx_t* ctx);

#ifdef __cplusplus
}

#include "lsx/core/types.h"

namespace lsx {

/**
 * @brief Twofish cipher class
 */
class Twofish {
public:
    /**
     * @brief Construct Twofish instance with key
     * @param key Encryption key (128, 192, or 256 bits)
     * @throws std::invalid_argument on any other key length
     */
    explicit Twofish(const ByteVec& key);
    explicit Twofish(const uint8_t* key, size_t key_len);

    explicit Twofish(const Twofish128Key& key);
    explicit Twofish(const Twofish192Key& key);
    explicit Twofish(const Twofish256Key& key);

    ~Twofish();

    // Disable copy
    Twofish(const Twofish&) = delete;
    Twofish& operator=(const Twofish&) = delete;

    // Enable move
    Twofish(Twofish&& other) noexcept;
    Twofish& operator=(Twofish&& other) noexcept;

    TwofishBlock encryptBlock(const TwofishBlock& input) const;
    TwofishBlock decryptBlock(const TwofishBlock& input) const;

    int keyBits() const noexcept { return ctx_.key_bits; }

    const lsx_twofish_ctx_t& context() const noexcept { return ctx_; }

private:
    lsx_twofish_ctx_t ctx_;
};

} // namespace lsx

#endif // __cplusplus

#endif // LSX_CRYPTO_TWOFISH_H
