/**
 * @file twofish.cpp
 * @brief Twofish implementation - C++ Core + C ABI Export
 *
 * Key setup follows the "full keying" option of the Twofish paper: the
 * key-dependent S-boxes and the MDS multiply are folded into four 256-entry
 * word tables, so g() is four lookups and three XORs.
 *
 * All fixed tables (q0, q1, GF(2^8) log/antilog for the RS code) are
 * generated at compile time from their published definitions.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "lsx/crypto/twofish.h"
#include "lsx/core/security.h"
#include "lsx/utils/byte_order.h"
#include <array>
#include <cstring>
#include <stdexcept>

namespace lsx::internal {

using byte_order::get_byte;
using byte_order::load_le32;
using byte_order::store_le32;

// ============================================================================
// q0 / q1 permutations
// ============================================================================

using Nibbles = std::array<uint8_t, 16>;

struct QDefinition {
    Nibbles t0, t1, t2, t3;
};

constexpr QDefinition Q0_DEF = {
    {{0x8, 0x1, 0x7, 0xD, 0x6, 0xF, 0x3, 0x2, 0x0, 0xB, 0x5, 0x9, 0xE, 0xC, 0xA, 0x4}},
    {{0xE, 0xC, 0xB, 0x8, 0x1, 0x2, 0x3, 0x5, 0xF, 0x4, 0xA, 0x6, 0x7, 0x0, 0x9, 0xD}},
    {{0xB, 0xA, 0x5, 0xE, 0x6, 0xD, 0x9, 0x0, 0xC, 0x8, 0xF, 0x3, 0x2, 0x4, 0x7, 0x1}},
    {{0xD, 0x7, 0xF, 0x4, 0x1, 0x2, 0x6, 0xE, 0x9, 0xB, 0x3, 0x0, 0x8, 0x5, 0xC, 0xA}},
};

constexpr QDefinition Q1_DEF = {
    {{0x2, 0x8, 0xB, 0xD, 0xF, 0x7, 0x6, 0xE, 0x3, 0x1, 0x9, 0x4, 0x0, 0xA, 0xC, 0x5}},
    {{0x1, 0xE, 0x2, 0xB, 0x4, 0xC, 0x3, 0x7, 0x6, 0xD, 0xA, 0x5, 0xF, 0x9, 0x0, 0x8}},
    {{0x4, 0xC, 0x7, 0x5, 0x1, 0x6, 0x9, 0xA, 0x0, 0xE, 0xD, 0x8, 0x2, 0xB, 0x3, 0xF}},
    {{0xB, 0x9, 0x5, 0x1, 0xC, 0x3, 0xD, 0xE, 0x6, 0x4, 0x7, 0xF, 0x2, 0x0, 0x8, 0xA}},
};

constexpr uint8_t ror4(uint8_t x) {
    return static_cast<uint8_t>(((x >> 1) | (x << 3)) & 0x0F);
}

// Two Feistel-like nibble rounds, see section 4.3.5 of the paper
constexpr uint8_t q_permute(const QDefinition& q, uint8_t x) {
    uint8_t a0 = x >> 4;
    uint8_t b0 = x & 0x0F;
    uint8_t a1 = a0 ^ b0;
    uint8_t b1 = static_cast<uint8_t>(a0 ^ ror4(b0) ^ ((a0 << 3) & 0x0F));
    uint8_t a2 = q.t0[a1];
    uint8_t b2 = q.t1[b1];
    uint8_t a3 = a2 ^ b2;
    uint8_t b3 = static_cast<uint8_t>(a2 ^ ror4(b2) ^ ((a2 << 3) & 0x0F));
    uint8_t a4 = q.t2[a3];
    uint8_t b4 = q.t3[b3];
    return static_cast<uint8_t>((b4 << 4) | a4);
}

constexpr std::array<uint8_t, 256> make_q(const QDefinition& q) {
    std::array<uint8_t, 256> out{};
    for (size_t i = 0; i < 256; i++) {
        out[i] = q_permute(q, static_cast<uint8_t>(i));
    }
    return out;
}

constexpr std::array<uint8_t, 256> Q0 = make_q(Q0_DEF);
constexpr std::array<uint8_t, 256> Q1 = make_q(Q1_DEF);

static_assert(Q0[0x00] == 0xA9 && Q0[0xFF] == 0xE0, "q0 construction");
static_assert(Q1[0x00] == 0x75 && Q1[0xFF] == 0x91, "q1 construction");

// ============================================================================
// GF(2^8) arithmetic
// ============================================================================

constexpr unsigned MDS_POLY = 0x169;  // x^8 + x^6 + x^5 + x^3 + 1
constexpr unsigned RS_POLY = 0x14D;   // x^8 + x^6 + x^3 + x^2 + 1

/**
 * @brief Constant-time multiply in GF(2^8) modulo `poly`
 */
constexpr uint8_t gf_mul(uint8_t a, uint8_t b, unsigned poly) {
    unsigned result = 0;
    unsigned temp = a;
    for (int i = 0; i < 8; i++) {
        unsigned mask = 0u - ((b >> i) & 1u);
        result ^= (temp & mask);
        unsigned hi_mask = 0u - ((temp >> 7) & 1u);
        temp = ((temp << 1) ^ (poly & hi_mask)) & 0xFF;
    }
    return static_cast<uint8_t>(result);
}

struct GfLogTables {
    std::array<uint8_t, 255> exp;
    std::array<uint8_t, 256> log;
};

// x generates the multiplicative group since RS_POLY is primitive
constexpr GfLogTables make_rs_log_tables() {
    GfLogTables t{};
    uint8_t x = 1;
    for (size_t i = 0; i < 255; i++) {
        t.exp[i] = x;
        t.log[x] = static_cast<uint8_t>(i);
        x = gf_mul(x, 0x02, RS_POLY);
    }
    return t;
}

constexpr GfLogTables RS_LOG = make_rs_log_tables();

constexpr bool log_tables_complete(const GfLogTables& t) {
    for (size_t i = 1; i < 256; i++) {
        if (t.exp[t.log[i]] != i) return false;
    }
    return true;
}

static_assert(log_tables_complete(RS_LOG), "RS polynomial must be primitive");

inline uint8_t rs_mul(uint8_t a, uint8_t b) noexcept {
    if (a == 0 || b == 0) return 0;
    return RS_LOG.exp[(RS_LOG.log[a] + RS_LOG.log[b]) % 255];
}

// ============================================================================
// Reed-Solomon and MDS matrices
// ============================================================================

constexpr uint8_t RS[4][8] = {
    {0x01, 0xA4, 0x55, 0x87, 0x5A, 0x58, 0xDB, 0x9E},
    {0xA4, 0x56, 0x82, 0xF3, 0x1E, 0xC6, 0x68, 0xE5},
    {0x02, 0xA1, 0xFC, 0xC1, 0x47, 0xAE, 0x3D, 0x19},
    {0xA4, 0x55, 0x87, 0x5A, 0x58, 0xDB, 0x9E, 0x03},
};

constexpr uint8_t MDS[4][4] = {
    {0x01, 0xEF, 0x5B, 0x5B},
    {0x5B, 0xEF, 0xEF, 0x01},
    {0xEF, 0x5B, 0x01, 0xEF},
    {0xEF, 0x01, 0xEF, 0x5B},
};

/**
 * @brief Multiply one input byte by MDS column `col`, packed little-endian
 */
inline uint32_t mds_column(size_t col, uint8_t v) noexcept {
    uint32_t out = 0;
    for (size_t row = 0; row < 4; row++) {
        out |= static_cast<uint32_t>(gf_mul(MDS[row][col], v, MDS_POLY)) << (8 * row);
    }
    return out;
}

/**
 * @brief One S-vector word from an 8-byte key chunk
 */
inline uint32_t rs_encode(const uint8_t chunk[8]) noexcept {
    uint32_t out = 0;
    for (size_t row = 0; row < 4; row++) {
        uint8_t acc = 0;
        for (size_t col = 0; col < 8; col++) {
            acc ^= rs_mul(RS[row][col], chunk[col]);
        }
        out |= static_cast<uint32_t>(acc) << (8 * row);
    }
    return out;
}

// ============================================================================
// h function
// ============================================================================

/**
 * @brief The q-permutation cascade of h(), byte-wise, before the MDS
 * @param y In: the four input bytes. Out: the bytes fed to the MDS.
 * @param L Key words L[0..k-1]
 * @param k Key length in 64-bit units (2, 3 or 4)
 */
inline void h_cascade(uint8_t y[4], const uint32_t* L, size_t k) noexcept {
    if (k == 4) {
        y[0] = Q1[y[0]] ^ get_byte(L[3], 0);
        y[1] = Q0[y[1]] ^ get_byte(L[3], 1);
        y[2] = Q0[y[2]] ^ get_byte(L[3], 2);
        y[3] = Q1[y[3]] ^ get_byte(L[3], 3);
    }
    if (k >= 3) {
        y[0] = Q1[y[0]] ^ get_byte(L[2], 0);
        y[1] = Q1[y[1]] ^ get_byte(L[2], 1);
        y[2] = Q0[y[2]] ^ get_byte(L[2], 2);
        y[3] = Q0[y[3]] ^ get_byte(L[2], 3);
    }
    y[0] = Q1[Q0[Q0[y[0]] ^ get_byte(L[1], 0)] ^ get_byte(L[0], 0)];
    y[1] = Q0[Q0[Q1[y[1]] ^ get_byte(L[1], 1)] ^ get_byte(L[0], 1)];
    y[2] = Q1[Q1[Q0[y[2]] ^ get_byte(L[1], 2)] ^ get_byte(L[0], 2)];
    y[3] = Q0[Q1[Q1[y[3]] ^ get_byte(L[1], 3)] ^ get_byte(L[0], 3)];
}

inline uint32_t h(uint32_t x, const uint32_t* L, size_t k) noexcept {
    uint8_t y[4] = {get_byte(x, 0), get_byte(x, 1), get_byte(x, 2), get_byte(x, 3)};
    h_cascade(y, L, k);
    return mds_column(0, y[0]) ^ mds_column(1, y[1]) ^
           mds_column(2, y[2]) ^ mds_column(3, y[3]);
}

// ============================================================================
// Key schedule
// ============================================================================

void twofish_key_schedule(lsx_twofish_ctx_t* ctx, const uint8_t* key, size_t key_len) noexcept {
    const size_t k = key_len / 8;

    uint32_t me[4] = {0};
    uint32_t mo[4] = {0};
    uint32_t s[4] = {0};

    for (size_t i = 0; i < k; i++) {
        me[i] = load_le32(key + 8 * i);
        mo[i] = load_le32(key + 8 * i + 4);
        // S-vector is consumed in reverse chunk order
        s[k - 1 - i] = rs_encode(key + 8 * i);
    }

    for (size_t x = 0; x < 256; x++) {
        uint8_t y[4] = {static_cast<uint8_t>(x), static_cast<uint8_t>(x),
                        static_cast<uint8_t>(x), static_cast<uint8_t>(x)};
        h_cascade(y, s, k);
        for (size_t lane = 0; lane < 4; lane++) {
            ctx->sbox[lane][x] = mds_column(lane, y[lane]);
        }
        secure_zero(y, sizeof(y));
    }

    constexpr uint32_t RHO = 0x01010101;
    uint32_t subkeys[40];
    for (uint32_t i = 0; i < 20; i++) {
        uint32_t a = h(2 * i * RHO, me, k);
        uint32_t b = LSX_ROTL32(h((2 * i + 1) * RHO, mo, k), 8);
        subkeys[2 * i] = a + b;
        subkeys[2 * i + 1] = LSX_ROTL32(a + 2 * b, 9);
    }

    std::memcpy(ctx->whitening, subkeys, sizeof(ctx->whitening));
    std::memcpy(ctx->round_keys, subkeys + 8, sizeof(ctx->round_keys));
    ctx->key_bits = static_cast<int>(key_len * 8);

    secure_zero(subkeys, sizeof(subkeys));
    secure_zero(me, sizeof(me));
    secure_zero(mo, sizeof(mo));
    secure_zero(s, sizeof(s));
}

// ============================================================================
// Block transform
// ============================================================================

inline uint32_t g(const lsx_twofish_ctx_t* ctx, uint32_t x) noexcept {
    return ctx->sbox[0][get_byte(x, 0)] ^ ctx->sbox[1][get_byte(x, 1)] ^
           ctx->sbox[2][get_byte(x, 2)] ^ ctx->sbox[3][get_byte(x, 3)];
}

void twofish_encrypt(const lsx_twofish_ctx_t* ctx, const uint8_t in[16], uint8_t out[16]) noexcept {
    const uint32_t* w = ctx->whitening;
    const uint32_t* rk = ctx->round_keys;

    uint32_t r0 = load_le32(in) ^ w[0];
    uint32_t r1 = load_le32(in + 4) ^ w[1];
    uint32_t r2 = load_le32(in + 8) ^ w[2];
    uint32_t r3 = load_le32(in + 12) ^ w[3];

    for (size_t r = 0; r < LSX_TWOFISH_ROUNDS / 2; r++) {
        uint32_t t0 = g(ctx, r0);
        uint32_t t1 = g(ctx, LSX_ROTL32(r1, 8));
        r2 = LSX_ROTR32(r2 ^ (t0 + t1 + rk[4 * r]), 1);
        r3 = LSX_ROTL32(r3, 1) ^ (t0 + 2 * t1 + rk[4 * r + 1]);

        t0 = g(ctx, r2);
        t1 = g(ctx, LSX_ROTL32(r3, 8));
        r0 = LSX_ROTR32(r0 ^ (t0 + t1 + rk[4 * r + 2]), 1);
        r1 = LSX_ROTL32(r1, 1) ^ (t0 + 2 * t1 + rk[4 * r + 3]);
    }

    // Undo the final swap
    store_le32(out, r2 ^ w[4]);
    store_le32(out + 4, r3 ^ w[5]);
    store_le32(out + 8, r0 ^ w[6]);
    store_le32(out + 12, r1 ^ w[7]);
}

void twofish_decrypt(const lsx_twofish_ctx_t* ctx, const uint8_t in[16], uint8_t out[16]) noexcept {
    const uint32_t* w = ctx->whitening;
    const uint32_t* rk = ctx->round_keys;

    uint32_t r2 = load_le32(in) ^ w[4];
    uint32_t r3 = load_le32(in + 4) ^ w[5];
    uint32_t r0 = load_le32(in + 8) ^ w[6];
    uint32_t r1 = load_le32(in + 12) ^ w[7];

    for (size_t r = LSX_TWOFISH_ROUNDS / 2; r-- > 0;) {
        uint32_t t0 = g(ctx, r2);
        uint32_t t1 = g(ctx, LSX_ROTL32(r3, 8));
        r0 = LSX_ROTL32(r0, 1) ^ (t0 + t1 + rk[4 * r + 2]);
        r1 = LSX_ROTR32(r1 ^ (t0 + 2 * t1 + rk[4 * r + 3]), 1);

        t0 = g(ctx, r0);
        t1 = g(ctx, LSX_ROTL32(r1, 8));
        r2 = LSX_ROTL32(r2, 1) ^ (t0 + t1 + rk[4 * r]);
        r3 = LSX_ROTR32(r3 ^ (t0 + 2 * t1 + rk[4 * r + 1]), 1);
    }

    store_le32(out, r0 ^ w[0]);
    store_le32(out + 4, r1 ^ w[1]);
    store_le32(out + 8, r2 ^ w[2]);
    store_le32(out + 12, r3 ^ w[3]);
}

} // namespace lsx::internal

// ============================================================================
// C API Implementation
// ============================================================================

extern "C" {

lsx_error_t lsx_twofish_init(lsx_twofish_ctx_t* ctx, const uint8_t* key, size_t key_len) {
    if (!ctx || !key) {
        return LSX_ERROR_INVALID_PARAM;
    }
    if (key_len != LSX_TWOFISH_128_KEY_SIZE && key_len != LSX_TWOFISH_192_KEY_SIZE &&
        key_len != LSX_TWOFISH_256_KEY_SIZE) {
        return LSX_ERROR_INVALID_KEY;
    }

    std::memset(ctx, 0, sizeof(*ctx));
    lsx::internal::twofish_key_schedule(ctx, key, key_len);
    return LSX_SUCCESS;
}

lsx_error_t lsx_twofish_init128(lsx_twofish_ctx_t* ctx, const uint8_t key[LSX_TWOFISH_128_KEY_SIZE]) {
    return lsx_twofish_init(ctx, key, LSX_TWOFISH_128_KEY_SIZE);
}

lsx_error_t lsx_twofish_init192(lsx_twofish_ctx_t* ctx, const uint8_t key[LSX_TWOFISH_192_KEY_SIZE]) {
    return lsx_twofish_init(ctx, key, LSX_TWOFISH_192_KEY_SIZE);
}

lsx_error_t lsx_twofish_init256(lsx_twofish_ctx_t* ctx, const uint8_t key[LSX_TWOFISH_256_KEY_SIZE]) {
    return lsx_twofish_init(ctx, key, LSX_TWOFISH_256_KEY_SIZE);
}

lsx_error_t lsx_twofish_encrypt_block(const lsx_twofish_ctx_t* ctx,
                                      const uint8_t input[16], uint8_t output[16]) {
    if (!ctx || !input || !output || ctx->key_bits == 0) {
        return LSX_ERROR_INVALID_PARAM;
    }

    lsx::internal::twofish_encrypt(ctx, input, output);
    return LSX_SUCCESS;
}

lsx_error_t lsx_twofish_decrypt_block(const lsx_twofish_ctx_t* ctx,
                                      const uint8_t input[16], uint8_t output[16]) {
    if (!ctx || !input || !output || ctx->key_bits == 0) {
        return LSX_ERROR_INVALID_PARAM;
    }

    lsx::internal::twofish_decrypt(ctx, input, output);
    return LSX_SUCCESS;
}

void lsx_twofish_clear(lsx_twofish_ctx_t* ctx) {
    if (ctx) {
        lsx_secure_zero(ctx, sizeof(lsx_twofish_ctx_t));
    }
}

} // extern "C"

// ============================================================================
// C++ Class Implementation
// ============================================================================

namespace lsx {

Twofish::Twofish(const ByteVec& key) : Twofish(key.data(), key.size()) {}

Twofish::Twofish(const uint8_t* key, size_t key_len) {
    lsx_error_t err = lsx_twofish_init(&ctx_, key, key_len);
    if (err != LSX_SUCCESS) {
        throw std::invalid_argument(lsx_error_string(err));
    }
}

Twofish::Twofish(const Twofish128Key& key) : Twofish(key.data(), key.size()) {}

Twofish::Twofish(const Twofish192Key& key) : Twofish(key.data(), key.size()) {}

Twofish::Twofish(const Twofish256Key& key) : Twofish(key.data(), key.size()) {}

Twofish::~Twofish() {
    lsx_twofish_clear(&ctx_);
}

Twofish::Twofish(Twofish&& other) noexcept {
    std::memcpy(&ctx_, &other.ctx_, sizeof(ctx_));
    lsx_secure_zero(&other.ctx_, sizeof(other.ctx_));
}

Twofish& Twofish::operator=(Twofish&& other) noexcept {
    if (this != &other) {
        lsx_twofish_clear(&ctx_);
        std::memcpy(&ctx_, &other.ctx_, sizeof(ctx_));
        lsx_secure_zero(&other.ctx_, sizeof(other.ctx_));
    }
    return *this;
}

TwofishBlock Twofish::encryptBlock(const TwofishBlock& input) const {
    TwofishBlock output;
    if (lsx_twofish_encrypt_block(&ctx_, input.data(), output.data()) != LSX_SUCCESS) {
        throw std::logic_error("Twofish instance has been moved from");
    }
    return output;
}

TwofishBlock Twofish::decryptBlock(const TwofishBlock& input) const {
    TwofishBlock output;
    if (lsx_twofish_decrypt_block(&ctx_, input.data(), output.data()) != LSX_SUCCESS) {
        throw std::logic_error("Twofish instance has been moved from");
    }
    return output;
}

} // namespace lsx
