/**
 * @file lsx.h
 * @brief lsx - SHA-256 and Twofish primitives
 *
 * Unified header for the whole library.
 *
 * Modules:
 * - Core: error codes, secure zeroing, constant-time compare, self tests
 * - Hash: RawSha256 (block-aligned), Sha256 (buffered), sha256::hash
 * - Cipher: Twofish (128/192/256-bit keys, single-block ECB)
 * - Utils: hex encoding
 *
 * Every module exposes a C ABI (lsx_* functions returning lsx_error_t)
 * and a C++ wrapper in namespace lsx that throws on failure.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef LSX_H
#define LSX_H

#include "lsx/version.h"

// ============================================================================
// Core Modules
// ============================================================================

#include "lsx/core/common.h"
#include "lsx/core/types.h"
#include "lsx/core/security.h"
#include "lsx/core/selftest.h"

// ============================================================================
// Cryptographic Modules
// ============================================================================

#include "lsx/crypto/sha256.h"      // RawSha256, Sha256, sha256::hash
#include "lsx/crypto/twofish.h"     // Twofish

// ============================================================================
// Utilities
// ============================================================================

#include "lsx/utils/encoding.h"     // hexEncode, hexDecode

// ============================================================================
// Quick Start Examples
// ============================================================================

/**
 * @example hash_example.cpp
 * @code
 * #include "lsx/lsx.h"
 *
 * // One-shot
 * auto digest = lsx::sha256::hash(std::string("abc"));
 *
 * // Incremental, any chunking
 * lsx::Sha256 hasher;
 * hasher.update(part1);
 * hasher.update(part2);
 * auto digest2 = hasher.finish(part3);
 * @endcode
 *
 * @example twofish_example.cpp
 * @code
 * #include "lsx/lsx.h"
 *
 * lsx::Twofish256Key key = {...};
 * lsx::Twofish cipher(key);
 * lsx::TwofishBlock ct = cipher.encryptBlock(pt);
 * lsx::TwofishBlock back = cipher.decryptBlock(ct);
 * @endcode
 */

#endif // LSX_H
