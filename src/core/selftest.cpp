/**
 * @file selftest.cpp
 * @brief Built-in known-answer self tests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "lsx/core/selftest.h"
#include "lsx/crypto/sha256.h"
#include "lsx/crypto/twofish.h"
#include "lsx/utils/encoding.h"

#include <algorithm>
#include <exception>
#include <new>
#include <utility>

namespace lsx {
namespace selftest {

namespace {

struct HashVector {
    const char* name;
    const char* message;
    const char* digest;
};

struct CipherVector {
    const char* name;
    const char* key;
    const char* plaintext;
    const char* ciphertext;
};

const HashVector HASH_VECTORS[] = {
    {"SHA-256 empty", "",
     "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"},
    {"SHA-256 abc", "abc",
     "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},
    {"SHA-256 448-bit", "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq",
     "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1"},
    {"SHA-256 896-bit",
     "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmnhijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu",
     "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1"},
};

const CipherVector CIPHER_VECTORS[] = {
    {"Twofish-128",
     "00000000000000000000000000000000",
     "00000000000000000000000000000000",
     "9f589f5cf6122c32b6bfec2f2ae8c35a"},
    {"Twofish-192",
     "0123456789abcdeffedcba98765432100011223344556677",
     "00000000000000000000000000000000",
     "cfd1d2e5a9be9cdf501f13b892bd2248"},
    {"Twofish-256",
     "0123456789abcdeffedcba987654321000112233445566778899aabbccddeeff",
     "00000000000000000000000000000000",
     "37527be0052334b89f0cfccae87cfa20"},
};

Result compare(const std::string& name, const std::string& got, const std::string& expected) {
    if (got == expected) {
        return {name, true, "passed"};
    }
    return {name, false, "got " + got + " expected " + expected};
}

Result hash_kat(const HashVector& v) {
    try {
        return compare(v.name, hexEncode(sha256::hash(std::string(v.message))), v.digest);
    } catch (const std::exception& e) {
        return {v.name, false, std::string("exception ") + e.what()};
    }
}

std::vector<Result> cipher_kat(const CipherVector& v) {
    const std::string enc_name = std::string(v.name) + " encrypt";
    const std::string dec_name = std::string(v.name) + " decrypt";
    try {
        Twofish cipher(hexDecode(v.key));
        TwofishBlock pt{};
        TwofishBlock ct{};
        ByteVec p = hexDecode(v.plaintext);
        ByteVec c = hexDecode(v.ciphertext);
        std::copy(p.begin(), p.end(), pt.begin());
        std::copy(c.begin(), c.end(), ct.begin());

        return {compare(enc_name, hexEncode(cipher.encryptBlock(pt)), v.ciphertext),
                compare(dec_name, hexEncode(cipher.decryptBlock(ct)), v.plaintext)};
    } catch (const std::exception& e) {
        return {{enc_name, false, std::string("exception ") + e.what()},
                {dec_name, false, std::string("exception ") + e.what()}};
    }
}

} // namespace

std::vector<Result> runAll() {
    std::vector<Result> results;
    for (const auto& v : HASH_VECTORS) {
        results.push_back(hash_kat(v));
    }
    for (const auto& v : CIPHER_VECTORS) {
        for (auto& r : cipher_kat(v)) {
            results.push_back(std::move(r));
        }
    }
    return results;
}

} // namespace selftest
} // namespace lsx

extern "C" {

lsx_error_t lsx_selftest(void) {
    try {
        for (const auto& r : lsx::selftest::runAll()) {
            if (!r.passed) {
                return LSX_ERROR_INTERNAL;
            }
        }
        return LSX_SUCCESS;
    } catch (const std::bad_alloc&) {
        return LSX_ERROR_INTERNAL;
    }
}

} // extern "C"
