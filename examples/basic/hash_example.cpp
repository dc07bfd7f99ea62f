/**
 * @file hash_example.cpp
 * @brief SHA-256 hashing example
 */

#include "lsx/lsx.h"
#include <iostream>
#include <string>

int main() {
    std::cout << "=== lsx SHA-256 Example ===" << std::endl;
    std::cout << "Library version: " << lsx_version() << std::endl;
    std::cout << std::endl;

    const std::string message = "The quick brown fox jumps over the lazy dog";

    // One-shot, C API
    uint8_t digest[LSX_SHA256_DIGEST_SIZE];
    if (lsx_sha256(reinterpret_cast<const uint8_t*>(message.data()), message.size(), digest)
            != LSX_SUCCESS) {
        std::cerr << "Hashing failed" << std::endl;
        return 1;
    }
    std::cout << "Message: \"" << message << "\"" << std::endl;
    std::cout << "SHA-256: " << lsx::hexEncode(digest, sizeof(digest)) << std::endl;

    // Incremental, arbitrary chunks
    lsx::Sha256 hasher;
    hasher.update(message.substr(0, 10));
    hasher.update(message.substr(10, 7));
    auto incremental = hasher.finish(message.substr(17));
    std::cout << "Chunked: " << lsx::hexEncode(incremental) << std::endl;

    // Block-aligned engine: every update must be a multiple of 64 bytes
    lsx::ByteVec first(64, 'a');
    lsx::ByteVec rest(64, 'a');
    rest.insert(rest.end(), {'t', 'a', 'i', 'l'});
    lsx::RawSha256 raw;
    raw.update(first);
    auto raw_digest = raw.finish(rest);
    std::cout << "Raw engine (128 x 'a' + \"tail\"): " << lsx::hexEncode(raw_digest) << std::endl;

    try {
        lsx::RawSha256 misaligned;
        misaligned.update(lsx::ByteVec(10, 'x'));
    } catch (const std::invalid_argument& e) {
        std::cout << "Rejected unaligned update: " << e.what() << std::endl;
    }

    return 0;
}
