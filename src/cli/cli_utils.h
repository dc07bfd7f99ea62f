/**
 * @file cli_utils.h
 * @brief Common utility functions for lsx CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef LSX_CLI_UTILS_H
#define LSX_CLI_UTILS_H

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

#include "lsx/crypto/sha256.h"
#include "lsx/utils/encoding.h"

namespace lsx {
namespace cli {

constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Hash a stream in fixed-size chunks through the buffered hasher
 */
inline Sha256Digest hash_stream(std::istream& in) {
    Sha256 hasher;
    std::vector<char> chunk(READ_CHUNK_SIZE);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            hasher.update(reinterpret_cast<const uint8_t*>(chunk.data()),
                          static_cast<size_t>(got));
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Read error");
    }
    return hasher.finish();
}

/**
 * @brief Hash a file without loading it into memory
 */
inline Sha256Digest hash_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return hash_stream(file);
}

/**
 * @brief Decode a hex argument and check its length
 * @param what Argument name used in error messages
 * @param allowed Accepted decoded lengths in bytes
 */
inline ByteVec parse_hex_arg(const std::string& what, const std::string& hex,
                             const std::vector<size_t>& allowed) {
    ByteVec bytes = hexDecode(hex);
    if (std::find(allowed.begin(), allowed.end(), bytes.size()) == allowed.end()) {
        throw std::invalid_argument(what + " has wrong length (" +
                                    std::to_string(bytes.size()) + " bytes)");
    }
    return bytes;
}

} // namespace cli
} // namespace lsx

#endif // LSX_CLI_UTILS_H
