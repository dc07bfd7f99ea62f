/**
 * @file cmd_twofish.cpp
 * @brief Twofish subcommand implementation for lsx CLI
 *
 * Operates on exactly one 16-byte block given in hex. Chaining modes are
 * out of scope for the library and therefore for the tool.
 *
 * Usage:
 *   lsx twofish -encrypt -key <hex> -block <hex>
 *   lsx twofish -decrypt -key <hex> -block <hex>
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <algorithm>
#include <iostream>
#include <string>

#include "lsx/core/security.h"
#include "lsx/crypto/twofish.h"
#include "lsx/utils/encoding.h"
#include "cli_utils.h"

/**
 * @brief Print Twofish subcommand help
 */
void print_twofish_help() {
    std::cout << "\nUsage: lsx twofish [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -encrypt          Encrypt the block\n";
    std::cout << "  -decrypt          Decrypt the block\n";
    std::cout << "  -key <hex>        Key, 16/24/32 bytes in hex (required)\n";
    std::cout << "  -block <hex>      One 16-byte block in hex (required)\n";
    std::cout << "  -v                Also print key size and input\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  lsx twofish -encrypt -key 00000000000000000000000000000000 \\\n";
    std::cout << "              -block 00000000000000000000000000000000\n";
    std::cout << "  (prints 9f589f5cf6122c32b6bfec2f2ae8c35a)\n\n";
}

/**
 * @brief Twofish subcommand handler
 */
int cmd_twofish(int argc, char* argv[]) {
    bool encrypt = false, decrypt = false, verbose = false;
    std::string key_hex, block_hex;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-encrypt") {
            encrypt = true;
        } else if (arg == "-decrypt") {
            decrypt = true;
        } else if (arg == "-key" && i + 1 < argc) {
            key_hex = argv[++i];
        } else if (arg == "-block" && i + 1 < argc) {
            block_hex = argv[++i];
        } else if (arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_twofish_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_twofish_help();
            return 1;
        }
    }

    if (!encrypt && !decrypt) {
        std::cerr << "Error: Must specify -encrypt or -decrypt\n";
        print_twofish_help();
        return 1;
    }
    if (encrypt && decrypt) {
        std::cerr << "Error: Cannot specify both -encrypt and -decrypt\n";
        return 1;
    }
    if (key_hex.empty() || block_hex.empty()) {
        std::cerr << "Error: Missing required arguments (-key, -block)\n";
        print_twofish_help();
        return 1;
    }

    try {
        lsx::ByteVec key = lsx::cli::parse_hex_arg(
            "Key", key_hex,
            {LSX_TWOFISH_128_KEY_SIZE, LSX_TWOFISH_192_KEY_SIZE, LSX_TWOFISH_256_KEY_SIZE});
        lsx::ByteVec block_bytes = lsx::cli::parse_hex_arg("Block", block_hex, {LSX_TWOFISH_BLOCK_SIZE});

        lsx::Twofish cipher(key);
        lsx_secure_zero(key.data(), key.size());

        lsx::TwofishBlock block{};
        std::copy(block_bytes.begin(), block_bytes.end(), block.begin());

        if (verbose) {
            std::cout << "Algorithm: Twofish-" << cipher.keyBits() << "\n";
            std::cout << "Operation: " << (encrypt ? "encrypt" : "decrypt") << "\n";
            std::cout << "Input:     " << lsx::hexEncode(block) << "\n";
            std::cout << "Output:    ";
        }

        lsx::TwofishBlock out = encrypt ? cipher.encryptBlock(block) : cipher.decryptBlock(block);
        std::cout << lsx::hexEncode(out) << "\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
