/**
 * @file cmd_hash.cpp
 * @brief Hash subcommand implementation for lsx CLI
 *
 * Prints one "<digest>  <name>" line per input, in the format of
 * sha256sum, so the output can be checked with `sha256sum -c`.
 *
 * Usage:
 *   lsx hash -in file.txt -in other.bin
 *   lsx hash -text "abc"
 *   cat data.bin | lsx hash
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "lsx/crypto/sha256.h"
#include "lsx/utils/encoding.h"
#include "cli_utils.h"

/**
 * @brief Print hash subcommand help
 */
void print_hash_help() {
    std::cout << "\nUsage: lsx hash [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -in <file>         Input file path (repeatable, '-' for stdin)\n";
    std::cout << "  -text <string>     Hash a literal string\n";
    std::cout << "  -upper             Print digest in uppercase hex\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "With no input options, stdin is hashed.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  lsx hash -in document.pdf\n";
    std::cout << "  lsx hash -text \"The quick brown fox jumps over the lazy dog\"\n\n";
}

/**
 * @brief Hash subcommand handler
 */
int cmd_hash(int argc, char* argv[]) {
    // (kind, value): kind is "file" or "text"
    std::vector<std::pair<std::string, std::string>> inputs;
    bool upper = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-in" && i + 1 < argc) {
            inputs.emplace_back("file", argv[++i]);
        } else if (arg == "-text" && i + 1 < argc) {
            inputs.emplace_back("text", argv[++i]);
        } else if (arg == "-upper") {
            upper = true;
        } else if (arg == "--help" || arg == "-h") {
            print_hash_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_hash_help();
            return 1;
        }
    }

    if (inputs.empty()) {
        inputs.emplace_back("file", "-");
    }

    int status = 0;
    for (const auto& input : inputs) {
        try {
            lsx::Sha256Digest digest;
            std::string label;
            if (input.first == "text") {
                digest = lsx::sha256::hash(input.second);
                label = "\"" + input.second + "\"";
            } else if (input.second == "-") {
                digest = lsx::cli::hash_stream(std::cin);
                label = "-";
            } else {
                digest = lsx::cli::hash_file(input.second);
                label = input.second;
            }

            std::string hex = upper ? lsx::hexEncodeUpper(digest.data(), digest.size())
                                    : lsx::hexEncode(digest);
            std::cout << hex << "  " << label << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Error: " << input.second << ": " << e.what() << "\n";
            status = 1;
        }
    }

    return status;
}
