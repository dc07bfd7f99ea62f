/**
 * @file lsx_main.cpp
 * @brief lsx Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   lsx <command> [options]
 *
 * Commands:
 *   hash         SHA-256 digests of files, stdin or literal text
 *   twofish      Single-block Twofish encryption/decryption
 *   selftest     Run the built-in known-answer tests
 *   version      Display version information
 *   help         Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <string>

#include "lsx/lsx.h"
#include "cli_utils.h"

// Subcommand handlers (forward declarations)
int cmd_hash(int argc, char* argv[]);
int cmd_twofish(int argc, char* argv[]);
int cmd_selftest(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: lsx <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  hash         Compute SHA-256 digests\n";
    std::cout << "  twofish      Encrypt or decrypt one 16-byte block with Twofish\n";
    std::cout << "  selftest     Run the built-in known-answer tests\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  lsx hash -in file.txt\n";
    std::cout << "  lsx hash -text abc\n";
    std::cout << "  lsx twofish -encrypt -key 000102030405060708090a0b0c0d0e0f -block 00000000000000000000000000000000\n";
    std::cout << "  lsx selftest\n\n";
    std::cout << "For command-specific help, use: lsx <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << LSX_LIBRARY_NAME << " - " << LSX_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << lsx_version() << "\n";
    std::cout << "Platform:     " << lsx_platform() << "\n";
    std::cout << "Build Type:   " << LSX_BUILD_TYPE << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Supported Algorithms:\n";
    std::cout << "  - SHA-256 (FIPS 180-4)\n";
    std::cout << "  - Twofish-128/192/256 (single block)\n";
    std::cout << "\n";
}

void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    const std::string command = lsx::cli::to_lower(argv[1]);

    if (command == "hash" || command == "sha256") {
        return cmd_hash(argc - 1, argv + 1);
    }
    else if (command == "twofish") {
        return cmd_twofish(argc - 1, argv + 1);
    }
    else if (command == "selftest" || command == "test") {
        return cmd_selftest(argc - 1, argv + 1);
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    }

    std::cerr << "\nError: Unknown command '" << command << "'\n";
    print_usage();
    return 1;
}
