/**
 * @file twofish_example.cpp
 * @brief Twofish encryption example
 */

#include "lsx/lsx.h"
#include <iostream>
#include <iomanip>
#include <cstring>
#include <stdexcept>

void print_hex(const char* label, const uint8_t* data, size_t len) {
    std::cout << label << ": ";
    for (size_t i = 0; i < len; i++) {
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    std::cout << std::dec << std::endl;
}

int main() {
    std::cout << "=== lsx Twofish Example ===" << std::endl;
    std::cout << "Library version: " << lsx_version() << std::endl;
    std::cout << "Platform: " << lsx_platform() << std::endl;
    std::cout << std::endl;

    // Twofish-256 key (32 bytes)
    uint8_t key[32] = {
        0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef,
        0xfe, 0xdc, 0xba, 0x98, 0x76, 0x54, 0x32, 0x10,
        0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77,
        0x88, 0x99, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff
    };

    uint8_t plaintext[16] = {0};

    print_hex("Key", key, 32);
    print_hex("Plaintext", plaintext, 16);

    // C API
    lsx_twofish_ctx_t ctx;
    if (lsx_twofish_init(&ctx, key, sizeof(key)) != LSX_SUCCESS) {
        std::cerr << "Failed to initialize Twofish context" << std::endl;
        return 1;
    }

    uint8_t ciphertext[16];
    if (lsx_twofish_encrypt_block(&ctx, plaintext, ciphertext) != LSX_SUCCESS) {
        std::cerr << "Encryption failed" << std::endl;
        return 1;
    }
    print_hex("Ciphertext", ciphertext, 16);

    uint8_t decrypted[16];
    if (lsx_twofish_decrypt_block(&ctx, ciphertext, decrypted) != LSX_SUCCESS) {
        std::cerr << "Decryption failed" << std::endl;
        return 1;
    }
    print_hex("Decrypted", decrypted, 16);

    if (memcmp(plaintext, decrypted, 16) == 0) {
        std::cout << "\nSuccess: Decrypted text matches original plaintext!" << std::endl;
    } else {
        std::cout << "\nError: Decrypted text does not match!" << std::endl;
    }
    lsx_twofish_clear(&ctx);

    // C++ API
    std::cout << "\n--- C++ API ---" << std::endl;
    try {
        lsx::Twofish cipher(key, sizeof(key));
        lsx::TwofishBlock block{};
        lsx::TwofishBlock ct = cipher.encryptBlock(block);
        std::cout << "Twofish-" << cipher.keyBits() << ": " << lsx::hexEncode(ct) << std::endl;

        // Bad key sizes are rejected
        lsx::Twofish bad(key, 20);
    } catch (const std::invalid_argument& e) {
        std::cout << "Rejected 20-byte key: " << e.what() << std::endl;
    }

    return 0;
}
