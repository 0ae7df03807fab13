/**
 * @file chapoly_main.cpp
 * @brief chapoly Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   chapoly <command> [options]
 *
 * Commands:
 *   genkey       Generate a random 256-bit key
 *   encrypt      ChaCha20-Poly1305 file encryption
 *   decrypt      ChaCha20-Poly1305 file decryption
 *   benchmark    Seal/open throughput
 *   version      Display version information
 *   help         Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "chapoly/chapoly.h"
#include "cli_commands.h"
#include "cli_utils.h"

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: chapoly <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  genkey       Print a random 32-byte key as hex\n";
    std::cout << "  encrypt      Encrypt a file (output: nonce || ciphertext || tag)\n";
    std::cout << "  decrypt      Verify and decrypt a file produced by encrypt\n";
    std::cout << "  benchmark    Measure seal/open throughput\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  chapoly genkey\n";
    std::cout << "  chapoly encrypt -in file.txt -out file.enc -key <64 hex chars>\n";
    std::cout << "  chapoly decrypt -in file.enc -out file.txt -key <64 hex chars>\n\n";
    std::cout << "For command-specific help, use: chapoly <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << CHAPOLY_LIBRARY_NAME << " - " << CHAPOLY_DESCRIPTION << "\n\n";
    std::cout << "Version:      " << chapoly_version() << "\n";
    std::cout << "Platform:     " << chapoly_platform() << "\n";
    std::cout << "Build Type:   " << CHAPOLY_BUILD_TYPE << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Algorithms (RFC 8439):\n";
    std::cout << "  - ChaCha20 stream cipher\n";
    std::cout << "  - Poly1305 one-time authenticator\n";
    std::cout << "  - ChaCha20-Poly1305 AEAD\n";
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command(argv[1]);
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    if (command == "help" || command == "-h" || command == "--help") {
        print_usage();
        return 0;
    }

    chapoly_error_t err = chapoly_init();
    if (err != CHAPOLY_SUCCESS) {
        chapoly::cli::log_error(std::string("Library initialization failed: ") +
                                chapoly_error_string(err));
        return 1;
    }

    if (command == "genkey") {
        return cmd_genkey(argc - 1, argv + 1);
    } else if (command == "encrypt") {
        return cmd_encrypt(argc - 1, argv + 1);
    } else if (command == "decrypt") {
        return cmd_decrypt(argc - 1, argv + 1);
    } else if (command == "benchmark" || command == "bench") {
        return cmd_benchmark(argc - 1, argv + 1);
    }

    chapoly::cli::log_error("Unknown command '" + command + "'");
    print_usage();
    return 1;
}
