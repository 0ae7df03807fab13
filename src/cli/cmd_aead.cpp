/**
 * @file cmd_aead.cpp
 * @brief genkey / encrypt / decrypt subcommands for chapoly CLI
 *
 * File framing: nonce (12) || ciphertext || tag (16)
 *
 * Usage:
 *   chapoly genkey
 *   chapoly encrypt -in plain.txt -out secret.enc -key <hex> [-nonce <hex>] [-aad <hex>]
 *   chapoly decrypt -in secret.enc -out plain.txt -key <hex> [-aad <hex>]
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <iostream>
#include <string>

#include "chapoly/chapoly.h"
#include "cli_commands.h"
#include "cli_utils.h"

using chapoly::ByteVec;
using chapoly::ChaCha20Poly1305;
using chapoly::cli::bytes_to_hex;
using chapoly::cli::hex_to_bytes;
using chapoly::cli::log_error;
using chapoly::cli::log_info;
using chapoly::cli::read_file;
using chapoly::cli::write_file;

namespace {

struct AeadArgs {
    std::string input_file;
    std::string output_file;
    std::string key_hex;
    std::string nonce_hex;
    std::string aad_hex;
};

void print_aead_help(const char* command, bool with_nonce) {
    std::cout << "\nUsage: chapoly " << command << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -in <file>        Input file path (required)\n";
    std::cout << "  -out <file>       Output file path (required)\n";
    std::cout << "  -key <hex>        256-bit key as 64 hex characters (required)\n";
    if (with_nonce) {
        std::cout << "  -nonce <hex>      96-bit nonce as 24 hex characters (default: random)\n";
    }
    std::cout << "  -aad <hex>        Associated data as hex (optional)\n";
    std::cout << "  --help            Show this help message\n\n";
}

/**
 * @return 0 to continue, 1 on error, 2 when help was printed
 */
int parse_aead_args(int argc, char* argv[], const char* command, bool with_nonce,
                    AeadArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-in" && i + 1 < argc) {
            args.input_file = argv[++i];
        } else if (arg == "-out" && i + 1 < argc) {
            args.output_file = argv[++i];
        } else if (arg == "-key" && i + 1 < argc) {
            args.key_hex = argv[++i];
        } else if (with_nonce && arg == "-nonce" && i + 1 < argc) {
            args.nonce_hex = argv[++i];
        } else if (arg == "-aad" && i + 1 < argc) {
            args.aad_hex = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_aead_help(command, with_nonce);
            return 2;
        } else {
            log_error("Unknown option: " + arg);
            print_aead_help(command, with_nonce);
            return 1;
        }
    }

    if (args.input_file.empty() || args.output_file.empty() || args.key_hex.empty()) {
        log_error("Missing required arguments (-in, -out, -key)");
        print_aead_help(command, with_nonce);
        return 1;
    }
    return 0;
}

} // namespace

/**
 * @brief Print a fresh random key
 */
int cmd_genkey(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            std::cout << "\nUsage: chapoly genkey\n\n";
            std::cout << "  Prints a random 256-bit key as 64 hex characters.\n\n";
            return 0;
        }
        log_error("Unknown option: " + arg);
        return 1;
    }

    try {
        ByteVec key = ChaCha20Poly1305::generateKey();
        std::cout << bytes_to_hex(key.data(), key.size()) << "\n";
        chapoly_secure_zero(key.data(), key.size());
        return 0;
    } catch (const chapoly::Error& e) {
        log_error(e.what());
        return 1;
    }
}

int cmd_encrypt(int argc, char* argv[]) {
    AeadArgs args;
    int rc = parse_aead_args(argc, argv, "encrypt", true, args);
    if (rc != 0) {
        return rc == 2 ? 0 : 1;
    }

    ByteVec key;
    try {
        key = hex_to_bytes(args.key_hex);
        ByteVec nonce = args.nonce_hex.empty() ? ChaCha20Poly1305::generateNonce()
                                               : hex_to_bytes(args.nonce_hex);
        ByteVec aad = hex_to_bytes(args.aad_hex);

        ByteVec input = read_file(args.input_file);
        log_info("Read " + std::to_string(input.size()) + " bytes from " + args.input_file);

        ChaCha20Poly1305 aead(key);
        chapoly_secure_zero(key.data(), key.size());

        ByteVec sealed = aead.seal(nonce, input, aad);

        ByteVec output;
        output.reserve(nonce.size() + sealed.size());
        output.insert(output.end(), nonce.begin(), nonce.end());
        output.insert(output.end(), sealed.begin(), sealed.end());

        write_file(args.output_file, output);
        log_info("Nonce " + bytes_to_hex(nonce.data(), nonce.size()));
        log_info("Wrote " + std::to_string(output.size()) + " bytes to " + args.output_file);
        return 0;
    } catch (const std::exception& e) {
        chapoly_secure_zero(key.data(), key.size());
        log_error(e.what());
        return 1;
    }
}

int cmd_decrypt(int argc, char* argv[]) {
    AeadArgs args;
    int rc = parse_aead_args(argc, argv, "decrypt", false, args);
    if (rc != 0) {
        return rc == 2 ? 0 : 1;
    }

    ByteVec key;
    try {
        key = hex_to_bytes(args.key_hex);
        ByteVec aad = hex_to_bytes(args.aad_hex);

        ByteVec input = read_file(args.input_file);
        log_info("Read " + std::to_string(input.size()) + " bytes from " + args.input_file);

        if (input.size() < ChaCha20Poly1305::NONCE_SIZE + ChaCha20Poly1305::TAG_SIZE) {
            log_error("Invalid input: shorter than nonce and tag");
            return 1;
        }

        ByteVec nonce(input.begin(), input.begin() + ChaCha20Poly1305::NONCE_SIZE);
        ByteVec sealed(input.begin() + ChaCha20Poly1305::NONCE_SIZE, input.end());

        ChaCha20Poly1305 aead(key);
        chapoly_secure_zero(key.data(), key.size());

        ByteVec plaintext = aead.open(nonce, sealed, aad);

        write_file(args.output_file, plaintext);
        chapoly_secure_zero(plaintext.data(), plaintext.size());
        log_info("Wrote " + std::to_string(plaintext.size()) + " bytes to " + args.output_file);
        return 0;
    } catch (const chapoly::Error& e) {
        chapoly_secure_zero(key.data(), key.size());
        if (e.code() == CHAPOLY_ERROR_TAG_MISMATCH) {
            log_error("Authentication failed, nothing written");
        } else {
            log_error(e.what());
        }
        return 1;
    } catch (const std::exception& e) {
        chapoly_secure_zero(key.data(), key.size());
        log_error(e.what());
        return 1;
    }
}
