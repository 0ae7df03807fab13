/**
 * @file cli_utils.h
 * @brief Common utility functions for chapoly CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_CLI_UTILS_H
#define CHAPOLY_CLI_UTILS_H

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "chapoly/core/types.h"

namespace chapoly {
namespace cli {

/**
 * @brief Read file into byte vector
 */
inline ByteVec read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return ByteVec(std::istreambuf_iterator<char>(file),
                   std::istreambuf_iterator<char>());
}

/**
 * @brief Write byte vector to file
 */
inline void write_file(const std::string& filename, const ByteVec& data) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + filename);
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filename);
    }
}

/**
 * @brief Convert bytes to lowercase hex string
 */
inline std::string bytes_to_hex(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
    }
    return oss.str();
}

/**
 * @brief Convert hex string to bytes
 * @throws std::invalid_argument on odd length or non-hex characters; the
 *         message names the offending position, never the input
 */
inline ByteVec hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    ByteVec bytes;
    bytes.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            // Position only: the string may be a key
            size_t bad = hi < 0 ? i : i + 1;
            throw std::invalid_argument("Invalid hex character at position " +
                                        std::to_string(bad));
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

inline void log_info(const std::string& msg) {
    std::cout << "[INFO] " << msg << "\n";
}

inline void log_error(const std::string& msg) {
    std::cerr << "[ERROR] " << msg << "\n";
}

} // namespace cli
} // namespace chapoly

#endif // CHAPOLY_CLI_UTILS_H
