/**
 * @file cmd_benchmark.cpp
 * @brief Benchmark subcommand implementation for chapoly CLI
 *
 * Usage:
 *   chapoly benchmark
 *   chapoly benchmark -iterations 50
 *
 * When built with OpenSSL, EVP_chacha20_poly1305 is measured alongside.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#include "chapoly/chapoly.h"
#include "cli_commands.h"
#include "cli_utils.h"

#ifdef CHAPOLY_BENCHMARK_HAS_OPENSSL
#include <openssl/evp.h>
#endif

namespace {

constexpr size_t WARMUP_ITERATIONS = 5;
constexpr size_t DEFAULT_ITERATIONS = 100;

const std::vector<size_t> TEST_SIZES = {
    64,               // 64 B
    1024,             // 1 KB
    64 * 1024,        // 64 KB
    1024 * 1024       // 1 MB
};

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

void print_benchmark_help() {
    std::cout << "\nUsage: chapoly benchmark [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -iterations <n>   Timed iterations per size (default: 100)\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Description:\n";
    std::cout << "  Measures ChaCha20-Poly1305 seal and open throughput\n";
    std::cout << "  for 64 B, 1 KB, 64 KB and 1 MB messages.\n\n";
}

double calculate_throughput(size_t bytes, double ms) {
    return (bytes / (1024.0 * 1024.0)) / (ms / 1000.0);
}

void run_benchmark_iterations(const std::string& name,
                              size_t data_size,
                              size_t iterations,
                              const std::function<void()>& op) {
    std::vector<double> times;
    times.reserve(iterations);

    for (size_t i = 0; i < WARMUP_ITERATIONS; ++i) {
        op();
    }

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        op();
        Duration elapsed = Clock::now() - start;
        times.push_back(elapsed.count());
    }

    double avg = std::accumulate(times.begin(), times.end(), 0.0) / times.size();

    std::cout << std::left << std::setw(25) << name
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(12) << calculate_throughput(data_size, avg) << " MB/s"
              << std::setw(12) << std::setprecision(4) << avg << " ms"
              << "\n";
}

std::string size_label(size_t size) {
    if (size >= 1024 * 1024) return std::to_string(size / (1024 * 1024)) + " MB";
    if (size >= 1024) return std::to_string(size / 1024) + " KB";
    return std::to_string(size) + " B";
}

#ifdef CHAPOLY_BENCHMARK_HAS_OPENSSL
/**
 * @brief One OpenSSL ChaCha20-Poly1305 encryption into ciphertext || tag
 */
void openssl_seal(const chapoly::ByteVec& key, const chapoly::ByteVec& nonce,
                  const chapoly::ByteVec& aad, const chapoly::ByteVec& plaintext,
                  chapoly::ByteVec& sealed) {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    sealed.resize(plaintext.size() + 16);
    int len = 0;
    uint8_t final_block[16];
    bool ok = EVP_EncryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr,
                                 key.data(), nonce.data()) == 1 &&
              EVP_EncryptUpdate(ctx, nullptr, &len, aad.data(),
                                static_cast<int>(aad.size())) == 1 &&
              EVP_EncryptUpdate(ctx, sealed.data(), &len, plaintext.data(),
                                static_cast<int>(plaintext.size())) == 1 &&
              EVP_EncryptFinal_ex(ctx, final_block, &len) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, 16,
                                  sealed.data() + plaintext.size()) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("OpenSSL ChaCha20-Poly1305 encryption failed");
    }
}
#endif

} // namespace

/**
 * @brief Benchmark subcommand handler
 */
int cmd_benchmark(int argc, char* argv[]) {
    size_t iterations = DEFAULT_ITERATIONS;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-iterations" && i + 1 < argc) {
            try {
                iterations = static_cast<size_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                chapoly::cli::log_error(std::string("Invalid iteration count: ") + argv[i]);
                return 1;
            }
            if (iterations == 0) {
                chapoly::cli::log_error("Iteration count must be positive");
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_benchmark_help();
            return 0;
        } else {
            chapoly::cli::log_error("Unknown option: " + arg);
            print_benchmark_help();
            return 1;
        }
    }

    try {
        chapoly::ByteVec key = chapoly::ChaCha20Poly1305::generateKey();
        chapoly::ChaCha20Poly1305 aead(key);
        chapoly::ByteVec nonce = chapoly::ChaCha20Poly1305::generateNonce();
        chapoly::ByteVec aad(16, 0xA5);

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "  ChaCha20-Poly1305 Benchmark (" << iterations << " iterations)\n";
        std::cout << std::string(60, '=') << "\n";

        for (size_t data_size : TEST_SIZES) {
            std::cout << "\n--- Data Size: " << size_label(data_size) << " ---\n";

            chapoly::ByteVec plaintext(data_size);
            chapoly::throw_if_error(chapoly_random_bytes(plaintext.data(), plaintext.size()),
                                    "benchmark");
            chapoly::ByteVec sealed = aead.seal(nonce, plaintext, aad);
            chapoly::ByteVec opened;

            run_benchmark_iterations("Seal", data_size, iterations, [&]() {
                sealed = aead.seal(nonce, plaintext, aad);
            });
            run_benchmark_iterations("Open", data_size, iterations, [&]() {
                opened = aead.open(nonce, sealed, aad);
            });

#ifdef CHAPOLY_BENCHMARK_HAS_OPENSSL
            chapoly::ByteVec reference;
            run_benchmark_iterations("Seal (OpenSSL)", data_size, iterations, [&]() {
                openssl_seal(key, nonce, aad, plaintext, reference);
            });
            if (reference != sealed) {
                chapoly::cli::log_error("Output differs from OpenSSL at " + size_label(data_size));
                return 1;
            }
#endif

            if (opened != plaintext) {
                chapoly::cli::log_error("Round trip mismatch at " + size_label(data_size));
                return 1;
            }
        }
        std::cout << "\n";
        chapoly_secure_zero(key.data(), key.size());
        return 0;
    } catch (const std::exception& e) {
        chapoly::cli::log_error(e.what());
        return 1;
    }
}
