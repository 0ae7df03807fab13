/**
 * @file common.h
 * @brief Common definitions and utility macros for chapoly library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef CHAPOLY_CORE_COMMON_H
#define CHAPOLY_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define CHAPOLY_PLATFORM_WINDOWS 1
    #define CHAPOLY_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define CHAPOLY_PLATFORM_LINUX 1
    #define CHAPOLY_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define CHAPOLY_PLATFORM_MACOS 1
    #define CHAPOLY_PLATFORM_NAME "macOS"
#else
    #define CHAPOLY_PLATFORM_UNKNOWN 1
    #define CHAPOLY_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef CHAPOLY_PLATFORM_WINDOWS
    #ifdef CHAPOLY_SHARED_LIBRARY
        #ifdef CHAPOLY_BUILDING
            #define CHAPOLY_API __declspec(dllexport)
        #else
            #define CHAPOLY_API __declspec(dllimport)
        #endif
    #else
        #define CHAPOLY_API
    #endif
#else
    #ifdef CHAPOLY_SHARED_LIBRARY
        #define CHAPOLY_API __attribute__((visibility("default")))
    #else
        #define CHAPOLY_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    CHAPOLY_SUCCESS = 0,
    CHAPOLY_ERROR_INVALID_PARAM = -1,         // Null context or primitive argument
    CHAPOLY_ERROR_INVALID_KEY = -2,           // Key absent or not 32 bytes
    CHAPOLY_ERROR_MISSING_ARGUMENT = -3,      // Required buffer absent
    CHAPOLY_ERROR_LENGTH_MISMATCH = -4,       // Plaintext/ciphertext lengths differ
    CHAPOLY_ERROR_INVALID_NONCE_LENGTH = -5,
    CHAPOLY_ERROR_INVALID_TAG_LENGTH = -6,
    CHAPOLY_ERROR_TAG_MISMATCH = -7,          // AEAD authentication failed
    CHAPOLY_ERROR_LENGTH_OVERFLOW = -8,       // Length outside counter or size_t range
    CHAPOLY_ERROR_CONTEXT_RELEASED = -9,      // Context used after release
    CHAPOLY_ERROR_MEMORY_ALLOC = -10,
    CHAPOLY_ERROR_RANDOM_FAILED = -11,        // CSPRNG failure
    CHAPOLY_ERROR_INTERNAL = -12
} chapoly_error_t;

// Fixed sizes (RFC 8439)
#define CHAPOLY_KEY_SIZE            32
#define CHAPOLY_NONCE_SIZE          12
#define CHAPOLY_TAG_SIZE            16

#define CHAPOLY_CHACHA20_BLOCK_SIZE 64
#define CHAPOLY_CHACHA20_STATE_WORDS 16
#define CHAPOLY_POLY1305_KEY_SIZE   32
#define CHAPOLY_POLY1305_BLOCK_SIZE 16

/**
 * Largest AEAD message: the 32-bit block counter starts at 1,
 * leaving (2^32 - 1) blocks of keystream.
 */
#define CHAPOLY_AEAD_MAX_MESSAGE_SIZE (0xFFFFFFFFULL * CHAPOLY_CHACHA20_BLOCK_SIZE)

// Utility macros
#define CHAPOLY_ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))
#define CHAPOLY_MIN(a, b) ((a) < (b) ? (a) : (b))

// Rotate operations
#define CHAPOLY_ROTL32(x, n) ((uint32_t)(((x) << (n)) | ((x) >> (32 - (n)))))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
CHAPOLY_API const char* chapoly_error_string(chapoly_error_t error);

#ifdef __cplusplus
}
#endif

#endif // CHAPOLY_CORE_COMMON_H
