/**
 * @file export.cpp
 * @brief Library export and initialization functions
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "chapoly/chapoly.h"

extern "C" {

const char* chapoly_version(void) {
    return CHAPOLY_VERSION_STRING;
}

const char* chapoly_platform(void) {
    return CHAPOLY_PLATFORM_NAME;
}

chapoly_error_t chapoly_init(void) {
    // Check that the CSPRNG answers; no state is kept
    uint8_t sample[16];
    chapoly_error_t err = chapoly_random_bytes(sample, sizeof(sample));
    chapoly_secure_zero(sample, sizeof(sample));
    return err;
}

const char* chapoly_error_string(chapoly_error_t error) {
    switch (error) {
        case CHAPOLY_SUCCESS:
            return "Success";
        case CHAPOLY_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case CHAPOLY_ERROR_INVALID_KEY:
            return "Specified key is not a valid size for this algorithm";
        case CHAPOLY_ERROR_MISSING_ARGUMENT:
            return "Required argument is missing";
        case CHAPOLY_ERROR_LENGTH_MISMATCH:
            return "Plaintext and ciphertext must have the same length";
        case CHAPOLY_ERROR_INVALID_NONCE_LENGTH:
            return "The specified nonce is not a valid size for this algorithm";
        case CHAPOLY_ERROR_INVALID_TAG_LENGTH:
            return "The specified tag is not a valid size for this algorithm";
        case CHAPOLY_ERROR_TAG_MISMATCH:
            return "Computed and provided tags don't match";
        case CHAPOLY_ERROR_LENGTH_OVERFLOW:
            return "Message length exceeds algorithm limits";
        case CHAPOLY_ERROR_CONTEXT_RELEASED:
            return "Context has been released";
        case CHAPOLY_ERROR_MEMORY_ALLOC:
            return "Memory allocation failed";
        case CHAPOLY_ERROR_RANDOM_FAILED:
            return "Random number generation failed";
        case CHAPOLY_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

} // extern "C"
