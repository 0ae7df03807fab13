/**
 * @file chapoly.h
 * @brief chapoly - ChaCha20-Poly1305 AEAD Library
 *
 * Unified header for all public modules:
 * - Core: error codes, secure memory, CSPRNG
 * - ChaCha20 stream cipher
 * - Poly1305 one-time authenticator
 * - ChaCha20-Poly1305 AEAD (C ABI and C++ class)
 *
 * Usage:
 * @code
 *   #include "chapoly/chapoly.h"
 *
 *   chapoly::ChaCha20Poly1305 aead(key);
 *   auto nonce = chapoly::ChaCha20Poly1305::generateNonce();
 *   auto sealed = aead.seal(nonce, plaintext, aad);
 *   auto opened = aead.open(nonce, sealed, aad);
 * @endcode
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_H
#define CHAPOLY_H

#include "chapoly/version.h"
#include "chapoly/core/common.h"
#include "chapoly/core/types.h"
#include "chapoly/core/security.h"
#include "chapoly/core/error.h"
#include "chapoly/crypto/chacha20.h"
#include "chapoly/crypto/poly1305.h"
#include "chapoly/crypto/aead_tag_input.h"
#include "chapoly/crypto/chacha20_poly1305.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Library initialization
 *
 * Checks that the platform CSPRNG is usable. Encrypt/decrypt do not depend
 * on it; key and nonce generation do.
 *
 * @return CHAPOLY_SUCCESS or CHAPOLY_ERROR_RANDOM_FAILED
 */
CHAPOLY_API chapoly_error_t chapoly_init(void);

/**
 * @brief Library version string
 */
CHAPOLY_API const char* chapoly_version(void);

/**
 * @brief Platform name the library was built for
 */
CHAPOLY_API const char* chapoly_platform(void);

#ifdef __cplusplus
}
#endif

#endif // CHAPOLY_H
