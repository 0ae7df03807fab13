/**
 * @file poly1305.h
 * @brief Poly1305 one-time authenticator (RFC 8439 Sections 2.5 - 2.6)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_CRYPTO_POLY1305_H
#define CHAPOLY_CRYPTO_POLY1305_H

#include "chapoly/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Poly1305 context
 *
 * Accumulator and clamped r are held in radix-2^26 limbs so every product
 * fits in 64 bits.
 */
typedef struct {
    uint32_t r[5];        // Clamped key r (radix-2^26)
    uint32_t s[4];        // Key s (for final addition)
    uint32_t h[5];        // Accumulator (radix-2^26)
    uint8_t buffer[16];   // Partial block buffer
    size_t buffer_len;    // Bytes in buffer
    int finalized;        // Whether finalized
} chapoly_poly1305_ctx_t;

/**
 * @brief Initialize Poly1305 context with one-time key
 *
 * @param ctx Poly1305 context
 * @param key 256-bit (32 byte) one-time key
 * @return CHAPOLY_SUCCESS or CHAPOLY_ERROR_INVALID_PARAM
 *
 * @warning The key MUST be used only once! Use the ChaCha20 derived key.
 */
CHAPOLY_API chapoly_error_t chapoly_poly1305_init(
    chapoly_poly1305_ctx_t* ctx,
    const uint8_t key[32]
);

/**
 * @brief Update Poly1305 with data
 *
 * @param ctx Initialized Poly1305 context
 * @param data Input data (may be NULL when len is 0)
 * @param len Data length
 * @return CHAPOLY_SUCCESS or CHAPOLY_ERROR_INVALID_PARAM (also after final)
 */
CHAPOLY_API chapoly_error_t chapoly_poly1305_update(
    chapoly_poly1305_ctx_t* ctx,
    const uint8_t* data,
    size_t len
);

/**
 * @brief Finalize Poly1305 and get tag
 */
CHAPOLY_API chapoly_error_t chapoly_poly1305_final(
    chapoly_poly1305_ctx_t* ctx,
    uint8_t tag[16]
);

/**
 * @brief One-shot Poly1305 MAC
 */
CHAPOLY_API chapoly_error_t chapoly_poly1305(
    const uint8_t key[32],
    const uint8_t* data,
    size_t len,
    uint8_t tag[16]
);

/**
 * @brief Verify Poly1305 tag (constant-time)
 *
 * The computed tag is erased before returning.
 *
 * @return CHAPOLY_SUCCESS, CHAPOLY_ERROR_TAG_MISMATCH or CHAPOLY_ERROR_INVALID_PARAM
 */
CHAPOLY_API chapoly_error_t chapoly_poly1305_verify(
    const uint8_t key[32],
    const uint8_t* data,
    size_t len,
    const uint8_t tag[16]
);

/**
 * @brief Derive the Poly1305 one-time key for an AEAD message
 *
 * First 32 bytes of ChaCha20 keystream block 0 under (key, nonce).
 */
CHAPOLY_API chapoly_error_t chapoly_poly1305_key_gen(
    const uint8_t key[32],
    const uint8_t nonce[12],
    uint8_t onetime_key[32]
);

/**
 * @brief Clear Poly1305 context
 */
CHAPOLY_API void chapoly_poly1305_clear(chapoly_poly1305_ctx_t* ctx);

#ifdef __cplusplus
}
#endif

#endif // CHAPOLY_CRYPTO_POLY1305_H
