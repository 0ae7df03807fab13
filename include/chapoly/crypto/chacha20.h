/**
 * @file chacha20.h
 * @brief ChaCha20 stream cipher (RFC 8439 Sections 2.3 - 2.4)
 *
 * 256-bit key, 96-bit nonce, 32-bit block counter.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_CRYPTO_CHACHA20_H
#define CHAPOLY_CRYPTO_CHACHA20_H

#include "chapoly/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief ChaCha20 context
 */
typedef struct {
    uint32_t state[16];    // Constants, key, counter (word 12), nonce
    uint8_t keystream[64]; // Current keystream block
    size_t remaining;      // Unused bytes left in keystream
} chapoly_chacha20_ctx_t;

/**
 * @brief Initialize ChaCha20 context
 *
 * @param ctx ChaCha20 context to initialize
 * @param key 256-bit (32 byte) key
 * @param nonce 96-bit (12 byte) nonce
 * @param counter Initial block counter (0 for the Poly1305 key, 1 for data)
 * @return CHAPOLY_SUCCESS or CHAPOLY_ERROR_INVALID_PARAM
 */
CHAPOLY_API chapoly_error_t chapoly_chacha20_init(
    chapoly_chacha20_ctx_t* ctx,
    const uint8_t key[32],
    const uint8_t nonce[12],
    uint32_t counter
);

/**
 * @brief Produce the keystream block at the current counter
 *
 * Writes one 64-byte block and increments the counter. Any partially used
 * keystream from chapoly_chacha20_crypt() is discarded.
 *
 * @param ctx Initialized ChaCha20 context
 * @param output 64-byte keystream output
 * @return CHAPOLY_SUCCESS or CHAPOLY_ERROR_INVALID_PARAM
 */
CHAPOLY_API chapoly_error_t chapoly_chacha20_block(
    chapoly_chacha20_ctx_t* ctx,
    uint8_t output[64]
);

/**
 * @brief ChaCha20 encryption/decryption
 *
 * XORs keystream into @p input. Successive calls continue the same
 * keystream. @p output may equal @p input for in-place operation.
 *
 * @param ctx Initialized ChaCha20 context
 * @param input Input data (may be NULL when input_len is 0)
 * @param input_len Input length
 * @param output Output buffer (same size as input)
 * @return CHAPOLY_SUCCESS or CHAPOLY_ERROR_INVALID_PARAM
 */
CHAPOLY_API chapoly_error_t chapoly_chacha20_crypt(
    chapoly_chacha20_ctx_t* ctx,
    const uint8_t* input,
    size_t input_len,
    uint8_t* output
);

/**
 * @brief Stateless ChaCha20 encryption/decryption
 */
CHAPOLY_API chapoly_error_t chapoly_chacha20(
    const uint8_t key[32],
    const uint8_t nonce[12],
    uint32_t counter,
    const uint8_t* input,
    size_t input_len,
    uint8_t* output
);

/**
 * @brief Clear ChaCha20 context
 */
CHAPOLY_API void chapoly_chacha20_clear(chapoly_chacha20_ctx_t* ctx);

#ifdef __cplusplus
}
#endif

#endif // CHAPOLY_CRYPTO_CHACHA20_H
