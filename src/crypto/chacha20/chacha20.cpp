/**
 * @file chacha20.cpp
 * @brief ChaCha20 Stream Cipher Implementation
 *
 * RFC 8439 Section 2.3 block function and Section 2.4 encryption.
 * Only additions, rotations and XORs on 32-bit words: no table lookups,
 * no secret-dependent branches.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "chapoly/crypto/chacha20.h"
#include "chapoly/core/security.h"
#include "chapoly/internal/byte_order_impl.h"

namespace {

/**
 * @brief ChaCha20 quarter round
 */
inline void quarter_round(uint32_t& a, uint32_t& b, uint32_t& c, uint32_t& d) {
    a += b; d ^= a; d = CHAPOLY_ROTL32(d, 16);
    c += d; b ^= c; b = CHAPOLY_ROTL32(b, 12);
    a += b; d ^= a; d = CHAPOLY_ROTL32(d, 8);
    c += d; b ^= c; b = CHAPOLY_ROTL32(b, 7);
}

// "expand 32-byte k"
const uint32_t CHACHA_CONSTANTS[4] = {
    0x61707865, 0x3320646e, 0x79622d32, 0x6b206574
};

/**
 * @brief Generate one ChaCha20 block
 *
 * @param state 16-word state (constants, key, counter, nonce)
 * @param output 64-byte output block
 */
void chacha20_block(const uint32_t state[16], uint8_t output[64]) {
    chapoly::SecureArray<uint32_t, CHAPOLY_CHACHA20_STATE_WORDS> working;

    for (int i = 0; i < CHAPOLY_CHACHA20_STATE_WORDS; i++) {
        working[i] = state[i];
    }

    // 20 rounds (10 double rounds)
    for (int i = 0; i < 10; i++) {
        // Column rounds
        quarter_round(working[0], working[4], working[8],  working[12]);
        quarter_round(working[1], working[5], working[9],  working[13]);
        quarter_round(working[2], working[6], working[10], working[14]);
        quarter_round(working[3], working[7], working[11], working[15]);

        // Diagonal rounds
        quarter_round(working[0], working[5], working[10], working[15]);
        quarter_round(working[1], working[6], working[11], working[12]);
        quarter_round(working[2], working[7], working[8],  working[13]);
        quarter_round(working[3], working[4], working[9],  working[14]);
    }

    for (int i = 0; i < 16; i++) {
        chapoly::internal::store32_le(&output[i * 4], working[i] + state[i]);
    }
}

} // namespace

extern "C" {

chapoly_error_t chapoly_chacha20_init(chapoly_chacha20_ctx_t* ctx,
                                      const uint8_t key[32],
                                      const uint8_t nonce[12],
                                      uint32_t counter) {
    if (!ctx || !key || !nonce) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    ctx->state[0] = CHACHA_CONSTANTS[0];
    ctx->state[1] = CHACHA_CONSTANTS[1];
    ctx->state[2] = CHACHA_CONSTANTS[2];
    ctx->state[3] = CHACHA_CONSTANTS[3];

    for (int i = 0; i < 8; i++) {
        ctx->state[4 + i] = chapoly::internal::load32_le(&key[i * 4]);
    }

    ctx->state[12] = counter;

    ctx->state[13] = chapoly::internal::load32_le(&nonce[0]);
    ctx->state[14] = chapoly::internal::load32_le(&nonce[4]);
    ctx->state[15] = chapoly::internal::load32_le(&nonce[8]);

    chapoly_secure_zero(ctx->keystream, sizeof(ctx->keystream));
    ctx->remaining = 0;

    return CHAPOLY_SUCCESS;
}

chapoly_error_t chapoly_chacha20_block(chapoly_chacha20_ctx_t* ctx, uint8_t output[64]) {
    if (!ctx || !output) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    chacha20_block(ctx->state, output);
    ctx->state[12]++;
    ctx->remaining = 0;

    return CHAPOLY_SUCCESS;
}

chapoly_error_t chapoly_chacha20_crypt(chapoly_chacha20_ctx_t* ctx,
                                       const uint8_t* input,
                                       size_t input_len,
                                       uint8_t* output) {
    if (!ctx) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }
    if (input_len == 0) {
        return CHAPOLY_SUCCESS;
    }
    if (!input || !output) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    size_t offset = 0;

    // Use any remaining keystream first
    if (ctx->remaining > 0) {
        size_t use = CHAPOLY_MIN(input_len, ctx->remaining);
        size_t ks_offset = CHAPOLY_CHACHA20_BLOCK_SIZE - ctx->remaining;

        for (size_t i = 0; i < use; i++) {
            output[i] = input[i] ^ ctx->keystream[ks_offset + i];
        }

        ctx->remaining -= use;
        offset = use;
    }

    // Full blocks
    while (offset + CHAPOLY_CHACHA20_BLOCK_SIZE <= input_len) {
        chacha20_block(ctx->state, ctx->keystream);
        ctx->state[12]++;

        for (size_t i = 0; i < CHAPOLY_CHACHA20_BLOCK_SIZE; i++) {
            output[offset + i] = input[offset + i] ^ ctx->keystream[i];
        }

        offset += CHAPOLY_CHACHA20_BLOCK_SIZE;
    }

    // Tail; keep the unused keystream for the next call
    if (offset < input_len) {
        chacha20_block(ctx->state, ctx->keystream);
        ctx->state[12]++;

        size_t tail = input_len - offset;
        for (size_t i = 0; i < tail; i++) {
            output[offset + i] = input[offset + i] ^ ctx->keystream[i];
        }

        ctx->remaining = CHAPOLY_CHACHA20_BLOCK_SIZE - tail;
    }

    return CHAPOLY_SUCCESS;
}

chapoly_error_t chapoly_chacha20(const uint8_t key[32],
                                 const uint8_t nonce[12],
                                 uint32_t counter,
                                 const uint8_t* input,
                                 size_t input_len,
                                 uint8_t* output) {
    chapoly::SecureObject<chapoly_chacha20_ctx_t> ctx;

    chapoly_error_t err = chapoly_chacha20_init(ctx.get(), key, nonce, counter);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }
    if (!output) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    return chapoly_chacha20_crypt(ctx.get(), input, input_len, output);
}

void chapoly_chacha20_clear(chapoly_chacha20_ctx_t* ctx) {
    if (ctx) {
        chapoly_secure_zero(ctx, sizeof(chapoly_chacha20_ctx_t));
    }
}

} // extern "C"
