/**
 * @file poly1305.cpp
 * @brief Poly1305 Message Authenticator Implementation
 *
 * RFC 8439 Section 2.5 with 26-bit limbs and 64-bit products, plus the
 * Section 2.6 one-time key derivation from ChaCha20 block 0.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "chapoly/crypto/poly1305.h"
#include "chapoly/crypto/chacha20.h"
#include "chapoly/core/security.h"
#include "chapoly/internal/byte_order_impl.h"

#include <cstring>

using chapoly::internal::load32_le;
using chapoly::internal::store32_le;

namespace {

/**
 * @brief Absorb one 16-byte block into the accumulator
 *
 * @param hibit 1 << 24 for full blocks, 0 for the padded last block
 */
void poly1305_block(chapoly_poly1305_ctx_t* ctx, const uint8_t block[16], uint32_t hibit) {
    uint32_t t0 = load32_le(&block[0]);
    uint32_t t1 = load32_le(&block[4]);
    uint32_t t2 = load32_le(&block[8]);
    uint32_t t3 = load32_le(&block[12]);

    uint64_t h0 = ctx->h[0] + (t0 & 0x3ffffff);
    uint64_t h1 = ctx->h[1] + (((t0 >> 26) | (t1 << 6)) & 0x3ffffff);
    uint64_t h2 = ctx->h[2] + (((t1 >> 20) | (t2 << 12)) & 0x3ffffff);
    uint64_t h3 = ctx->h[3] + (((t2 >> 14) | (t3 << 18)) & 0x3ffffff);
    uint64_t h4 = ctx->h[4] + ((t3 >> 8) | hibit);

    const uint64_t r0 = ctx->r[0];
    const uint64_t r1 = ctx->r[1];
    const uint64_t r2 = ctx->r[2];
    const uint64_t r3 = ctx->r[3];
    const uint64_t r4 = ctx->r[4];

    // 2^130 = 5 (mod p)
    const uint64_t s1 = r1 * 5;
    const uint64_t s2 = r2 * 5;
    const uint64_t s3 = r3 * 5;
    const uint64_t s4 = r4 * 5;

    uint64_t d0 = h0 * r0 + h1 * s4 + h2 * s3 + h3 * s2 + h4 * s1;
    uint64_t d1 = h0 * r1 + h1 * r0 + h2 * s4 + h3 * s3 + h4 * s2;
    uint64_t d2 = h0 * r2 + h1 * r1 + h2 * r0 + h3 * s4 + h4 * s3;
    uint64_t d3 = h0 * r3 + h1 * r2 + h2 * r1 + h3 * r0 + h4 * s4;
    uint64_t d4 = h0 * r4 + h1 * r3 + h2 * r2 + h3 * r1 + h4 * r0;

    uint64_t c;
    c = d0 >> 26; d1 += c; d0 &= 0x3ffffff;
    c = d1 >> 26; d2 += c; d1 &= 0x3ffffff;
    c = d2 >> 26; d3 += c; d2 &= 0x3ffffff;
    c = d3 >> 26; d4 += c; d3 &= 0x3ffffff;
    c = d4 >> 26; d0 += c * 5; d4 &= 0x3ffffff;
    c = d0 >> 26; d1 += c; d0 &= 0x3ffffff;

    ctx->h[0] = static_cast<uint32_t>(d0);
    ctx->h[1] = static_cast<uint32_t>(d1);
    ctx->h[2] = static_cast<uint32_t>(d2);
    ctx->h[3] = static_cast<uint32_t>(d3);
    ctx->h[4] = static_cast<uint32_t>(d4);
}

} // namespace

extern "C" {

chapoly_error_t chapoly_poly1305_init(chapoly_poly1305_ctx_t* ctx, const uint8_t key[32]) {
    if (!ctx || !key) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    std::memset(ctx, 0, sizeof(chapoly_poly1305_ctx_t));

    uint32_t t0 = load32_le(&key[0]);
    uint32_t t1 = load32_le(&key[4]);
    uint32_t t2 = load32_le(&key[8]);
    uint32_t t3 = load32_le(&key[12]);

    // r &= 0x0ffffffc0ffffffc0ffffffc0fffffff, split into 26-bit limbs
    ctx->r[0] = t0 & 0x3ffffff;
    ctx->r[1] = ((t0 >> 26) | (t1 << 6)) & 0x3ffff03;
    ctx->r[2] = ((t1 >> 20) | (t2 << 12)) & 0x3ffc0ff;
    ctx->r[3] = ((t2 >> 14) | (t3 << 18)) & 0x3f03fff;
    ctx->r[4] = (t3 >> 8) & 0x00fffff;

    ctx->s[0] = load32_le(&key[16]);
    ctx->s[1] = load32_le(&key[20]);
    ctx->s[2] = load32_le(&key[24]);
    ctx->s[3] = load32_le(&key[28]);

    return CHAPOLY_SUCCESS;
}

chapoly_error_t chapoly_poly1305_update(chapoly_poly1305_ctx_t* ctx,
                                        const uint8_t* data,
                                        size_t len) {
    if (!ctx || ctx->finalized) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }
    if (len == 0) {
        return CHAPOLY_SUCCESS;
    }
    if (!data) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    size_t offset = 0;

    if (ctx->buffer_len > 0) {
        size_t use = CHAPOLY_MIN(len, CHAPOLY_POLY1305_BLOCK_SIZE - ctx->buffer_len);

        std::memcpy(&ctx->buffer[ctx->buffer_len], data, use);
        ctx->buffer_len += use;
        offset = use;

        if (ctx->buffer_len == CHAPOLY_POLY1305_BLOCK_SIZE) {
            poly1305_block(ctx, ctx->buffer, 1U << 24);
            ctx->buffer_len = 0;
        }
    }

    while (offset + CHAPOLY_POLY1305_BLOCK_SIZE <= len) {
        poly1305_block(ctx, &data[offset], 1U << 24);
        offset += CHAPOLY_POLY1305_BLOCK_SIZE;
    }

    if (offset < len) {
        std::memcpy(ctx->buffer, &data[offset], len - offset);
        ctx->buffer_len = len - offset;
    }

    return CHAPOLY_SUCCESS;
}

chapoly_error_t chapoly_poly1305_final(chapoly_poly1305_ctx_t* ctx, uint8_t tag[16]) {
    if (!ctx || !tag || ctx->finalized) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    // Partial block: append 0x01 then zeros, no 2^128 bit
    if (ctx->buffer_len > 0) {
        ctx->buffer[ctx->buffer_len] = 1;
        for (size_t i = ctx->buffer_len + 1; i < CHAPOLY_POLY1305_BLOCK_SIZE; i++) {
            ctx->buffer[i] = 0;
        }
        poly1305_block(ctx, ctx->buffer, 0);
    }

    uint32_t h0 = ctx->h[0];
    uint32_t h1 = ctx->h[1];
    uint32_t h2 = ctx->h[2];
    uint32_t h3 = ctx->h[3];
    uint32_t h4 = ctx->h[4];

    uint32_t c;
    c = h1 >> 26; h2 += c; h1 &= 0x3ffffff;
    c = h2 >> 26; h3 += c; h2 &= 0x3ffffff;
    c = h3 >> 26; h4 += c; h3 &= 0x3ffffff;
    c = h4 >> 26; h0 += c * 5; h4 &= 0x3ffffff;
    c = h0 >> 26; h1 += c; h0 &= 0x3ffffff;

    // g = h + 5 - 2^130
    uint32_t g0 = h0 + 5; c = g0 >> 26; g0 &= 0x3ffffff;
    uint32_t g1 = h1 + c; c = g1 >> 26; g1 &= 0x3ffffff;
    uint32_t g2 = h2 + c; c = g2 >> 26; g2 &= 0x3ffffff;
    uint32_t g3 = h3 + c; c = g3 >> 26; g3 &= 0x3ffffff;
    uint32_t g4 = h4 + c - (1U << 26);

    // mask is all ones when h >= p (g4 did not borrow)
    uint32_t mask = (g4 >> 31) - 1;
    h0 = (h0 & ~mask) | (g0 & mask);
    h1 = (h1 & ~mask) | (g1 & mask);
    h2 = (h2 & ~mask) | (g2 & mask);
    h3 = (h3 & ~mask) | (g3 & mask);
    h4 = (h4 & ~mask) | (g4 & mask);

    // tag = (h + s) mod 2^128
    uint64_t f0 = static_cast<uint64_t>(h0 | (h1 << 26)) + ctx->s[0];
    uint64_t f1 = static_cast<uint64_t>((h1 >> 6) | (h2 << 20)) + ctx->s[1];
    uint64_t f2 = static_cast<uint64_t>((h2 >> 12) | (h3 << 14)) + ctx->s[2];
    uint64_t f3 = static_cast<uint64_t>((h3 >> 18) | (h4 << 8)) + ctx->s[3];

    f1 += f0 >> 32;
    f2 += f1 >> 32;
    f3 += f2 >> 32;

    store32_le(&tag[0], static_cast<uint32_t>(f0));
    store32_le(&tag[4], static_cast<uint32_t>(f1));
    store32_le(&tag[8], static_cast<uint32_t>(f2));
    store32_le(&tag[12], static_cast<uint32_t>(f3));

    ctx->finalized = 1;

    return CHAPOLY_SUCCESS;
}

chapoly_error_t chapoly_poly1305(const uint8_t key[32],
                                 const uint8_t* data,
                                 size_t len,
                                 uint8_t tag[16]) {
    chapoly::SecureObject<chapoly_poly1305_ctx_t> ctx;

    chapoly_error_t err = chapoly_poly1305_init(ctx.get(), key);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    err = chapoly_poly1305_update(ctx.get(), data, len);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    return chapoly_poly1305_final(ctx.get(), tag);
}

chapoly_error_t chapoly_poly1305_verify(const uint8_t key[32],
                                        const uint8_t* data,
                                        size_t len,
                                        const uint8_t tag[16]) {
    if (!tag) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    chapoly::SecureArray<uint8_t, CHAPOLY_TAG_SIZE> computed;

    chapoly_error_t err = chapoly_poly1305(key, data, len, computed.data());
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    if (!chapoly_secure_compare(tag, computed.data(), CHAPOLY_TAG_SIZE)) {
        return CHAPOLY_ERROR_TAG_MISMATCH;
    }

    return CHAPOLY_SUCCESS;
}

chapoly_error_t chapoly_poly1305_key_gen(const uint8_t key[32],
                                         const uint8_t nonce[12],
                                         uint8_t onetime_key[32]) {
    if (!onetime_key) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    chapoly::SecureObject<chapoly_chacha20_ctx_t> chacha;
    chapoly::SecureArray<uint8_t, CHAPOLY_CHACHA20_BLOCK_SIZE> block;

    chapoly_error_t err = chapoly_chacha20_init(chacha.get(), key, nonce, 0);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    err = chapoly_chacha20_block(chacha.get(), block.data());
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    std::memcpy(onetime_key, block.data(), CHAPOLY_POLY1305_KEY_SIZE);

    return CHAPOLY_SUCCESS;
}

void chapoly_poly1305_clear(chapoly_poly1305_ctx_t* ctx) {
    if (ctx) {
        chapoly_secure_zero(ctx, sizeof(chapoly_poly1305_ctx_t));
    }
}

} // extern "C"
