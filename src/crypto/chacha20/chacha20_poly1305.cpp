/**
 * @file chacha20_poly1305.cpp
 * @brief ChaCha20-Poly1305 AEAD Implementation
 *
 * RFC 8439 Section 2.8 composition:
 * - Validation of every argument before any keystream is produced
 * - One-time Poly1305 key from ChaCha20 block 0
 * - Payload keystream from block 1 onward
 * - Tag over the tag-input message built by aead_tag_input.cpp
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "chapoly/crypto/chacha20_poly1305.h"
#include "chapoly/crypto/aead_tag_input.h"
#include "chapoly/crypto/chacha20.h"
#include "chapoly/crypto/poly1305.h"
#include "chapoly/core/error.h"
#include "chapoly/core/security.h"

#include <cstring>
#include <memory>
#include <new>

namespace {

/**
 * @brief Argument checks shared by encrypt and decrypt
 *
 * @p in is the caller's input message and @p out its output buffer.
 */
chapoly_error_t validate_call(const chapoly_aead_ctx_t* ctx,
                              const uint8_t* nonce, size_t nonce_len,
                              const uint8_t* in, size_t in_len,
                              const uint8_t* out, size_t out_len,
                              const uint8_t* tag, size_t tag_len,
                              const uint8_t* aad, size_t aad_len) {
    if (!ctx) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }
    if (!ctx->initialized) {
        return CHAPOLY_ERROR_CONTEXT_RELEASED;
    }
    if (!nonce || !tag ||
        (!in && in_len > 0) ||
        (!out && out_len > 0) ||
        (!aad && aad_len > 0)) {
        return CHAPOLY_ERROR_MISSING_ARGUMENT;
    }
    if (in_len != out_len) {
        return CHAPOLY_ERROR_LENGTH_MISMATCH;
    }
    if (nonce_len != CHAPOLY_NONCE_SIZE) {
        return CHAPOLY_ERROR_INVALID_NONCE_LENGTH;
    }
    if (tag_len != CHAPOLY_TAG_SIZE) {
        return CHAPOLY_ERROR_INVALID_TAG_LENGTH;
    }
    if (static_cast<unsigned long long>(in_len) > CHAPOLY_AEAD_MAX_MESSAGE_SIZE) {
        return CHAPOLY_ERROR_LENGTH_OVERFLOW;
    }

    size_t tag_input_len = 0;
    return chapoly_aead_tag_input_size(aad_len, in_len, &tag_input_len);
}

/**
 * @brief Heap buffer for the Poly1305 input of one call
 */
struct TagInput {
    std::unique_ptr<uint8_t[]> data;
    size_t size = 0;
};

chapoly_error_t alloc_tag_input(size_t aad_len, size_t ciphertext_len, TagInput* input) {
    chapoly_error_t err = chapoly_aead_tag_input_size(aad_len, ciphertext_len, &input->size);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    input->data.reset(new (std::nothrow) uint8_t[input->size]);
    if (!input->data) {
        return CHAPOLY_ERROR_MEMORY_ALLOC;
    }
    return CHAPOLY_SUCCESS;
}

} // namespace

extern "C" {

chapoly_error_t chapoly_aead_init(chapoly_aead_ctx_t* ctx,
                                  const uint8_t* key,
                                  size_t key_len) {
    if (!ctx) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }
    if (!key || key_len != CHAPOLY_KEY_SIZE) {
        return CHAPOLY_ERROR_INVALID_KEY;
    }

    std::memcpy(ctx->key, key, CHAPOLY_KEY_SIZE);
    ctx->initialized = 1;

    return CHAPOLY_SUCCESS;
}

chapoly_error_t chapoly_aead_encrypt(const chapoly_aead_ctx_t* ctx,
                                     const uint8_t* nonce,
                                     size_t nonce_len,
                                     const uint8_t* plaintext,
                                     size_t plaintext_len,
                                     uint8_t* ciphertext,
                                     size_t ciphertext_len,
                                     uint8_t* tag,
                                     size_t tag_len,
                                     const uint8_t* aad,
                                     size_t aad_len) {
    chapoly_error_t err = validate_call(ctx, nonce, nonce_len,
                                        plaintext, plaintext_len,
                                        ciphertext, ciphertext_len,
                                        tag, tag_len, aad, aad_len);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    TagInput input;
    err = alloc_tag_input(aad_len, ciphertext_len, &input);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    chapoly::SecureArray<uint8_t, CHAPOLY_POLY1305_KEY_SIZE> otk;

    if (plaintext_len > 0) {
        err = chapoly_chacha20(ctx->key, nonce, 1, plaintext, plaintext_len, ciphertext);
    }
    if (err == CHAPOLY_SUCCESS) {
        err = chapoly_aead_tag_input_build(aad, aad_len, ciphertext, ciphertext_len,
                                           input.data.get(), input.size);
    }
    if (err == CHAPOLY_SUCCESS) {
        err = chapoly_poly1305_key_gen(ctx->key, nonce, otk.data());
    }
    if (err == CHAPOLY_SUCCESS) {
        err = chapoly_poly1305(otk.data(), input.data.get(), input.size, tag);
    }

    if (err != CHAPOLY_SUCCESS) {
        chapoly_secure_zero(ciphertext, ciphertext_len);
        chapoly_secure_zero(tag, tag_len);
    }
    return err;
}

chapoly_error_t chapoly_aead_decrypt(const chapoly_aead_ctx_t* ctx,
                                     const uint8_t* nonce,
                                     size_t nonce_len,
                                     const uint8_t* ciphertext,
                                     size_t ciphertext_len,
                                     const uint8_t* tag,
                                     size_t tag_len,
                                     uint8_t* plaintext,
                                     size_t plaintext_len,
                                     const uint8_t* aad,
                                     size_t aad_len) {
    chapoly_error_t err = validate_call(ctx, nonce, nonce_len,
                                        ciphertext, ciphertext_len,
                                        plaintext, plaintext_len,
                                        tag, tag_len, aad, aad_len);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    TagInput input;
    err = alloc_tag_input(aad_len, ciphertext_len, &input);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }

    chapoly::SecureArray<uint8_t, CHAPOLY_POLY1305_KEY_SIZE> otk;

    err = chapoly_aead_tag_input_build(aad, aad_len, ciphertext, ciphertext_len,
                                       input.data.get(), input.size);
    if (err == CHAPOLY_SUCCESS) {
        err = chapoly_poly1305_key_gen(ctx->key, nonce, otk.data());
    }
    if (err == CHAPOLY_SUCCESS) {
        err = chapoly_poly1305_verify(otk.data(), input.data.get(), input.size, tag);
    }

    // No keystream is applied unless the tag matched
    if (err == CHAPOLY_SUCCESS && ciphertext_len > 0) {
        err = chapoly_chacha20(ctx->key, nonce, 1, ciphertext, ciphertext_len, plaintext);
    }

    if (err != CHAPOLY_SUCCESS) {
        chapoly_secure_zero(plaintext, plaintext_len);
    }
    return err;
}

void chapoly_aead_clear(chapoly_aead_ctx_t* ctx) {
    if (ctx) {
        chapoly_secure_zero(ctx, sizeof(chapoly_aead_ctx_t));
    }
}

} // extern "C"

// ============================================================================
// C++ Implementation
// ============================================================================

namespace chapoly {

namespace {

// Empty vectors may report a null data(); substitute a valid address so the
// length checks report them
const uint8_t* in_ptr(const ByteVec& v, const uint8_t* fallback) {
    return v.empty() ? fallback : v.data();
}

uint8_t* out_ptr(ByteVec& v, uint8_t* fallback) {
    return v.empty() ? fallback : v.data();
}

} // namespace

ChaCha20Poly1305::ChaCha20Poly1305(const ByteVec& key) : ctx_{} {
    throw_if_error(chapoly_aead_init(&ctx_, key.data(), key.size()), "ChaCha20Poly1305");
}

ChaCha20Poly1305::ChaCha20Poly1305(const uint8_t* key, size_t key_len) : ctx_{} {
    throw_if_error(chapoly_aead_init(&ctx_, key, key_len), "ChaCha20Poly1305");
}

ChaCha20Poly1305::~ChaCha20Poly1305() {
    chapoly_aead_clear(&ctx_);
}

ChaCha20Poly1305::ChaCha20Poly1305(ChaCha20Poly1305&& other) noexcept : ctx_(other.ctx_) {
    chapoly_aead_clear(&other.ctx_);
}

ChaCha20Poly1305& ChaCha20Poly1305::operator=(ChaCha20Poly1305&& other) noexcept {
    if (this != &other) {
        chapoly_aead_clear(&ctx_);
        ctx_ = other.ctx_;
        chapoly_aead_clear(&other.ctx_);
    }
    return *this;
}

void ChaCha20Poly1305::encrypt(const ByteVec& nonce,
                               const ByteVec& plaintext,
                               ByteVec& ciphertext,
                               ByteVec& tag,
                               const ByteVec& aad) const {
    uint8_t empty = 0;
    throw_if_error(chapoly_aead_encrypt(&ctx_,
                                        in_ptr(nonce, &empty), nonce.size(),
                                        plaintext.data(), plaintext.size(),
                                        out_ptr(ciphertext, &empty), ciphertext.size(),
                                        out_ptr(tag, &empty), tag.size(),
                                        aad.data(), aad.size()),
                   "ChaCha20Poly1305::encrypt");
}

void ChaCha20Poly1305::decrypt(const ByteVec& nonce,
                               const ByteVec& ciphertext,
                               const ByteVec& tag,
                               ByteVec& plaintext,
                               const ByteVec& aad) const {
    uint8_t empty = 0;
    throw_if_error(chapoly_aead_decrypt(&ctx_,
                                        in_ptr(nonce, &empty), nonce.size(),
                                        ciphertext.data(), ciphertext.size(),
                                        in_ptr(tag, &empty), tag.size(),
                                        out_ptr(plaintext, &empty), plaintext.size(),
                                        aad.data(), aad.size()),
                   "ChaCha20Poly1305::decrypt");
}

ByteVec ChaCha20Poly1305::seal(const ByteVec& nonce,
                               const ByteVec& plaintext,
                               const ByteVec& aad) const {
    uint8_t empty = 0;
    ByteVec out(plaintext.size() + TAG_SIZE);

    throw_if_error(chapoly_aead_encrypt(&ctx_,
                                        in_ptr(nonce, &empty), nonce.size(),
                                        plaintext.data(), plaintext.size(),
                                        out.data(), plaintext.size(),
                                        out.data() + plaintext.size(), TAG_SIZE,
                                        aad.data(), aad.size()),
                   "ChaCha20Poly1305::seal");
    return out;
}

ByteVec ChaCha20Poly1305::open(const ByteVec& nonce,
                               const ByteVec& sealed,
                               const ByteVec& aad) const {
    if (released()) {
        throw Error(CHAPOLY_ERROR_CONTEXT_RELEASED, "ChaCha20Poly1305::open");
    }
    if (sealed.size() < TAG_SIZE) {
        throw Error(CHAPOLY_ERROR_INVALID_TAG_LENGTH, "ChaCha20Poly1305::open");
    }

    uint8_t empty = 0;
    const size_t ct_len = sealed.size() - TAG_SIZE;
    ByteVec plaintext(ct_len);

    throw_if_error(chapoly_aead_decrypt(&ctx_,
                                        in_ptr(nonce, &empty), nonce.size(),
                                        sealed.data(), ct_len,
                                        sealed.data() + ct_len, TAG_SIZE,
                                        out_ptr(plaintext, &empty), plaintext.size(),
                                        aad.data(), aad.size()),
                   "ChaCha20Poly1305::open");
    return plaintext;
}

void ChaCha20Poly1305::release() noexcept {
    chapoly_aead_clear(&ctx_);
}

bool ChaCha20Poly1305::released() const noexcept {
    return ctx_.initialized == 0;
}

ByteVec ChaCha20Poly1305::generateNonce() {
    ByteVec nonce(NONCE_SIZE);
    throw_if_error(chapoly_random_bytes(nonce.data(), nonce.size()),
                   "ChaCha20Poly1305::generateNonce");
    return nonce;
}

ByteVec ChaCha20Poly1305::generateKey() {
    ByteVec key(KEY_SIZE);
    throw_if_error(chapoly_random_bytes(key.data(), key.size()),
                   "ChaCha20Poly1305::generateKey");
    return key;
}

} // namespace chapoly
