/**
 * @file aead_tag_input.cpp
 * @brief Poly1305 input construction for ChaCha20-Poly1305
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "chapoly/crypto/aead_tag_input.h"
#include "chapoly/core/error.h"
#include "chapoly/internal/byte_order_impl.h"

#include <cstdint>
#include <cstring>

namespace {

// Two little-endian 64-bit lengths
constexpr size_t LENGTH_BLOCK_SIZE = 16;

bool add_overflows(size_t a, size_t b, size_t* sum) {
    if (a > SIZE_MAX - b) {
        return true;
    }
    *sum = a + b;
    return false;
}

} // namespace

extern "C" {

size_t chapoly_aead_pad16(size_t len) {
    return (16 - (len % 16)) % 16;
}

chapoly_error_t chapoly_aead_tag_input_size(size_t aad_len,
                                            size_t ciphertext_len,
                                            size_t* out_size) {
    if (!out_size) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }

    size_t total = 0;
    if (add_overflows(total, aad_len, &total) ||
        add_overflows(total, chapoly_aead_pad16(aad_len), &total) ||
        add_overflows(total, ciphertext_len, &total) ||
        add_overflows(total, chapoly_aead_pad16(ciphertext_len), &total) ||
        add_overflows(total, LENGTH_BLOCK_SIZE, &total)) {
        return CHAPOLY_ERROR_LENGTH_OVERFLOW;
    }

    *out_size = total;
    return CHAPOLY_SUCCESS;
}

chapoly_error_t chapoly_aead_tag_input_build(const uint8_t* aad,
                                             size_t aad_len,
                                             const uint8_t* ciphertext,
                                             size_t ciphertext_len,
                                             uint8_t* out,
                                             size_t out_len) {
    if (!out || (!aad && aad_len > 0) || (!ciphertext && ciphertext_len > 0)) {
        return CHAPOLY_ERROR_MISSING_ARGUMENT;
    }

    size_t expected = 0;
    chapoly_error_t err = chapoly_aead_tag_input_size(aad_len, ciphertext_len, &expected);
    if (err != CHAPOLY_SUCCESS) {
        return err;
    }
    if (out_len != expected) {
        return CHAPOLY_ERROR_LENGTH_MISMATCH;
    }

    size_t offset = 0;

    if (aad_len > 0) {
        std::memcpy(out + offset, aad, aad_len);
        offset += aad_len;
    }
    std::memset(out + offset, 0, chapoly_aead_pad16(aad_len));
    offset += chapoly_aead_pad16(aad_len);

    if (ciphertext_len > 0) {
        std::memcpy(out + offset, ciphertext, ciphertext_len);
        offset += ciphertext_len;
    }
    std::memset(out + offset, 0, chapoly_aead_pad16(ciphertext_len));
    offset += chapoly_aead_pad16(ciphertext_len);

    chapoly::internal::store64_le(out + offset, static_cast<uint64_t>(aad_len));
    chapoly::internal::store64_le(out + offset + 8, static_cast<uint64_t>(ciphertext_len));

    return CHAPOLY_SUCCESS;
}

} // extern "C"

namespace chapoly {
namespace aead {

ByteVec build_tag_input(const ByteVec& aad, const ByteVec& ciphertext) {
    size_t size = 0;
    throw_if_error(chapoly_aead_tag_input_size(aad.size(), ciphertext.size(), &size),
                   "build_tag_input");

    ByteVec out(size);
    throw_if_error(chapoly_aead_tag_input_build(aad.data(), aad.size(),
                                                ciphertext.data(), ciphertext.size(),
                                                out.data(), out.size()),
                   "build_tag_input");
    return out;
}

} // namespace aead
} // namespace chapoly
