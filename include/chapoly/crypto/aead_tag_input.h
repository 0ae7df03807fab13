/**
 * @file aead_tag_input.h
 * @brief Poly1305 input message for the ChaCha20-Poly1305 AEAD
 *
 * RFC 8439 Section 2.8 layout:
 *
 *     aad || pad16(aad) || ciphertext || pad16(ciphertext)
 *         || le64(len(aad)) || le64(len(ciphertext))
 *
 * pad16(x) is (16 - len(x) mod 16) mod 16 zero bytes.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_CRYPTO_AEAD_TAG_INPUT_H
#define CHAPOLY_CRYPTO_AEAD_TAG_INPUT_H

#include "chapoly/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Number of zero bytes pad16() appends after @p len bytes
 */
CHAPOLY_API size_t chapoly_aead_pad16(size_t len);

/**
 * @brief Total size of the tag-input message
 *
 * @param aad_len Associated data length
 * @param ciphertext_len Ciphertext length
 * @param out_size Receives the message size
 * @return CHAPOLY_SUCCESS, CHAPOLY_ERROR_INVALID_PARAM or
 *         CHAPOLY_ERROR_LENGTH_OVERFLOW when the size does not fit in size_t
 */
CHAPOLY_API chapoly_error_t chapoly_aead_tag_input_size(
    size_t aad_len,
    size_t ciphertext_len,
    size_t* out_size
);

/**
 * @brief Write the tag-input message
 *
 * @param aad Associated data (may be NULL when aad_len is 0)
 * @param aad_len Associated data length
 * @param ciphertext Ciphertext (may be NULL when ciphertext_len is 0)
 * @param ciphertext_len Ciphertext length
 * @param out Output buffer
 * @param out_len Output buffer size, must equal chapoly_aead_tag_input_size()
 * @return CHAPOLY_SUCCESS, CHAPOLY_ERROR_MISSING_ARGUMENT,
 *         CHAPOLY_ERROR_LENGTH_MISMATCH or CHAPOLY_ERROR_LENGTH_OVERFLOW
 */
CHAPOLY_API chapoly_error_t chapoly_aead_tag_input_build(
    const uint8_t* aad,
    size_t aad_len,
    const uint8_t* ciphertext,
    size_t ciphertext_len,
    uint8_t* out,
    size_t out_len
);

#ifdef __cplusplus
}

#include "chapoly/core/types.h"

namespace chapoly {
namespace aead {

/**
 * @brief Build the tag-input message into a new buffer
 * @throws chapoly::Error on length overflow or missing input
 */
CHAPOLY_API ByteVec build_tag_input(const ByteVec& aad, const ByteVec& ciphertext);

} // namespace aead
} // namespace chapoly

#endif // __cplusplus

#endif // CHAPOLY_CRYPTO_AEAD_TAG_INPUT_H
