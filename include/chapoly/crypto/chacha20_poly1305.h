/**
 * @file chacha20_poly1305.h
 * @brief ChaCha20-Poly1305 AEAD (Authenticated Encryption with Associated Data)
 *
 * Implementation of RFC 8439 Section 2.8:
 * - Per-message Poly1305 key from ChaCha20 block 0
 * - Payload encrypted with ChaCha20 starting at block 1
 * - Tag over aad || pad || ciphertext || pad || le64 lengths
 * - Authenticate-then-decrypt with constant-time tag comparison
 *
 * Nonce uniqueness per key is the caller's obligation; reusing a nonce under
 * the same key reveals the XOR of plaintexts and allows tag forgery.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_CRYPTO_CHACHA20_POLY1305_H
#define CHAPOLY_CRYPTO_CHACHA20_POLY1305_H

#include "chapoly/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief ChaCha20-Poly1305 AEAD key context
 *
 * Created once per key and reused for any number of messages. Concurrent
 * encrypt/decrypt calls on one context are safe; clearing it while calls are
 * in flight is not.
 */
typedef struct {
    uint8_t key[32];
    int initialized;
} chapoly_aead_ctx_t;

/**
 * @brief Load a key into an AEAD context
 *
 * @param ctx Context to initialize
 * @param key Key bytes
 * @param key_len Key length, must be 32
 * @return CHAPOLY_SUCCESS, CHAPOLY_ERROR_INVALID_PARAM (null ctx) or
 *         CHAPOLY_ERROR_INVALID_KEY (null key or wrong length)
 */
CHAPOLY_API chapoly_error_t chapoly_aead_init(
    chapoly_aead_ctx_t* ctx,
    const uint8_t* key,
    size_t key_len
);

/**
 * @brief ChaCha20-Poly1305 authenticated encryption
 *
 * Arguments are validated before any cryptographic work, in the order:
 * released context, missing buffers, plaintext/ciphertext length mismatch,
 * nonce length, tag length, message length limits.
 *
 * @param ctx Initialized context
 * @param nonce Nonce (MUST be unique per key)
 * @param nonce_len Nonce length, must be 12
 * @param plaintext Input plaintext (may be NULL only when plaintext_len is 0)
 * @param plaintext_len Plaintext length
 * @param ciphertext Output ciphertext (may alias plaintext exactly)
 * @param ciphertext_len Ciphertext buffer length, must equal plaintext_len
 * @param tag Tag output
 * @param tag_len Tag buffer length, must be 16
 * @param aad Additional authenticated data (NULL when absent)
 * @param aad_len AAD length
 * @return CHAPOLY_SUCCESS or error code
 */
CHAPOLY_API chapoly_error_t chapoly_aead_encrypt(
    const chapoly_aead_ctx_t* ctx,
    const uint8_t* nonce,
    size_t nonce_len,
    const uint8_t* plaintext,
    size_t plaintext_len,
    uint8_t* ciphertext,
    size_t ciphertext_len,
    uint8_t* tag,
    size_t tag_len,
    const uint8_t* aad,
    size_t aad_len
);

/**
 * @brief ChaCha20-Poly1305 authenticated decryption
 *
 * The tag is verified over the received ciphertext before any keystream is
 * applied. On CHAPOLY_ERROR_TAG_MISMATCH the plaintext buffer is zero-filled;
 * when it aliases @p ciphertext the ciphertext is zeroed with it.
 *
 * @param ctx Initialized context
 * @param nonce Nonce used for encryption
 * @param nonce_len Nonce length, must be 12
 * @param ciphertext Input ciphertext (may be NULL only when ciphertext_len is 0)
 * @param ciphertext_len Ciphertext length
 * @param tag Authentication tag to verify
 * @param tag_len Tag length, must be 16
 * @param plaintext Output plaintext (may alias ciphertext exactly)
 * @param plaintext_len Plaintext buffer length, must equal ciphertext_len
 * @param aad Additional authenticated data (NULL when absent)
 * @param aad_len AAD length
 * @return CHAPOLY_SUCCESS, CHAPOLY_ERROR_TAG_MISMATCH or validation error
 */
CHAPOLY_API chapoly_error_t chapoly_aead_decrypt(
    const chapoly_aead_ctx_t* ctx,
    const uint8_t* nonce,
    size_t nonce_len,
    const uint8_t* ciphertext,
    size_t ciphertext_len,
    const uint8_t* tag,
    size_t tag_len,
    uint8_t* plaintext,
    size_t plaintext_len,
    const uint8_t* aad,
    size_t aad_len
);

/**
 * @brief Erase the key and mark the context released
 *
 * Subsequent encrypt/decrypt calls fail with CHAPOLY_ERROR_CONTEXT_RELEASED.
 * Safe to call more than once; NULL is a no-op.
 */
CHAPOLY_API void chapoly_aead_clear(chapoly_aead_ctx_t* ctx);

#ifdef __cplusplus
}
#endif

// C++ Interface
#ifdef __cplusplus

#include "chapoly/core/types.h"

namespace chapoly {

/**
 * @brief ChaCha20-Poly1305 AEAD class
 *
 * Owns the key for its lifetime and erases it on release(), on move-from and
 * in the destructor. All failures are reported as chapoly::Error.
 */
class CHAPOLY_API ChaCha20Poly1305 {
public:
    static constexpr size_t KEY_SIZE = CHAPOLY_KEY_SIZE;
    static constexpr size_t NONCE_SIZE = CHAPOLY_NONCE_SIZE;
    static constexpr size_t TAG_SIZE = CHAPOLY_TAG_SIZE;

    /**
     * @brief Construct with 256-bit key
     * @throws chapoly::Error (CHAPOLY_ERROR_INVALID_KEY) if key is not 32 bytes
     */
    explicit ChaCha20Poly1305(const ByteVec& key);
    ChaCha20Poly1305(const uint8_t* key, size_t key_len);

    ~ChaCha20Poly1305();

    // Disable copy
    ChaCha20Poly1305(const ChaCha20Poly1305&) = delete;
    ChaCha20Poly1305& operator=(const ChaCha20Poly1305&) = delete;

    // Enable move
    ChaCha20Poly1305(ChaCha20Poly1305&&) noexcept;
    ChaCha20Poly1305& operator=(ChaCha20Poly1305&&) noexcept;

    /**
     * @brief Authenticated encryption into caller-supplied buffers
     * @param nonce 12-byte nonce (MUST be unique per message)
     * @param plaintext Input data
     * @param ciphertext Output, must already have plaintext.size() bytes
     * @param tag Output, must already have TAG_SIZE bytes
     * @param aad Additional authenticated data
     */
    void encrypt(const ByteVec& nonce,
                 const ByteVec& plaintext,
                 ByteVec& ciphertext,
                 ByteVec& tag,
                 const ByteVec& aad = {}) const;

    /**
     * @brief Authenticated decryption into a caller-supplied buffer
     *
     * On tag mismatch the plaintext buffer is zero-filled and
     * chapoly::Error (CHAPOLY_ERROR_TAG_MISMATCH) is thrown.
     */
    void decrypt(const ByteVec& nonce,
                 const ByteVec& ciphertext,
                 const ByteVec& tag,
                 ByteVec& plaintext,
                 const ByteVec& aad = {}) const;

    /**
     * @brief Encrypt and return ciphertext || tag in a new buffer
     */
    ByteVec seal(const ByteVec& nonce,
                 const ByteVec& plaintext,
                 const ByteVec& aad = {}) const;

    /**
     * @brief Verify and decrypt ciphertext || tag
     * @throws chapoly::Error (CHAPOLY_ERROR_INVALID_TAG_LENGTH) if sealed is
     *         shorter than TAG_SIZE, (CHAPOLY_ERROR_TAG_MISMATCH) on forgery
     */
    ByteVec open(const ByteVec& nonce,
                 const ByteVec& sealed,
                 const ByteVec& aad = {}) const;

    /**
     * @brief Erase the key; later operations throw CHAPOLY_ERROR_CONTEXT_RELEASED
     */
    void release() noexcept;

    bool released() const noexcept;

    /**
     * @brief Generate random nonce
     */
    static ByteVec generateNonce();

    /**
     * @brief Generate random key
     */
    static ByteVec generateKey();

private:
    chapoly_aead_ctx_t ctx_;
};

} // namespace chapoly

#endif // __cplusplus

#endif // CHAPOLY_CRYPTO_CHACHA20_POLY1305_H
