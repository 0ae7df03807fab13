/**
 * @file test_openssl_interop.cpp
 * @brief Cross-checks ChaCha20-Poly1305 against OpenSSL EVP_chacha20_poly1305
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <vector>

#include <openssl/evp.h>

#include "chapoly/chapoly.h"

using chapoly::ByteVec;
using chapoly::ChaCha20Poly1305;

namespace {

using EvpCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

EvpCtxPtr make_ctx() {
    return EvpCtxPtr(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
}

/**
 * @brief OpenSSL encryption, output ciphertext || tag
 */
bool openssl_seal(const ByteVec& key, const ByteVec& nonce, const ByteVec& aad,
                  const ByteVec& plaintext, ByteVec& sealed) {
    EvpCtxPtr ctx = make_ctx();
    if (!ctx) return false;

    int len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, 12, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return false;
    }
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        return false;
    }

    sealed.assign(plaintext.size() + 16, 0);
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), sealed.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
        return false;
    }

    uint8_t final_block[16];
    if (EVP_EncryptFinal_ex(ctx.get(), final_block, &len) != 1) {
        return false;
    }
    return EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, 16,
                               sealed.data() + plaintext.size()) == 1;
}

/**
 * @brief OpenSSL verification and decryption of ciphertext || tag
 */
bool openssl_open(const ByteVec& key, const ByteVec& nonce, const ByteVec& aad,
                  const ByteVec& sealed, ByteVec& plaintext) {
    EvpCtxPtr ctx = make_ctx();
    if (!ctx || sealed.size() < 16) return false;

    const size_t ct_len = sealed.size() - 16;
    ByteVec tag(sealed.begin() + static_cast<std::ptrdiff_t>(ct_len), sealed.end());

    int len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, 12, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return false;
    }
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        return false;
    }

    plaintext.assign(ct_len, 0);
    if (ct_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, sealed.data(),
                          static_cast<int>(ct_len)) != 1) {
        return false;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, 16, tag.data()) != 1) {
        return false;
    }

    uint8_t final_block[16];
    return EVP_DecryptFinal_ex(ctx.get(), final_block, &len) > 0;
}

ByteVec random_bytes(size_t len) {
    ByteVec v(len);
    chapoly::throw_if_error(chapoly_random_bytes(v.data(), v.size()), "random_bytes");
    return v;
}

} // namespace

class OpenSslInteropTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(chapoly_init(), CHAPOLY_SUCCESS);
    }
};

TEST_F(OpenSslInteropTest, SealMatchesOpenSSL) {
    const size_t pt_sizes[] = {0, 1, 16, 63, 64, 65, 255, 1024, 70000};
    const size_t aad_sizes[] = {0, 5, 16, 33};

    for (size_t pt_len : pt_sizes) {
        for (size_t aad_len : aad_sizes) {
            ByteVec key = ChaCha20Poly1305::generateKey();
            ByteVec nonce = ChaCha20Poly1305::generateNonce();
            ByteVec aad = random_bytes(aad_len);
            ByteVec pt = random_bytes(pt_len);

            ChaCha20Poly1305 aead(key);
            ByteVec ours = aead.seal(nonce, pt, aad);

            ByteVec theirs;
            ASSERT_TRUE(openssl_seal(key, nonce, aad, pt, theirs));
            EXPECT_EQ(ours, theirs) << "pt_len=" << pt_len << " aad_len=" << aad_len;
        }
    }
}

TEST_F(OpenSslInteropTest, OpenSSLOpensOurs) {
    ByteVec key = ChaCha20Poly1305::generateKey();
    ByteVec nonce = ChaCha20Poly1305::generateNonce();
    ByteVec aad = random_bytes(21);
    ByteVec pt = random_bytes(333);

    ChaCha20Poly1305 aead(key);
    ByteVec sealed = aead.seal(nonce, pt, aad);

    ByteVec opened;
    ASSERT_TRUE(openssl_open(key, nonce, aad, sealed, opened));
    EXPECT_EQ(opened, pt);

    sealed[0] ^= 0x01;
    EXPECT_FALSE(openssl_open(key, nonce, aad, sealed, opened));
}

TEST_F(OpenSslInteropTest, WeOpenOpenSSL) {
    ByteVec key = ChaCha20Poly1305::generateKey();
    ByteVec nonce = ChaCha20Poly1305::generateNonce();
    ByteVec aad = random_bytes(7);
    ByteVec pt = random_bytes(129);

    ByteVec sealed;
    ASSERT_TRUE(openssl_seal(key, nonce, aad, pt, sealed));

    ChaCha20Poly1305 aead(key);
    EXPECT_EQ(aead.open(nonce, sealed, aad), pt);
}
