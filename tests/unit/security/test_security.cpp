/**
 * @file test_security.cpp
 * @brief Security primitive and library core tests
 *
 * - Secure zeroing and constant-time comparison boundaries
 * - CSPRNG
 * - RAII secret containers
 * - Error codes, chapoly::Error, version information
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <array>
#include <cstring>
#include <set>
#include <string>
#include <vector>

#include "chapoly/chapoly.h"

class SecurityTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(chapoly_init(), CHAPOLY_SUCCESS);
    }
};

// ============================================================================
// Secure Zero
// ============================================================================

TEST_F(SecurityTest, SecureZero_NullPointer) {
    chapoly_secure_zero(nullptr, 100);
    chapoly_secure_zero(nullptr, 0);
    SUCCEED();
}

TEST_F(SecurityTest, SecureZero_ZeroLength) {
    uint8_t buf[4] = {1, 2, 3, 4};
    chapoly_secure_zero(buf, 0);
    EXPECT_EQ(buf[0], 1);
    EXPECT_EQ(buf[3], 4);
}

TEST_F(SecurityTest, SecureZero_Clears) {
    std::vector<uint8_t> buf(257, 0xff);
    chapoly_secure_zero(buf.data(), buf.size());
    for (uint8_t b : buf) {
        ASSERT_EQ(b, 0);
    }
}

// ============================================================================
// Constant-time Compare
// ============================================================================

TEST_F(SecurityTest, SecureCompare_Basic) {
    uint8_t a[16], b[16];
    std::memset(a, 0x3c, sizeof(a));
    std::memset(b, 0x3c, sizeof(b));

    EXPECT_EQ(chapoly_secure_compare(a, b, sizeof(a)), 1);

    for (size_t i = 0; i < sizeof(b); ++i) {
        b[i] ^= 0x01;
        EXPECT_EQ(chapoly_secure_compare(a, b, sizeof(a)), 0) << "byte " << i;
        b[i] ^= 0x01;
    }
}

TEST_F(SecurityTest, SecureCompare_NullPointer) {
    uint8_t a[4] = {0};
    EXPECT_EQ(chapoly_secure_compare(nullptr, a, 4), 0);
    EXPECT_EQ(chapoly_secure_compare(a, nullptr, 4), 0);
    EXPECT_EQ(chapoly_secure_compare(nullptr, nullptr, 0), 0);
}

TEST_F(SecurityTest, SecureCompare_ZeroLength) {
    uint8_t a[1] = {1};
    uint8_t b[1] = {2};
    EXPECT_EQ(chapoly_secure_compare(a, b, 0), 1);
}

TEST_F(SecurityTest, SecureCompare_Containers) {
    chapoly::ByteVec a = {1, 2, 3};
    chapoly::ByteVec b = {1, 2, 3};
    chapoly::ByteVec c = {1, 2, 4};
    chapoly::ByteVec shorter = {1, 2};

    EXPECT_TRUE(chapoly::secure_compare(a, b));
    EXPECT_FALSE(chapoly::secure_compare(a, c));
    EXPECT_FALSE(chapoly::secure_compare(a, shorter));
    EXPECT_TRUE(chapoly::secure_compare(chapoly::ByteVec{}, chapoly::ByteVec{}));

    std::array<uint32_t, 2> w1 = {{0xdeadbeef, 1}};
    std::array<uint32_t, 2> w2 = {{0xdeadbeef, 2}};
    EXPECT_FALSE(chapoly::secure_compare(w1, w2));
}

// ============================================================================
// CSPRNG
// ============================================================================

TEST_F(SecurityTest, RandomBytes) {
    EXPECT_EQ(chapoly_random_bytes(nullptr, 16), CHAPOLY_ERROR_INVALID_PARAM);

    uint8_t one = 0;
    EXPECT_EQ(chapoly_random_bytes(&one, 0), CHAPOLY_SUCCESS);

    std::set<std::vector<uint8_t>> seen;
    for (int i = 0; i < 8; ++i) {
        std::vector<uint8_t> buf(32);
        ASSERT_EQ(chapoly_random_bytes(buf.data(), buf.size()), CHAPOLY_SUCCESS);
        seen.insert(buf);
    }
    EXPECT_EQ(seen.size(), 8u);
}

TEST_F(SecurityTest, RandomBytes_ZeroLength) {
    EXPECT_EQ(chapoly_random_bytes(nullptr, 0), CHAPOLY_SUCCESS);

    std::vector<uint8_t> empty;
    EXPECT_EQ(chapoly_random_bytes(empty.data(), empty.size()), CHAPOLY_SUCCESS);
}

TEST_F(SecurityTest, RandomBytes_Large) {
    std::vector<uint8_t> buf(1 << 20, 0);
    ASSERT_EQ(chapoly_random_bytes(buf.data(), buf.size()), CHAPOLY_SUCCESS);

    size_t zeros = 0;
    for (uint8_t b : buf) {
        if (b == 0) ++zeros;
    }
    // Expected about 4096 zero bytes
    EXPECT_GT(zeros, 3000u);
    EXPECT_LT(zeros, 5200u);
}

// ============================================================================
// RAII Containers
// ============================================================================

TEST_F(SecurityTest, SecureArray_Basics) {
    chapoly::SecureArray<uint8_t, 32> arr;
    EXPECT_EQ(arr.size(), 32u);
    EXPECT_EQ(arr.size_bytes(), 32u);
    for (size_t i = 0; i < arr.size(); ++i) {
        EXPECT_EQ(arr[i], 0);
        arr[i] = static_cast<uint8_t>(i);
    }
    EXPECT_EQ(arr.data()[31], 31);

    chapoly::SecureArray<uint32_t, 16> words;
    EXPECT_EQ(words.size_bytes(), 64u);
}

TEST_F(SecurityTest, SecureObject_Basics) {
    chapoly::SecureObject<chapoly_poly1305_ctx_t> ctx;
    EXPECT_EQ(ctx->buffer_len, 0u);
    EXPECT_EQ(ctx->finalized, 0);

    uint8_t key[32] = {1};
    ASSERT_EQ(chapoly_poly1305_init(ctx.get(), key), CHAPOLY_SUCCESS);
    EXPECT_EQ(ctx->r[0], 1u);
}

// ============================================================================
// Errors and Version
// ============================================================================

TEST_F(SecurityTest, ErrorStrings) {
    const chapoly_error_t codes[] = {
        CHAPOLY_SUCCESS,
        CHAPOLY_ERROR_INVALID_PARAM,
        CHAPOLY_ERROR_INVALID_KEY,
        CHAPOLY_ERROR_MISSING_ARGUMENT,
        CHAPOLY_ERROR_LENGTH_MISMATCH,
        CHAPOLY_ERROR_INVALID_NONCE_LENGTH,
        CHAPOLY_ERROR_INVALID_TAG_LENGTH,
        CHAPOLY_ERROR_TAG_MISMATCH,
        CHAPOLY_ERROR_LENGTH_OVERFLOW,
        CHAPOLY_ERROR_CONTEXT_RELEASED,
        CHAPOLY_ERROR_MEMORY_ALLOC,
        CHAPOLY_ERROR_RANDOM_FAILED,
        CHAPOLY_ERROR_INTERNAL,
    };

    std::set<std::string> messages;
    for (chapoly_error_t code : codes) {
        const char* msg = chapoly_error_string(code);
        ASSERT_NE(msg, nullptr);
        EXPECT_NE(std::string(msg), "Unknown error");
        messages.insert(msg);
    }
    EXPECT_EQ(messages.size(), CHAPOLY_ARRAY_SIZE(codes));

    EXPECT_EQ(std::string(chapoly_error_string(static_cast<chapoly_error_t>(-999))),
              "Unknown error");
}

TEST_F(SecurityTest, ErrorException) {
    chapoly::Error plain(CHAPOLY_ERROR_INVALID_KEY);
    EXPECT_EQ(plain.code(), CHAPOLY_ERROR_INVALID_KEY);
    EXPECT_EQ(std::string(plain.what()), chapoly_error_string(CHAPOLY_ERROR_INVALID_KEY));

    chapoly::Error ctx(CHAPOLY_ERROR_TAG_MISMATCH, "open");
    EXPECT_EQ(std::string(ctx.what()),
              std::string("open: ") + chapoly_error_string(CHAPOLY_ERROR_TAG_MISMATCH));

    EXPECT_NO_THROW(chapoly::throw_if_error(CHAPOLY_SUCCESS, "noop"));
    EXPECT_THROW(chapoly::throw_if_error(CHAPOLY_ERROR_INTERNAL, "fail"), chapoly::Error);
    EXPECT_THROW(chapoly::throw_if_error(CHAPOLY_ERROR_INTERNAL, "fail"), std::runtime_error);
}

TEST_F(SecurityTest, Version) {
    EXPECT_STREQ(chapoly_version(), CHAPOLY_VERSION_STRING);
    EXPECT_STREQ(chapoly_platform(), CHAPOLY_PLATFORM_NAME);
    EXPECT_TRUE(CHAPOLY_VERSION_AT_LEAST(1, 0, 0));
    EXPECT_EQ(CHAPOLY_VERSION_NUMBER,
              CHAPOLY_VERSION_MAJOR * 10000 + CHAPOLY_VERSION_MINOR * 100 + CHAPOLY_VERSION_PATCH);
}
