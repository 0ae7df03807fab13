/**
 * @file test_cmd_aead.cpp
 * @brief encrypt / decrypt subcommand tests on temporary files
 *
 * - nonce || ciphertext || tag framing
 * - Authentication failure leaves no output file
 * - Hex parsing errors never echo the input
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "chapoly/chapoly.h"
#include "cli_commands.h"
#include "cli_utils.h"

namespace fs = std::filesystem;

using chapoly::ByteVec;
using chapoly::cli::hex_to_bytes;
using chapoly::cli::read_file;
using chapoly::cli::write_file;

namespace {

const std::string kKeyHex =
    "808182838485868788898a8b8c8d8e8f909192939495969798999a9b9c9d9e9f";
const std::string kNonceHex = "070000004041424344454647";
const std::string kAadHex = "50515253c0c1c2c3c4c5c6c7";

int run_command(int (*cmd)(int, char*[]), std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(&a[0]);
    }
    argv.push_back(nullptr);
    return cmd(static_cast<int>(args.size()), argv.data());
}

} // namespace

class CmdAeadTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(chapoly_init(), CHAPOLY_SUCCESS);

        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::path(::testing::TempDir()) /
               (std::string("chapoly_cli_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        plain_ = (dir_ / "plain.bin").string();
        sealed_ = (dir_ / "sealed.bin").string();
        opened_ = (dir_ / "opened.bin").string();

        message_.resize(100);
        for (size_t i = 0; i < message_.size(); ++i) {
            message_[i] = static_cast<uint8_t>(i * 7 + 3);
        }
        write_file(plain_, message_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    int encrypt(const std::vector<std::string>& extra) {
        std::vector<std::string> args = {"encrypt", "-in", plain_, "-out", sealed_,
                                         "-key", kKeyHex};
        args.insert(args.end(), extra.begin(), extra.end());
        return run_command(cmd_encrypt, args);
    }

    int decrypt(const std::vector<std::string>& extra) {
        std::vector<std::string> args = {"decrypt", "-in", sealed_, "-out", opened_,
                                         "-key", kKeyHex};
        args.insert(args.end(), extra.begin(), extra.end());
        return run_command(cmd_decrypt, args);
    }

    fs::path dir_;
    std::string plain_;
    std::string sealed_;
    std::string opened_;
    ByteVec message_;
};

// ============================================================================
// Framing
// ============================================================================

TEST_F(CmdAeadTest, Encrypt_Framing) {
    ASSERT_EQ(encrypt({"-nonce", kNonceHex, "-aad", kAadHex}), 0);

    ByteVec framed = read_file(sealed_);
    ASSERT_EQ(framed.size(), 12u + message_.size() + 16u);

    ByteVec nonce = hex_to_bytes(kNonceHex);
    EXPECT_EQ(ByteVec(framed.begin(), framed.begin() + 12), nonce);

    chapoly::ChaCha20Poly1305 aead(hex_to_bytes(kKeyHex));
    ByteVec expected = aead.seal(nonce, message_, hex_to_bytes(kAadHex));
    EXPECT_EQ(ByteVec(framed.begin() + 12, framed.end()), expected);
}

TEST_F(CmdAeadTest, EncryptDecrypt_RoundTrip) {
    ASSERT_EQ(encrypt({"-aad", kAadHex}), 0);
    ASSERT_EQ(decrypt({"-aad", kAadHex}), 0);
    EXPECT_EQ(read_file(opened_), message_);
}

TEST_F(CmdAeadTest, Encrypt_RandomNonce) {
    ASSERT_EQ(encrypt({}), 0);
    ByteVec first = read_file(sealed_);
    ASSERT_EQ(encrypt({}), 0);
    ByteVec second = read_file(sealed_);

    ASSERT_EQ(first.size(), second.size());
    EXPECT_NE(ByteVec(first.begin(), first.begin() + 12),
              ByteVec(second.begin(), second.begin() + 12));

    ASSERT_EQ(decrypt({}), 0);
    EXPECT_EQ(read_file(opened_), message_);
}

TEST_F(CmdAeadTest, EmptyFile) {
    write_file(plain_, ByteVec());
    ASSERT_EQ(encrypt({}), 0);
    EXPECT_EQ(read_file(sealed_).size(), 28u);

    ASSERT_EQ(decrypt({}), 0);
    EXPECT_TRUE(read_file(opened_).empty());
}

// ============================================================================
// Rejection
// ============================================================================

TEST_F(CmdAeadTest, Decrypt_FlippedTagBit_WritesNothing) {
    ASSERT_EQ(encrypt({}), 0);
    ByteVec framed = read_file(sealed_);
    framed.back() ^= 0x01;
    write_file(sealed_, framed);

    EXPECT_EQ(decrypt({}), 1);
    EXPECT_FALSE(fs::exists(opened_));
}

TEST_F(CmdAeadTest, Decrypt_FlippedCiphertextBit_WritesNothing) {
    ASSERT_EQ(encrypt({}), 0);
    ByteVec framed = read_file(sealed_);
    framed[12 + 40] ^= 0x80;
    write_file(sealed_, framed);

    EXPECT_EQ(decrypt({}), 1);
    EXPECT_FALSE(fs::exists(opened_));
}

TEST_F(CmdAeadTest, Decrypt_WrongAad_WritesNothing) {
    ASSERT_EQ(encrypt({"-aad", kAadHex}), 0);
    EXPECT_EQ(decrypt({"-aad", "00"}), 1);
    EXPECT_FALSE(fs::exists(opened_));
}

TEST_F(CmdAeadTest, Decrypt_ShortInput) {
    write_file(sealed_, ByteVec(27, 0));
    EXPECT_EQ(decrypt({}), 1);
    EXPECT_FALSE(fs::exists(opened_));
}

// ============================================================================
// Arguments
// ============================================================================

TEST_F(CmdAeadTest, MissingArguments) {
    EXPECT_EQ(run_command(cmd_encrypt, {"encrypt", "-in", plain_}), 1);
    EXPECT_EQ(run_command(cmd_decrypt, {"decrypt", "-out", opened_}), 1);
    EXPECT_EQ(run_command(cmd_encrypt, {"encrypt", "--help"}), 0);
}

TEST_F(CmdAeadTest, BadKeyOrNonce) {
    std::vector<std::string> args = {"encrypt", "-in", plain_, "-out", sealed_,
                                     "-key", "00112233"};
    EXPECT_EQ(run_command(cmd_encrypt, args), 1);
    EXPECT_FALSE(fs::exists(sealed_));

    EXPECT_EQ(encrypt({"-nonce", "0011"}), 1);
    EXPECT_FALSE(fs::exists(sealed_));
}

TEST_F(CmdAeadTest, HexError_DoesNotEchoInput) {
    const std::string secret = "a1b2c3d4e5f6zz";
    try {
        hex_to_bytes(secret);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        std::string msg = e.what();
        EXPECT_EQ(msg.find(secret), std::string::npos);
        EXPECT_EQ(msg.find("a1b2"), std::string::npos);
        EXPECT_NE(msg.find("position 12"), std::string::npos);
    }

    EXPECT_THROW(hex_to_bytes("abc"), std::invalid_argument);
    EXPECT_EQ(hex_to_bytes("00Ff"), (ByteVec{0x00, 0xff}));
}
