/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "crypto/aead.hpp"
#include "crypto/envelope_cipher.hpp"
#include "io/codec.hpp"

#include <gtest/gtest.h>
#include <random>
#include <vector>

using namespace hdriv::crypto;
using hdriv::core::ErrorCode;

namespace {

    std::vector<uint8_t> fixed_key(uint8_t fill) {
        return std::vector<uint8_t>(AES256_KEY_LEN, fill);
    }

    std::vector<uint8_t> random_payload(size_t n, unsigned seed) {
        std::mt19937 rng(seed);
        std::vector<uint8_t> data(n);
        for (auto& b : data) {
            b = static_cast<uint8_t>(rng());
        }
        return data;
    }

    // Flip one bit in the middle of a base64 field, keeping it valid base64
    std::string tamper(const std::string& field) {
        auto bytes = hdriv::io::base64_decode(field);
        EXPECT_TRUE(bytes.has_value());
        (*bytes)[bytes->size() / 2] ^= 0x01;
        return hdriv::io::base64_encode(*bytes);
    }

} // namespace

class EnvelopeCipherTest : public ::testing::Test {
protected:
    EnvelopeCipherTest()
        : keys_(std::make_unique<StaticKeySource>(fixed_key(0x11))),
          other_keys_(std::make_unique<StaticKeySource>(fixed_key(0x22))),
          cipher_(keys_),
          other_cipher_(other_keys_) {}

    KeyManager keys_;
    KeyManager other_keys_;
    EnvelopeCipher cipher_;
    EnvelopeCipher other_cipher_;
};

TEST_F(EnvelopeCipherTest, RoundTrip) {
    for (const size_t n : {size_t{0}, size_t{1}, size_t{15}, size_t{16}, size_t{1024}, size_t{1 << 20}}) {
        const auto plaintext = random_payload(n, static_cast<unsigned>(n));
        auto packet = cipher_.encrypt_payload(plaintext);
        ASSERT_TRUE(packet.has_value()) << packet.error().format();

        auto decrypted = cipher_.decrypt_payload(*packet);
        ASSERT_TRUE(decrypted.has_value()) << "n=" << n;
        EXPECT_EQ(*decrypted, plaintext);
    }
}

TEST_F(EnvelopeCipherTest, PacketLayout) {
    const auto plaintext = random_payload(100, 1);
    auto packet = cipher_.encrypt_payload(plaintext);
    ASSERT_TRUE(packet.has_value());

    EXPECT_EQ(hdriv::io::base64_decode(packet->content_nonce)->size(), GCM_NONCE_LEN);
    EXPECT_EQ(hdriv::io::base64_decode(packet->key_nonce)->size(), GCM_NONCE_LEN);
    EXPECT_EQ(hdriv::io::base64_decode(packet->ciphertext)->size(), plaintext.size() + GCM_TAG_LEN);
    EXPECT_EQ(hdriv::io::base64_decode(packet->wrapped_key)->size(), AES256_KEY_LEN + GCM_TAG_LEN);
}

TEST_F(EnvelopeCipherTest, EncryptionIsNotDeterministic) {
    const auto plaintext = random_payload(64, 2);
    auto a = cipher_.encrypt_payload(plaintext);
    auto b = cipher_.encrypt_payload(plaintext);
    ASSERT_TRUE(a && b);

    EXPECT_NE(a->ciphertext, b->ciphertext);
    EXPECT_NE(a->content_nonce, b->content_nonce);
    EXPECT_NE(a->wrapped_key, b->wrapped_key);
    EXPECT_NE(a->key_nonce, b->key_nonce);
}

TEST_F(EnvelopeCipherTest, OtherApplicationKeyCannotDecrypt) {
    auto packet = cipher_.encrypt_payload(random_payload(256, 3));
    ASSERT_TRUE(packet.has_value());

    auto result = other_cipher_.decrypt_payload(*packet);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DECRYPTION_FAILED);
}

TEST_F(EnvelopeCipherTest, AnyTamperingFailsWithTheSameError) {
    auto packet = cipher_.encrypt_payload(random_payload(256, 4));
    ASSERT_TRUE(packet.has_value());

    std::vector<EncryptedPacket> damaged(6, *packet);
    damaged[0].ciphertext = tamper(packet->ciphertext);
    damaged[1].content_nonce = tamper(packet->content_nonce);
    damaged[2].wrapped_key = tamper(packet->wrapped_key);
    damaged[3].key_nonce = tamper(packet->key_nonce);
    damaged[4].wrapped_key = "not base64";
    damaged[5].content_nonce = hdriv::io::base64_encode(std::vector<uint8_t>(8, 0));

    auto reference = other_cipher_.decrypt_payload(*packet);
    ASSERT_FALSE(reference.has_value());

    for (const auto& p : damaged) {
        auto result = cipher_.decrypt_payload(p);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::DECRYPTION_FAILED);
        EXPECT_EQ(result.error().message, reference.error().message);
        EXPECT_EQ(result.error().details, reference.error().details);
    }
}

TEST_F(EnvelopeCipherTest, UnavailableKeyIsReportedAsSuch) {
    KeyManager no_keys(nullptr);
    EnvelopeCipher cipher(no_keys);

    auto encrypted = cipher.encrypt_payload(random_payload(16, 5));
    ASSERT_FALSE(encrypted.has_value());
    EXPECT_EQ(encrypted.error().code, ErrorCode::KEY_UNAVAILABLE);

    auto packet = cipher_.encrypt_payload(random_payload(16, 6));
    ASSERT_TRUE(packet.has_value());
    auto decrypted = cipher.decrypt_payload(*packet);
    ASSERT_FALSE(decrypted.has_value());
    EXPECT_EQ(decrypted.error().code, ErrorCode::KEY_UNAVAILABLE);
}
