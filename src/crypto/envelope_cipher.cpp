/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "crypto/envelope_cipher.hpp"
#include "core/logger.hpp"
#include "crypto/aead.hpp"
#include "io/codec.hpp"

namespace hdriv::crypto {

    using core::ErrorCode;
    using core::make_error;

    namespace {

        constexpr const char* DECRYPT_FAILED_MESSAGE =
            "Decryption failed: the application key does not match or the data is corrupted";

        std::unexpected<core::Error> decryption_failed() {
            return make_error(ErrorCode::DECRYPTION_FAILED, DECRYPT_FAILED_MESSAGE);
        }

    } // namespace

    EnvelopeCipher::EnvelopeCipher(KeyManager& keys)
        : keys_(keys) {}

    core::Result<EncryptedPacket> EnvelopeCipher::encrypt_payload(std::span<const uint8_t> plaintext) const {
        auto kek = keys_.application_key();
        if (!kek) {
            return std::unexpected(kek.error());
        }

        SecretBytes dek(AES256_KEY_LEN);
        if (auto r = random_bytes({dek.data(), dek.size()}); !r) {
            return std::unexpected(r.error());
        }

        auto content_nonce = random_nonce();
        if (!content_nonce) {
            return std::unexpected(content_nonce.error());
        }
        auto ciphertext = aes256gcm_seal(dek.view(), *content_nonce, plaintext);
        if (!ciphertext) {
            return std::unexpected(ciphertext.error());
        }

        auto key_nonce = random_nonce();
        if (!key_nonce) {
            return std::unexpected(key_nonce.error());
        }
        auto wrapped = aes256gcm_seal((*kek)->key_bytes(), *key_nonce, dek.view());
        dek.clear();
        if (!wrapped) {
            return std::unexpected(wrapped.error());
        }

        LOG_TRACE("Sealed {} bytes into envelope ({} bytes ciphertext)", plaintext.size(), ciphertext->size());

        return EncryptedPacket{
            .ciphertext = io::base64_encode(*ciphertext),
            .content_nonce = io::base64_encode(*content_nonce),
            .wrapped_key = io::base64_encode(*wrapped),
            .key_nonce = io::base64_encode(*key_nonce)};
    }

    core::Result<std::vector<uint8_t>> EnvelopeCipher::decrypt_payload(const EncryptedPacket& packet) const {
        auto kek = keys_.application_key();
        if (!kek) {
            return std::unexpected(kek.error());
        }

        auto key_nonce = io::base64_decode(packet.key_nonce);
        auto wrapped = io::base64_decode(packet.wrapped_key);
        auto content_nonce = io::base64_decode(packet.content_nonce);
        auto ciphertext = io::base64_decode(packet.ciphertext);
        if (!key_nonce || !wrapped || !content_nonce || !ciphertext) {
            return decryption_failed();
        }

        auto dek_raw = aes256gcm_open((*kek)->key_bytes(), *key_nonce, *wrapped);
        if (!dek_raw) {
            return decryption_failed();
        }
        SecretBytes dek(std::move(*dek_raw));
        if (dek.size() != AES256_KEY_LEN) {
            return decryption_failed();
        }

        auto plaintext = aes256gcm_open(dek.view(), *content_nonce, *ciphertext);
        if (!plaintext) {
            return decryption_failed();
        }
        return plaintext;
    }

} // namespace hdriv::crypto
