/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "crypto/key_manager.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace hdriv::crypto {

    /**
     * @brief Envelope-encrypted asset, all fields base64
     *
     * ciphertext    content under the data key, GCM tag appended
     * content_nonce 96-bit nonce used with the data key
     * wrapped_key   data key under the application key, GCM tag appended
     * key_nonce     96-bit nonce used with the application key
     */
    struct EncryptedPacket {
        std::string ciphertext;
        std::string content_nonce;
        std::string wrapped_key;
        std::string key_nonce;
    };

    /**
     * @brief Envelope encryption of binary assets
     *
     * Every encrypt_payload() call draws a fresh 256-bit data key and two
     * fresh nonces; the raw data key is wiped as soon as it is wrapped.
     * Thread-safe: the only shared state is the key manager's cached key.
     */
    class EnvelopeCipher {
    public:
        explicit EnvelopeCipher(KeyManager& keys);

        /**
         * @brief Encrypt under a new data key and wrap that key
         *
         * Errors: KEY_UNAVAILABLE, ENCRYPTION_FAILED.
         */
        [[nodiscard]] core::Result<EncryptedPacket> encrypt_payload(std::span<const uint8_t> plaintext) const;

        /**
         * @brief Unwrap the data key and decrypt
         *
         * Errors: KEY_UNAVAILABLE, or DECRYPTION_FAILED for every kind of
         * damaged or foreign packet. The failing stage is not reported.
         */
        [[nodiscard]] core::Result<std::vector<uint8_t>> decrypt_payload(const EncryptedPacket& packet) const;

    private:
        KeyManager& keys_;
    };

} // namespace hdriv::crypto
