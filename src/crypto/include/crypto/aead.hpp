/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace hdriv::crypto {

    // AES-256-GCM through OpenSSL EVP.
    // Key 32 bytes, nonce 12 bytes (96 bit), tag 16 bytes appended to the
    // ciphertext (same layout as Web Crypto's AES-GCM output).

    constexpr size_t AES256_KEY_LEN = 32;
    constexpr size_t GCM_NONCE_LEN = 12;
    constexpr size_t GCM_TAG_LEN = 16;

    using Nonce = std::array<uint8_t, GCM_NONCE_LEN>;

    /**
     * @brief Fill @p out from the OpenSSL CSPRNG
     */
    [[nodiscard]] core::Result<void> random_bytes(std::span<uint8_t> out);

    [[nodiscard]] core::Result<Nonce> random_nonce();

    /**
     * @brief Encrypt and authenticate
     * @return ciphertext || tag; errors are ErrorCode::ENCRYPTION_FAILED
     */
    [[nodiscard]] core::Result<std::vector<uint8_t>> aes256gcm_seal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext);

    /**
     * @brief Verify and decrypt ciphertext || tag
     *
     * Any failure (wrong sizes, tag mismatch) is ErrorCode::DECRYPTION_FAILED
     * with no indication of the cause.
     */
    [[nodiscard]] core::Result<std::vector<uint8_t>> aes256gcm_open(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> sealed);

} // namespace hdriv::crypto
