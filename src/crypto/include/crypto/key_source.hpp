/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "crypto/secret_bytes.hpp"
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace hdriv::crypto {

    constexpr const char* DEFAULT_KEY_ENV_VAR = "HDRIV_APP_KEY";

    // Passphrase stretching parameters; changing either changes every derived key
    constexpr const char* PASSPHRASE_SALT = "hdriv-passphrase-kek-v1";
    constexpr int PASSPHRASE_ITERATIONS = 600000;

    /**
     * @brief Origin of the application secret
     *
     * The KeyManager derives the application key from whatever a source
     * returns; sources never see the derived key. load() must fail with
     * ErrorCode::KEY_UNAVAILABLE when no secret can be produced.
     */
    class KeySource {
    public:
        virtual ~KeySource() = default;

        [[nodiscard]] virtual core::Result<SecretBytes> load() const = 0;

        // Human-readable origin for logs. Must not contain secret material.
        [[nodiscard]] virtual std::string describe() const = 0;
    };

    // Secret handed over in memory (tests, embedding applications).
    class StaticKeySource final : public KeySource {
    public:
        explicit StaticKeySource(std::span<const uint8_t> secret);

        [[nodiscard]] core::Result<SecretBytes> load() const override;
        [[nodiscard]] std::string describe() const override { return "static secret"; }

    private:
        SecretBytes secret_;
    };

    /**
     * @brief UTF-8 passphrase
     *
     * load() returns a 32-byte key stretched with PBKDF2-HMAC-SHA256
     * (PASSPHRASE_SALT, PASSPHRASE_ITERATIONS), whatever the passphrase
     * length. The passphrase bytes themselves are never used as a key.
     */
    class PassphraseKeySource final : public KeySource {
    public:
        explicit PassphraseKeySource(const std::string& passphrase);

        [[nodiscard]] core::Result<SecretBytes> load() const override;
        [[nodiscard]] std::string describe() const override { return "passphrase"; }

    private:
        SecretBytes secret_;
    };

    // Base64 secret read from an environment variable at load() time.
    class EnvironmentKeySource final : public KeySource {
    public:
        explicit EnvironmentKeySource(std::string variable = DEFAULT_KEY_ENV_VAR);

        [[nodiscard]] core::Result<SecretBytes> load() const override;
        [[nodiscard]] std::string describe() const override;

    private:
        std::string variable_;
    };

    // Key file holding either exactly 32 raw bytes or a base64 secret.
    class FileKeySource final : public KeySource {
    public:
        explicit FileKeySource(std::filesystem::path path);

        [[nodiscard]] core::Result<SecretBytes> load() const override;
        [[nodiscard]] std::string describe() const override;

    private:
        std::filesystem::path path_;
    };

} // namespace hdriv::crypto
