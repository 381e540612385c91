/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "crypto/key_source.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"
#include "crypto/aead.hpp"
#include "io/codec.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace hdriv::crypto {

    using core::ErrorCode;
    using core::make_error;

    namespace {

        std::string_view trim(std::string_view s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
                s.remove_prefix(1);
            }
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
                s.remove_suffix(1);
            }
            return s;
        }

        core::Result<SecretBytes> decode_secret(std::string_view text, const std::string& origin) {
            auto decoded = io::base64_decode(trim(text));
            if (!decoded) {
                return make_error(ErrorCode::KEY_UNAVAILABLE, "Key material is not valid base64", origin);
            }
            if (decoded->empty()) {
                return make_error(ErrorCode::KEY_UNAVAILABLE, "Key material is empty", origin);
            }
            return SecretBytes(std::move(*decoded));
        }

        SecretBytes copy_secret(const SecretBytes& s) {
            return SecretBytes(s.view());
        }

    } // namespace

    StaticKeySource::StaticKeySource(std::span<const uint8_t> secret)
        : secret_(secret) {}

    core::Result<SecretBytes> StaticKeySource::load() const {
        if (secret_.empty()) {
            return make_error(ErrorCode::KEY_UNAVAILABLE, "Static key source holds no secret");
        }
        return copy_secret(secret_);
    }

    PassphraseKeySource::PassphraseKeySource(const std::string& passphrase)
        : secret_(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(passphrase.data()),
                                           passphrase.size())) {}

    core::Result<SecretBytes> PassphraseKeySource::load() const {
        if (secret_.empty()) {
            return make_error(ErrorCode::KEY_UNAVAILABLE, "Passphrase is empty");
        }

        SecretBytes key(AES256_KEY_LEN);
        const int rc = PKCS5_PBKDF2_HMAC(
            reinterpret_cast<const char*>(secret_.data()), static_cast<int>(secret_.size()),
            reinterpret_cast<const unsigned char*>(PASSPHRASE_SALT), static_cast<int>(std::strlen(PASSPHRASE_SALT)),
            PASSPHRASE_ITERATIONS,
            EVP_sha256(),
            static_cast<int>(key.size()), key.data());
        if (rc != 1) {
            return make_error(ErrorCode::KEY_UNAVAILABLE, "PBKDF2 derivation failed");
        }
        return key;
    }

    EnvironmentKeySource::EnvironmentKeySource(std::string variable)
        : variable_(std::move(variable)) {}

    std::string EnvironmentKeySource::describe() const {
        return "environment variable " + variable_;
    }

    core::Result<SecretBytes> EnvironmentKeySource::load() const {
        const char* value = std::getenv(variable_.c_str());
        if (!value || *value == '\0') {
            return make_error(ErrorCode::KEY_UNAVAILABLE, "Application key not set in environment", variable_);
        }
        return decode_secret(value, variable_);
    }

    FileKeySource::FileKeySource(std::filesystem::path path)
        : path_(std::move(path)) {}

    std::string FileKeySource::describe() const {
        return "key file " + core::path_to_utf8(path_);
    }

    core::Result<SecretBytes> FileKeySource::load() const {
        auto bytes = core::read_file_bytes(path_);
        if (!bytes) {
            return make_error(ErrorCode::KEY_UNAVAILABLE, "Cannot read key file", bytes.error().details);
        }

        SecretBytes raw(std::move(*bytes));
        const std::string_view text(reinterpret_cast<const char*>(raw.data()), raw.size());
        auto decoded = decode_secret(text, core::path_to_utf8(path_));
        if (!decoded && raw.size() == AES256_KEY_LEN) {
            LOG_DEBUG("Key file {} is not base64, using its 32 bytes as the secret", core::path_to_utf8(path_));
            return raw;
        }
        return decoded;
    }

} // namespace hdriv::crypto
