/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "crypto/key_manager.hpp"
#include "core/logger.hpp"
#include "crypto/aead.hpp"

#include <openssl/core_names.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>

namespace hdriv::crypto {

    using core::ErrorCode;
    using core::make_error;

    namespace {

        constexpr char HKDF_SALT[] = "hdriv-application-key";
        constexpr char HKDF_INFO[] = "kek-v1";

        std::mutex g_global_mutex;
        std::unique_ptr<KeySource> g_global_source;
        bool g_global_created = false;

        core::Result<SecretBytes> hkdf_sha256(const SecretBytes& secret) {
            EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
            if (!kdf) {
                return make_error(ErrorCode::KEY_UNAVAILABLE, "HKDF is not available from the crypto provider");
            }
            std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)> kctx(EVP_KDF_CTX_new(kdf), &EVP_KDF_CTX_free);
            EVP_KDF_free(kdf);
            if (!kctx) {
                return make_error(ErrorCode::KEY_UNAVAILABLE, "EVP_KDF_CTX_new failed");
            }

            char digest[] = "SHA256";
            OSSL_PARAM params[] = {
                OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest, 0),
                OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY,
                                                  const_cast<uint8_t*>(secret.data()), secret.size()),
                OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT,
                                                  const_cast<char*>(HKDF_SALT), sizeof(HKDF_SALT) - 1),
                OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO,
                                                  const_cast<char*>(HKDF_INFO), sizeof(HKDF_INFO) - 1),
                OSSL_PARAM_construct_end(),
            };

            SecretBytes out(AES256_KEY_LEN);
            if (EVP_KDF_derive(kctx.get(), out.data(), out.size(), params) != 1) {
                return make_error(ErrorCode::KEY_UNAVAILABLE, "HKDF derivation failed");
            }
            return out;
        }

    } // namespace

    KeyManager::KeyManager(std::unique_ptr<KeySource> source)
        : source_(std::move(source)) {}

    core::Result<ApplicationKeyPtr> KeyManager::application_key() {
        // Held across derivation: concurrent first callers block here and then
        // observe the cached instance.
        std::lock_guard lock(mutex_);
        if (cached_) {
            return cached_;
        }

        auto key = derive();
        if (!key) {
            LOG_ERROR("Application key unavailable: {}", key.error().format());
            return std::unexpected(key.error());
        }
        cached_ = *key;
        return cached_;
    }

    bool KeyManager::has_cached_key() const {
        std::lock_guard lock(mutex_);
        return cached_ != nullptr;
    }

    core::Result<ApplicationKeyPtr> KeyManager::derive() {
        if (!source_) {
            return make_error(ErrorCode::KEY_UNAVAILABLE, "No key source configured");
        }
        if (RAND_status() != 1) {
            return make_error(ErrorCode::KEY_UNAVAILABLE, "Secure random source is not available");
        }

        auto secret = source_->load();
        if (!secret) {
            return std::unexpected(secret.error());
        }

        SecretBytes key_bytes;
        if (secret->size() == AES256_KEY_LEN) {
            key_bytes = std::move(*secret);
        } else {
            auto derived = hkdf_sha256(*secret);
            if (!derived) {
                return std::unexpected(derived.error());
            }
            key_bytes = std::move(*derived);
        }

        LOG_DEBUG("Application key ready (source: {})", source_->describe());
        return ApplicationKeyPtr(new ApplicationKey(std::move(key_bytes)));
    }

    KeyManager& KeyManager::global() {
        static KeyManager instance = [] {
            std::lock_guard lock(g_global_mutex);
            g_global_created = true;
            std::unique_ptr<KeySource> source = std::move(g_global_source);
            if (!source) {
                source = std::make_unique<EnvironmentKeySource>();
            }
            return KeyManager(std::move(source));
        }();
        return instance;
    }

    bool KeyManager::configure_global(std::unique_ptr<KeySource> source) {
        std::lock_guard lock(g_global_mutex);
        if (g_global_created) {
            LOG_WARN("Global key manager already created, key source not replaced");
            return false;
        }
        g_global_source = std::move(source);
        return true;
    }

} // namespace hdriv::crypto
