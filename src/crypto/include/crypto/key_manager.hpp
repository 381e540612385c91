/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "crypto/key_source.hpp"
#include "crypto/secret_bytes.hpp"
#include <memory>
#include <mutex>
#include <span>

namespace hdriv::crypto {

    class KeyManager;

    /**
     * @brief The key-encryption key (KEK)
     *
     * Only wraps and unwraps per-asset data keys. The key bytes are reachable
     * through key_bytes() for the cipher, are never persisted and are wiped
     * when the last reference goes away.
     */
    class ApplicationKey {
    public:
        ApplicationKey(const ApplicationKey&) = delete;
        ApplicationKey& operator=(const ApplicationKey&) = delete;

        [[nodiscard]] std::span<const uint8_t> key_bytes() const { return key_.view(); }

    private:
        friend class KeyManager;
        explicit ApplicationKey(SecretBytes key) : key_(std::move(key)) {}

        SecretBytes key_;
    };

    using ApplicationKeyPtr = std::shared_ptr<const ApplicationKey>;

    /**
     * @brief Derives the application key once and caches it
     *
     * application_key() is safe to call from any thread. Concurrent first
     * calls wait for a single derivation and all receive the same instance.
     * A failed derivation is not cached, the next call retries.
     *
     * A 32 byte secret is used as the key directly. Any other length is
     * stretched with HKDF-SHA256.
     */
    class KeyManager {
    public:
        explicit KeyManager(std::unique_ptr<KeySource> source);

        KeyManager(const KeyManager&) = delete;
        KeyManager& operator=(const KeyManager&) = delete;

        [[nodiscard]] core::Result<ApplicationKeyPtr> application_key();

        [[nodiscard]] bool has_cached_key() const;

        /**
         * @brief Process-wide manager
         *
         * Created on first use and alive until process exit. Uses the source
         * installed by configure_global(), or EnvironmentKeySource otherwise.
         *
         * Meant for applications embedding the library that hold one key for
         * the whole process. hdriv_tool does not use it: each run_tool() call
         * builds its own manager from the key options of that invocation.
         */
        static KeyManager& global();

        /**
         * @brief Install the key source for global()
         * @return false if global() has already been created
         */
        static bool configure_global(std::unique_ptr<KeySource> source);

    private:
        core::Result<ApplicationKeyPtr> derive();

        std::unique_ptr<KeySource> source_;
        mutable std::mutex mutex_;
        ApplicationKeyPtr cached_;
    };

} // namespace hdriv::crypto
