/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <openssl/crypto.h>

namespace hdriv::crypto {

    /**
     * @brief Move-only byte buffer that is cleansed when released
     *
     * Holds raw key material. OPENSSL_cleanse is used so the wipe is not
     * optimized away.
     */
    class SecretBytes {
    public:
        SecretBytes() = default;
        explicit SecretBytes(size_t size) : bytes_(size, 0) {}
        explicit SecretBytes(std::vector<uint8_t>&& bytes) : bytes_(std::move(bytes)) {}
        SecretBytes(std::span<const uint8_t> bytes) : bytes_(bytes.begin(), bytes.end()) {}

        ~SecretBytes() { clear(); }

        SecretBytes(const SecretBytes&) = delete;
        SecretBytes& operator=(const SecretBytes&) = delete;

        SecretBytes(SecretBytes&& other) noexcept : bytes_(std::move(other.bytes_)) {
            other.bytes_.clear();
        }

        SecretBytes& operator=(SecretBytes&& other) noexcept {
            if (this != &other) {
                clear();
                bytes_ = std::move(other.bytes_);
                other.bytes_.clear();
            }
            return *this;
        }

        void clear() {
            if (!bytes_.empty()) {
                OPENSSL_cleanse(bytes_.data(), bytes_.size());
                bytes_.clear();
            }
        }

        [[nodiscard]] uint8_t* data() { return bytes_.data(); }
        [[nodiscard]] const uint8_t* data() const { return bytes_.data(); }
        [[nodiscard]] size_t size() const { return bytes_.size(); }
        [[nodiscard]] bool empty() const { return bytes_.empty(); }

        [[nodiscard]] std::span<const uint8_t> view() const { return {bytes_.data(), bytes_.size()}; }

    private:
        std::vector<uint8_t> bytes_;
    };

} // namespace hdriv::crypto
