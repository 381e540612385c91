/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "crypto/aead.hpp"

#include <climits>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace hdriv::crypto {

    using core::ErrorCode;
    using core::make_error;

    namespace {

        using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

        CipherCtx new_ctx() {
            return CipherCtx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
        }

        constexpr const char* OPEN_FAILED = "authenticated decryption failed";

    } // namespace

    core::Result<void> random_bytes(std::span<uint8_t> out) {
        if (out.size() > static_cast<size_t>(INT_MAX)) {
            return make_error(ErrorCode::ENCRYPTION_FAILED, "random request too large");
        }
        if (!out.empty() && RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
            return make_error(ErrorCode::KEY_UNAVAILABLE, "RAND_bytes failed: no secure random source");
        }
        return {};
    }

    core::Result<Nonce> random_nonce() {
        Nonce nonce{};
        if (auto r = random_bytes(nonce); !r) {
            return std::unexpected(r.error());
        }
        return nonce;
    }

    core::Result<std::vector<uint8_t>> aes256gcm_seal(std::span<const uint8_t> key,
                                                      std::span<const uint8_t> nonce,
                                                      std::span<const uint8_t> plaintext) {
        if (key.size() != AES256_KEY_LEN || nonce.size() != GCM_NONCE_LEN) {
            return make_error(ErrorCode::ENCRYPTION_FAILED, "AES-256-GCM: bad key or nonce length");
        }
        if (plaintext.size() > static_cast<size_t>(INT_MAX)) {
            return make_error(ErrorCode::ENCRYPTION_FAILED, "AES-256-GCM: payload too large");
        }

        auto ctx = new_ctx();
        if (!ctx) {
            return make_error(ErrorCode::ENCRYPTION_FAILED, "EVP_CIPHER_CTX_new failed");
        }

        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_NONCE_LEN), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
            return make_error(ErrorCode::ENCRYPTION_FAILED, "AES-256-GCM encrypt init failed");
        }

        std::vector<uint8_t> out(plaintext.size() + GCM_TAG_LEN);
        int len = 0;
        if (!plaintext.empty() &&
            EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return make_error(ErrorCode::ENCRYPTION_FAILED, "AES-256-GCM EncryptUpdate failed");
        }

        int final_len = 0;
        if (EVP_EncryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1) {
            return make_error(ErrorCode::ENCRYPTION_FAILED, "AES-256-GCM EncryptFinal failed");
        }
        const size_t ct_len = static_cast<size_t>(len + final_len);

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_LEN),
                                out.data() + ct_len) != 1) {
            return make_error(ErrorCode::ENCRYPTION_FAILED, "AES-256-GCM GET_TAG failed");
        }

        out.resize(ct_len + GCM_TAG_LEN);
        return out;
    }

    core::Result<std::vector<uint8_t>> aes256gcm_open(std::span<const uint8_t> key,
                                                      std::span<const uint8_t> nonce,
                                                      std::span<const uint8_t> sealed) {
        if (key.size() != AES256_KEY_LEN || nonce.size() != GCM_NONCE_LEN ||
            sealed.size() < GCM_TAG_LEN || sealed.size() > static_cast<size_t>(INT_MAX)) {
            return make_error(ErrorCode::DECRYPTION_FAILED, OPEN_FAILED);
        }

        const size_t ct_len = sealed.size() - GCM_TAG_LEN;
        const uint8_t* tag = sealed.data() + ct_len;

        auto ctx = new_ctx();
        if (!ctx) {
            return make_error(ErrorCode::DECRYPTION_FAILED, OPEN_FAILED);
        }

        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_NONCE_LEN), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
            return make_error(ErrorCode::DECRYPTION_FAILED, OPEN_FAILED);
        }

        std::vector<uint8_t> plaintext(ct_len);
        int len = 0;
        if (ct_len > 0 &&
            EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, sealed.data(), static_cast<int>(ct_len)) != 1) {
            return make_error(ErrorCode::DECRYPTION_FAILED, OPEN_FAILED);
        }

        // Expected tag must be set before finalising
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_LEN),
                                const_cast<uint8_t*>(tag)) != 1) {
            return make_error(ErrorCode::DECRYPTION_FAILED, OPEN_FAILED);
        }

        int final_len = 0;
        if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &final_len) != 1) {
            OPENSSL_cleanse(plaintext.data(), plaintext.size());
            return make_error(ErrorCode::DECRYPTION_FAILED, OPEN_FAILED);
        }

        plaintext.resize(static_cast<size_t>(len + final_len));
        return plaintext;
    }

} // namespace hdriv::crypto
