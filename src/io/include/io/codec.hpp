/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hdriv::io {

    /**
     * @brief Standard base64 (RFC 4648 alphabet, '=' padding)
     *
     * Output length is always ceil(n / 3) * 4.
     */
    [[nodiscard]] std::string base64_encode(std::span<const uint8_t> data);

    /**
     * @brief Strict base64 decoding
     *
     * Rejects characters outside the alphabet, inputs whose length is not a
     * multiple of four and padding anywhere but the final one or two
     * positions. Failures are reported as ErrorCode::INVALID_FORMAT.
     */
    [[nodiscard]] core::Result<std::vector<uint8_t>> base64_decode(std::string_view text);

    [[nodiscard]] constexpr size_t base64_encoded_size(const size_t n) {
        return ((n + 2) / 3) * 4;
    }

    struct DataUrl {
        std::string content_type;
        std::vector<uint8_t> bytes;
    };

    /**
     * @brief Read the legacy "data:<content-type>;base64,<payload>" asset form
     *
     * Assets stored before encryption was introduced carry their MIME type
     * in this prefix. Only the base64 variant is accepted.
     */
    [[nodiscard]] core::Result<DataUrl> parse_data_url(std::string_view text);

} // namespace hdriv::io
