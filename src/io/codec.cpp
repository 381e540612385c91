/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/codec.hpp"

#include <array>

namespace hdriv::io {

    using core::ErrorCode;
    using core::make_error;

    namespace {

        constexpr char ALPHABET[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        constexpr std::array<int8_t, 256> make_decode_table() {
            std::array<int8_t, 256> table{};
            for (auto& v : table) {
                v = -1;
            }
            for (int i = 0; i < 64; ++i) {
                table[static_cast<uint8_t>(ALPHABET[i])] = static_cast<int8_t>(i);
            }
            return table;
        }

        constexpr auto DECODE_TABLE = make_decode_table();

        constexpr std::string_view DATA_PREFIX = "data:";
        constexpr std::string_view BASE64_MARKER = ";base64,";

    } // namespace

    std::string base64_encode(std::span<const uint8_t> data) {
        std::string out;
        out.reserve(base64_encoded_size(data.size()));

        const size_t len = data.size();
        for (size_t i = 0; i < len; i += 3) {
            uint32_t b = static_cast<uint32_t>(data[i]) << 16;
            if (i + 1 < len) b |= static_cast<uint32_t>(data[i + 1]) << 8;
            if (i + 2 < len) b |= static_cast<uint32_t>(data[i + 2]);

            out += ALPHABET[(b >> 18) & 0x3F];
            out += ALPHABET[(b >> 12) & 0x3F];
            out += (i + 1 < len) ? ALPHABET[(b >> 6) & 0x3F] : '=';
            out += (i + 2 < len) ? ALPHABET[b & 0x3F] : '=';
        }
        return out;
    }

    core::Result<std::vector<uint8_t>> base64_decode(const std::string_view text) {
        if (text.size() % 4 != 0) {
            return make_error(ErrorCode::INVALID_FORMAT, "base64 length is not a multiple of 4");
        }

        size_t padding = 0;
        if (!text.empty() && text.back() == '=') {
            padding = (text.size() >= 2 && text[text.size() - 2] == '=') ? 2 : 1;
        }

        std::vector<uint8_t> out;
        out.reserve(text.size() / 4 * 3);

        const size_t data_chars = text.size() - padding;
        uint32_t buf = 0;
        int bits = 0;
        for (size_t i = 0; i < data_chars; ++i) {
            const int8_t val = DECODE_TABLE[static_cast<uint8_t>(text[i])];
            if (val < 0) {
                return make_error(ErrorCode::INVALID_FORMAT, "invalid base64 character",
                                  "offset " + std::to_string(i));
            }
            buf = (buf << 6) | static_cast<uint32_t>(val);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                out.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
            }
        }
        // Bits below the last whole byte must be zero; otherwise two texts decode to the same bytes
        if ((buf & ((1u << bits) - 1)) != 0) {
            return make_error(ErrorCode::INVALID_FORMAT, "non-canonical base64 padding bits");
        }
        return out;
    }

    core::Result<DataUrl> parse_data_url(const std::string_view text) {
        if (!text.starts_with(DATA_PREFIX)) {
            return make_error(ErrorCode::INVALID_FORMAT, "legacy asset is not a data URL");
        }

        const auto marker = text.find(BASE64_MARKER);
        if (marker == std::string_view::npos) {
            return make_error(ErrorCode::INVALID_FORMAT, "data URL is not base64 encoded");
        }

        const auto content_type = text.substr(DATA_PREFIX.size(), marker - DATA_PREFIX.size());
        auto bytes = base64_decode(text.substr(marker + BASE64_MARKER.size()));
        if (!bytes) {
            return std::unexpected(bytes.error());
        }

        return DataUrl{std::string(content_type), std::move(*bytes)};
    }

} // namespace hdriv::io
