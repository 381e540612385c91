/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace hdriv::core {

    enum class ErrorCode {
        KEY_UNAVAILABLE,
        DECRYPTION_FAILED,
        ENCRYPTION_FAILED,
        INVALID_FORMAT,
        PARSE_ERROR,
        UNSUPPORTED_LEGACY_SCHEME,
        READ_FAILURE,
        WRITE_FAILURE,
        INVALID_CONFIG,
    };

    [[nodiscard]] std::string_view error_code_name(ErrorCode code);

    struct Error {
        ErrorCode code = ErrorCode::INVALID_FORMAT;
        std::string message;
        std::string details; // optional context, e.g. a file path or JSON pointer

        [[nodiscard]] std::string format() const;
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message, std::string details = {}) {
        return std::unexpected(Error{code, std::move(message), std::move(details)});
    }

} // namespace hdriv::core
