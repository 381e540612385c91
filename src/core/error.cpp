/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/error.hpp"

namespace hdriv::core {

    std::string_view error_code_name(const ErrorCode code) {
        switch (code) {
        case ErrorCode::KEY_UNAVAILABLE: return "KeyUnavailable";
        case ErrorCode::DECRYPTION_FAILED: return "DecryptionFailed";
        case ErrorCode::ENCRYPTION_FAILED: return "EncryptionFailed";
        case ErrorCode::INVALID_FORMAT: return "InvalidFormat";
        case ErrorCode::PARSE_ERROR: return "ParseError";
        case ErrorCode::UNSUPPORTED_LEGACY_SCHEME: return "UnsupportedLegacyScheme";
        case ErrorCode::READ_FAILURE: return "ReadFailure";
        case ErrorCode::WRITE_FAILURE: return "WriteFailure";
        case ErrorCode::INVALID_CONFIG: return "InvalidConfig";
        }
        return "Unknown";
    }

    std::string Error::format() const {
        std::string out;
        out.reserve(message.size() + details.size() + 32);
        out += '[';
        out += error_code_name(code);
        out += "] ";
        out += message;
        if (!details.empty()) {
            out += " (";
            out += details;
            out += ')';
        }
        return out;
    }

} // namespace hdriv::core
