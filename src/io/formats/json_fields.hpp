/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace hdriv::io::json_fields {

    using json = nlohmann::json;

    // Thrown by the readers below; parsers catch it at their entry point and
    // turn it into INVALID_FORMAT.
    class FormatError : public std::runtime_error {
    public:
        FormatError(const std::string& where, const std::string& what)
            : std::runtime_error(what),
              where_(where) {}

        [[nodiscard]] const std::string& where() const { return where_; }

    private:
        std::string where_;
    };

    inline std::string join(const std::string& parent, const char* key) {
        return parent.empty() ? std::string(key) : parent + "." + key;
    }

    inline const json& require_object(const json& parent, const char* key, const std::string& where) {
        const auto it = parent.find(key);
        if (it == parent.end()) {
            throw FormatError(join(where, key), "required block is missing");
        }
        if (!it->is_object()) {
            throw FormatError(join(where, key), "expected an object");
        }
        return *it;
    }

    inline const json* optional_object(const json& parent, const char* key, const std::string& where) {
        const auto it = parent.find(key);
        if (it == parent.end() || it->is_null()) {
            return nullptr;
        }
        if (!it->is_object()) {
            throw FormatError(join(where, key), "expected an object");
        }
        return &*it;
    }

    inline std::optional<double> read_number(const json& obj, const char* key, const std::string& where) {
        const auto it = obj.find(key);
        if (it == obj.end()) {
            return std::nullopt;
        }
        if (!it->is_number()) {
            throw FormatError(join(where, key), "expected a number");
        }
        return it->get<double>();
    }

    inline std::optional<bool> read_bool(const json& obj, const char* key, const std::string& where) {
        const auto it = obj.find(key);
        if (it == obj.end()) {
            return std::nullopt;
        }
        if (!it->is_boolean()) {
            throw FormatError(join(where, key), "expected a boolean");
        }
        return it->get<bool>();
    }

    // null is accepted and reads as absent
    inline std::optional<std::string> read_string(const json& obj, const char* key, const std::string& where) {
        const auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            throw FormatError(join(where, key), "expected a string");
        }
        return it->get<std::string>();
    }

    inline std::string require_string(const json& obj, const char* key, const std::string& where) {
        auto value = read_string(obj, key, where);
        if (!value) {
            throw FormatError(join(where, key), "required string is missing");
        }
        return std::move(*value);
    }

} // namespace hdriv::io::json_fields
