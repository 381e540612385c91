/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/logger.hpp"
#include "crypto/key_source.hpp"
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace hdriv::app {

    constexpr const char* DEFAULT_CONFIG_FILE = "hdriv.json";

    enum class KeySourceKind {
        Environment,
        File,
        Passphrase,
    };

    struct KeyConfig {
        KeySourceKind source = KeySourceKind::Environment;
        std::string env_var = crypto::DEFAULT_KEY_ENV_VAR;
        std::filesystem::path path;
        std::string passphrase;

        static KeyConfig from_json(const nlohmann::json& j);
        nlohmann::json to_json() const;

        // INVALID_CONFIG when the selected source is missing its parameter
        [[nodiscard]] core::Result<std::unique_ptr<crypto::KeySource>> make_source() const;
    };

    struct ToolConfig {
        KeyConfig key;
        core::LogLevel log_level = core::LogLevel::Info;
        std::string log_file;
        int indent = -1;
        bool parallel_encrypt = true;

        // Throws nlohmann::json::exception or std::invalid_argument on bad input
        static ToolConfig from_json(const nlohmann::json& j);
        nlohmann::json to_json() const;
    };

    /**
     * @brief Read a tool configuration file
     *
     * Unknown keys are ignored. Unreadable files, malformed JSON and values
     * of the wrong type or range are INVALID_CONFIG.
     */
    [[nodiscard]] core::Result<ToolConfig> load_tool_config(const std::filesystem::path& path);

} // namespace hdriv::app
