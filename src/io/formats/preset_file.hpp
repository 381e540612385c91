/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "io/project.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace hdriv::io {

    constexpr const char* PRESET_FILE_VERSION = "1.0";

    /**
     * @brief Read a preset payload
     * @param j Preset object
     * @param require_version true for standalone preset files, false for the
     *        copy embedded in a project as "loadedPreset"
     *
     * Missing fields keep their defaults. Wrong field types are INVALID_FORMAT.
     */
    [[nodiscard]] core::Result<CustomPreset> preset_from_json(const nlohmann::json& j, bool require_version);

    [[nodiscard]] nlohmann::json preset_to_json(const CustomPreset& preset, bool include_version = true);

    [[nodiscard]] core::Result<CustomPreset> parse_preset_text(std::string_view text);

    [[nodiscard]] std::string write_preset_text(const CustomPreset& preset, int indent = 2);

    [[nodiscard]] core::Result<CustomPreset> load_preset_file(const std::filesystem::path& path);

    [[nodiscard]] core::Result<void> save_preset_file(const std::filesystem::path& path, const CustomPreset& preset);

} // namespace hdriv::io
