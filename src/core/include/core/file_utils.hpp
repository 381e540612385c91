/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hdriv::core {

    /**
     * @brief Path as UTF-8 for log messages and error details
     */
    [[nodiscard]] std::string path_to_utf8(const std::filesystem::path& p);

    [[nodiscard]] Result<std::vector<uint8_t>> read_file_bytes(const std::filesystem::path& path);

    [[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path& path);

    /**
     * @brief Write a file through a sibling temporary and rename it into place
     *
     * Either the complete new content is visible at @p path or the previous
     * file (if any) is left untouched.
     */
    [[nodiscard]] Result<void> write_file_atomic(const std::filesystem::path& path,
                                                 std::span<const uint8_t> data);

    [[nodiscard]] Result<void> write_file_atomic(const std::filesystem::path& path,
                                                 std::string_view text);

} // namespace hdriv::core
