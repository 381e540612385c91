/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "crypto/envelope_cipher.hpp"
#include "io/formats/project_document.hpp"
#include "io/project.hpp"
#include <filesystem>
#include <string_view>

namespace hdriv::io {

    constexpr const char* WARNING_KEY_MISMATCH = "asset skipped: key mismatch or corruption";
    constexpr const char* WARNING_CORRUPT_LEGACY = "asset skipped: corrupt legacy data";
    constexpr const char* WARNING_RETIRED_SCHEME = "asset skipped: unsupported legacy encryption";

    /**
     * @brief Bring a document of any schema version into the normalized model
     *
     * Assets are processed in document order. An asset that cannot be
     * recovered is left out and reported in LoadResult::warnings; the rest of
     * the project still loads. Only KEY_UNAVAILABLE fails the whole call.
     *
     * The selected HDRI is cleared when no asset of that name survived.
     */
    [[nodiscard]] core::Result<LoadResult> migrate_project(const ProjectDocument& doc,
                                                           const crypto::EnvelopeCipher& cipher);

    // parse_project_document() followed by migrate_project()
    [[nodiscard]] core::Result<LoadResult> load_project(std::string_view text,
                                                        const crypto::EnvelopeCipher& cipher);

    [[nodiscard]] core::Result<LoadResult> load_project_file(const std::filesystem::path& path,
                                                             const crypto::EnvelopeCipher& cipher);

} // namespace hdriv::io
