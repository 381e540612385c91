/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "crypto/envelope_cipher.hpp"
#include "io/formats/project_document.hpp"
#include "io/project.hpp"
#include <filesystem>
#include <string>

namespace hdriv::io {

    struct SerializeOptions {
        bool parallel = true; // one async task per asset; false runs them inline
        int indent = -1;      // JSON indent for text output, -1 is compact
    };

    /**
     * @brief Build a schema 1.7 document with every asset envelope-encrypted
     *
     * All HDRIs and material textures are encrypted concurrently. Every task
     * is joined before any result is looked at; if one fails, the first
     * failure (HDRIs in list order, then floor, glass, matte, chrome and
     * plastic textures) is returned and no document is produced.
     */
    [[nodiscard]] core::Result<DocumentV1_7> serialize_project(const NormalizedProject& project,
                                                               const crypto::EnvelopeCipher& cipher,
                                                               const SerializeOptions& options = {});

    [[nodiscard]] core::Result<std::string> write_project_text(const NormalizedProject& project,
                                                               const crypto::EnvelopeCipher& cipher,
                                                               const SerializeOptions& options = {});

    /**
     * @brief Serialize and write atomically
     *
     * The target is only replaced once the whole document has been produced
     * and written to a temporary sibling file.
     */
    [[nodiscard]] core::Result<void> save_project(const std::filesystem::path& path,
                                                  const NormalizedProject& project,
                                                  const crypto::EnvelopeCipher& cipher,
                                                  const SerializeOptions& options = {});

} // namespace hdriv::io
