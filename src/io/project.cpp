/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/project.hpp"

#include <algorithm>
#include <utility>

namespace hdriv::io {

    namespace {

        constexpr std::array<std::pair<SchemaVersion, std::string_view>, 8> SCHEMA_NAMES{{
            {SchemaVersion::V1_0, "1.0"},
            {SchemaVersion::V1_1, "1.1"},
            {SchemaVersion::V1_2, "1.2"},
            {SchemaVersion::V1_3, "1.3"},
            {SchemaVersion::V1_4, "1.4"},
            {SchemaVersion::V1_5, "1.5"},
            {SchemaVersion::V1_6, "1.6"},
            {SchemaVersion::V1_7, "1.7"},
        }};

    } // namespace

    std::string_view to_string(const SchemaVersion version) {
        for (const auto& [v, name] : SCHEMA_NAMES) {
            if (v == version) {
                return name;
            }
        }
        return "?";
    }

    std::optional<SchemaVersion> parse_schema_version(const std::string_view text) {
        for (const auto& [v, name] : SCHEMA_NAMES) {
            if (name == text) {
                return v;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(const ToneMapping mode) {
        switch (mode) {
        case ToneMapping::ACESFilmic: return "ACES Filmic";
        case ToneMapping::Reinhard: return "Reinhard";
        case ToneMapping::Cineon: return "Cineon";
        case ToneMapping::None: return "None";
        }
        return "ACES Filmic";
    }

    ToneMapping tone_mapping_from_string(const std::string_view name) {
        if (name == "Linear" || name == "None (sRGB)" || name == "None") {
            return ToneMapping::None;
        }
        if (name == "Reinhard") {
            return ToneMapping::Reinhard;
        }
        if (name == "Cineon") {
            return ToneMapping::Cineon;
        }
        return ToneMapping::ACESFilmic;
    }

    std::string_view to_string(const MaterialPreset preset) {
        switch (preset) {
        case MaterialPreset::SHV: return "SHV";
        case MaterialPreset::Polyhaven: return "Polyhaven";
        case MaterialPreset::Grayscale: return "Grayscale";
        case MaterialPreset::SkinTone: return "SkinTone";
        }
        return "SHV";
    }

    MaterialPreset material_preset_from_string(const std::string_view name) {
        if (name == "Polyhaven") return MaterialPreset::Polyhaven;
        if (name == "Grayscale") return MaterialPreset::Grayscale;
        if (name == "SkinTone") return MaterialPreset::SkinTone;
        return MaterialPreset::SHV;
    }

    const AssetRecord* NormalizedProject::find_hdri(const std::string_view name) const {
        const auto it = std::find_if(hdris.begin(), hdris.end(),
                                     [&](const AssetRecord& a) { return a.name == name; });
        return it != hdris.end() ? &*it : nullptr;
    }

} // namespace hdriv::io
