/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hdriv::io {

    enum class SchemaVersion : uint8_t {
        V1_0,
        V1_1,
        V1_2,
        V1_3,
        V1_4,
        V1_5,
        V1_6,
        V1_7,
    };

    constexpr SchemaVersion CURRENT_SCHEMA_VERSION = SchemaVersion::V1_7;
    constexpr const char* PROJECT_FILE_EXTENSION = ".hdriv";

    [[nodiscard]] std::string_view to_string(SchemaVersion version);
    [[nodiscard]] std::optional<SchemaVersion> parse_schema_version(std::string_view text);

    enum class ToneMapping : uint8_t {
        ACESFilmic,
        Reinhard,
        Cineon,
        None,
    };

    [[nodiscard]] std::string_view to_string(ToneMapping mode);

    /**
     * @brief Map a stored tone-mapping name to a mode
     *
     * Old projects wrote "Linear" and "None (sRGB)"; both mean None.
     * Anything unrecognized falls back to ACES Filmic.
     */
    [[nodiscard]] ToneMapping tone_mapping_from_string(std::string_view name);

    enum class MaterialPreset : uint8_t {
        SHV,
        Polyhaven,
        Grayscale,
        SkinTone,
    };

    [[nodiscard]] std::string_view to_string(MaterialPreset preset);
    [[nodiscard]] MaterialPreset material_preset_from_string(std::string_view name);

    // Directional light extracted from an HDRI, in degrees.
    struct LightAnnotation {
        double azimuth = 0.0;
        double elevation = 45.0;
        double intensity = 1.0;
        std::string color = "#ffffff";

        bool operator==(const LightAnnotation&) const = default;
    };

    /**
     * @brief One bundled binary (HDRI or material texture), decrypted
     */
    struct AssetRecord {
        std::string name;
        std::vector<uint8_t> bytes;
        std::string content_type; // may be empty, the UI layer decides
        bool encrypted = false;   // how it was stored
        SchemaVersion schema_origin = CURRENT_SCHEMA_VERSION;
        std::vector<LightAnnotation> lights;
    };

    struct Visibility {
        bool spheres = true;
        bool ground = true;
        bool shadows = true;
        bool color_checker = true;

        bool operator==(const Visibility&) const = default;
    };

    struct Settings {
        double rotation = 0.0;
        double exposure = 1.0;
        double blur = 0.0;
        ToneMapping tone_mapping = ToneMapping::ACESFilmic;
        Visibility visibility;
        MaterialPreset active_preset = MaterialPreset::SHV;
    };

    struct FloorMaterial {
        double tiling = 40.0;
        std::optional<AssetRecord> texture;
    };

    struct GlassMaterial {
        std::string color = "#ffffff";
        double roughness = 0.0;
        double ior = 1.5;
        double transmission = 1.0;
        std::optional<AssetRecord> roughness_texture;
    };

    struct SurfaceMaterial {
        std::string color;
        double roughness = 0.0;
        double metalness = 0.0;
        std::optional<AssetRecord> roughness_texture;
    };

    struct Materials {
        FloorMaterial floor;
        GlassMaterial glass;
        SurfaceMaterial matte{.color = "#ffffff", .roughness = 1.0, .metalness = 0.0};
        SurfaceMaterial chrome{.color = "#ffffff", .roughness = 0.0, .metalness = 1.0};
        SurfaceMaterial plastic{.color = "#00bcd4", .roughness = 0.1, .metalness = 0.05};
    };

    /**
     * @brief Named material/visibility setup, also stored as a preset file
     *
     * Textures are not part of a preset; only scalar parameters are kept.
     */
    struct CustomPreset {
        std::string name;
        Visibility visibility;
        Materials materials;
    };

    struct NormalizedProject {
        Settings settings;
        Materials materials;
        std::vector<AssetRecord> hdris;
        std::optional<std::string> selected_hdri;
        std::optional<CustomPreset> loaded_preset;

        [[nodiscard]] const AssetRecord* find_hdri(std::string_view name) const;
    };

    struct AssetWarning {
        std::string asset_name;
        core::ErrorCode code = core::ErrorCode::DECRYPTION_FAILED;
        std::string message;
    };

    struct LoadResult {
        NormalizedProject project;
        std::vector<AssetWarning> warnings;
    };

} // namespace hdriv::io
