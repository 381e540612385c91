/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "crypto/envelope_cipher.hpp"
#include "io/project.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hdriv::io {

    // Legacy "data:<type>;base64,<payload>" text, stored unencrypted
    struct PlainPayload {
        std::string data_url;
    };

    struct EnvelopePayload {
        crypto::EncryptedPacket packet;
    };

    // Encrypted with a scheme this build can no longer read
    struct RetiredPayload {
        std::string scheme;
    };

    using AssetPayload = std::variant<PlainPayload, EnvelopePayload, RetiredPayload>;

    struct StoredAsset {
        std::string name;
        AssetPayload payload;
        std::optional<std::string> content_type; // "type", 1.7 only
        std::vector<LightAnnotation> lights;     // HDRIs, 1.4+
    };

    // Settings, one struct per schema revision that added fields.
    // Absent fields stay empty; defaults are applied during migration.
    struct SettingsV1_0 {
        std::optional<double> rotation;
        std::optional<double> exposure;
        std::optional<double> blur;
        std::optional<std::string> selected_hdri_name;
        std::optional<std::string> tone_mapping;
    };

    struct SettingsV1_1 : SettingsV1_0 {
        std::optional<bool> spheres_visible;
        std::optional<bool> ground_visible;
        std::optional<bool> shadows_visible;
        std::optional<bool> color_checker_visible;
    };

    struct SettingsV1_3 : SettingsV1_1 {
        std::optional<std::string> active_preset;
    };

    struct FloorFields {
        std::optional<double> tiling;
        std::optional<StoredAsset> texture;
    };

    struct SurfaceFields {
        std::optional<std::string> color;
        std::optional<double> roughness;
        std::optional<double> metalness;
    };

    struct TexturedSurfaceFields : SurfaceFields {
        std::optional<StoredAsset> roughness_texture;
    };

    struct GlassFieldsV1_1 {
        std::optional<double> roughness;
        std::optional<double> ior;
    };

    struct GlassFieldsV1_2 : GlassFieldsV1_1 {
        std::optional<StoredAsset> roughness_texture;
    };

    struct GlassFieldsV1_3 : GlassFieldsV1_2 {
        std::optional<std::string> color;
        std::optional<double> transmission;
    };

    struct MaterialsV1_1 {
        FloorFields floor;
        GlassFieldsV1_1 glass;
        SurfaceFields matte;
        TexturedSurfaceFields chrome;
        SurfaceFields plastic;
    };

    struct MaterialsV1_2 {
        FloorFields floor;
        GlassFieldsV1_2 glass;
        TexturedSurfaceFields matte;
        TexturedSurfaceFields chrome;
        TexturedSurfaceFields plastic;
    };

    struct MaterialsV1_3 {
        FloorFields floor;
        GlassFieldsV1_3 glass;
        TexturedSurfaceFields matte;
        TexturedSurfaceFields chrome;
        TexturedSurfaceFields plastic;
    };

    struct DocumentV1_0 {
        static constexpr SchemaVersion VERSION = SchemaVersion::V1_0;
        SettingsV1_0 settings;
        std::vector<StoredAsset> hdris;
    };

    struct DocumentV1_1 {
        static constexpr SchemaVersion VERSION = SchemaVersion::V1_1;
        SettingsV1_1 settings;
        MaterialsV1_1 materials;
        std::vector<StoredAsset> hdris;
    };

    struct DocumentV1_2 {
        static constexpr SchemaVersion VERSION = SchemaVersion::V1_2;
        SettingsV1_1 settings;
        MaterialsV1_2 materials;
        std::vector<StoredAsset> hdris;
    };

    struct DocumentV1_3 {
        static constexpr SchemaVersion VERSION = SchemaVersion::V1_3;
        SettingsV1_3 settings;
        MaterialsV1_3 materials;
        std::vector<StoredAsset> hdris;
    };

    // Adds light annotations on HDRIs
    struct DocumentV1_4 {
        static constexpr SchemaVersion VERSION = SchemaVersion::V1_4;
        SettingsV1_3 settings;
        MaterialsV1_3 materials;
        std::vector<StoredAsset> hdris;
    };

    struct DocumentV1_5 {
        static constexpr SchemaVersion VERSION = SchemaVersion::V1_5;
        SettingsV1_3 settings;
        MaterialsV1_3 materials;
        std::vector<StoredAsset> hdris;
        std::optional<CustomPreset> loaded_preset;
    };

    // Adds direct-encrypted assets (retired)
    struct DocumentV1_6 {
        static constexpr SchemaVersion VERSION = SchemaVersion::V1_6;
        SettingsV1_3 settings;
        MaterialsV1_3 materials;
        std::vector<StoredAsset> hdris;
        std::optional<CustomPreset> loaded_preset;
    };

    // Adds envelope-encrypted assets; the only version written
    struct DocumentV1_7 {
        static constexpr SchemaVersion VERSION = SchemaVersion::V1_7;
        SettingsV1_3 settings;
        MaterialsV1_3 materials;
        std::vector<StoredAsset> hdris;
        std::optional<CustomPreset> loaded_preset;
    };

    using ProjectDocument = std::variant<DocumentV1_0, DocumentV1_1, DocumentV1_2, DocumentV1_3,
                                         DocumentV1_4, DocumentV1_5, DocumentV1_6, DocumentV1_7>;

    [[nodiscard]] SchemaVersion document_version(const ProjectDocument& doc);

    /**
     * @brief Parse project text into the struct of its declared version
     *
     * Malformed JSON is PARSE_ERROR. A missing or unknown version, a missing
     * settings/materials/hdris block, a field of the wrong type, or a field
     * that only exists in a newer version is INVALID_FORMAT.
     */
    [[nodiscard]] core::Result<ProjectDocument> parse_project_document(std::string_view text);

    // Throws std::logic_error for a RetiredPayload, which is never written.
    [[nodiscard]] nlohmann::json to_json(const DocumentV1_7& doc);

} // namespace hdriv::io
