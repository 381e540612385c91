/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "project_document.hpp"
#include "core/logger.hpp"
#include "json_fields.hpp"
#include "preset_file.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <type_traits>

namespace hdriv::io {

    using json = nlohmann::json;
    using core::ErrorCode;
    using core::make_error;
    using namespace json_fields;

    namespace {

        constexpr const char* RETIRED_DIRECT_SCHEME = "direct-aes-gcm";

        constexpr bool at_least(const SchemaVersion v, const SchemaVersion min) {
            return static_cast<uint8_t>(v) >= static_cast<uint8_t>(min);
        }

        std::string requires_version(const char* what, const SchemaVersion min) {
            return std::string(what) + " requires schema " + std::string(to_string(min)) + " or newer";
        }

        // ---- reading -------------------------------------------------------

        std::vector<LightAnnotation> read_lights(const json& asset, const SchemaVersion v, const std::string& where) {
            const auto it = asset.find("lights");
            if (it == asset.end() || it->is_null()) {
                return {};
            }
            if (!at_least(v, SchemaVersion::V1_4)) {
                throw FormatError(join(where, "lights"), requires_version("light annotations", SchemaVersion::V1_4));
            }
            if (!it->is_array()) {
                throw FormatError(join(where, "lights"), "expected an array");
            }

            std::vector<LightAnnotation> lights;
            lights.reserve(it->size());
            for (size_t i = 0; i < it->size(); ++i) {
                const json& l = (*it)[i];
                const std::string path = join(where, "lights") + "[" + std::to_string(i) + "]";
                if (!l.is_object()) {
                    throw FormatError(path, "expected an object");
                }
                LightAnnotation light;
                light.azimuth = read_number(l, "azimuth", path).value_or(light.azimuth);
                light.elevation = read_number(l, "elevation", path).value_or(light.elevation);
                light.intensity = read_number(l, "intensity", path).value_or(light.intensity);
                light.color = read_string(l, "color", path).value_or(light.color);
                lights.push_back(std::move(light));
            }
            return lights;
        }

        StoredAsset read_asset(const json& j, const SchemaVersion v, const std::string& where) {
            if (!j.is_object()) {
                throw FormatError(where, "asset entry must be an object");
            }

            StoredAsset asset;
            asset.name = require_string(j, "name", where);
            std::string data = require_string(j, "data", where);

            if (read_bool(j, "encrypted", where).value_or(false)) {
                if (!at_least(v, SchemaVersion::V1_6)) {
                    throw FormatError(join(where, "encrypted"),
                                      requires_version("encrypted assets", SchemaVersion::V1_6));
                }
                auto iv = read_string(j, "iv", where);
                auto wrapped_key = read_string(j, "wrappedKey", where);
                auto key_iv = read_string(j, "keyIv", where);

                if (v == SchemaVersion::V1_6 || (!wrapped_key && !key_iv)) {
                    asset.payload = RetiredPayload{RETIRED_DIRECT_SCHEME};
                } else {
                    // A half-present key wrap is kept and fails authentication later
                    asset.payload = EnvelopePayload{crypto::EncryptedPacket{
                        .ciphertext = std::move(data),
                        .content_nonce = iv.value_or(""),
                        .wrapped_key = wrapped_key.value_or(""),
                        .key_nonce = key_iv.value_or("")}};
                }
            } else {
                asset.payload = PlainPayload{std::move(data)};
            }

            if (at_least(v, SchemaVersion::V1_7)) {
                asset.content_type = read_string(j, "type", where);
            }
            return asset;
        }

        std::optional<StoredAsset> read_texture(const json& parent, const char* key, const SchemaVersion v,
                                                const std::string& where) {
            const auto it = parent.find(key);
            if (it == parent.end() || it->is_null()) {
                return std::nullopt;
            }
            return read_asset(*it, v, join(where, key));
        }

        std::vector<StoredAsset> read_hdris(const json& root, const SchemaVersion v) {
            const auto it = root.find("hdris");
            if (it == root.end()) {
                throw FormatError("hdris", "required block is missing");
            }
            if (!it->is_array()) {
                throw FormatError("hdris", "expected an array");
            }

            std::vector<StoredAsset> hdris;
            hdris.reserve(it->size());
            for (size_t i = 0; i < it->size(); ++i) {
                const std::string path = "hdris[" + std::to_string(i) + "]";
                StoredAsset asset = read_asset((*it)[i], v, path);
                asset.lights = read_lights((*it)[i], v, path);
                hdris.push_back(std::move(asset));
            }
            return hdris;
        }

        void read_settings(const json& j, SettingsV1_0& s, const std::string& where) {
            s.rotation = read_number(j, "rotation", where);
            s.exposure = read_number(j, "exposure", where);
            s.blur = read_number(j, "blur", where);
            s.selected_hdri_name = read_string(j, "selectedHdriName", where);
            s.tone_mapping = read_string(j, "toneMapping", where);
        }

        void read_settings(const json& j, SettingsV1_1& s, const std::string& where) {
            read_settings(j, static_cast<SettingsV1_0&>(s), where);
            s.spheres_visible = read_bool(j, "spheresVisible", where);
            s.ground_visible = read_bool(j, "groundVisible", where);
            s.shadows_visible = read_bool(j, "shadowsVisible", where);
            s.color_checker_visible = read_bool(j, "colorCheckerVisible", where);
        }

        void read_settings(const json& j, SettingsV1_3& s, const std::string& where) {
            read_settings(j, static_cast<SettingsV1_1&>(s), where);
            s.active_preset = read_string(j, "activePreset", where);
        }

        void read_floor(const json& m, FloorFields& f, const SchemaVersion v, const std::string& where) {
            const json* j = optional_object(m, "floor", where);
            if (!j) {
                return;
            }
            const std::string path = join(where, "floor");
            f.tiling = read_number(*j, "tiling", path);
            f.texture = read_texture(*j, "texture", v, path);
        }

        const json* read_surface(const json& m, const char* key, SurfaceFields& s, const std::string& where) {
            const json* j = optional_object(m, key, where);
            if (!j) {
                return nullptr;
            }
            const std::string path = join(where, key);
            s.color = read_string(*j, "color", path);
            s.roughness = read_number(*j, "roughness", path);
            s.metalness = read_number(*j, "metalness", path);
            return j;
        }

        void read_surface(const json& m, const char* key, TexturedSurfaceFields& s, const SchemaVersion v,
                          const std::string& where) {
            if (const json* j = read_surface(m, key, static_cast<SurfaceFields&>(s), where)) {
                s.roughness_texture = read_texture(*j, "roughnessTexture", v, join(where, key));
            }
        }

        const json* read_glass(const json& m, GlassFieldsV1_1& g, const std::string& where) {
            const json* j = optional_object(m, "glass", where);
            if (j) {
                g.roughness = read_number(*j, "roughness", join(where, "glass"));
                g.ior = read_number(*j, "ior", join(where, "glass"));
            }
            return j;
        }

        const json* read_glass(const json& m, GlassFieldsV1_2& g, const SchemaVersion v, const std::string& where) {
            const json* j = read_glass(m, static_cast<GlassFieldsV1_1&>(g), where);
            if (j) {
                g.roughness_texture = read_texture(*j, "roughnessTexture", v, join(where, "glass"));
            }
            return j;
        }

        void read_glass(const json& m, GlassFieldsV1_3& g, const SchemaVersion v, const std::string& where) {
            if (const json* j = read_glass(m, static_cast<GlassFieldsV1_2&>(g), v, where)) {
                g.color = read_string(*j, "color", join(where, "glass"));
                g.transmission = read_number(*j, "transmission", join(where, "glass"));
            }
        }

        void read_materials(const json& j, MaterialsV1_1& m, const SchemaVersion v, const std::string& where) {
            read_floor(j, m.floor, v, where);
            read_glass(j, m.glass, where);
            read_surface(j, "matte", m.matte, where);
            read_surface(j, "chrome", m.chrome, v, where);
            read_surface(j, "plastic", m.plastic, where);
        }

        void read_materials(const json& j, MaterialsV1_2& m, const SchemaVersion v, const std::string& where) {
            read_floor(j, m.floor, v, where);
            read_glass(j, m.glass, v, where);
            read_surface(j, "matte", m.matte, v, where);
            read_surface(j, "chrome", m.chrome, v, where);
            read_surface(j, "plastic", m.plastic, v, where);
        }

        void read_materials(const json& j, MaterialsV1_3& m, const SchemaVersion v, const std::string& where) {
            read_floor(j, m.floor, v, where);
            read_glass(j, m.glass, v, where);
            read_surface(j, "matte", m.matte, v, where);
            read_surface(j, "chrome", m.chrome, v, where);
            read_surface(j, "plastic", m.plastic, v, where);
        }

        void reject_newer_field(const json& j, const char* key, const std::string& where, const SchemaVersion min) {
            const auto it = j.find(key);
            if (it != j.end() && !it->is_null()) {
                throw FormatError(join(where, key), requires_version(key, min));
            }
        }

        void reject_newer_field(const json& materials, const char* block, const char* key, const SchemaVersion min) {
            const auto it = materials.find(block);
            if (it != materials.end() && it->is_object()) {
                reject_newer_field(*it, key, join("materials", block), min);
            }
        }

        // Fields a version's readers skip must not be present, or they would load as defaults
        void reject_newer_fields(const json& root, const SchemaVersion v) {
            const json& settings = root.at("settings");
            if (!at_least(v, SchemaVersion::V1_1)) {
                for (const char* key : {"spheresVisible", "groundVisible", "shadowsVisible", "colorCheckerVisible"}) {
                    reject_newer_field(settings, key, "settings", SchemaVersion::V1_1);
                }
            }
            if (!at_least(v, SchemaVersion::V1_3)) {
                reject_newer_field(settings, "activePreset", "settings", SchemaVersion::V1_3);
            }

            const auto materials = root.find("materials");
            if (materials == root.end() || !materials->is_object()) {
                return;
            }
            if (!at_least(v, SchemaVersion::V1_2)) {
                for (const char* block : {"glass", "matte", "plastic"}) {
                    reject_newer_field(*materials, block, "roughnessTexture", SchemaVersion::V1_2);
                }
            }
            if (!at_least(v, SchemaVersion::V1_3)) {
                reject_newer_field(*materials, "glass", "color", SchemaVersion::V1_3);
                reject_newer_field(*materials, "glass", "transmission", SchemaVersion::V1_3);
            }
        }

        template <typename Document>
        ProjectDocument parse_document(const json& root) {
            constexpr SchemaVersion v = Document::VERSION;
            Document doc;

            read_settings(require_object(root, "settings", ""), doc.settings, "settings");

            if constexpr (v == SchemaVersion::V1_0) {
                if (root.contains("materials")) {
                    throw FormatError("materials", requires_version("material block", SchemaVersion::V1_1));
                }
            } else {
                read_materials(require_object(root, "materials", ""), doc.materials, v, "materials");
            }

            if constexpr (!at_least(v, SchemaVersion::V1_3)) {
                reject_newer_fields(root, v);
            }

            doc.hdris = read_hdris(root, v);

            if constexpr (at_least(v, SchemaVersion::V1_5)) {
                if (const json* preset = optional_object(root, "loadedPreset", "")) {
                    auto parsed = preset_from_json(*preset, false);
                    if (!parsed) {
                        throw FormatError("loadedPreset", parsed.error().message);
                    }
                    doc.loaded_preset = std::move(*parsed);
                }
            } else {
                if (root.contains("loadedPreset")) {
                    throw FormatError("loadedPreset", requires_version("loaded preset", SchemaVersion::V1_5));
                }
            }
            return doc;
        }

        using DocumentParser = ProjectDocument (*)(const json&);

        struct VersionEntry {
            SchemaVersion version;
            DocumentParser parse;
        };

        constexpr std::array<VersionEntry, 8> VERSION_TABLE{{
            {SchemaVersion::V1_0, &parse_document<DocumentV1_0>},
            {SchemaVersion::V1_1, &parse_document<DocumentV1_1>},
            {SchemaVersion::V1_2, &parse_document<DocumentV1_2>},
            {SchemaVersion::V1_3, &parse_document<DocumentV1_3>},
            {SchemaVersion::V1_4, &parse_document<DocumentV1_4>},
            {SchemaVersion::V1_5, &parse_document<DocumentV1_5>},
            {SchemaVersion::V1_6, &parse_document<DocumentV1_6>},
            {SchemaVersion::V1_7, &parse_document<DocumentV1_7>},
        }};

        // ---- writing -------------------------------------------------------

        json asset_to_json(const StoredAsset& asset) {
            json j;
            j["name"] = asset.name;
            std::visit(
                [&j](const auto& payload) {
                    using T = std::decay_t<decltype(payload)>;
                    if constexpr (std::is_same_v<T, PlainPayload>) {
                        j["data"] = payload.data_url;
                    } else if constexpr (std::is_same_v<T, EnvelopePayload>) {
                        j["data"] = payload.packet.ciphertext;
                        j["encrypted"] = true;
                        j["iv"] = payload.packet.content_nonce;
                        j["wrappedKey"] = payload.packet.wrapped_key;
                        j["keyIv"] = payload.packet.key_nonce;
                    } else {
                        static_assert(std::is_same_v<T, RetiredPayload>);
                        throw std::logic_error("retired payloads are never written");
                    }
                },
                asset.payload);
            if (asset.content_type && !asset.content_type->empty()) {
                j["type"] = *asset.content_type;
            }
            return j;
        }

        json texture_to_json(const std::optional<StoredAsset>& texture) {
            return texture ? asset_to_json(*texture) : json(nullptr);
        }

        json surface_to_json(const TexturedSurfaceFields& s) {
            return json{
                {"color", s.color.value_or("")},
                {"roughness", s.roughness.value_or(0.0)},
                {"metalness", s.metalness.value_or(0.0)},
                {"roughnessTexture", texture_to_json(s.roughness_texture)}};
        }

    } // anonymous namespace

    SchemaVersion document_version(const ProjectDocument& doc) {
        return std::visit([](const auto& d) { return std::decay_t<decltype(d)>::VERSION; }, doc);
    }

    core::Result<ProjectDocument> parse_project_document(const std::string_view text) {
        json root;
        try {
            root = json::parse(text);
        } catch (const json::parse_error& e) {
            return make_error(ErrorCode::PARSE_ERROR, "Project file is not valid JSON", e.what());
        }

        if (!root.is_object()) {
            return make_error(ErrorCode::INVALID_FORMAT, "Project file must contain a JSON object");
        }
        const auto version_it = root.find("version");
        if (version_it == root.end() || !version_it->is_string()) {
            return make_error(ErrorCode::INVALID_FORMAT, "Project file has no version");
        }
        const std::string version = version_it->get<std::string>();

        const auto entry = std::find_if(VERSION_TABLE.begin(), VERSION_TABLE.end(),
                                        [&](const VersionEntry& e) { return to_string(e.version) == version; });
        if (entry == VERSION_TABLE.end()) {
            return make_error(ErrorCode::INVALID_FORMAT, "Unsupported project version", version);
        }

        try {
            ProjectDocument doc = entry->parse(root);
            LOG_DEBUG("Parsed project document, schema {}", version);
            return doc;
        } catch (const FormatError& e) {
            return make_error(ErrorCode::INVALID_FORMAT,
                              "Project does not match schema " + version + ": " + e.what(), e.where());
        } catch (const json::exception& e) {
            return make_error(ErrorCode::INVALID_FORMAT, "Project does not match schema " + version, e.what());
        }
    }

    json to_json(const DocumentV1_7& doc) {
        json project;
        project["version"] = std::string(to_string(DocumentV1_7::VERSION));

        const auto& s = doc.settings;
        json settings;
        settings["rotation"] = s.rotation.value_or(0.0);
        settings["exposure"] = s.exposure.value_or(1.0);
        settings["blur"] = s.blur.value_or(0.0);
        settings["selectedHdriName"] = s.selected_hdri_name ? json(*s.selected_hdri_name) : json(nullptr);
        settings["toneMapping"] = s.tone_mapping.value_or(std::string(to_string(ToneMapping::ACESFilmic)));
        settings["spheresVisible"] = s.spheres_visible.value_or(true);
        settings["groundVisible"] = s.ground_visible.value_or(true);
        settings["shadowsVisible"] = s.shadows_visible.value_or(true);
        settings["colorCheckerVisible"] = s.color_checker_visible.value_or(true);
        settings["activePreset"] = s.active_preset.value_or(std::string(to_string(MaterialPreset::SHV)));
        project["settings"] = std::move(settings);

        const auto& m = doc.materials;
        json materials;
        materials["floor"] = {
            {"tiling", m.floor.tiling.value_or(40.0)},
            {"texture", texture_to_json(m.floor.texture)}};
        materials["glass"] = {
            {"color", m.glass.color.value_or("#ffffff")},
            {"roughness", m.glass.roughness.value_or(0.0)},
            {"ior", m.glass.ior.value_or(1.5)},
            {"transmission", m.glass.transmission.value_or(1.0)},
            {"roughnessTexture", texture_to_json(m.glass.roughness_texture)}};
        materials["matte"] = surface_to_json(m.matte);
        materials["chrome"] = surface_to_json(m.chrome);
        materials["plastic"] = surface_to_json(m.plastic);
        project["materials"] = std::move(materials);

        json hdris = json::array();
        for (const auto& hdri : doc.hdris) {
            json h = asset_to_json(hdri);
            if (!hdri.lights.empty()) {
                json lights = json::array();
                for (const auto& l : hdri.lights) {
                    lights.push_back({{"azimuth", l.azimuth},
                                      {"elevation", l.elevation},
                                      {"intensity", l.intensity},
                                      {"color", l.color}});
                }
                h["lights"] = std::move(lights);
            }
            hdris.push_back(std::move(h));
        }
        project["hdris"] = std::move(hdris);

        if (doc.loaded_preset) {
            project["loadedPreset"] = preset_to_json(*doc.loaded_preset, false);
        }
        return project;
    }

} // namespace hdriv::io
