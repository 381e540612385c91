/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "preset_file.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"
#include "json_fields.hpp"

namespace hdriv::io {

    using json = nlohmann::json;
    using core::ErrorCode;
    using core::make_error;
    using namespace json_fields;

    namespace {

        void read_visibility(const json& j, Visibility& v, const std::string& where) {
            v.spheres = read_bool(j, "spheresVisible", where).value_or(v.spheres);
            v.ground = read_bool(j, "groundVisible", where).value_or(v.ground);
            v.shadows = read_bool(j, "shadowsVisible", where).value_or(v.shadows);
            v.color_checker = read_bool(j, "colorCheckerVisible", where).value_or(v.color_checker);
        }

        void read_surface(const json& parent, const char* key, SurfaceMaterial& m, const std::string& where) {
            const json* j = optional_object(parent, key, where);
            if (!j) {
                return;
            }
            const std::string path = join(where, key);
            m.color = read_string(*j, "color", path).value_or(m.color);
            m.roughness = read_number(*j, "roughness", path).value_or(m.roughness);
            m.metalness = read_number(*j, "metalness", path).value_or(m.metalness);
        }

        void read_material_scalars(const json& j, Materials& m, const std::string& where) {
            if (const json* floor = optional_object(j, "floor", where)) {
                m.floor.tiling = read_number(*floor, "tiling", join(where, "floor")).value_or(m.floor.tiling);
            }
            if (const json* glass = optional_object(j, "glass", where)) {
                const std::string path = join(where, "glass");
                m.glass.color = read_string(*glass, "color", path).value_or(m.glass.color);
                m.glass.roughness = read_number(*glass, "roughness", path).value_or(m.glass.roughness);
                m.glass.ior = read_number(*glass, "ior", path).value_or(m.glass.ior);
                m.glass.transmission = read_number(*glass, "transmission", path).value_or(m.glass.transmission);
            }
            read_surface(j, "matte", m.matte, where);
            read_surface(j, "chrome", m.chrome, where);
            read_surface(j, "plastic", m.plastic, where);
        }

        json surface_to_json(const SurfaceMaterial& m) {
            return json{{"color", m.color}, {"roughness", m.roughness}, {"metalness", m.metalness}};
        }

    } // anonymous namespace

    core::Result<CustomPreset> preset_from_json(const json& j, const bool require_version) {
        if (!j.is_object()) {
            return make_error(ErrorCode::INVALID_FORMAT, "Preset must be a JSON object");
        }

        try {
            if (require_version) {
                const auto version = read_string(j, "version", "");
                if (!version) {
                    return make_error(ErrorCode::INVALID_FORMAT, "Preset has no version");
                }
                if (*version != PRESET_FILE_VERSION) {
                    return make_error(ErrorCode::INVALID_FORMAT, "Unsupported preset version", *version);
                }
            }

            CustomPreset preset;
            preset.name = read_string(j, "name", "").value_or("");
            if (const json* vis = optional_object(j, "visibility", "")) {
                read_visibility(*vis, preset.visibility, "visibility");
            }
            if (const json* mats = optional_object(j, "materials", "")) {
                read_material_scalars(*mats, preset.materials, "materials");
            }
            return preset;
        } catch (const FormatError& e) {
            return make_error(ErrorCode::INVALID_FORMAT, std::string("Invalid preset: ") + e.what(), e.where());
        }
    }

    json preset_to_json(const CustomPreset& preset, const bool include_version) {
        json j;
        if (include_version) {
            j["version"] = PRESET_FILE_VERSION;
        }
        j["name"] = preset.name;

        const auto& v = preset.visibility;
        j["visibility"] = {
            {"spheresVisible", v.spheres},
            {"groundVisible", v.ground},
            {"shadowsVisible", v.shadows},
            {"colorCheckerVisible", v.color_checker}};

        const auto& m = preset.materials;
        json mats;
        mats["floor"] = {{"tiling", m.floor.tiling}};
        mats["glass"] = {
            {"color", m.glass.color},
            {"roughness", m.glass.roughness},
            {"ior", m.glass.ior},
            {"transmission", m.glass.transmission}};
        mats["matte"] = surface_to_json(m.matte);
        mats["chrome"] = surface_to_json(m.chrome);
        mats["plastic"] = surface_to_json(m.plastic);
        j["materials"] = std::move(mats);
        return j;
    }

    core::Result<CustomPreset> parse_preset_text(const std::string_view text) {
        json j;
        try {
            j = json::parse(text);
        } catch (const json::parse_error& e) {
            return make_error(ErrorCode::PARSE_ERROR, "Preset is not valid JSON", e.what());
        }
        return preset_from_json(j, true);
    }

    std::string write_preset_text(const CustomPreset& preset, const int indent) {
        return preset_to_json(preset, true).dump(indent);
    }

    core::Result<CustomPreset> load_preset_file(const std::filesystem::path& path) {
        auto text = core::read_text_file(path);
        if (!text) {
            return std::unexpected(text.error());
        }
        auto preset = parse_preset_text(*text);
        if (!preset) {
            auto err = preset.error();
            err.details = core::path_to_utf8(path) + (err.details.empty() ? "" : ": " + err.details);
            return std::unexpected(std::move(err));
        }
        LOG_INFO("Loaded preset '{}' from {}", preset->name, core::path_to_utf8(path));
        return preset;
    }

    core::Result<void> save_preset_file(const std::filesystem::path& path, const CustomPreset& preset) {
        if (auto r = core::write_file_atomic(path, write_preset_text(preset)); !r) {
            return r;
        }
        LOG_INFO("Saved preset '{}' to {}", preset.name, core::path_to_utf8(path));
        return {};
    }

} // namespace hdriv::io
