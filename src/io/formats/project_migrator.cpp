/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "project_migrator.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"
#include "io/codec.hpp"

#include <type_traits>
#include <utility>

namespace hdriv::io {

    using core::ErrorCode;
    using core::make_error;

    namespace {

        class ProjectMigrator {
        public:
            ProjectMigrator(const crypto::EnvelopeCipher& cipher, std::vector<AssetWarning>& warnings)
                : cipher_(cipher),
                  warnings_(warnings) {}

            template <typename Document>
            core::Result<NormalizedProject> operator()(const Document& doc) {
                version_ = Document::VERSION;

                NormalizedProject project;
                apply_settings(doc.settings, project);

                if constexpr (requires(const Document& d) { d.materials; }) {
                    if (auto r = apply_materials(doc.materials, project.materials); !r) {
                        return std::unexpected(r.error());
                    }
                }

                project.hdris.reserve(doc.hdris.size());
                for (const auto& stored : doc.hdris) {
                    auto record = resolve(stored);
                    if (!record) {
                        return std::unexpected(record.error());
                    }
                    if (*record) {
                        project.hdris.push_back(std::move(**record));
                    }
                }

                if constexpr (requires(const Document& d) { d.loaded_preset; }) {
                    project.loaded_preset = doc.loaded_preset;
                }

                if (project.selected_hdri && !project.find_hdri(*project.selected_hdri)) {
                    LOG_DEBUG("Selected HDRI '{}' is not available, clearing selection", *project.selected_hdri);
                    project.selected_hdri.reset();
                }
                return project;
            }

        private:
            void warn(const StoredAsset& asset, const ErrorCode code, const char* message) {
                LOG_WARN("'{}': {}", asset.name, message);
                warnings_.push_back({asset.name, code, message});
            }

            // nullopt: asset skipped and reported
            core::Result<std::optional<AssetRecord>> resolve(const StoredAsset& stored) {
                AssetRecord record;
                record.name = stored.name;
                record.schema_origin = version_;
                record.lights = stored.lights;

                return std::visit(
                    [&](const auto& payload) -> core::Result<std::optional<AssetRecord>> {
                        using T = std::decay_t<decltype(payload)>;
                        if constexpr (std::is_same_v<T, PlainPayload>) {
                            auto url = parse_data_url(payload.data_url);
                            if (!url) {
                                warn(stored, ErrorCode::INVALID_FORMAT, WARNING_CORRUPT_LEGACY);
                                return std::nullopt;
                            }
                            record.bytes = std::move(url->bytes);
                            record.content_type = stored.content_type.value_or(url->content_type);
                            record.encrypted = false;
                        } else if constexpr (std::is_same_v<T, EnvelopePayload>) {
                            auto bytes = cipher_.decrypt_payload(payload.packet);
                            if (!bytes) {
                                if (bytes.error().code == ErrorCode::KEY_UNAVAILABLE) {
                                    return std::unexpected(bytes.error());
                                }
                                warn(stored, ErrorCode::DECRYPTION_FAILED, WARNING_KEY_MISMATCH);
                                return std::nullopt;
                            }
                            record.bytes = std::move(*bytes);
                            record.content_type = stored.content_type.value_or("");
                            record.encrypted = true;
                        } else {
                            static_assert(std::is_same_v<T, RetiredPayload>);
                            LOG_DEBUG("'{}' uses retired scheme '{}'", stored.name, payload.scheme);
                            warn(stored, ErrorCode::UNSUPPORTED_LEGACY_SCHEME, WARNING_RETIRED_SCHEME);
                            return std::nullopt;
                        }
                        return std::optional<AssetRecord>(std::move(record));
                    },
                    stored.payload);
            }

            core::Result<void> resolve_texture(const std::optional<StoredAsset>& stored,
                                               std::optional<AssetRecord>& out) {
                if (!stored) {
                    return {};
                }
                auto record = resolve(*stored);
                if (!record) {
                    return std::unexpected(record.error());
                }
                out = std::move(*record);
                return {};
            }

            // ---- settings ----

            void apply_settings(const SettingsV1_0& s, NormalizedProject& p) {
                p.settings.rotation = s.rotation.value_or(p.settings.rotation);
                p.settings.exposure = s.exposure.value_or(p.settings.exposure);
                p.settings.blur = s.blur.value_or(p.settings.blur);
                if (s.tone_mapping) {
                    p.settings.tone_mapping = tone_mapping_from_string(*s.tone_mapping);
                }
                p.selected_hdri = s.selected_hdri_name;
            }

            void apply_settings(const SettingsV1_1& s, NormalizedProject& p) {
                apply_settings(static_cast<const SettingsV1_0&>(s), p);
                auto& v = p.settings.visibility;
                v.spheres = s.spheres_visible.value_or(v.spheres);
                v.ground = s.ground_visible.value_or(v.ground);
                v.shadows = s.shadows_visible.value_or(v.shadows);
                v.color_checker = s.color_checker_visible.value_or(v.color_checker);
            }

            void apply_settings(const SettingsV1_3& s, NormalizedProject& p) {
                apply_settings(static_cast<const SettingsV1_1&>(s), p);
                if (s.active_preset) {
                    p.settings.active_preset = material_preset_from_string(*s.active_preset);
                }
            }

            // ---- materials ----

            void copy_scalars(const SurfaceFields& s, SurfaceMaterial& m) {
                m.color = s.color.value_or(m.color);
                m.roughness = s.roughness.value_or(m.roughness);
                m.metalness = s.metalness.value_or(m.metalness);
            }

            void copy_scalars(const GlassFieldsV1_1& g, GlassMaterial& m) {
                m.roughness = g.roughness.value_or(m.roughness);
                m.ior = g.ior.value_or(m.ior);
            }

            core::Result<void> apply_surface(const SurfaceFields& s, SurfaceMaterial& m) {
                copy_scalars(s, m);
                return {};
            }

            core::Result<void> apply_surface(const TexturedSurfaceFields& s, SurfaceMaterial& m) {
                copy_scalars(s, m);
                return resolve_texture(s.roughness_texture, m.roughness_texture);
            }

            core::Result<void> apply_glass(const GlassFieldsV1_1& g, GlassMaterial& m) {
                copy_scalars(g, m);
                return {};
            }

            core::Result<void> apply_glass(const GlassFieldsV1_2& g, GlassMaterial& m) {
                copy_scalars(g, m);
                return resolve_texture(g.roughness_texture, m.roughness_texture);
            }

            core::Result<void> apply_glass(const GlassFieldsV1_3& g, GlassMaterial& m) {
                m.color = g.color.value_or(m.color);
                m.transmission = g.transmission.value_or(m.transmission);
                return apply_glass(static_cast<const GlassFieldsV1_2&>(g), m);
            }

            template <typename MaterialsFields>
            core::Result<void> apply_materials(const MaterialsFields& f, Materials& m) {
                m.floor.tiling = f.floor.tiling.value_or(m.floor.tiling);
                if (auto r = resolve_texture(f.floor.texture, m.floor.texture); !r) return r;
                if (auto r = apply_glass(f.glass, m.glass); !r) return r;
                if (auto r = apply_surface(f.matte, m.matte); !r) return r;
                if (auto r = apply_surface(f.chrome, m.chrome); !r) return r;
                return apply_surface(f.plastic, m.plastic);
            }

            const crypto::EnvelopeCipher& cipher_;
            std::vector<AssetWarning>& warnings_;
            SchemaVersion version_ = CURRENT_SCHEMA_VERSION;
        };

    } // anonymous namespace

    core::Result<LoadResult> migrate_project(const ProjectDocument& doc, const crypto::EnvelopeCipher& cipher) {
        LoadResult result;
        ProjectMigrator migrator(cipher, result.warnings);

        auto project = std::visit(migrator, doc);
        if (!project) {
            LOG_ERROR("Project migration failed: {}", project.error().format());
            return std::unexpected(project.error());
        }
        result.project = std::move(*project);

        LOG_INFO("Project loaded (schema {}): {} HDRIs, {} skipped",
                 to_string(document_version(doc)), result.project.hdris.size(), result.warnings.size());
        return result;
    }

    core::Result<LoadResult> load_project(const std::string_view text, const crypto::EnvelopeCipher& cipher) {
        auto doc = parse_project_document(text);
        if (!doc) {
            LOG_ERROR("Failed to parse project: {}", doc.error().format());
            return std::unexpected(doc.error());
        }
        return migrate_project(*doc, cipher);
    }

    core::Result<LoadResult> load_project_file(const std::filesystem::path& path,
                                               const crypto::EnvelopeCipher& cipher) {
        LOG_INFO("Loading project file: {}", core::path_to_utf8(path));

        auto text = core::read_text_file(path);
        if (!text) {
            return std::unexpected(text.error());
        }
        auto result = load_project(*text, cipher);
        if (!result) {
            auto err = result.error();
            err.details = core::path_to_utf8(path) + (err.details.empty() ? "" : ": " + err.details);
            return std::unexpected(std::move(err));
        }
        return result;
    }

} // namespace hdriv::io
