/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "project_serializer.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"

#include <chrono>
#include <future>
#include <utility>
#include <vector>

namespace hdriv::io {

    using core::ErrorCode;
    using core::make_error;

    namespace {

        core::Result<StoredAsset> seal_asset(const AssetRecord& record, const crypto::EnvelopeCipher& cipher) {
            auto packet = cipher.encrypt_payload(record.bytes);
            if (!packet) {
                auto err = packet.error();
                err.details = record.name;
                return std::unexpected(std::move(err));
            }

            StoredAsset stored;
            stored.name = record.name;
            stored.payload = EnvelopePayload{std::move(*packet)};
            if (!record.content_type.empty()) {
                stored.content_type = record.content_type;
            }
            stored.lights = record.lights;
            return stored;
        }

        // Where an encrypted asset lands in the document
        struct SealJob {
            const AssetRecord* source;
            std::optional<StoredAsset>* texture_slot; // null for HDRIs
        };

        void copy_settings(const NormalizedProject& project, SettingsV1_3& out) {
            const auto& s = project.settings;
            out.rotation = s.rotation;
            out.exposure = s.exposure;
            out.blur = s.blur;
            out.selected_hdri_name = project.selected_hdri;
            out.tone_mapping = std::string(to_string(s.tone_mapping));
            out.spheres_visible = s.visibility.spheres;
            out.ground_visible = s.visibility.ground;
            out.shadows_visible = s.visibility.shadows;
            out.color_checker_visible = s.visibility.color_checker;
            out.active_preset = std::string(to_string(s.active_preset));
        }

        void copy_surface(const SurfaceMaterial& m, TexturedSurfaceFields& out) {
            out.color = m.color;
            out.roughness = m.roughness;
            out.metalness = m.metalness;
        }

        void copy_material_scalars(const Materials& m, MaterialsV1_3& out) {
            out.floor.tiling = m.floor.tiling;
            out.glass.color = m.glass.color;
            out.glass.roughness = m.glass.roughness;
            out.glass.ior = m.glass.ior;
            out.glass.transmission = m.glass.transmission;
            copy_surface(m.matte, out.matte);
            copy_surface(m.chrome, out.chrome);
            copy_surface(m.plastic, out.plastic);
        }

    } // anonymous namespace

    core::Result<DocumentV1_7> serialize_project(const NormalizedProject& project,
                                                 const crypto::EnvelopeCipher& cipher,
                                                 const SerializeOptions& options) {
        const auto start = std::chrono::steady_clock::now();

        DocumentV1_7 doc;
        copy_settings(project, doc.settings);
        copy_material_scalars(project.materials, doc.materials);
        doc.loaded_preset = project.loaded_preset;

        std::vector<SealJob> jobs;
        jobs.reserve(project.hdris.size() + 5);
        for (const auto& hdri : project.hdris) {
            jobs.push_back({&hdri, nullptr});
        }
        const auto add_texture = [&jobs](const std::optional<AssetRecord>& texture,
                                         std::optional<StoredAsset>& slot) {
            if (texture) {
                jobs.push_back({&*texture, &slot});
            }
        };
        const auto& m = project.materials;
        add_texture(m.floor.texture, doc.materials.floor.texture);
        add_texture(m.glass.roughness_texture, doc.materials.glass.roughness_texture);
        add_texture(m.matte.roughness_texture, doc.materials.matte.roughness_texture);
        add_texture(m.chrome.roughness_texture, doc.materials.chrome.roughness_texture);
        add_texture(m.plastic.roughness_texture, doc.materials.plastic.roughness_texture);

        const auto policy = options.parallel ? std::launch::async : std::launch::deferred;

        std::vector<core::Result<StoredAsset>> results;
        results.reserve(jobs.size());
        try {
            std::vector<std::future<core::Result<StoredAsset>>> pending;
            pending.reserve(jobs.size());
            for (const auto& job : jobs) {
                pending.push_back(std::async(policy, seal_asset, std::cref(*job.source), std::cref(cipher)));
            }
            for (auto& f : pending) {
                results.push_back(f.get());
            }
        } catch (const std::exception& e) {
            return make_error(ErrorCode::ENCRYPTION_FAILED, "Asset encryption task failed", e.what());
        }

        for (size_t i = 0; i < jobs.size(); ++i) {
            if (!results[i]) {
                LOG_ERROR("Save aborted, asset '{}' could not be encrypted: {}",
                          jobs[i].source->name, results[i].error().format());
                return std::unexpected(results[i].error());
            }
        }

        for (size_t i = 0; i < jobs.size(); ++i) {
            if (jobs[i].texture_slot) {
                *jobs[i].texture_slot = std::move(*results[i]);
            } else {
                doc.hdris.push_back(std::move(*results[i]));
            }
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        LOG_DEBUG("Encrypted {} assets in {} ms ({})", jobs.size(), elapsed.count(),
                  options.parallel ? "parallel" : "sequential");
        return doc;
    }

    core::Result<std::string> write_project_text(const NormalizedProject& project,
                                                 const crypto::EnvelopeCipher& cipher,
                                                 const SerializeOptions& options) {
        auto doc = serialize_project(project, cipher, options);
        if (!doc) {
            return std::unexpected(doc.error());
        }
        try {
            return to_json(*doc).dump(options.indent);
        } catch (const nlohmann::json::exception& e) {
            return make_error(ErrorCode::INVALID_FORMAT, "Project contains text that cannot be written as JSON",
                              e.what());
        }
    }

    core::Result<void> save_project(const std::filesystem::path& path,
                                    const NormalizedProject& project,
                                    const crypto::EnvelopeCipher& cipher,
                                    const SerializeOptions& options) {
        LOG_INFO("Saving project file: {}", core::path_to_utf8(path));

        auto text = write_project_text(project, cipher, options);
        if (!text) {
            return std::unexpected(text.error());
        }
        if (auto r = core::write_file_atomic(path, *text); !r) {
            LOG_ERROR("Failed to write project: {}", r.error().format());
            return r;
        }

        LOG_INFO("Project saved: {} HDRIs, {} bytes", project.hdris.size(), text->size());
        return {};
    }

} // namespace hdriv::io
