/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/hdriv_tool.hpp"
#include "app/tool_config.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"
#include "crypto/aead.hpp"
#include "crypto/envelope_cipher.hpp"
#include "crypto/key_manager.hpp"
#include "crypto/secret_bytes.hpp"
#include "io/codec.hpp"
#include "io/formats/preset_file.hpp"
#include "io/formats/project_migrator.hpp"
#include "io/formats/project_serializer.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <array>
#include <set>
#include <span>
#include <string_view>
#include <system_error>

namespace hdriv::app {

    namespace fs = std::filesystem;
    using core::ErrorCode;
    using core::make_error;

    namespace {

        constexpr std::array<std::string_view, 5> COMMANDS{"inspect", "migrate", "extract", "export-preset", "keygen"};

        int report(const core::Error& error, std::ostream& err) {
            err << "Error: " << error.format() << "\n";
            return exit_code_for(error.code);
        }

        void print_warnings(const std::vector<io::AssetWarning>& warnings, std::ostream& err) {
            for (const auto& w : warnings) {
                err << "Warning: " << w.asset_name << ": " << w.message
                    << " [" << core::error_code_name(w.code) << "]\n";
            }
        }

        core::Result<ToolConfig> resolve_config(const ToolArgs& args) {
            ToolConfig cfg;
            std::error_code ec;
            if (args.config) {
                auto loaded = load_tool_config(*args.config);
                if (!loaded) {
                    return std::unexpected(loaded.error());
                }
                cfg = std::move(*loaded);
            } else if (fs::exists(DEFAULT_CONFIG_FILE, ec)) {
                auto loaded = load_tool_config(DEFAULT_CONFIG_FILE);
                if (!loaded) {
                    return std::unexpected(loaded.error());
                }
                cfg = std::move(*loaded);
            }

            if (args.key_file) {
                cfg.key.source = KeySourceKind::File;
                cfg.key.path = *args.key_file;
            } else if (args.passphrase) {
                cfg.key.source = KeySourceKind::Passphrase;
                cfg.key.passphrase = *args.passphrase;
            } else if (args.key_env) {
                cfg.key.source = KeySourceKind::Environment;
                cfg.key.env_var = *args.key_env;
            }

            if (args.log_level) {
                const auto level = core::parse_log_level(*args.log_level);
                if (!level) {
                    return make_error(ErrorCode::INVALID_CONFIG, "Unknown log level", *args.log_level);
                }
                cfg.log_level = *level;
            }
            return cfg;
        }

        // Reduce an asset name to a plain file name inside the output directory
        fs::path output_name(const std::string& name, const std::string& prefix, const size_t index) {
            fs::path file = fs::path(name).filename();
            if (file.empty() || file == "." || file == "..") {
                file = "asset_" + std::to_string(index);
            }
            return prefix.empty() ? file : fs::path(prefix + "_" + file.string());
        }

        // Later assets whose names collide get a numeric suffix before the extension
        fs::path unique_name(const fs::path& file, std::set<fs::path>& used) {
            if (used.insert(file).second) {
                return file;
            }
            const std::string stem = file.stem().string();
            const std::string ext = file.extension().string();
            for (size_t n = 1;; ++n) {
                fs::path candidate = stem + "_" + std::to_string(n) + ext;
                if (used.insert(candidate).second) {
                    return candidate;
                }
            }
        }

        // ---- commands ----

        int cmd_keygen(const ToolArgs& args, std::ostream& out, std::ostream& err) {
            if (args.out.empty()) {
                err << "keygen requires --out\n";
                return EXIT_USAGE;
            }

            crypto::SecretBytes key(crypto::AES256_KEY_LEN);
            if (auto r = crypto::random_bytes({key.data(), key.size()}); !r) {
                return report(r.error(), err);
            }
            std::string encoded = io::base64_encode(key.view()) + "\n";
            auto written = core::write_file_atomic(args.out, encoded);
            OPENSSL_cleanse(encoded.data(), encoded.size());
            if (!written) {
                return report(written.error(), err);
            }

            std::error_code ec;
            fs::permissions(args.out, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
            if (ec) {
                LOG_WARN("Could not restrict permissions of {}: {}", core::path_to_utf8(args.out), ec.message());
            }

            out << "Wrote 256-bit key to " << core::path_to_utf8(args.out) << "\n";
            return EXIT_OK;
        }

        int cmd_inspect(const io::LoadResult& loaded, const ToolArgs& args, std::ostream& out) {
            const auto& p = loaded.project;
            const auto& s = p.settings;

            out << "Project: " << core::path_to_utf8(args.in) << "\n";
            out << "  HDRIs: " << p.hdris.size() << "\n";
            for (const auto& h : p.hdris) {
                out << "    " << h.name << "  " << h.bytes.size() << " bytes"
                    << "  " << (h.content_type.empty() ? "-" : h.content_type)
                    << "  schema " << io::to_string(h.schema_origin)
                    << (h.encrypted ? "  encrypted" : "")
                    << "  lights: " << h.lights.size() << "\n";
            }
            out << "  Selected: " << p.selected_hdri.value_or("(none)") << "\n";
            out << "  Rotation: " << s.rotation << "  Exposure: " << s.exposure << "  Blur: " << s.blur << "\n";
            out << "  Tone mapping: " << io::to_string(s.tone_mapping) << "\n";
            out << "  Material preset: " << io::to_string(s.active_preset) << "\n";
            if (p.loaded_preset) {
                out << "  Loaded preset: " << p.loaded_preset->name << "\n";
            }

            const auto& m = p.materials;
            const auto texture_line = [&out](const char* slot, const std::optional<io::AssetRecord>& t) {
                if (t) {
                    out << "    " << slot << ": " << t->name << " (" << t->bytes.size() << " bytes)\n";
                }
            };
            out << "  Textures:\n";
            texture_line("floor", m.floor.texture);
            texture_line("glass roughness", m.glass.roughness_texture);
            texture_line("matte roughness", m.matte.roughness_texture);
            texture_line("chrome roughness", m.chrome.roughness_texture);
            texture_line("plastic roughness", m.plastic.roughness_texture);

            out << "  Skipped assets: " << loaded.warnings.size() << "\n";
            return EXIT_OK;
        }

        int cmd_migrate(const io::LoadResult& loaded, const ToolArgs& args, const ToolConfig& cfg,
                        const crypto::EnvelopeCipher& cipher, std::ostream& out, std::ostream& err) {
            const io::SerializeOptions options{.parallel = cfg.parallel_encrypt, .indent = cfg.indent};
            if (auto r = io::save_project(args.out, loaded.project, cipher, options); !r) {
                return report(r.error(), err);
            }
            out << "Wrote schema " << io::to_string(io::CURRENT_SCHEMA_VERSION) << " project to "
                << core::path_to_utf8(args.out) << " (" << loaded.project.hdris.size() << " HDRIs)\n";
            return EXIT_OK;
        }

        int cmd_extract(const io::LoadResult& loaded, const ToolArgs& args, std::ostream& out, std::ostream& err) {
            std::error_code ec;
            fs::create_directories(args.out, ec);
            if (ec) {
                err << "Error: cannot create " << core::path_to_utf8(args.out) << ": " << ec.message() << "\n";
                return EXIT_IO;
            }

            size_t count = 0;
            std::set<fs::path> used;
            const auto write_asset = [&](const io::AssetRecord& asset, const std::string& prefix) -> core::Result<void> {
                const fs::path target = args.out / unique_name(output_name(asset.name, prefix, count), used);
                if (auto r = core::write_file_atomic(target, std::span<const uint8_t>(asset.bytes)); !r) {
                    return r;
                }
                ++count;
                LOG_DEBUG("Extracted {} ({} bytes)", core::path_to_utf8(target), asset.bytes.size());
                return {};
            };

            for (const auto& hdri : loaded.project.hdris) {
                if (auto r = write_asset(hdri, ""); !r) {
                    return report(r.error(), err);
                }
            }

            const auto& m = loaded.project.materials;
            const std::array<std::pair<const char*, const std::optional<io::AssetRecord>*>, 5> textures{{
                {"floor", &m.floor.texture},
                {"glass", &m.glass.roughness_texture},
                {"matte", &m.matte.roughness_texture},
                {"chrome", &m.chrome.roughness_texture},
                {"plastic", &m.plastic.roughness_texture},
            }};
            for (const auto& [slot, texture] : textures) {
                if (*texture) {
                    if (auto r = write_asset(**texture, slot); !r) {
                        return report(r.error(), err);
                    }
                }
            }

            out << "Extracted " << count << " assets to " << core::path_to_utf8(args.out) << "\n";
            return EXIT_OK;
        }

        int cmd_export_preset(const io::LoadResult& loaded, const ToolArgs& args,
                              std::ostream& out, std::ostream& err) {
            const auto& p = loaded.project;

            io::CustomPreset preset;
            if (p.loaded_preset) {
                preset = *p.loaded_preset;
            } else {
                preset.name = std::string(io::to_string(p.settings.active_preset));
                preset.visibility = p.settings.visibility;
                preset.materials = p.materials;
            }
            if (args.preset_name) {
                preset.name = *args.preset_name;
            }
            // presets carry parameters only
            preset.materials.floor.texture.reset();
            preset.materials.glass.roughness_texture.reset();
            preset.materials.matte.roughness_texture.reset();
            preset.materials.chrome.roughness_texture.reset();
            preset.materials.plastic.roughness_texture.reset();

            if (auto r = io::save_preset_file(args.out, preset); !r) {
                return report(r.error(), err);
            }
            out << "Wrote preset '" << preset.name << "' to " << core::path_to_utf8(args.out) << "\n";
            return EXIT_OK;
        }

    } // anonymous namespace

    void print_usage(std::ostream& os, const char* prog) {
        os << "Usage: " << prog << " <command> [options]\n"
              "\n"
              "Commands:\n"
              "  inspect        Load a project and print a summary\n"
              "  migrate        Load a project of any version and save it as 1.7\n"
              "  extract        Write the decrypted assets of a project to a directory\n"
              "  export-preset  Write the project's material setup as a preset file\n"
              "  keygen         Write a new random 256-bit application key (base64)\n"
              "\n"
              "Options:\n"
              "  --in <file>           Input project\n"
              "  --out <path>          Output project, directory, preset or key file\n"
              "  --name <name>         Preset name (export-preset)\n"
              "  --config <file>       Tool configuration (default: ./hdriv.json if present)\n"
              "  --key-file <file>     Read the application key from a file\n"
              "  --key-env <var>       Read the application key from an environment variable\n"
              "  --passphrase <text>   Derive the application key from a passphrase\n"
              "  --log-level <level>   trace, debug, info, warn, error, critical, off\n"
              "\n"
              "Exit codes: 0 ok, 1 usage, 2 crypto, 3 I/O, 4 format\n";
    }

    std::optional<ToolArgs> parse_tool_args(const int argc, const char* const* argv, std::ostream& err) {
        const char* prog = argc > 0 ? argv[0] : "hdriv_tool";
        if (argc < 2) {
            print_usage(err, prog);
            return std::nullopt;
        }

        ToolArgs args;
        args.command = argv[1];
        if (args.command == "--help" || args.command == "-h") {
            print_usage(err, prog);
            return std::nullopt;
        }
        if (std::find(COMMANDS.begin(), COMMANDS.end(), args.command) == COMMANDS.end()) {
            err << "Unknown command: " << args.command << "\n\n";
            print_usage(err, prog);
            return std::nullopt;
        }

        int key_options = 0;
        for (int i = 2; i < argc; ++i) {
            const std::string opt = argv[i];
            if (i + 1 >= argc) {
                err << "Option " << opt << " requires a value\n";
                return std::nullopt;
            }
            const std::string value = argv[++i];

            if (opt == "--in") {
                args.in = value;
            } else if (opt == "--out") {
                args.out = value;
            } else if (opt == "--name") {
                args.preset_name = value;
            } else if (opt == "--config") {
                args.config = value;
            } else if (opt == "--key-file") {
                args.key_file = value;
                ++key_options;
            } else if (opt == "--key-env") {
                args.key_env = value;
                ++key_options;
            } else if (opt == "--passphrase") {
                args.passphrase = value;
                ++key_options;
            } else if (opt == "--log-level") {
                args.log_level = value;
            } else {
                err << "Unknown option: " << opt << "\n\n";
                print_usage(err, prog);
                return std::nullopt;
            }
        }

        if (key_options > 1) {
            err << "Use only one of --key-file, --key-env and --passphrase\n";
            return std::nullopt;
        }
        return args;
    }

    int exit_code_for(const ErrorCode code) {
        switch (code) {
        case ErrorCode::KEY_UNAVAILABLE:
        case ErrorCode::DECRYPTION_FAILED:
        case ErrorCode::ENCRYPTION_FAILED:
            return EXIT_CRYPTO;
        case ErrorCode::READ_FAILURE:
        case ErrorCode::WRITE_FAILURE:
            return EXIT_IO;
        case ErrorCode::INVALID_FORMAT:
        case ErrorCode::PARSE_ERROR:
        case ErrorCode::UNSUPPORTED_LEGACY_SCHEME:
            return EXIT_FORMAT;
        case ErrorCode::INVALID_CONFIG:
            return EXIT_USAGE;
        }
        return EXIT_USAGE;
    }

    int run_tool(const ToolArgs& args, std::ostream& out, std::ostream& err) {
        auto cfg = resolve_config(args);
        if (!cfg) {
            return report(cfg.error(), err);
        }
        core::Logger::get().init(cfg->log_level, cfg->log_file);

        if (args.command == "keygen") {
            return cmd_keygen(args, out, err);
        }

        if (args.in.empty()) {
            err << args.command << " requires --in\n";
            return EXIT_USAGE;
        }
        if (args.command != "inspect" && args.out.empty()) {
            err << args.command << " requires --out\n";
            return EXIT_USAGE;
        }

        auto source = cfg->key.make_source();
        if (!source) {
            return report(source.error(), err);
        }
        // Per invocation; KeyManager::global() is left to embedding applications
        crypto::KeyManager keys(std::move(*source));
        const crypto::EnvelopeCipher cipher(keys);

        auto loaded = io::load_project_file(args.in, cipher);
        if (!loaded) {
            return report(loaded.error(), err);
        }
        print_warnings(loaded->warnings, err);

        if (args.command == "inspect") {
            return cmd_inspect(*loaded, args, out);
        }
        if (args.command == "migrate") {
            return cmd_migrate(*loaded, args, *cfg, cipher, out, err);
        }
        if (args.command == "extract") {
            return cmd_extract(*loaded, args, out, err);
        }
        return cmd_export_preset(*loaded, args, out, err);
    }

} // namespace hdriv::app
