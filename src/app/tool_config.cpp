/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/tool_config.hpp"
#include "core/file_utils.hpp"

#include <stdexcept>

namespace hdriv::app {

    using json = nlohmann::json;
    using core::ErrorCode;
    using core::make_error;

    namespace {

        KeySourceKind key_source_from_string(const std::string& name) {
            if (name == "env") return KeySourceKind::Environment;
            if (name == "file") return KeySourceKind::File;
            if (name == "passphrase") return KeySourceKind::Passphrase;
            throw std::invalid_argument("unknown key source '" + name + "'");
        }

        const char* to_string(const KeySourceKind kind) {
            switch (kind) {
            case KeySourceKind::Environment: return "env";
            case KeySourceKind::File: return "file";
            case KeySourceKind::Passphrase: return "passphrase";
            }
            return "env";
        }

        const char* log_level_name(const core::LogLevel level) {
            switch (level) {
            case core::LogLevel::Trace: return "trace";
            case core::LogLevel::Debug: return "debug";
            case core::LogLevel::Info: return "info";
            case core::LogLevel::Warn: return "warn";
            case core::LogLevel::Error: return "error";
            case core::LogLevel::Critical: return "critical";
            case core::LogLevel::Off: return "off";
            }
            return "info";
        }

    } // anonymous namespace

    KeyConfig KeyConfig::from_json(const json& j) {
        if (!j.is_object()) {
            throw std::invalid_argument("\"key\" must be an object");
        }
        KeyConfig cfg;
        cfg.source = key_source_from_string(j.value("source", std::string("env")));
        cfg.env_var = j.value("env_var", cfg.env_var);
        cfg.path = j.value("path", std::string());
        cfg.passphrase = j.value("passphrase", std::string());
        return cfg;
    }

    json KeyConfig::to_json() const {
        json j;
        j["source"] = to_string(source);
        j["env_var"] = env_var;
        j["path"] = core::path_to_utf8(path);
        // the passphrase is never written back
        return j;
    }

    core::Result<std::unique_ptr<crypto::KeySource>> KeyConfig::make_source() const {
        switch (source) {
        case KeySourceKind::Environment:
            if (env_var.empty()) {
                return make_error(ErrorCode::INVALID_CONFIG, "Key source 'env' needs an environment variable name");
            }
            return std::make_unique<crypto::EnvironmentKeySource>(env_var);
        case KeySourceKind::File:
            if (path.empty()) {
                return make_error(ErrorCode::INVALID_CONFIG, "Key source 'file' needs a path");
            }
            return std::make_unique<crypto::FileKeySource>(path);
        case KeySourceKind::Passphrase:
            if (passphrase.empty()) {
                return make_error(ErrorCode::INVALID_CONFIG, "Key source 'passphrase' needs a passphrase");
            }
            return std::make_unique<crypto::PassphraseKeySource>(passphrase);
        }
        return make_error(ErrorCode::INVALID_CONFIG, "Unknown key source");
    }

    ToolConfig ToolConfig::from_json(const json& j) {
        if (!j.is_object()) {
            throw std::invalid_argument("configuration must be a JSON object");
        }
        ToolConfig cfg;
        if (j.contains("key")) {
            cfg.key = KeyConfig::from_json(j["key"]);
        }
        if (j.contains("log_level")) {
            const auto name = j["log_level"].get<std::string>();
            const auto level = core::parse_log_level(name);
            if (!level) {
                throw std::invalid_argument("unknown log level '" + name + "'");
            }
            cfg.log_level = *level;
        }
        cfg.log_file = j.value("log_file", cfg.log_file);
        cfg.indent = j.value("indent", cfg.indent);
        if (cfg.indent < -1) {
            throw std::invalid_argument("indent must be -1 or greater");
        }
        cfg.parallel_encrypt = j.value("parallel_encrypt", cfg.parallel_encrypt);
        return cfg;
    }

    json ToolConfig::to_json() const {
        json j;
        j["key"] = key.to_json();
        j["log_level"] = log_level_name(log_level);
        j["log_file"] = log_file;
        j["indent"] = indent;
        j["parallel_encrypt"] = parallel_encrypt;
        return j;
    }

    core::Result<ToolConfig> load_tool_config(const std::filesystem::path& path) {
        auto text = core::read_text_file(path);
        if (!text) {
            return make_error(ErrorCode::INVALID_CONFIG, "Cannot read configuration file", text.error().details);
        }
        try {
            return ToolConfig::from_json(json::parse(*text));
        } catch (const json::exception& e) {
            return make_error(ErrorCode::INVALID_CONFIG, "Invalid configuration: " + std::string(e.what()),
                              core::path_to_utf8(path));
        } catch (const std::invalid_argument& e) {
            return make_error(ErrorCode::INVALID_CONFIG, "Invalid configuration: " + std::string(e.what()),
                              core::path_to_utf8(path));
        }
    }

} // namespace hdriv::app
