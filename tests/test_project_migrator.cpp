/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "crypto/envelope_cipher.hpp"
#include "io/codec.hpp"
#include "io/formats/project_document.hpp"
#include "io/formats/project_migrator.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace hdriv::io;
using hdriv::core::ErrorCode;
using json = nlohmann::json;

namespace {

    std::vector<uint8_t> bytes_of(const std::string& s) {
        return {s.begin(), s.end()};
    }

    std::string data_url(const std::string& type, const std::vector<uint8_t>& bytes) {
        return "data:" + type + ";base64," + base64_encode(bytes);
    }

    json minimal_document(const std::string& version) {
        json doc{{"version", version}, {"settings", json::object()}, {"hdris", json::array()}};
        if (version != "1.0") {
            doc["materials"] = json::object();
        }
        return doc;
    }

} // namespace

class ProjectMigratorTest : public ::testing::Test {
protected:
    ProjectMigratorTest()
        : keys_(std::make_unique<hdriv::crypto::StaticKeySource>(std::vector<uint8_t>(32, 0x5A))),
          cipher_(keys_) {}

    json encrypted_asset(const std::string& name, const std::vector<uint8_t>& bytes) {
        auto packet = cipher_.encrypt_payload(bytes);
        EXPECT_TRUE(packet.has_value());
        return json{{"name", name},
                    {"data", packet->ciphertext},
                    {"encrypted", true},
                    {"iv", packet->content_nonce},
                    {"wrappedKey", packet->wrapped_key},
                    {"keyIv", packet->key_nonce}};
    }

    hdriv::core::Result<LoadResult> load(const json& doc) {
        return load_project(doc.dump(), cipher_);
    }

    hdriv::crypto::KeyManager keys_;
    hdriv::crypto::EnvelopeCipher cipher_;
};

TEST_F(ProjectMigratorTest, MinimalDocumentOfEveryVersionLoadsWithDefaults) {
    const std::vector<std::pair<std::string, SchemaVersion>> versions{
        {"1.0", SchemaVersion::V1_0}, {"1.1", SchemaVersion::V1_1}, {"1.2", SchemaVersion::V1_2},
        {"1.3", SchemaVersion::V1_3}, {"1.4", SchemaVersion::V1_4}, {"1.5", SchemaVersion::V1_5},
        {"1.6", SchemaVersion::V1_6}, {"1.7", SchemaVersion::V1_7}};

    for (const auto& [name, version] : versions) {
        SCOPED_TRACE(name);
        const json doc = minimal_document(name);

        auto parsed = parse_project_document(doc.dump());
        ASSERT_TRUE(parsed.has_value()) << parsed.error().format();
        EXPECT_EQ(document_version(*parsed), version);

        auto result = load(doc);
        ASSERT_TRUE(result.has_value()) << result.error().format();
        EXPECT_TRUE(result->warnings.empty());

        const auto& p = result->project;
        EXPECT_DOUBLE_EQ(p.settings.rotation, 0.0);
        EXPECT_DOUBLE_EQ(p.settings.exposure, 1.0);
        EXPECT_DOUBLE_EQ(p.settings.blur, 0.0);
        EXPECT_EQ(p.settings.tone_mapping, ToneMapping::ACESFilmic);
        EXPECT_EQ(p.settings.visibility, Visibility{});
        EXPECT_EQ(p.settings.active_preset, MaterialPreset::SHV);
        EXPECT_FALSE(p.selected_hdri.has_value());
        EXPECT_FALSE(p.loaded_preset.has_value());
        EXPECT_TRUE(p.hdris.empty());

        const auto& m = p.materials;
        EXPECT_DOUBLE_EQ(m.floor.tiling, 40.0);
        EXPECT_FALSE(m.floor.texture.has_value());
        EXPECT_EQ(m.glass.color, "#ffffff");
        EXPECT_DOUBLE_EQ(m.glass.roughness, 0.0);
        EXPECT_DOUBLE_EQ(m.glass.ior, 1.5);
        EXPECT_DOUBLE_EQ(m.glass.transmission, 1.0);
        EXPECT_EQ(m.matte.color, "#ffffff");
        EXPECT_DOUBLE_EQ(m.matte.roughness, 1.0);
        EXPECT_DOUBLE_EQ(m.matte.metalness, 0.0);
        EXPECT_EQ(m.chrome.color, "#ffffff");
        EXPECT_DOUBLE_EQ(m.chrome.roughness, 0.0);
        EXPECT_DOUBLE_EQ(m.chrome.metalness, 1.0);
        EXPECT_EQ(m.plastic.color, "#00bcd4");
        EXPECT_DOUBLE_EQ(m.plastic.roughness, 0.1);
        EXPECT_DOUBLE_EQ(m.plastic.metalness, 0.05);
        EXPECT_FALSE(m.chrome.roughness_texture.has_value());
    }
}

TEST_F(ProjectMigratorTest, Version1_0LegacyAssetAndSettings) {
    const auto hdr = bytes_of("#?RADIANCE\nFORMAT=32-bit_rle_rgbe\n");
    json doc{
        {"version", "1.0"},
        {"settings", {{"rotation", 0.5}, {"exposure", 2.0}, {"blur", 0.1},
                      {"selectedHdriName", "studio.hdr"}, {"toneMapping", "Linear"}}},
        {"hdris", {{{"name", "studio.hdr"}, {"data", data_url("image/vnd.radiance", hdr)}}}}};

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    const auto& p = result->project;

    EXPECT_DOUBLE_EQ(p.settings.rotation, 0.5);
    EXPECT_DOUBLE_EQ(p.settings.exposure, 2.0);
    EXPECT_DOUBLE_EQ(p.settings.blur, 0.1);
    EXPECT_EQ(p.settings.tone_mapping, ToneMapping::None);
    ASSERT_EQ(p.hdris.size(), 1u);
    EXPECT_EQ(p.hdris[0].name, "studio.hdr");
    EXPECT_EQ(p.hdris[0].bytes, hdr);
    EXPECT_EQ(p.hdris[0].content_type, "image/vnd.radiance");
    EXPECT_FALSE(p.hdris[0].encrypted);
    EXPECT_EQ(p.hdris[0].schema_origin, SchemaVersion::V1_0);
    EXPECT_EQ(p.selected_hdri.value_or(""), "studio.hdr");
}

TEST_F(ProjectMigratorTest, ToneMappingNames) {
    const std::vector<std::pair<std::string, ToneMapping>> cases{
        {"None (sRGB)", ToneMapping::None}, {"Linear", ToneMapping::None}, {"None", ToneMapping::None},
        {"Reinhard", ToneMapping::Reinhard}, {"Cineon", ToneMapping::Cineon},
        {"ACES Filmic", ToneMapping::ACESFilmic}, {"Filmic Deluxe", ToneMapping::ACESFilmic}};

    for (const auto& [name, expected] : cases) {
        json doc = minimal_document("1.2");
        doc["settings"]["toneMapping"] = name;
        auto result = load(doc);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->project.settings.tone_mapping, expected) << name;
    }
}

TEST_F(ProjectMigratorTest, Version1_1VisibilityAndTextures) {
    const auto floor_png = bytes_of("floor-texture");
    const auto chrome_png = bytes_of("chrome-roughness");
    json doc{
        {"version", "1.1"},
        {"settings", {{"spheresVisible", false}, {"groundVisible", true},
                      {"shadowsVisible", false}, {"colorCheckerVisible", false}}},
        {"materials",
         {{"floor", {{"tiling", 12.0}, {"texture", {{"name", "floor.png"}, {"data", data_url("image/png", floor_png)}}}}},
          {"glass", {{"roughness", 0.2}, {"ior", 1.33}}},
          {"matte", {{"color", "#101010"}, {"roughness", 0.8}, {"metalness", 0.0}}},
          {"chrome", {{"color", "#eeeeee"}, {"roughness", 0.05}, {"metalness", 1.0},
                      {"roughnessTexture", {{"name", "chrome.png"}, {"data", data_url("image/png", chrome_png)}}}}},
          {"plastic", {{"color", "#ff0000"}, {"roughness", 0.3}, {"metalness", 0.0}}}}},
        {"hdris", json::array()}};

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    const auto& p = result->project;

    EXPECT_FALSE(p.settings.visibility.spheres);
    EXPECT_TRUE(p.settings.visibility.ground);
    EXPECT_FALSE(p.settings.visibility.shadows);
    EXPECT_FALSE(p.settings.visibility.color_checker);

    const auto& m = p.materials;
    EXPECT_DOUBLE_EQ(m.floor.tiling, 12.0);
    ASSERT_TRUE(m.floor.texture.has_value());
    EXPECT_EQ(m.floor.texture->bytes, floor_png);
    EXPECT_EQ(m.floor.texture->content_type, "image/png");
    EXPECT_DOUBLE_EQ(m.glass.ior, 1.33);
    EXPECT_EQ(m.glass.color, "#ffffff");
    EXPECT_EQ(m.matte.color, "#101010");
    ASSERT_TRUE(m.chrome.roughness_texture.has_value());
    EXPECT_EQ(m.chrome.roughness_texture->bytes, chrome_png);
    EXPECT_EQ(m.plastic.color, "#ff0000");
}

TEST_F(ProjectMigratorTest, Version1_2TexturesOnAllSurfaces) {
    json doc = minimal_document("1.2");
    doc["materials"]["glass"] = {{"roughnessTexture", {{"name", "g.png"}, {"data", data_url("image/png", bytes_of("g"))}}}};
    doc["materials"]["matte"] = {{"roughnessTexture", {{"name", "m.png"}, {"data", data_url("image/png", bytes_of("m"))}}}};
    doc["materials"]["plastic"] = {{"roughnessTexture", nullptr}};

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    const auto& m = result->project.materials;
    ASSERT_TRUE(m.glass.roughness_texture.has_value());
    EXPECT_EQ(m.glass.roughness_texture->bytes, bytes_of("g"));
    ASSERT_TRUE(m.matte.roughness_texture.has_value());
    EXPECT_EQ(m.matte.roughness_texture->bytes, bytes_of("m"));
    EXPECT_FALSE(m.plastic.roughness_texture.has_value());
}

TEST_F(ProjectMigratorTest, Version1_3GlassColorAndPreset) {
    json doc = minimal_document("1.3");
    doc["materials"]["glass"] = {{"color", "#aaffaa"}, {"transmission", 0.7}};
    doc["settings"]["activePreset"] = "Grayscale";

    auto result = load(doc);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->project.materials.glass.color, "#aaffaa");
    EXPECT_DOUBLE_EQ(result->project.materials.glass.transmission, 0.7);
    EXPECT_EQ(result->project.settings.active_preset, MaterialPreset::Grayscale);

    doc["settings"]["activePreset"] = "Unknown";
    result = load(doc);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->project.settings.active_preset, MaterialPreset::SHV);
}

TEST_F(ProjectMigratorTest, Version1_4LightAnnotations) {
    json doc = minimal_document("1.4");
    doc["hdris"] = {{{"name", "sky.hdr"},
                     {"data", data_url("image/vnd.radiance", bytes_of("sky"))},
                     {"lights", {{{"azimuth", 90.0}, {"elevation", 30.0}, {"intensity", 2.5}, {"color", "#ffeecc"}},
                                 {{"azimuth", 270.0}}}}}};

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    ASSERT_EQ(result->project.hdris.size(), 1u);
    const auto& lights = result->project.hdris[0].lights;
    ASSERT_EQ(lights.size(), 2u);
    EXPECT_EQ(lights[0], (LightAnnotation{90.0, 30.0, 2.5, "#ffeecc"}));
    EXPECT_DOUBLE_EQ(lights[1].azimuth, 270.0);
    EXPECT_DOUBLE_EQ(lights[1].elevation, LightAnnotation{}.elevation);
}

TEST_F(ProjectMigratorTest, Version1_5LoadedPreset) {
    json doc = minimal_document("1.5");
    doc["loadedPreset"] = {{"name", "Studio"},
                           {"visibility", {{"groundVisible", false}}},
                           {"materials", {{"matte", {{"color", "#123456"}}}}}};

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    const auto& preset = result->project.loaded_preset;
    ASSERT_TRUE(preset.has_value());
    EXPECT_EQ(preset->name, "Studio");
    EXPECT_FALSE(preset->visibility.ground);
    EXPECT_TRUE(preset->visibility.spheres);
    EXPECT_EQ(preset->materials.matte.color, "#123456");
    EXPECT_DOUBLE_EQ(preset->materials.matte.roughness, 1.0);
}

TEST_F(ProjectMigratorTest, Version1_6RetiredEncryptionIsSkipped) {
    json doc = minimal_document("1.6");
    doc["hdris"] = {{{"name", "plain.hdr"}, {"data", data_url("image/vnd.radiance", bytes_of("plain"))}},
                    {{"name", "old.hdr"}, {"data", "AAAA"}, {"encrypted", true}, {"iv", "AAAAAAAAAAAAAAAA"}}};

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    ASSERT_EQ(result->project.hdris.size(), 1u);
    EXPECT_EQ(result->project.hdris[0].name, "plain.hdr");

    ASSERT_EQ(result->warnings.size(), 1u);
    EXPECT_EQ(result->warnings[0].asset_name, "old.hdr");
    EXPECT_EQ(result->warnings[0].code, ErrorCode::UNSUPPORTED_LEGACY_SCHEME);
    EXPECT_EQ(result->warnings[0].message, WARNING_RETIRED_SCHEME);
}

TEST_F(ProjectMigratorTest, Version1_7EnvelopeAssets) {
    const auto hdr = bytes_of("encrypted radiance data");
    json asset = encrypted_asset("secret.hdr", hdr);
    asset["type"] = "image/vnd.radiance";

    json doc = minimal_document("1.7");
    doc["hdris"] = json::array({asset});
    doc["materials"]["floor"] = {{"texture", encrypted_asset("floor.png", bytes_of("floor"))}};

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    ASSERT_EQ(result->project.hdris.size(), 1u);
    const auto& h = result->project.hdris[0];
    EXPECT_EQ(h.bytes, hdr);
    EXPECT_TRUE(h.encrypted);
    EXPECT_EQ(h.content_type, "image/vnd.radiance");
    EXPECT_EQ(h.schema_origin, SchemaVersion::V1_7);

    ASSERT_TRUE(result->project.materials.floor.texture.has_value());
    EXPECT_EQ(result->project.materials.floor.texture->bytes, bytes_of("floor"));
}

TEST_F(ProjectMigratorTest, CorruptWrappedKeyOnlyDropsThatAsset) {
    json doc = minimal_document("1.7");
    doc["settings"]["selectedHdriName"] = "two.hdr";
    doc["hdris"] = {encrypted_asset("one.hdr", bytes_of("1111")),
                    encrypted_asset("two.hdr", bytes_of("2222")),
                    encrypted_asset("three.hdr", bytes_of("3333"))};

    auto wrapped = base64_decode(doc["hdris"][1]["wrappedKey"].get<std::string>());
    ASSERT_TRUE(wrapped.has_value());
    (*wrapped)[3] ^= 0xFF;
    doc["hdris"][1]["wrappedKey"] = base64_encode(*wrapped);

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();

    const auto& hdris = result->project.hdris;
    ASSERT_EQ(hdris.size(), 2u);
    EXPECT_EQ(hdris[0].name, "one.hdr");
    EXPECT_EQ(hdris[0].bytes, bytes_of("1111"));
    EXPECT_EQ(hdris[1].name, "three.hdr");
    EXPECT_EQ(hdris[1].bytes, bytes_of("3333"));

    ASSERT_EQ(result->warnings.size(), 1u);
    EXPECT_EQ(result->warnings[0].asset_name, "two.hdr");
    EXPECT_EQ(result->warnings[0].code, ErrorCode::DECRYPTION_FAILED);
    EXPECT_EQ(result->warnings[0].message, WARNING_KEY_MISMATCH);

    EXPECT_FALSE(result->project.selected_hdri.has_value());
}

TEST_F(ProjectMigratorTest, CorruptTextureIsLeftUnsetAndReported) {
    json doc = minimal_document("1.7");
    doc["hdris"] = json::array({encrypted_asset("sky.hdr", bytes_of("sky"))});
    doc["materials"]["floor"] = {{"tiling", 10.0}, {"texture", encrypted_asset("floor.png", bytes_of("floor"))}};

    auto wrapped = base64_decode(doc["materials"]["floor"]["texture"]["wrappedKey"].get<std::string>());
    ASSERT_TRUE(wrapped.has_value());
    (*wrapped)[3] ^= 0xFF;
    doc["materials"]["floor"]["texture"]["wrappedKey"] = base64_encode(*wrapped);

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();

    const auto& floor = result->project.materials.floor;
    EXPECT_FALSE(floor.texture.has_value());
    EXPECT_DOUBLE_EQ(floor.tiling, 10.0);
    ASSERT_EQ(result->project.hdris.size(), 1u);
    EXPECT_EQ(result->project.hdris[0].bytes, bytes_of("sky"));

    ASSERT_EQ(result->warnings.size(), 1u);
    EXPECT_EQ(result->warnings[0].asset_name, "floor.png");
    EXPECT_EQ(result->warnings[0].code, ErrorCode::DECRYPTION_FAILED);
    EXPECT_EQ(result->warnings[0].message, WARNING_KEY_MISMATCH);
}

TEST_F(ProjectMigratorTest, IncompleteEnvelopeFields) {
    json half = encrypted_asset("half.hdr", bytes_of("half"));
    half.erase("keyIv");
    json none = encrypted_asset("none.hdr", bytes_of("none"));
    none.erase("keyIv");
    none.erase("wrappedKey");

    json doc = minimal_document("1.7");
    doc["hdris"] = {half, none};

    auto result = load(doc);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    EXPECT_TRUE(result->project.hdris.empty());
    ASSERT_EQ(result->warnings.size(), 2u);
    EXPECT_EQ(result->warnings[0].code, ErrorCode::DECRYPTION_FAILED);
    EXPECT_EQ(result->warnings[1].code, ErrorCode::UNSUPPORTED_LEGACY_SCHEME);
}

TEST_F(ProjectMigratorTest, CorruptLegacyDataIsSkipped) {
    json doc = minimal_document("1.2");
    doc["hdris"] = {{{"name", "bad.hdr"}, {"data", "data:image/vnd.radiance;base64,@@@"}},
                    {{"name", "raw.hdr"}, {"data", "no prefix"}},
                    {{"name", "good.hdr"}, {"data", data_url("", bytes_of("ok"))}}};

    auto result = load(doc);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->project.hdris.size(), 1u);
    EXPECT_EQ(result->project.hdris[0].name, "good.hdr");
    EXPECT_TRUE(result->project.hdris[0].content_type.empty());
    ASSERT_EQ(result->warnings.size(), 2u);
    for (const auto& w : result->warnings) {
        EXPECT_EQ(w.code, ErrorCode::INVALID_FORMAT);
        EXPECT_EQ(w.message, WARNING_CORRUPT_LEGACY);
    }
}

TEST_F(ProjectMigratorTest, RejectsBadVersions) {
    json no_version = minimal_document("1.7");
    no_version.erase("version");
    auto missing = load(no_version);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::INVALID_FORMAT);

    json future = minimal_document("1.7");
    future["version"] = "9.9";
    auto unknown = load(future);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::INVALID_FORMAT);

    json numeric = minimal_document("1.7");
    numeric["version"] = 1.7;
    EXPECT_EQ(load(numeric).error().code, ErrorCode::INVALID_FORMAT);
}

TEST_F(ProjectMigratorTest, RejectsMalformedText) {
    auto r = load_project("{\"version\": \"1.7\", ", cipher_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::PARSE_ERROR);

    auto array = load_project("[1, 2, 3]", cipher_);
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error().code, ErrorCode::INVALID_FORMAT);
}

TEST_F(ProjectMigratorTest, RejectsMissingBlocks) {
    for (const char* block : {"settings", "hdris", "materials"}) {
        json doc = minimal_document("1.4");
        doc.erase(block);
        auto r = load(doc);
        ASSERT_FALSE(r.has_value()) << block;
        EXPECT_EQ(r.error().code, ErrorCode::INVALID_FORMAT) << block;
    }
}

TEST_F(ProjectMigratorTest, RejectsStructureOfNewerVersions) {
    std::vector<std::pair<std::string, json>> cases;

    json with_materials = minimal_document("1.0");
    with_materials["materials"] = json::object();
    cases.emplace_back("materials in 1.0", with_materials);

    json with_lights = minimal_document("1.3");
    with_lights["hdris"] = {{{"name", "a"}, {"data", data_url("", bytes_of("a"))}, {"lights", json::array()}}};
    cases.emplace_back("lights in 1.3", with_lights);

    json with_preset = minimal_document("1.4");
    with_preset["loadedPreset"] = {{"name", "x"}};
    cases.emplace_back("loadedPreset in 1.4", with_preset);

    json with_encrypted = minimal_document("1.5");
    with_encrypted["hdris"] = json::array({encrypted_asset("a", bytes_of("a"))});
    cases.emplace_back("encrypted asset in 1.5", with_encrypted);

    json with_flags = minimal_document("1.0");
    with_flags["settings"]["groundVisible"] = false;
    cases.emplace_back("visibility flag in 1.0", with_flags);

    json glass_texture = minimal_document("1.1");
    glass_texture["materials"]["glass"] = {{"roughnessTexture", {{"name", "g.png"}, {"data", data_url("image/png", bytes_of("g"))}}}};
    cases.emplace_back("glass roughnessTexture in 1.1", glass_texture);

    json matte_texture = minimal_document("1.1");
    matte_texture["materials"]["matte"] = {{"roughnessTexture", {{"name", "m.png"}, {"data", data_url("image/png", bytes_of("m"))}}}};
    cases.emplace_back("matte roughnessTexture in 1.1", matte_texture);

    json glass_color = minimal_document("1.2");
    glass_color["materials"]["glass"] = {{"color", "#aaffaa"}};
    cases.emplace_back("glass color in 1.2", glass_color);

    json active_preset = minimal_document("1.2");
    active_preset["settings"]["activePreset"] = "Grayscale";
    cases.emplace_back("activePreset in 1.2", active_preset);

    for (const auto& [label, doc] : cases) {
        auto r = load(doc);
        ASSERT_FALSE(r.has_value()) << label;
        EXPECT_EQ(r.error().code, ErrorCode::INVALID_FORMAT) << label;
    }
}

TEST_F(ProjectMigratorTest, RejectsWrongFieldTypes) {
    std::vector<std::pair<std::string, json>> cases;

    json rotation = minimal_document("1.7");
    rotation["settings"]["rotation"] = "fast";
    cases.emplace_back("string rotation", rotation);

    json flag = minimal_document("1.1");
    flag["settings"]["groundVisible"] = 1;
    cases.emplace_back("numeric flag", flag);

    json hdris = minimal_document("1.7");
    hdris["hdris"] = json::object();
    cases.emplace_back("hdris object", hdris);

    json entry = minimal_document("1.7");
    entry["hdris"] = {"not an object"};
    cases.emplace_back("string entry", entry);

    json no_data = minimal_document("1.7");
    no_data["hdris"] = {{{"name", "a"}}};
    cases.emplace_back("missing data", no_data);

    json tiling = minimal_document("1.2");
    tiling["materials"]["floor"] = {{"tiling", "large"}};
    cases.emplace_back("string tiling", tiling);

    for (const auto& [label, doc] : cases) {
        auto r = load(doc);
        ASSERT_FALSE(r.has_value()) << label;
        EXPECT_EQ(r.error().code, ErrorCode::INVALID_FORMAT) << label;
    }
}

TEST_F(ProjectMigratorTest, MissingKeyIsFatalOnlyWhenNeeded) {
    hdriv::crypto::KeyManager no_keys(nullptr);
    hdriv::crypto::EnvelopeCipher no_cipher(no_keys);

    json plain = minimal_document("1.2");
    plain["hdris"] = {{{"name", "a.hdr"}, {"data", data_url("image/vnd.radiance", bytes_of("a"))}}};
    auto plain_result = load_project(plain.dump(), no_cipher);
    ASSERT_TRUE(plain_result.has_value());
    EXPECT_EQ(plain_result->project.hdris.size(), 1u);

    json encrypted = minimal_document("1.7");
    encrypted["hdris"] = json::array({encrypted_asset("a.hdr", bytes_of("a"))});
    auto encrypted_result = load_project(encrypted.dump(), no_cipher);
    ASSERT_FALSE(encrypted_result.has_value());
    EXPECT_EQ(encrypted_result.error().code, ErrorCode::KEY_UNAVAILABLE);
}

TEST_F(ProjectMigratorTest, MissingFileIsReadFailure) {
    auto r = load_project_file("/nonexistent/dir/project.hdriv", cipher_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::READ_FAILURE);
}
