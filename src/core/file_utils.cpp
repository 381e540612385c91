/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/file_utils.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <random>
#include <system_error>

namespace hdriv::core {

    namespace {

        std::filesystem::path temp_sibling(const std::filesystem::path& target) {
            std::random_device rd;
            const auto suffix = std::to_string(rd()) + std::to_string(rd());
            auto tmp = target;
            tmp += ".tmp" + suffix;
            return tmp;
        }

    } // namespace

    std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
        const auto u8 = p.u8string();
        return std::string(u8.begin(), u8.end());
#else
        return p.string();
#endif
    }

    Result<std::vector<uint8_t>> read_file_bytes(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            return make_error(ErrorCode::READ_FAILURE, "Failed to open file for reading", path_to_utf8(path));
        }

        const auto end = file.tellg();
        if (end < 0) {
            return make_error(ErrorCode::READ_FAILURE, "Failed to determine file size", path_to_utf8(path));
        }
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> buffer(static_cast<size_t>(end));
        if (!buffer.empty() &&
            !file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()))) {
            return make_error(ErrorCode::READ_FAILURE, "Short read", path_to_utf8(path));
        }

        LOG_DEBUG("Read {} bytes from {}", buffer.size(), path_to_utf8(path));
        return buffer;
    }

    Result<std::string> read_text_file(const std::filesystem::path& path) {
        auto bytes = read_file_bytes(path);
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        return std::string(bytes->begin(), bytes->end());
    }

    Result<void> write_file_atomic(const std::filesystem::path& path, std::span<const uint8_t> data) {
        const auto tmp = temp_sibling(path);

        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                return make_error(ErrorCode::WRITE_FAILURE, "Failed to open file for writing", path_to_utf8(tmp));
            }
            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file) {
                file.close();
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                return make_error(ErrorCode::WRITE_FAILURE, "Write error", path_to_utf8(tmp));
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return make_error(ErrorCode::WRITE_FAILURE, "Failed to move file into place: " + ec.message(),
                              path_to_utf8(path));
        }

        LOG_DEBUG("Wrote {} bytes to {}", data.size(), path_to_utf8(path));
        return {};
    }

    Result<void> write_file_atomic(const std::filesystem::path& path, const std::string_view text) {
        return write_file_atomic(path, std::span<const uint8_t>(
                                           reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }

} // namespace hdriv::core
