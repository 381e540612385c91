/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace hdriv::app {

    constexpr int EXIT_OK = 0;
    constexpr int EXIT_USAGE = 1;
    constexpr int EXIT_CRYPTO = 2;
    constexpr int EXIT_IO = 3;
    constexpr int EXIT_FORMAT = 4;

    struct ToolArgs {
        std::string command;
        std::filesystem::path in;
        std::filesystem::path out;
        std::optional<std::filesystem::path> config;
        std::optional<std::string> preset_name;

        // override the key section of the configuration
        std::optional<std::filesystem::path> key_file;
        std::optional<std::string> key_env;
        std::optional<std::string> passphrase;

        std::optional<std::string> log_level;
    };

    void print_usage(std::ostream& os, const char* prog);

    /**
     * @brief Parse "<command> [options]"
     * @return nullopt after printing a diagnostic (or the help text) to @p err
     */
    [[nodiscard]] std::optional<ToolArgs> parse_tool_args(int argc, const char* const* argv, std::ostream& err);

    [[nodiscard]] int exit_code_for(core::ErrorCode code);

    /**
     * @brief Run one command
     *
     * Reports go to @p out, diagnostics and per-asset warnings to @p err.
     * @return one of the EXIT_* codes
     */
    int run_tool(const ToolArgs& args, std::ostream& out, std::ostream& err);

} // namespace hdriv::app
