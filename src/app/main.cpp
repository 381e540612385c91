/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/hdriv_tool.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    const auto args = hdriv::app::parse_tool_args(argc, argv, std::cerr);
    if (!args) {
        return hdriv::app::EXIT_USAGE;
    }
    return hdriv::app::run_tool(*args, std::cout, std::cerr);
}
