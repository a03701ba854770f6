// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for turboplot-render
 */

#include "trace_renderer.h"

#include <cstdint>
#include <optional>
#include <string>

namespace turboplot {

/**
 * @brief Parsed command-line arguments
 *
 * Unset optionals fall back to the configuration file.
 */
struct CliArgs {
    std::string config_path = "turboplot.json";

    // Logging
    int verbosity = 0;

    // Workers
    std::optional<RendererBackend> backend; ///< Applied to every worker
    int workers = -1;                       ///< -1 = one per /render/workers entry

    // Synthetic trace and view
    uint64_t samples = 1000000;
    int view_width = 1280;
    int view_height = 720;
    int zoom_steps = 0;

    // Output
    std::string output_path; ///< PPM file, empty = none

    bool help_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or an error occurred
 *         (help_requested tells the two apart)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace turboplot
