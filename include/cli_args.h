// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for printcast
 *
 * Values given on the command line override the environment (see app_config.h).
 */

#include <string>

namespace printcast {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    int port = -1; // -1 = not set

    std::string printer_ip; // --printer: fixed device, disables auto-connect

    // Logging
    int verbosity = 0;
    std::string log_dest; // empty = not set
    std::string log_file;

    bool help_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or an error occurred
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace printcast
