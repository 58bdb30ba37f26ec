// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the printdesk daemon
 */

#include <string>

namespace printdesk {

/**
 * @brief Parsed command-line arguments
 *
 * Values left at their defaults defer to the config file.
 */
struct CliArgs {
    std::string config_path = "printdesk.json";
    int port = -1;      // -1 = use config
    int verbosity = -1; // -1 = use config log_level
    std::string log_dest;
    std::string log_file;
    bool help = false;
};

/**
 * @brief Parse argv into CliArgs
 *
 * Prints usage for -h/--help and an error message for bad input.
 *
 * @return false if the program should exit (help shown or invalid input)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace printdesk
