// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace printdesk {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux); console elsewhere
    Journal, ///< systemd journal (falls back to syslog without systemd support)
    Syslog,  ///< syslog(3)
    File,    ///< Rotating log file
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Console;
    bool enable_console = true;
    std::string file_path; ///< Override for LogTarget::File (empty = auto)
};

/**
 * @brief Install the "printdesk" logger as spdlog's default
 *
 * Also aligns libhv's internal log level with the chosen level.
 */
void init(const LogConfig& config);

/// "journal", "syslog", "file", "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Parse a level name ("trace" ... "off"; "warning" means warn)
 * @return Parsed level, or fallback for unrecognized input
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum fallback);

/// Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// libhv LOG_LEVEL_* for an spdlog level (capped at DEBUG)
int to_hv_level(spdlog::level::level_enum level);

} // namespace logging
} // namespace printdesk
