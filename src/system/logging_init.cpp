// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#include "hv/hlog.h"

#ifdef __linux__
#ifdef PRINTDESK_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace printdesk {
namespace logging {

namespace {

/// Check if a path is writable (for file logging location selection)
bool is_path_writable(const std::string& path) {
    std::filesystem::path p(path);
    std::filesystem::path dir = p.parent_path();

    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return false;
    }

    auto perms = std::filesystem::status(dir, ec).permissions();
    if (ec) {
        return false;
    }

    // Owner write permission only (simplified check)
    return (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
}

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp";
}

/// Resolve log file path with fallback logic
std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    const std::string var_log = "/var/log/printdesk.log";
    if (is_path_writable(var_log)) {
        return var_log;
    }

    std::string user_dir = get_xdg_data_home() + "/printdesk";
    std::error_code ec;
    std::filesystem::create_directories(user_dir, ec);

    return user_dir + "/printdesk.log";
}

/// Detect best available logging target at runtime
LogTarget detect_best_target() {
#ifdef __linux__
#ifdef PRINTDESK_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Journal:
#ifdef PRINTDESK_HAS_SYSTEMD
        sinks.push_back(std::make_shared<spdlog::sinks::systemd_sink_mt>("printdesk"));
        break;
#else
        [[fallthrough]];
#endif
    case LogTarget::Syslog:
        sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>("printdesk", LOG_PID,
                                                                        LOG_USER, false));
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        // 5MB max size, 3 rotated files
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        break;
    }
    default:
        // Console-only, or a system target this platform lacks
        break;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    add_system_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("printdesk", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    // libhv levels: VERBOSE(0) < DEBUG < INFO < WARN < ERROR < FATAL < SILENT
    hlog_set_level(to_hv_level(config.level));

    spdlog::debug("[Logging] Initialized: target={}, console={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no");
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "journal")
        return LogTarget::Journal;
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum fallback) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return fallback;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity < 0 ? spdlog::level::warn : spdlog::level::trace;
    }
}

int to_hv_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG; // libhv VERBOSE is too noisy
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    default:
        return LOG_LEVEL_SILENT;
    }
}

} // namespace logging
} // namespace printdesk
