// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>
#include <vector>

namespace fs = std::filesystem;

namespace printdesk {

Config* Config::instance{NULL};

namespace {

/// Add keys present in defaults but missing from target (recursing into objects)
bool merge_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto& [key, value] : defaults.items()) {
        if (!target.contains(key)) {
            target[key] = value;
            modified = true;
        } else if (value.is_object() && target[key].is_object()) {
            modified = merge_missing(target[key], value) || modified;
        }
    }
    return modified;
}

} // namespace

json Config::get_default_config() {
    return {{"upload_folder", "print"},
            {"database_path", "print_history.db"},
            {"max_content_length_mb", 20},
            {"allowed_extensions", {"pdf", "txt", "jpg", "jpeg", "png"}},
            {"file_retention_days", 7},
            {"cleanup_interval_hours", 6},
            {"status_sync_interval_sec", 60},
            {"app_name", "Acres of ice"},
            {"hostname", "printerpi.local"},
            {"http", {{"host", "0.0.0.0"}, {"port", 5000}, {"worker_threads", 4}}},
            {"log_level", "info"},
            {"log_target", "console"},
            {"log_path", ""}};
}

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] {} is not a JSON object, resetting to defaults", config_path);
            data = get_default_config();
            config_modified = true;
        }

        if (merge_missing(data, get_default_config())) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] No config at {}, creating defaults", config_path);
        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
        }
        data = get_default_config();
        config_modified = true;
    }

    if (config_modified) {
        std::ofstream o(config_path);
        if (o.is_open()) {
            o << std::setw(2) << data << std::endl;
            spdlog::debug("[Config] Saved updated config to {}", config_path);
        } else {
            spdlog::warn("[Config] Could not write {}, continuing with in-memory config",
                         config_path);
        }
    }

    spdlog::debug("[Config] initialized: http={}:{}, upload_folder={}",
                  get<std::string>("/http/host", "0.0.0.0"), get<int>("/http/port", 5000),
                  get<std::string>("/upload_folder", "print"));
}

std::string Config::get_path() {
    return path;
}

AppSettings Config::settings() {
    AppSettings s;

    s.print.upload_folder = get<std::string>("/upload_folder", s.print.upload_folder);
    s.print.retention_days = std::max(1, get<int>("/file_retention_days", s.print.retention_days));
    s.print.hostname = get<std::string>("/hostname", s.print.hostname);
    s.print.app_name = get<std::string>("/app_name", s.print.app_name);

    auto extensions = get<std::vector<std::string>>("/allowed_extensions", {});
    if (!extensions.empty()) {
        s.print.allowed_extensions.clear();
        for (auto ext : extensions) {
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (!ext.empty() && ext.front() == '.') {
                ext.erase(0, 1);
            }
            if (!ext.empty()) {
                s.print.allowed_extensions.insert(ext);
            }
        }
    }

    s.http.host = get<std::string>("/http/host", s.http.host);
    s.http.port = get<int>("/http/port", s.http.port);
    s.http.worker_threads = std::max(1, get<int>("/http/worker_threads", s.http.worker_threads));
    s.http.max_content_length_mb =
        std::max(1, get<int>("/max_content_length_mb", s.http.max_content_length_mb));

    s.maintenance.cleanup_interval_hours =
        std::max(1, get<int>("/cleanup_interval_hours", s.maintenance.cleanup_interval_hours));
    s.maintenance.status_sync_interval_sec =
        std::max(1, get<int>("/status_sync_interval_sec", s.maintenance.status_sync_interval_sec));

    s.database_path = get<std::string>("/database_path", s.database_path);
    s.log_level = get<std::string>("/log_level", s.log_level);
    s.log_target = get<std::string>("/log_target", s.log_target);
    s.log_path = get<std::string>("/log_path", s.log_path);

    return s;
}

} // namespace printdesk
