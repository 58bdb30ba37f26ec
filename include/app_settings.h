// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <set>
#include <string>

namespace printdesk {

/// Settings consumed by PrintService (immutable snapshot of the config file)
struct PrintSettings {
    std::string upload_folder = "print";
    std::set<std::string> allowed_extensions = {"pdf", "txt", "jpg", "jpeg", "png"};
    int retention_days = 7;
    std::string hostname = "printerpi.local";
    std::string app_name = "Acres of ice";
};

struct HttpSettings {
    std::string host = "0.0.0.0";
    int port = 5000;
    int worker_threads = 4;
    int max_content_length_mb = 20;
};

struct MaintenanceSettings {
    int cleanup_interval_hours = 6;
    int status_sync_interval_sec = 60;
};

/// Everything main() needs to wire the service together
struct AppSettings {
    PrintSettings print;
    HttpSettings http;
    MaintenanceSettings maintenance;
    std::string database_path = "print_history.db";
    std::string log_level = "info";
    std::string log_target = "console";
    std::string log_path;
};

} // namespace printdesk
