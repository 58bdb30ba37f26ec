// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "api_server.h"
#include "cli_args.h"
#include "config.h"
#include "cups_spooler_client.h"
#include "job_store.h"
#include "logging_init.h"
#include "periodic_task.h"
#include "print_service.h"
#include "retention_sweeper.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <memory>
#include <pthread.h>

using namespace printdesk;

namespace {

void init_logging(const CliArgs& args, const AppSettings& settings) {
    logging::LogConfig log_config;

    // CLI verbosity wins over the config file
    if (args.verbosity >= 0) {
        log_config.level = logging::verbosity_to_level(args.verbosity);
    } else {
        log_config.level = logging::parse_level(settings.log_level, spdlog::level::info);
    }

    log_config.target = logging::parse_log_target(args.log_dest.empty() ? settings.log_target
                                                                        : args.log_dest);
    log_config.file_path = args.log_file.empty() ? settings.log_path : args.log_file;

    logging::init(log_config);
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help ? 0 : 1;
    }

    // Block shutdown signals before any thread starts so every worker inherits
    // the mask and only sigwait() below sees them
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    Config* config = Config::get_instance();
    config->init(args.config_path);
    AppSettings settings = config->settings();
    if (args.port > 0) {
        settings.http.port = args.port;
    }

    init_logging(args, settings);
    spdlog::info("[Main] {} starting (config {})", settings.print.app_name, config->get_path());

    if (!PrintService::ensure_upload_folder(settings.print.upload_folder)) {
        spdlog::critical("[Main] Upload folder {} is not usable", settings.print.upload_folder);
        return 1;
    }

    std::unique_ptr<JobStore> store;
    try {
        store = std::make_unique<JobStore>(settings.database_path);
    } catch (const JobStoreError& e) {
        spdlog::critical("[Main] {}", e.what());
        return 1;
    }

    CupsSpoolerClient spooler;
    PrintService service(settings.print, spooler, *store);

    RetentionSweeper sweeper(*store, settings.print.upload_folder, settings.print.retention_days);
    sweeper.sweep_once();
    sweeper.start(std::chrono::hours(settings.maintenance.cleanup_interval_hours));

    PeriodicTask status_sync("StatusSync",
                             std::chrono::seconds(settings.maintenance.status_sync_interval_sec),
                             [&service] { service.sync_pending(); });
    status_sync.start();

    ApiServer server(service, settings.http);
    if (!server.start()) {
        status_sync.stop();
        sweeper.stop();
        return 1;
    }

    int sig = 0;
    sigwait(&shutdown_signals, &sig);
    spdlog::info("[Main] Received signal {}, shutting down", sig);

    server.stop();
    status_sync.stop();
    sweeper.stop();

    spdlog::info("[Main] Shutdown complete");
    spdlog::shutdown();
    return 0;
}
