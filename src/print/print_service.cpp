// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "print_service.h"

#include "content_validator.h"
#include "filename_sanitizer.h"
#include "job_store.h"
#include "spdlog/spdlog.h"
#include "spooler_client.h"

#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace printdesk {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

/// Remove a partially processed upload; failures are only logged
void discard_file(const std::string& path) {
    std::error_code ec;
    if (fs::exists(path, ec) && !fs::remove(path, ec)) {
        spdlog::warn("[PrintService] Could not remove {}: {}", path, ec.message());
    }
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open " + path + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw std::runtime_error("failed to write " + path);
    }
}

} // namespace

double round_mb(double value) {
    return std::round(value * 100.0) / 100.0;
}

PrintOutcome PrintOutcome::failure(PrintErrorKind kind, std::string error) {
    PrintOutcome outcome;
    outcome.kind = kind;
    outcome.error = std::move(error);
    return outcome;
}

PrintService::PrintService(PrintSettings settings, SpoolerClient& spooler, JobStore& store,
                           Clock clock)
    : settings_(std::move(settings)), spooler_(spooler), store_(store), clock_(std::move(clock)) {}

// ============================================================================
// Upload
// ============================================================================

UploadOutcome PrintService::upload(const std::vector<UploadFile>& files, int copies, bool duplex) {
    UploadOutcome outcome;

    if (copies < MIN_COPIES || copies > MAX_COPIES) {
        outcome.kind = PrintErrorKind::INVALID_INPUT;
        outcome.error = "Number of copies must be between 1 and 10";
        return outcome;
    }
    if (files.empty()) {
        outcome.kind = PrintErrorKind::INVALID_INPUT;
        outcome.error = "No files provided";
        return outcome;
    }
    bool any_named = false;
    for (const auto& f : files) {
        any_named = any_named || !f.filename.empty();
    }
    if (!any_named) {
        outcome.kind = PrintErrorKind::INVALID_INPUT;
        outcome.error = "No files selected";
        return outcome;
    }
    if (!spooler_.is_available()) {
        spdlog::warn("[PrintService] Upload refused: spooler unavailable");
        outcome.kind = PrintErrorKind::UNAVAILABLE;
        outcome.error = "Print server is not available. Please contact administrator.";
        return outcome;
    }

    for (const auto& file : files) {
        if (file.filename.empty()) {
            continue;
        }
        FileResult result = process_file(file, copies, duplex);
        outcome.success = outcome.success || result.success;
        outcome.results.push_back(std::move(result));
    }

    spdlog::info("[PrintService] Upload batch: {} file(s), success={}", outcome.results.size(),
                 outcome.success);
    return outcome;
}

FileResult PrintService::process_file(const UploadFile& file, int copies, bool duplex) {
    FileResult result;
    result.filename = file.filename;

    if (!filename::is_allowed(file.filename, settings_.allowed_extensions)) {
        result.error = "File type not allowed. Allowed types: " + allowed_types_text();
        return result;
    }

    std::string path;
    try {
        const auto now = clock_();
        const std::string stored_name = filename::sanitize(file.filename, now);
        path = (fs::absolute(settings_.upload_folder) / stored_name).string();

        write_file(path, file.content);

        const std::string extension = filename::extension_of(file.filename);
        if (!ContentValidator::validate(path, extension)) {
            discard_file(path);
            result.error = "File content does not match extension";
            return result;
        }

        const double size_mb = static_cast<double>(fs::file_size(path)) / BYTES_PER_MB;

        SpoolerResult submitted = spooler_.submit(path, copies, duplex);
        if (!submitted.success()) {
            spdlog::warn("[PrintService] Spooler refused {}: {} ({})", file.filename,
                         submitted.message, submitted.get_kind_string());
            discard_file(path);
            result.error = submitted.message;
            return result;
        }

        PrintJob job;
        job.job_id = submitted.value;
        job.stored_filename = stored_name;
        job.original_filename = file.filename;
        job.file_path = path;
        job.file_size_mb = size_mb;
        job.copies = copies;
        job.duplex = duplex;
        job.submitted_at = now;
        store_.insert(job);

        result.success = true;
        result.job_id = submitted.value;
        result.message = "Print job submitted (Job ID: " + submitted.value + ")";
        spdlog::info("[PrintService] Submitted {} as job {}", file.filename, submitted.value);
    } catch (const std::exception& e) {
        spdlog::error("[PrintService] Failed to process {}: {}", file.filename, e.what());
        if (!path.empty()) {
            discard_file(path);
        }
        result.success = false;
        result.job_id.reset();
        result.error = std::string("Error processing file: ") + e.what();
    }
    return result;
}

std::string PrintService::allowed_types_text() const {
    std::string text;
    for (const auto& ext : settings_.allowed_extensions) {
        if (!text.empty()) {
            text += ", ";
        }
        text += ext;
    }
    return text;
}

// ============================================================================
// Queue / History
// ============================================================================

QueueOutcome PrintService::queue() {
    QueueOutcome outcome;
    try {
        std::vector<QueuedJob> live = spooler_.list_queue();

        // recent_jobs is newest first; keep the first record seen per job id
        std::map<std::string, PrintJob> records;
        for (auto& job : store_.recent_jobs(1, clock_())) {
            if (job.job_id) {
                records.emplace(*job.job_id, std::move(job));
            }
        }

        for (const auto& queued : live) {
            QueueEntry entry;
            entry.job_id = queued.job_id;
            entry.status = queued.status;
            entry.size = queued.size.empty() ? "Unknown" : queued.size;
            auto it = records.find(queued.job_id);
            if (it != records.end()) {
                entry.filename = it->second.original_filename;
                entry.copies = it->second.copies;
                entry.duplex = it->second.duplex;
            }
            outcome.queue.push_back(std::move(entry));
        }
        outcome.success = true;
    } catch (const std::exception& e) {
        spdlog::error("[PrintService] Queue lookup failed: {}", e.what());
        outcome.kind = PrintErrorKind::INTERNAL;
        outcome.error = std::string("Error getting queue: ") + e.what();
    }
    return outcome;
}

HistoryOutcome PrintService::history() {
    HistoryOutcome outcome;
    try {
        outcome.history = store_.recent_jobs(settings_.retention_days, clock_());
        for (auto& job : outcome.history) {
            job.file_size_mb = round_mb(job.file_size_mb);
        }
        outcome.success = true;
    } catch (const std::exception& e) {
        spdlog::error("[PrintService] History lookup failed: {}", e.what());
        outcome.kind = PrintErrorKind::INTERNAL;
        outcome.error = std::string("Error getting history: ") + e.what();
    }
    return outcome;
}

// ============================================================================
// Cancel / Reprint
// ============================================================================

PrintOutcome PrintService::cancel(const std::string& job_id) {
    try {
        SpoolerResult cancelled = spooler_.cancel(job_id);
        if (!cancelled.success()) {
            spdlog::warn("[PrintService] Cancel of job {} refused: {}", job_id, cancelled.message);
            return PrintOutcome::failure(PrintErrorKind::REJECTED, cancelled.message);
        }

        store_.update_status(job_id, JobStatus::CANCELLED, std::nullopt, clock_());

        PrintOutcome outcome;
        outcome.success = true;
        outcome.job_id = job_id;
        outcome.message = cancelled.value;
        spdlog::info("[PrintService] Cancelled job {}", job_id);
        return outcome;
    } catch (const std::exception& e) {
        spdlog::error("[PrintService] Cancel of job {} failed: {}", job_id, e.what());
        return PrintOutcome::failure(PrintErrorKind::INTERNAL,
                                     std::string("Error cancelling job: ") + e.what());
    }
}

PrintOutcome PrintService::reprint(const std::string& job_id) {
    try {
        auto original = store_.job_by_id(job_id);
        if (!original) {
            return PrintOutcome::failure(PrintErrorKind::NOT_FOUND, "Job not found");
        }

        std::error_code ec;
        if (!fs::exists(original->file_path, ec)) {
            return PrintOutcome::failure(PrintErrorKind::NOT_FOUND, "File no longer available");
        }

        SpoolerResult submitted =
            spooler_.submit(original->file_path, original->copies, original->duplex);
        if (!submitted.success()) {
            spdlog::warn("[PrintService] Reprint of job {} refused: {}", job_id, submitted.message);
            return PrintOutcome::failure(PrintErrorKind::REJECTED, submitted.message);
        }

        PrintJob copy;
        copy.job_id = submitted.value;
        copy.stored_filename = original->stored_filename;
        copy.original_filename = original->original_filename;
        copy.file_path = original->file_path;
        copy.file_size_mb = original->file_size_mb;
        copy.copies = original->copies;
        copy.duplex = original->duplex;
        copy.submitted_at = clock_();
        store_.insert(copy);

        PrintOutcome outcome;
        outcome.success = true;
        outcome.job_id = submitted.value;
        outcome.message = "Reprint submitted (Job ID: " + submitted.value + ")";
        spdlog::info("[PrintService] Reprinted job {} as job {}", job_id, submitted.value);
        return outcome;
    } catch (const std::exception& e) {
        spdlog::error("[PrintService] Reprint of job {} failed: {}", job_id, e.what());
        return PrintOutcome::failure(PrintErrorKind::INTERNAL,
                                     std::string("Error reprinting job: ") + e.what());
    }
}

// ============================================================================
// Status / Maintenance
// ============================================================================

ServiceStatus PrintService::status() {
    ServiceStatus st;
    try {
        st.cups_available = spooler_.is_available();
        st.upload_folder_ok = ensure_upload_folder(settings_.upload_folder);
        st.hostname = settings_.hostname;
        st.app_name = settings_.app_name;
        st.success = true;
    } catch (const std::exception& e) {
        spdlog::error("[PrintService] Status check failed: {}", e.what());
        st.error = std::string("Error getting status: ") + e.what();
    }
    return st;
}

int PrintService::sync_pending() {
    int updated = 0;
    try {
        for (const auto& job : store_.pending_jobs()) {
            if (!job.job_id) {
                continue;
            }
            auto state = spooler_.job_status(*job.job_id);
            if (state && *state == JobStatus::COMPLETED) {
                updated += store_.update_status(*job.job_id, JobStatus::COMPLETED, std::nullopt,
                                                clock_());
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[PrintService] Status sync failed: {}", e.what());
    }
    if (updated > 0) {
        spdlog::info("[PrintService] Marked {} job(s) completed", updated);
    }
    return updated;
}

bool PrintService::ensure_upload_folder(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::error("[PrintService] Cannot create upload folder {}: {}", path, ec.message());
        return false;
    }
    if (!fs::is_directory(path, ec)) {
        return false;
    }
    return access(path.c_str(), W_OK) == 0;
}

} // namespace printdesk
