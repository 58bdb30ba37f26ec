// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "api_server.h"

#include "multipart_form.h"
#include "spdlog/spdlog.h"
#include "time_utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <utility>

namespace printdesk {

namespace api {

namespace {

json optional_text(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

int http_status_for(PrintErrorKind kind) {
    switch (kind) {
    case PrintErrorKind::NONE:
        return 200;
    case PrintErrorKind::INVALID_INPUT:
    case PrintErrorKind::REJECTED:
        return 400;
    case PrintErrorKind::NOT_FOUND:
        return 404;
    case PrintErrorKind::UNAVAILABLE:
        return 503;
    case PrintErrorKind::INTERNAL:
        return 500;
    }
    return 500;
}

std::optional<int> parse_copies(const std::string& text) {
    auto begin = text.find_first_not_of(" \t");
    auto end = text.find_last_not_of(" \t");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    std::string trimmed = text.substr(begin, end - begin + 1);

    errno = 0;
    char* parse_end = nullptr;
    long value = std::strtol(trimmed.c_str(), &parse_end, 10);
    if (errno != 0 || parse_end == trimmed.c_str() || *parse_end != '\0') {
        return std::nullopt;
    }
    if (value < INT32_MIN || value > INT32_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

bool parse_duplex(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "true";
}

bool exceeds_limit(const std::string& content_length, int64_t max_bytes) {
    if (content_length.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(content_length.c_str(), &end, 10);
    if (errno != 0 || end == content_length.c_str()) {
        return false;
    }
    return value > max_bytes;
}

std::string too_large_message(int max_mb) {
    return "File too large. Maximum size is " + std::to_string(max_mb) + " MB";
}

UploadForm parse_upload_form(const std::string& content_type, const std::string& body) {
    UploadForm form;
    for (auto& part : MultipartForm::parse_request(content_type, body)) {
        if (part.name == "files" && part.has_filename) {
            form.files.push_back(UploadFile{std::move(part.filename), std::move(part.content)});
        } else if (part.name == "copies" && !form.copies) {
            form.copies = std::move(part.content);
        } else if (part.name == "duplex" && !form.duplex) {
            form.duplex = std::move(part.content);
        }
    }
    return form;
}

std::string dump_json(const json& body) {
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

json error_json(const std::string& error) {
    return json{{"success", false}, {"error", error}};
}

json to_json(const UploadOutcome& outcome) {
    if (outcome.kind != PrintErrorKind::NONE) {
        return error_json(outcome.error);
    }
    json results = json::array();
    for (const auto& r : outcome.results) {
        json item{{"filename", r.filename}, {"success", r.success}};
        if (r.success) {
            item["job_id"] = optional_text(r.job_id);
            item["message"] = r.message;
        } else {
            item["error"] = r.error;
        }
        results.push_back(std::move(item));
    }
    return json{{"success", outcome.success}, {"results", results}};
}

json to_json(const QueueOutcome& outcome) {
    if (!outcome.success) {
        return error_json(outcome.error);
    }
    json queue = json::array();
    for (const auto& entry : outcome.queue) {
        queue.push_back({{"job_id", entry.job_id},
                         {"filename", entry.filename},
                         {"copies", entry.copies},
                         {"duplex", entry.duplex},
                         {"status", to_string(entry.status)},
                         {"size", entry.size}});
    }
    return json{{"success", true}, {"queue", queue}};
}

json job_to_json(const PrintJob& job) {
    json completed = job.completed_at ? json(time_utils::format_utc(*job.completed_at))
                                      : json(nullptr);
    return json{{"job_id", optional_text(job.job_id)},
                {"filename", job.original_filename},
                {"copies", job.copies},
                {"duplex", job.duplex},
                {"status", to_string(job.status)},
                {"submitted_at", time_utils::format_utc(job.submitted_at)},
                {"completed_at", completed},
                {"file_size_mb", round_mb(job.file_size_mb)},
                {"error_message", optional_text(job.error_message)}};
}

json to_json(const HistoryOutcome& outcome) {
    if (!outcome.success) {
        return error_json(outcome.error);
    }
    json history = json::array();
    for (const auto& job : outcome.history) {
        history.push_back(job_to_json(job));
    }
    return json{{"success", true}, {"history", history}};
}

json to_json(const PrintOutcome& outcome) {
    if (!outcome.success) {
        return error_json(outcome.error);
    }
    json j{{"success", true}, {"message", outcome.message}};
    if (outcome.job_id) {
        j["job_id"] = *outcome.job_id;
    }
    return j;
}

json to_json(const ServiceStatus& status) {
    if (!status.success) {
        return error_json(status.error);
    }
    return json{{"success", true},
                {"status",
                 {{"cups_available", status.cups_available},
                  {"upload_folder_ok", status.upload_folder_ok},
                  {"hostname", status.hostname},
                  {"app_name", status.app_name}}}};
}

} // namespace api

// ============================================================================
// ApiServer
// ============================================================================

namespace {

int reply(HttpResponse* resp, int status, const json& body) {
    resp->status_code = static_cast<http_status>(status);
    resp->content_type = APPLICATION_JSON;
    resp->body = api::dump_json(body);
    return status;
}

/// Run a route body; any escaping exception becomes a 500 JSON reply
template <typename Fn> int guarded(const char* route, HttpResponse* resp, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        spdlog::error("[Api] {} failed: {}", route, e.what());
        return reply(resp, 500, api::error_json(std::string("Internal server error: ") + e.what()));
    }
}

} // namespace

ApiServer::ApiServer(PrintService& service, HttpSettings settings)
    : service_(service), settings_(std::move(settings)),
      max_bytes_(static_cast<int64_t>(settings_.max_content_length_mb) * 1024 * 1024),
      router_(std::make_unique<hv::HttpService>()) {
    register_routes();
}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::register_routes() {
    // Runs once headers are parsed, before libhv buffers the body
    router_->headerHandler = http_sync_handler([this](HttpRequest* req, HttpResponse* resp) {
        return handle_headers(req, resp);
    });

    router_->POST("/api/upload", [this](HttpRequest* req, HttpResponse* resp) {
        return handle_upload(req, resp);
    });
    router_->GET("/api/queue", [this](HttpRequest* req, HttpResponse* resp) {
        return handle_queue(req, resp);
    });
    router_->GET("/api/history", [this](HttpRequest* req, HttpResponse* resp) {
        return handle_history(req, resp);
    });
    router_->POST("/api/cancel/{job_id}", [this](HttpRequest* req, HttpResponse* resp) {
        return handle_cancel(req, resp);
    });
    router_->POST("/api/reprint/{job_id}", [this](HttpRequest* req, HttpResponse* resp) {
        return handle_reprint(req, resp);
    });
    router_->GET("/api/status", [this](HttpRequest* req, HttpResponse* resp) {
        return handle_status(req, resp);
    });
}

int ApiServer::reject_too_large(HttpResponse* resp) {
    spdlog::warn("[Api] Request rejected: body exceeds {} MB", settings_.max_content_length_mb);
    return reply(resp, 413, api::error_json(api::too_large_message(settings_.max_content_length_mb)));
}

int ApiServer::handle_headers(HttpRequest* req, HttpResponse* resp) {
    if (api::exceeds_limit(req->GetHeader("Content-Length"), max_bytes_)) {
        return reject_too_large(resp);
    }
    return HTTP_STATUS_NEXT;
}

int ApiServer::handle_upload(HttpRequest* req, HttpResponse* resp) {
    return guarded("upload", resp, [&] {
        // Chunked bodies carry no Content-Length
        if (api::exceeds_limit(req->GetHeader("Content-Length"), max_bytes_) ||
            static_cast<int64_t>(req->body.size()) > max_bytes_) {
            return reject_too_large(resp);
        }

        api::UploadForm form = api::parse_upload_form(req->GetHeader("Content-Type"), req->body);

        int copies = 1;
        if (form.copies) {
            auto parsed = api::parse_copies(*form.copies);
            if (!parsed) {
                return reply(resp, 400,
                             api::error_json("Number of copies must be between 1 and 10"));
            }
            copies = *parsed;
        }
        bool duplex = form.duplex && api::parse_duplex(*form.duplex);

        UploadOutcome outcome = service_.upload(form.files, copies, duplex);
        return reply(resp, api::http_status_for(outcome.kind), api::to_json(outcome));
    });
}

int ApiServer::handle_queue(HttpRequest*, HttpResponse* resp) {
    return guarded("queue", resp, [&] {
        QueueOutcome outcome = service_.queue();
        return reply(resp, api::http_status_for(outcome.kind), api::to_json(outcome));
    });
}

int ApiServer::handle_history(HttpRequest*, HttpResponse* resp) {
    return guarded("history", resp, [&] {
        HistoryOutcome outcome = service_.history();
        return reply(resp, api::http_status_for(outcome.kind), api::to_json(outcome));
    });
}

int ApiServer::handle_cancel(HttpRequest* req, HttpResponse* resp) {
    return guarded("cancel", resp, [&] {
        PrintOutcome outcome = service_.cancel(req->GetParam("job_id"));
        return reply(resp, api::http_status_for(outcome.kind), api::to_json(outcome));
    });
}

int ApiServer::handle_reprint(HttpRequest* req, HttpResponse* resp) {
    return guarded("reprint", resp, [&] {
        PrintOutcome outcome = service_.reprint(req->GetParam("job_id"));
        return reply(resp, api::http_status_for(outcome.kind), api::to_json(outcome));
    });
}

int ApiServer::handle_status(HttpRequest*, HttpResponse* resp) {
    return guarded("status", resp, [&] {
        ServiceStatus status = service_.status();
        return reply(resp, status.success ? 200 : 500, api::to_json(status));
    });
}

bool ApiServer::start() {
    if (running_) {
        return true;
    }
    server_ = std::make_unique<hv::HttpServer>();
    server_->registerHttpService(router_.get());
    server_->setHost(settings_.host.c_str());
    server_->setPort(settings_.port);
    server_->setThreadNum(settings_.worker_threads);

    int rc = server_->start();
    if (rc != 0) {
        spdlog::error("[Api] Failed to listen on {}:{} (error {})", settings_.host, settings_.port,
                      rc);
        server_.reset();
        return false;
    }
    running_ = true;
    spdlog::info("[Api] Listening on {}:{} with {} worker thread(s)", settings_.host,
                 settings_.port, settings_.worker_threads);
    return true;
}

void ApiServer::stop() {
    if (!running_) {
        return;
    }
    server_->stop();
    server_.reset();
    running_ = false;
    spdlog::info("[Api] Stopped");
}

} // namespace printdesk
