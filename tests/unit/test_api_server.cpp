// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "api_server.h"

#include "../test_fixtures.h"
#include "time_utils.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using namespace printdesk;
using Catch::Approx;

// ============================================================================
// Request helpers
// ============================================================================

TEST_CASE("api: error kinds map to HTTP status", "[api]") {
    CHECK(api::http_status_for(PrintErrorKind::NONE) == 200);
    CHECK(api::http_status_for(PrintErrorKind::INVALID_INPUT) == 400);
    CHECK(api::http_status_for(PrintErrorKind::REJECTED) == 400);
    CHECK(api::http_status_for(PrintErrorKind::NOT_FOUND) == 404);
    CHECK(api::http_status_for(PrintErrorKind::UNAVAILABLE) == 503);
    CHECK(api::http_status_for(PrintErrorKind::INTERNAL) == 500);
}

TEST_CASE("api: parse_copies accepts integers only", "[api][form]") {
    CHECK(api::parse_copies("2") == 2);
    CHECK(api::parse_copies(" 10 ") == 10);
    CHECK(api::parse_copies("0") == 0);
    CHECK(api::parse_copies("-3") == -3);
    CHECK_FALSE(api::parse_copies("").has_value());
    CHECK_FALSE(api::parse_copies("two").has_value());
    CHECK_FALSE(api::parse_copies("2.5").has_value());
    CHECK_FALSE(api::parse_copies("99999999999999999999").has_value());
}

TEST_CASE("api: parse_duplex is true only for 'true'", "[api][form]") {
    CHECK(api::parse_duplex("true"));
    CHECK(api::parse_duplex("TRUE"));
    CHECK(api::parse_duplex("True"));
    CHECK_FALSE(api::parse_duplex("false"));
    CHECK_FALSE(api::parse_duplex("1"));
    CHECK_FALSE(api::parse_duplex("on"));
    CHECK_FALSE(api::parse_duplex(""));
}

TEST_CASE("api: request size limit", "[api]") {
    const int64_t limit = 20LL * 1024 * 1024;
    CHECK_FALSE(api::exceeds_limit("", limit));
    CHECK_FALSE(api::exceeds_limit("1024", limit));
    CHECK_FALSE(api::exceeds_limit(std::to_string(limit), limit));
    CHECK(api::exceeds_limit(std::to_string(limit + 1), limit));
    CHECK_FALSE(api::exceeds_limit("garbage", limit));
    CHECK(api::too_large_message(20) == "File too large. Maximum size is 20 MB");
}

TEST_CASE("api: parse_upload_form collects files and first fields", "[api][form]") {
    const std::string b = "XyZ";
    std::string body = "--XyZ\r\nContent-Disposition: form-data; name=\"files\"; "
                       "filename=\"a.pdf\"\r\n\r\nAAA\r\n"
                       "--XyZ\r\nContent-Disposition: form-data; name=\"files\"; "
                       "filename=\"\"\r\n\r\n\r\n"
                       "--XyZ\r\nContent-Disposition: form-data; name=\"copies\"\r\n\r\n3\r\n"
                       "--XyZ\r\nContent-Disposition: form-data; name=\"copies\"\r\n\r\n9\r\n"
                       "--XyZ\r\nContent-Disposition: form-data; name=\"other\"; "
                       "filename=\"x.pdf\"\r\n\r\nZZ\r\n"
                       "--XyZ--\r\n";

    auto form = api::parse_upload_form("multipart/form-data; boundary=" + b, body);
    REQUIRE(form.files.size() == 2);
    CHECK(form.files[0].filename == "a.pdf");
    CHECK(form.files[0].content == "AAA");
    CHECK(form.files[1].filename.empty());
    CHECK(form.copies == "3");
    CHECK_FALSE(form.duplex.has_value());
}

TEST_CASE("api: non-multipart body yields an empty form", "[api][form]") {
    auto form = api::parse_upload_form("application/json", "{}");
    CHECK(form.files.empty());
    CHECK_FALSE(form.copies.has_value());
}

// ============================================================================
// Response bodies
// ============================================================================

TEST_CASE("api: upload outcome JSON", "[api][json]") {
    UploadOutcome outcome;
    outcome.success = true;
    FileResult ok;
    ok.filename = "report.pdf";
    ok.success = true;
    ok.job_id = "42";
    ok.message = "Print job submitted (Job ID: 42)";
    FileResult bad;
    bad.filename = "x.exe";
    bad.error = "File type not allowed. Allowed types: jpeg, jpg, pdf, png, txt";
    outcome.results = {ok, bad};

    json j = api::to_json(outcome);
    CHECK(j["success"] == true);
    REQUIRE(j["results"].size() == 2);
    CHECK(j["results"][0]["job_id"] == "42");
    CHECK(j["results"][0]["message"] == "Print job submitted (Job ID: 42)");
    CHECK_FALSE(j["results"][0].contains("error"));
    CHECK(j["results"][1]["success"] == false);
    CHECK_FALSE(j["results"][1].contains("job_id"));

    SECTION("batch failure collapses to an error body") {
        UploadOutcome failed;
        failed.kind = PrintErrorKind::UNAVAILABLE;
        failed.error = "Print server is not available. Please contact administrator.";
        json e = api::to_json(failed);
        CHECK(e == json{{"success", false}, {"error", failed.error}});
    }
}

TEST_CASE("api: history job JSON uses null for missing values", "[api][json]") {
    PrintJob job;
    job.job_id = "42";
    job.original_filename = "report.pdf";
    job.copies = 2;
    job.duplex = true;
    job.file_size_mb = 1.23456;
    job.submitted_at = std::chrono::system_clock::from_time_t(1762943400);

    json j = api::job_to_json(job);
    CHECK(j["job_id"] == "42");
    CHECK(j["filename"] == "report.pdf");
    CHECK(j["status"] == "pending");
    CHECK(j["submitted_at"] == time_utils::format_utc(job.submitted_at));
    CHECK(j["completed_at"].is_null());
    CHECK(j["error_message"].is_null());
    CHECK(j["file_size_mb"].get<double>() == Approx(1.23));

    job.job_id.reset();
    job.status = JobStatus::FAILED;
    job.error_message = "paper jam";
    job.completed_at = job.submitted_at;
    j = api::job_to_json(job);
    CHECK(j["job_id"].is_null());
    CHECK(j["status"] == "failed");
    CHECK(j["error_message"] == "paper jam");
    CHECK(j["completed_at"].is_string());
}

TEST_CASE("api: queue and status JSON", "[api][json]") {
    QueueOutcome queue;
    queue.success = true;
    queue.queue.push_back(QueueEntry{});
    queue.queue[0].job_id = "7";
    json q = api::to_json(queue);
    CHECK(q["queue"][0]["filename"] == "Unknown");
    CHECK(q["queue"][0]["copies"] == 1);
    CHECK(q["queue"][0]["status"] == "pending");

    ServiceStatus status;
    status.success = true;
    status.cups_available = false;
    status.upload_folder_ok = true;
    status.hostname = "printerpi.local";
    status.app_name = "Acres of ice";
    json s = api::to_json(status);
    CHECK(s["status"]["cups_available"] == false);
    CHECK(s["status"]["upload_folder_ok"] == true);
    CHECK(s["status"]["hostname"] == "printerpi.local");
}

TEST_CASE("api: dump_json replaces invalid UTF-8", "[api][json][utf8]") {
    json body = api::error_json("lp: unknown printer \xff\xfe");
    std::string text;
    REQUIRE_NOTHROW(text = api::dump_json(body));

    json back = json::parse(text);
    CHECK(back["error"] == "lp: unknown printer \xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("api: cancel and reprint JSON", "[api][json]") {
    PrintOutcome cancel;
    cancel.success = true;
    cancel.message = "Job 42 cancelled successfully";
    json c = api::to_json(cancel);
    CHECK(c["message"] == "Job 42 cancelled successfully");
    CHECK_FALSE(c.contains("job_id"));

    PrintOutcome reprint;
    reprint.success = true;
    reprint.job_id = "43";
    reprint.message = "Reprint submitted (Job ID: 43)";
    CHECK(api::to_json(reprint)["job_id"] == "43");

    auto missing = PrintOutcome::failure(PrintErrorKind::NOT_FOUND, "Job not found");
    CHECK(api::to_json(missing) == api::error_json("Job not found"));
}

// ============================================================================
// Server lifecycle
// ============================================================================

TEST_CASE_METHOD(PrintServiceFixture, "ApiServer: stop without start is harmless", "[api]") {
    HttpSettings http;
    http.port = 0;
    ApiServer server(service(), http);
    CHECK_FALSE(server.is_running());
    server.stop();
    CHECK_FALSE(server.is_running());
}

// ============================================================================
// Route handlers
// ============================================================================

namespace {

const std::string BOUNDARY = "PrintDeskBoundary";

std::string file_part(const std::string& filename, const std::string& content) {
    return "--" + BOUNDARY + "\r\nContent-Disposition: form-data; name=\"files\"; filename=\"" +
           filename + "\"\r\nContent-Type: application/octet-stream\r\n\r\n" + content +
           "\r\n";
}

std::string field_part(const std::string& name, const std::string& value) {
    return "--" + BOUNDARY + "\r\nContent-Disposition: form-data; name=\"" + name +
           "\"\r\n\r\n" + value + "\r\n";
}

void make_upload(HttpRequest& req, const std::string& parts) {
    req.method = HTTP_POST;
    req.path = "/api/upload";
    req.body = parts + "--" + BOUNDARY + "--\r\n";
    req.headers["Content-Type"] = "multipart/form-data; boundary=" + BOUNDARY;
    req.headers["Content-Length"] = std::to_string(req.body.size());
}

class ApiHandlerFixture : public PrintServiceFixture {
  public:
    ApiHandlerFixture() {
        http_.max_content_length_mb = 1;
        server_ = std::make_unique<ApiServer>(service(), http_);
    }

    ApiServer& server() {
        return *server_;
    }

    /// Parse the response body; fails the test if it is not valid JSON
    static json body_of(const HttpResponse& resp) {
        json j;
        REQUIRE_NOTHROW(j = json::parse(resp.body));
        return j;
    }

  private:
    HttpSettings http_;
    std::unique_ptr<ApiServer> server_;
};

} // namespace

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: upload defaults to one simplex copy",
                 "[api][handlers]") {
    HttpRequest req;
    make_upload(req, file_part("report.txt", sample_content::text()));
    HttpResponse resp;

    CHECK(server().handle_upload(&req, &resp) == 200);
    CHECK(resp.status_code == 200);

    json body = body_of(resp);
    CHECK(body["success"] == true);
    REQUIRE(body["results"].size() == 1);
    CHECK(body["results"][0]["job_id"] == "1");

    REQUIRE(spooler().submits.size() == 1);
    CHECK(spooler().submits[0].copies == 1);
    CHECK_FALSE(spooler().submits[0].duplex);
}

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: upload passes copies and duplex through",
                 "[api][handlers]") {
    HttpRequest req;
    make_upload(req, file_part("report.txt", sample_content::text()) + field_part("copies", "3") +
                         field_part("duplex", "True"));
    HttpResponse resp;

    CHECK(server().handle_upload(&req, &resp) == 200);
    REQUIRE(spooler().submits.size() == 1);
    CHECK(spooler().submits[0].copies == 3);
    CHECK(spooler().submits[0].duplex);
}

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: non-numeric copies is a 400", "[api][handlers]") {
    HttpRequest req;
    make_upload(req, file_part("report.txt", sample_content::text()) + field_part("copies", "abc"));
    HttpResponse resp;

    CHECK(server().handle_upload(&req, &resp) == 400);
    CHECK(body_of(resp) == api::error_json("Number of copies must be between 1 and 10"));
    CHECK(spooler().submits.empty());
}

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: upload with spooler down is a 503",
                 "[api][handlers]") {
    spooler().available = false;
    HttpRequest req;
    make_upload(req, file_part("report.txt", sample_content::text()));
    HttpResponse resp;

    CHECK(server().handle_upload(&req, &resp) == 503);
    CHECK(body_of(resp)["success"] == false);
    CHECK(spooler().submits.empty());
}

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: Latin-1 filename still yields JSON responses",
                 "[api][handlers][utf8]") {
    HttpRequest req;
    make_upload(req, file_part("r\xe9sum\xe9.txt", sample_content::text()));
    HttpResponse resp;

    CHECK(server().handle_upload(&req, &resp) == 200);
    json body = body_of(resp);
    REQUIRE(body["results"].size() == 1);
    CHECK(body["results"][0]["success"] == true);
    CHECK(body["results"][0]["filename"] == "r\xEF\xBF\xBDsum\xEF\xBF\xBD.txt");

    // The stored record must not poison later listings
    HttpRequest history_req;
    HttpResponse history_resp;
    CHECK(server().handle_history(&history_req, &history_resp) == 200);
    json history = body_of(history_resp);
    REQUIRE(history["history"].size() == 1);
    CHECK(history["history"][0]["filename"] == "r\xEF\xBF\xBDsum\xEF\xBF\xBD.txt");

    HttpRequest queue_req;
    HttpResponse queue_resp;
    CHECK(server().handle_queue(&queue_req, &queue_resp) == 200);
    CHECK(body_of(queue_resp)["success"] == true);
}

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: oversized Content-Length is refused at headers",
                 "[api][handlers][limits]") {
    HttpRequest req;
    req.method = HTTP_POST;
    req.path = "/api/upload";
    req.headers["Content-Length"] = std::to_string(2 * 1024 * 1024);
    HttpResponse resp;

    CHECK(server().handle_headers(&req, &resp) == 413);
    CHECK(resp.status_code == 413);
    CHECK(body_of(resp) == api::error_json(api::too_large_message(1)));

    SECTION("small requests continue to the route") {
        HttpRequest small;
        small.headers["Content-Length"] = "1024";
        HttpResponse small_resp;
        CHECK(server().handle_headers(&small, &small_resp) == HTTP_STATUS_NEXT);
    }
}

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: oversized upload is refused before parsing",
                 "[api][handlers][limits]") {
    HttpRequest req;
    make_upload(req, file_part("report.txt", sample_content::text()));
    req.headers["Content-Length"] = std::to_string(2 * 1024 * 1024);
    HttpResponse resp;

    CHECK(server().handle_upload(&req, &resp) == 413);
    CHECK(body_of(resp) == api::error_json(api::too_large_message(1)));
    CHECK(spooler().availability_checks == 0);
    CHECK(spooler().submits.empty());
    CHECK(upload_file_count() == 0);

    SECTION("a body over the limit without Content-Length is refused too") {
        HttpRequest chunked;
        make_upload(chunked, file_part("big.txt", std::string(1024 * 1024 + 1, 'a')));
        chunked.headers.erase("Content-Length");
        HttpResponse chunked_resp;
        CHECK(server().handle_upload(&chunked, &chunked_resp) == 413);
        CHECK(spooler().submits.empty());
    }
}

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: status maps to 200 with the status object",
                 "[api][handlers]") {
    spooler().available = false;
    HttpRequest req;
    HttpResponse resp;

    CHECK(server().handle_status(&req, &resp) == 200);
    json body = body_of(resp);
    CHECK(body["success"] == true);
    CHECK(body["status"]["cups_available"] == false);
    CHECK(body["status"]["upload_folder_ok"] == true);
    CHECK(body["status"]["hostname"] == settings().hostname);
    CHECK(body["status"]["app_name"] == settings().app_name);
}

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: cancel reads the job id path parameter",
                 "[api][handlers]") {
    HttpRequest req;
    req.query_params["job_id"] = "42";
    HttpResponse resp;

    CHECK(server().handle_cancel(&req, &resp) == 200);
    REQUIRE(spooler().cancels.size() == 1);
    CHECK(spooler().cancels[0] == "42");
    CHECK(body_of(resp)["message"] == "Job 42 cancelled successfully");

    SECTION("spooler refusal is a 400 with its message, even with stray bytes") {
        spooler().cancel_result =
            SpoolerResult::failure(SpoolerErrorKind::REJECTED, "cancel: job 42 \xff not found");
        HttpResponse refused;
        CHECK(server().handle_cancel(&req, &refused) == 400);
        json body = body_of(refused);
        CHECK(body["success"] == false);
        CHECK(body["error"].get<std::string>().find("\xEF\xBF\xBD") != std::string::npos);
    }
}

TEST_CASE_METHOD(ApiHandlerFixture, "ApiServer: reprint of an unknown job is a 404",
                 "[api][handlers]") {
    HttpRequest req;
    req.query_params["job_id"] = "999";
    HttpResponse resp;

    CHECK(server().handle_reprint(&req, &resp) == 404);
    CHECK(body_of(resp) == api::error_json("Job not found"));
    CHECK(spooler().submits.empty());
}
