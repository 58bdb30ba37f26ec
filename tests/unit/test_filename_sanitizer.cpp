// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "filename_sanitizer.h"

#include <catch2/catch_test_macros.hpp>

#include <ctime>

using namespace printdesk;

namespace {

/// Local-time 2025-11-12 10:30:00
std::chrono::system_clock::time_point fixed_time() {
    std::tm tm{};
    tm.tm_year = 2025 - 1900;
    tm.tm_mon = 10;
    tm.tm_mday = 12;
    tm.tm_hour = 10;
    tm.tm_min = 30;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

} // namespace

TEST_CASE("Filename: secure_filename flattens paths", "[filename]") {
    CHECK(filename::secure_filename("../../etc/passwd") == "etc_passwd");
    CHECK(filename::secure_filename("C:\\Users\\bob\\report.pdf") == "C_Users_bob_report.pdf");
    CHECK(filename::secure_filename("My Report 2025.pdf") == "My_Report_2025.pdf");
}

TEST_CASE("Filename: secure_filename drops unsafe characters", "[filename]") {
    CHECK(filename::secure_filename("r\xc3\xa9sum\xc3\xa9.pdf") == "rsum.pdf");
    CHECK(filename::secure_filename("inv$oice#1.pdf") == "invoice1.pdf");
    CHECK(filename::secure_filename("...hidden") == "hidden");
    CHECK(filename::secure_filename("__init__.txt") == "init__.txt");
    CHECK(filename::secure_filename("\xe6\x96\x87\xe4\xbb\xb6") == "");
}

TEST_CASE("Filename: Windows device names are prefixed", "[filename]") {
    CHECK(filename::secure_filename("con.txt") == "_con.txt");
    CHECK(filename::secure_filename("NUL") == "_NUL");
    CHECK(filename::secure_filename("console.txt") == "console.txt");
}

TEST_CASE("Filename: sanitize prefixes a local timestamp", "[filename]") {
    auto t = fixed_time();
    CHECK(filename::sanitize("report.pdf", t) == "20251112_103000_report.pdf");
    CHECK(filename::sanitize("../../etc/passwd", t) == "20251112_103000_etc_passwd");
}

TEST_CASE("Filename: sanitize falls back to unnamed", "[filename]") {
    CHECK(filename::sanitize("\xe6\x96\x87", fixed_time()) == "20251112_103000_unnamed");
}

TEST_CASE("Filename: sanitize is deterministic", "[filename]") {
    auto t = fixed_time();
    CHECK(filename::sanitize("a b.pdf", t) == filename::sanitize("a b.pdf", t));
}

TEST_CASE("Filename: extension_of lower-cases the last extension", "[filename]") {
    CHECK(filename::extension_of("Report.PDF") == "pdf");
    CHECK(filename::extension_of("archive.tar.gz") == "gz");
    CHECK(filename::extension_of("README") == "");
}

TEST_CASE("Filename: is_allowed checks the extension set", "[filename]") {
    std::set<std::string> allowed = {"pdf", "txt", "jpg", "jpeg", "png"};
    CHECK(filename::is_allowed("a.PDF", allowed));
    CHECK(filename::is_allowed("photo.jpeg", allowed));
    CHECK_FALSE(filename::is_allowed("script.sh", allowed));
    CHECK_FALSE(filename::is_allowed("pdf", allowed));
}
