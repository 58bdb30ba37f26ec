// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file test_fixtures.h
 * @brief Reusable test fixtures for printdesk unit tests
 *
 * Available Fixtures:
 * - TempDirFixture: unique scratch directory, removed on destruction
 * - PrintServiceFixture: TempDirFixture + JobStore + MockSpoolerClient +
 *   PrintService with a fixed clock
 *
 * Usage:
 * @code
 * TEST_CASE_METHOD(PrintServiceFixture, "Test name", "[tags]") {
 *     auto outcome = service().upload({pdf_file("a.pdf")}, 1, false);
 *     REQUIRE(outcome.success);
 * }
 * @endcode
 */

#include "job_store.h"
#include "mocks/mock_spooler_client.h"
#include "print_service.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unistd.h>

using namespace printdesk;

/// Smallest byte sequences libmagic classifies as each media type
namespace sample_content {

inline std::string pdf() {
    return "%PDF-1.4\n1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
           "2 0 obj\n<< /Type /Pages /Kids [] /Count 0 >>\nendobj\n"
           "trailer\n<< /Root 1 0 R >>\n%%EOF\n";
}

inline std::string text() {
    return "Quarterly report\nThis is plain ASCII text for the printer.\n";
}

inline std::string png() {
    static const unsigned char bytes[] = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D, 0x49, 0x48,
        0x44, 0x52, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01, 0x08, 0x06, 0x00, 0x00,
        0x00, 0x1F, 0x15, 0xC4, 0x89, 0x00, 0x00, 0x00, 0x0A, 0x49, 0x44, 0x41, 0x54, 0x78,
        0x9C, 0x63, 0x00, 0x01, 0x00, 0x00, 0x05, 0x00, 0x01, 0x0D, 0x0A, 0x2D, 0xB4, 0x00,
        0x00, 0x00, 0x00, 0x49, 0x45, 0x4E, 0x44, 0xAE, 0x42, 0x60, 0x82};
    return std::string(reinterpret_cast<const char*>(bytes), sizeof(bytes));
}

inline std::string jpeg() {
    static const unsigned char bytes[] = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 0x4A, 0x46,
                                          0x49, 0x46, 0x00, 0x01, 0x01, 0x00, 0x00, 0x01,
                                          0x00, 0x01, 0x00, 0x00, 0xFF, 0xD9};
    return std::string(reinterpret_cast<const char*>(bytes), sizeof(bytes));
}

} // namespace sample_content

// ============================================================================
// TempDirFixture
// ============================================================================

class TempDirFixture {
  public:
    TempDirFixture() {
        static std::atomic<int> counter{0};
        dir_ = std::filesystem::temp_directory_path() /
               ("printdesk_test_" + std::to_string(getpid()) + "_" +
                std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(dir_);
    }

    ~TempDirFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    TempDirFixture(const TempDirFixture&) = delete;
    TempDirFixture& operator=(const TempDirFixture&) = delete;

    const std::filesystem::path& dir() const {
        return dir_;
    }

    std::string path_of(const std::string& name) const {
        return (dir_ / name).string();
    }

    std::string write_file(const std::string& name, const std::string& content) const {
        std::string path = path_of(name);
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

  private:
    std::filesystem::path dir_;
};

// ============================================================================
// PrintServiceFixture
// ============================================================================

/**
 * @brief PrintService over a real JobStore and a scripted spooler
 *
 * The clock is fixed at now_ (settable) so stored names and timestamps are
 * predictable.
 */
class PrintServiceFixture : public TempDirFixture {
  public:
    PrintServiceFixture() {
        settings_.upload_folder = path_of("uploads");
        std::filesystem::create_directories(settings_.upload_folder);
        store_ = std::make_unique<JobStore>(path_of("history.db"));
        rebuild_service();
    }

    PrintService& service() {
        return *service_;
    }

    JobStore& store() {
        return *store_;
    }

    MockSpoolerClient& spooler() {
        return spooler_;
    }

    PrintSettings& settings() {
        return settings_;
    }

    /// Recreate the service after changing settings()
    void rebuild_service() {
        service_ = std::make_unique<PrintService>(settings_, spooler_, *store_,
                                                  [this] { return now_; });
    }

    void set_now(std::chrono::system_clock::time_point now) {
        now_ = now;
    }

    std::chrono::system_clock::time_point now() const {
        return now_;
    }

    size_t upload_file_count() const {
        size_t n = 0;
        for (const auto& entry : std::filesystem::directory_iterator(settings_.upload_folder)) {
            (void)entry;
            ++n;
        }
        return n;
    }

    static UploadFile pdf_file(const std::string& name) {
        return UploadFile{name, sample_content::pdf()};
    }

    static UploadFile text_file(const std::string& name) {
        return UploadFile{name, sample_content::text()};
    }

  private:
    PrintSettings settings_;
    MockSpoolerClient spooler_;
    std::unique_ptr<JobStore> store_;
    std::unique_ptr<PrintService> service_;
    std::chrono::system_clock::time_point now_ = std::chrono::system_clock::now();
};
