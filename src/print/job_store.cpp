// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "job_store.h"

#include "spdlog/spdlog.h"
#include "time_utils.h"

#include <sqlite3.h>

namespace printdesk {

namespace {

constexpr const char* JOB_COLUMNS = R"(
    id, job_id, filename, original_filename, filepath, file_size_mb,
    copies, duplex, status, submitted_at, completed_at, error_message
)";

/// RAII wrapper around a prepared statement
class Statement {
  public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw JobStoreError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void bind_optional_text(int idx, const std::optional<std::string>& value) {
        if (value) {
            bind_text(idx, *value);
        } else {
            check(sqlite3_bind_null(stmt_, idx));
        }
    }

    void bind_int(int idx, int value) {
        check(sqlite3_bind_int(stmt_, idx, value));
    }

    void bind_int64(int idx, int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, value));
    }

    void bind_double(int idx, double value) {
        check(sqlite3_bind_double(stmt_, idx, value));
    }

    /// @return true while rows are available
    bool step_row() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw JobStoreError("Query failed: " + std::string(sqlite3_errmsg(db_)));
        }
        return false;
    }

    void step_done() {
        if (sqlite3_step(stmt_) != SQLITE_DONE) {
            throw JobStoreError("Statement failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    sqlite3_stmt* get() const {
        return stmt_;
    }

  private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw JobStoreError("Failed to bind parameter: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw JobStoreError(msg);
    }
}

/// All-or-nothing scope: rolls back unless commit() was reached
class Transaction {
  public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec_sql(db_, "BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!committed_) {
            if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
                spdlog::error("[JobStore] Rollback failed: {}", sqlite3_errmsg(db_));
            }
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_sql(db_, "COMMIT");
        committed_ = true;
    }

  private:
    sqlite3* db_;
    bool committed_ = false;
};

std::optional<std::string> optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::optional<std::string>{text} : std::nullopt;
}

std::string text_or_empty(sqlite3_stmt* stmt, int col) {
    return optional_text(stmt, col).value_or("");
}

PrintJob parse_row(sqlite3_stmt* stmt) {
    PrintJob job;
    job.record_id = sqlite3_column_int64(stmt, 0);
    job.job_id = optional_text(stmt, 1);
    job.stored_filename = text_or_empty(stmt, 2);
    job.original_filename = text_or_empty(stmt, 3);
    job.file_path = text_or_empty(stmt, 4);
    job.file_size_mb = sqlite3_column_double(stmt, 5);
    job.copies = sqlite3_column_int(stmt, 6);
    job.duplex = sqlite3_column_int(stmt, 7) != 0;

    auto status_text = text_or_empty(stmt, 8);
    auto status = parse_job_status(status_text);
    if (!status) {
        spdlog::warn("[JobStore] Record {} has unknown status '{}', treating as pending",
                     job.record_id, status_text);
    }
    job.status = status.value_or(JobStatus::PENDING);

    job.submitted_at = time_utils::parse_utc(text_or_empty(stmt, 9)).value_or(JobStore::TimePoint{});
    if (auto completed = optional_text(stmt, 10)) {
        job.completed_at = time_utils::parse_utc(*completed);
    }
    job.error_message = optional_text(stmt, 11);
    return job;
}

std::vector<PrintJob> collect_rows(Statement& stmt) {
    std::vector<PrintJob> jobs;
    while (stmt.step_row()) {
        jobs.push_back(parse_row(stmt.get()));
    }
    return jobs;
}

} // namespace

// ============================================================================
// Construction / Schema
// ============================================================================

JobStore::JobStore(const std::string& db_path) : path_(db_path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw JobStoreError("Failed to open database " + db_path + ": " + msg);
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        exec_sql(db_, "PRAGMA journal_mode=WAL");
        init_schema();
    } catch (const JobStoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    spdlog::info("[JobStore] Opened {}", db_path);
}

JobStore::~JobStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void JobStore::init_schema() {
    Transaction tx(db_);
    exec_sql(db_, R"(
        CREATE TABLE IF NOT EXISTS print_jobs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            job_id TEXT,
            filename TEXT NOT NULL,
            original_filename TEXT NOT NULL,
            filepath TEXT NOT NULL,
            file_size_mb REAL,
            copies INTEGER DEFAULT 1,
            duplex INTEGER DEFAULT 0,
            status TEXT DEFAULT 'pending',
            submitted_at TEXT NOT NULL,
            completed_at TEXT,
            error_message TEXT
        )
    )");
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_job_id ON print_jobs(job_id)");
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_submitted_at ON print_jobs(submitted_at)");
    tx.commit();
}

// ============================================================================
// Writes
// ============================================================================

int64_t JobStore::insert(const PrintJob& job) {
    auto submitted = job.submitted_at == TimePoint{} ? std::chrono::system_clock::now()
                                                     : job.submitted_at;

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, R"(
        INSERT INTO print_jobs
            (job_id, filename, original_filename, filepath, file_size_mb,
             copies, duplex, status, submitted_at, error_message)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    stmt.bind_optional_text(1, job.job_id);
    stmt.bind_text(2, job.stored_filename);
    stmt.bind_text(3, job.original_filename);
    stmt.bind_text(4, job.file_path);
    stmt.bind_double(5, job.file_size_mb);
    stmt.bind_int(6, job.copies);
    stmt.bind_int(7, job.duplex ? 1 : 0);
    stmt.bind_text(8, to_string(job.status));
    stmt.bind_text(9, time_utils::format_utc(submitted));
    stmt.bind_optional_text(10, job.error_message);
    stmt.step_done();

    int64_t record_id = sqlite3_last_insert_rowid(db_);
    spdlog::debug("[JobStore] Inserted record {} (job {}, {})", record_id,
                  job.job_id.value_or("<none>"), job.original_filename);
    return record_id;
}

int JobStore::update_status(const std::string& job_id, JobStatus status,
                            const std::optional<std::string>& error_message) {
    return update_status(job_id, status, error_message, std::chrono::system_clock::now());
}

int JobStore::update_status(const std::string& job_id, JobStatus status,
                            const std::optional<std::string>& error_message, TimePoint now) {
    if (status == JobStatus::PENDING) {
        throw std::invalid_argument("Job status cannot be reset to pending");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (status == JobStatus::COMPLETED) {
        Statement stmt(db_, R"(
            UPDATE print_jobs SET status = ?, completed_at = ?
            WHERE job_id = ? AND status = 'pending'
        )");
        stmt.bind_text(1, to_string(status));
        stmt.bind_text(2, time_utils::format_utc(now));
        stmt.bind_text(3, job_id);
        stmt.step_done();
    } else {
        Statement stmt(db_, R"(
            UPDATE print_jobs SET status = ?, error_message = ?
            WHERE job_id = ? AND status = 'pending'
        )");
        stmt.bind_text(1, to_string(status));
        stmt.bind_optional_text(2, error_message);
        stmt.bind_text(3, job_id);
        stmt.step_done();
    }

    int changed = sqlite3_changes(db_);
    spdlog::debug("[JobStore] Job {} -> {} ({} record(s))", job_id, to_string(status), changed);
    return changed;
}

int JobStore::delete_older_than(int days) {
    return delete_older_than(days, std::chrono::system_clock::now());
}

int JobStore::delete_older_than(int days, TimePoint now) {
    std::string cutoff = time_utils::format_utc(time_utils::days_before(now, days));

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM print_jobs WHERE submitted_at < ?");
    stmt.bind_text(1, cutoff);
    stmt.step_done();

    int deleted = sqlite3_changes(db_);
    spdlog::debug("[JobStore] Deleted {} record(s) submitted before {}", deleted, cutoff);
    return deleted;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<PrintJob> JobStore::recent_jobs(int days) const {
    return recent_jobs(days, std::chrono::system_clock::now());
}

std::vector<PrintJob> JobStore::recent_jobs(int days, TimePoint now) const {
    std::string cutoff = time_utils::format_utc(time_utils::days_before(now, days));

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, std::string("SELECT ") + JOB_COLUMNS +
                            " FROM print_jobs WHERE submitted_at > ?"
                            " ORDER BY submitted_at DESC, id DESC");
    stmt.bind_text(1, cutoff);
    return collect_rows(stmt);
}

std::optional<PrintJob> JobStore::job_by_id(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, std::string("SELECT ") + JOB_COLUMNS +
                            " FROM print_jobs WHERE job_id = ?"
                            " ORDER BY submitted_at DESC, id DESC LIMIT 1");
    stmt.bind_text(1, job_id);
    if (stmt.step_row()) {
        return parse_row(stmt.get());
    }
    return std::nullopt;
}

std::optional<PrintJob> JobStore::job_by_record_id(int64_t record_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, std::string("SELECT ") + JOB_COLUMNS + " FROM print_jobs WHERE id = ?");
    stmt.bind_int64(1, record_id);
    if (stmt.step_row()) {
        return parse_row(stmt.get());
    }
    return std::nullopt;
}

std::vector<PrintJob> JobStore::pending_jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, std::string("SELECT ") + JOB_COLUMNS +
                            " FROM print_jobs WHERE status = 'pending'"
                            " ORDER BY submitted_at ASC, id ASC");
    return collect_rows(stmt);
}

} // namespace printdesk
