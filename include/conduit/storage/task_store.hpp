// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/config.hpp>
#include <conduit/core/download_task.hpp>
#include <conduit/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

struct sqlite3;

namespace conduit::storage {

struct StoreConfig {
    std::filesystem::path data_dir;
    std::chrono::seconds backup_interval{core::BACKUP_INTERVAL};
};

struct DatabaseCloser {
    void operator()(sqlite3* db) const noexcept;
};

using DatabaseHandle = std::unique_ptr<sqlite3, DatabaseCloser>;

// Durable task storage: a SQLite database keyed by task id plus a JSON
// backup file that is used to rebuild the database after corruption.
// Not thread-safe; the orchestrator serializes all calls.
class TaskStore {
public:
    explicit TaskStore(StoreConfig config);
    ~TaskStore();

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    // Opens (or creates) the database. A file that cannot be opened or
    // fails its integrity check is quarantined, a fresh database is created
    // and the backup is restored into it.
    [[nodiscard]] core::Result<void> open();
    void close() noexcept;
    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }

    // Upsert by id. A failed write triggers one recovery and one retry; a
    // second failure is logged and recorded in healthy()/failed_writes().
    void save(const core::DownloadTask& task);

    // Non-removed tasks, most recently created first
    [[nodiscard]] core::Result<std::vector<core::DownloadTask>> load_all();

    // Soft delete: the row is kept with status 'removed'
    [[nodiscard]] core::Result<void> remove(std::string_view id);

    // Writes every non-removed task to the backup file. An empty task set
    // leaves the previous backup in place. Returns the number written.
    [[nodiscard]] core::Result<std::size_t> backup_snapshot();

    // Re-populates the database from the backup file; skips entries that
    // fail to decode. Returns the number restored (0 when no backup exists).
    [[nodiscard]] core::Result<std::size_t> restore_from_snapshot();

    [[nodiscard]] bool healthy() const noexcept { return healthy_; }
    [[nodiscard]] std::uint64_t failed_writes() const noexcept { return failed_writes_; }

    [[nodiscard]] const std::filesystem::path& database_path() const noexcept { return db_path_; }
    [[nodiscard]] const std::filesystem::path& backup_path() const noexcept { return backup_path_; }
    [[nodiscard]] const std::optional<std::filesystem::path>& last_quarantine() const noexcept {
        return last_quarantine_;
    }

private:
    [[nodiscard]] core::Result<void> open_database();
    [[nodiscard]] core::Result<void> check_integrity();
    [[nodiscard]] core::Result<void> create_schema();
    [[nodiscard]] core::Result<void> recover(std::string_view reason);
    [[nodiscard]] core::Result<void> quarantine();
    [[nodiscard]] std::filesystem::path quarantine_path() const;

    [[nodiscard]] core::Result<void> write(const core::DownloadTask& task);
    [[nodiscard]] core::Result<std::vector<core::DownloadTask>> read_all();
    [[nodiscard]] core::Result<void> exec(const char* sql);
    [[nodiscard]] core::Error sqlite_error(std::string_view what, int rc);

    void backup_if_due();

    StoreConfig config_;
    std::filesystem::path db_path_;
    std::filesystem::path backup_path_;
    DatabaseHandle db_;

    int last_rc_{0};
    bool healthy_{true};
    std::uint64_t failed_writes_{0};
    std::chrono::steady_clock::time_point last_backup_{};
    std::optional<std::filesystem::path> last_quarantine_;
};

} // namespace conduit::storage
