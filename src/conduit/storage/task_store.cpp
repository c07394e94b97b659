// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/storage/task_store.hpp>
#include <conduit/storage/task_codec.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <algorithm>
#include <fstream>
#include <string>

namespace conduit::storage {

namespace fs = std::filesystem;

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;
constexpr int BACKUP_FORMAT_VERSION = 1;

constexpr const char* SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS downloads (
    id             TEXT PRIMARY KEY,
    gid            TEXT,
    url            TEXT NOT NULL,
    filename       TEXT NOT NULL DEFAULT '',
    destination    TEXT NOT NULL DEFAULT '',
    size           INTEGER,
    completed_size INTEGER NOT NULL DEFAULT 0,
    status         TEXT NOT NULL,
    segments       INTEGER NOT NULL DEFAULT 8,
    speed_limit    INTEGER,
    error_message  TEXT,
    checksum_type  TEXT,
    checksum_value TEXT,
    post_actions   TEXT NOT NULL DEFAULT '[]',
    metadata       TEXT NOT NULL DEFAULT '{}',
    created_at     TEXT NOT NULL,
    started_at     TEXT,
    completed_at   TEXT,
    updated_at     TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_downloads_status ON downloads(status);
CREATE INDEX IF NOT EXISTS idx_downloads_created ON downloads(created_at);
)sql";

constexpr const char* UPSERT_SQL = R"sql(
INSERT INTO downloads (
    id, gid, url, filename, destination, size, completed_size, status,
    segments, speed_limit, error_message, checksum_type, checksum_value,
    post_actions, metadata, created_at, started_at, completed_at, updated_at
) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19)
ON CONFLICT(id) DO UPDATE SET
    gid = excluded.gid,
    url = excluded.url,
    filename = excluded.filename,
    destination = excluded.destination,
    size = excluded.size,
    completed_size = excluded.completed_size,
    status = excluded.status,
    segments = excluded.segments,
    speed_limit = excluded.speed_limit,
    error_message = excluded.error_message,
    checksum_type = excluded.checksum_type,
    checksum_value = excluded.checksum_value,
    post_actions = excluded.post_actions,
    metadata = excluded.metadata,
    started_at = excluded.started_at,
    completed_at = excluded.completed_at,
    updated_at = excluded.updated_at
)sql";

constexpr const char* SELECT_SQL = R"sql(
SELECT id, gid, url, filename, destination, size, completed_size, status,
       segments, speed_limit, error_message, checksum_type, checksum_value,
       post_actions, metadata, created_at, started_at, completed_at
FROM downloads
WHERE status != 'removed'
ORDER BY created_at DESC, rowid DESC
)sql";

enum Column : int {
    col_id, col_gid, col_url, col_filename, col_destination, col_size,
    col_completed_size, col_status, col_segments, col_speed_limit,
    col_error_message, col_checksum_type, col_checksum_value,
    col_post_actions, col_metadata, col_created_at, col_started_at,
    col_completed_at
};

[[nodiscard]] bool is_corruption(int rc) noexcept {
    int primary = rc & 0xff;
    return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB;
}

// RAII prepared statement. Bind failures are remembered and reported by
// the next step() so call sites only check one return code.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) noexcept {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] bool prepared() const noexcept { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    [[nodiscard]] int rc() const noexcept { return rc_; }

    void bind_text(int idx, std::string_view value) noexcept {
        track(sqlite3_bind_text(stmt_, idx, value.data(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }

    void bind_opt_text(int idx, const std::optional<std::string>& value) noexcept {
        if (value) bind_text(idx, *value);
        else track(sqlite3_bind_null(stmt_, idx));
    }

    void bind_u64(int idx, std::uint64_t value) noexcept {
        track(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)));
    }

    void bind_opt_u64(int idx, const std::optional<std::uint64_t>& value) noexcept {
        if (value) bind_u64(idx, *value);
        else track(sqlite3_bind_null(stmt_, idx));
    }

    [[nodiscard]] int step() noexcept {
        if (rc_ != SQLITE_OK) return rc_;
        return sqlite3_step(stmt_);
    }

    [[nodiscard]] std::optional<std::string> text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        const auto* raw = sqlite3_column_text(stmt_, col);
        int len = sqlite3_column_bytes(stmt_, col);
        return std::string(reinterpret_cast<const char*>(raw), static_cast<std::size_t>(len));
    }

    [[nodiscard]] std::optional<std::uint64_t> integer(int col) const noexcept {
        if (sqlite3_column_type(stmt_, col) != SQLITE_INTEGER) return std::nullopt;
        auto value = sqlite3_column_int64(stmt_, col);
        if (value < 0) return std::nullopt;
        return static_cast<std::uint64_t>(value);
    }

private:
    void track(int rc) noexcept {
        if (rc != SQLITE_OK && rc_ == SQLITE_OK) rc_ = rc;
    }

    sqlite3_stmt* stmt_{nullptr};
    int rc_{SQLITE_OK};
};

[[nodiscard]] std::optional<core::DownloadTask> decode_row(const Statement& row) {
    auto id = row.text(col_id);
    auto url = row.text(col_url);
    auto status_name = row.text(col_status);
    auto created = row.text(col_created_at);
    if (!id || !url || !status_name || !created) return std::nullopt;

    auto status = core::status_from_string(*status_name);
    auto created_at = parse_timestamp(*created);
    if (!status || !created_at) return std::nullopt;

    core::DownloadTask task;
    task.id = std::move(*id);
    task.source_url = std::move(*url);
    task.status = *status;
    task.created_at = *created_at;
    task.remote_handle = row.text(col_gid);
    task.filename = row.text(col_filename).value_or("");
    task.destination = row.text(col_destination).value_or("");
    task.total_size = row.integer(col_size);
    task.completed_size = row.integer(col_completed_size).value_or(0);
    task.speed_limit = row.integer(col_speed_limit);
    task.error_message = row.text(col_error_message);

    auto segments = row.integer(col_segments).value_or(core::DEFAULT_SEGMENTS);
    task.segments = static_cast<std::uint32_t>(
        std::clamp<std::uint64_t>(segments, core::MIN_SEGMENTS, core::MAX_SEGMENTS));

    auto checksum_type = row.text(col_checksum_type);
    auto checksum_value = row.text(col_checksum_value);
    if (checksum_type && checksum_value) {
        if (auto type = core::checksum_type_from_string(*checksum_type)) {
            task.checksum = core::Checksum{*type, std::move(*checksum_value)};
        }
    }

    if (auto actions = row.text(col_post_actions)) {
        task.post_actions = decode_post_actions(nlohmann::json::parse(*actions, nullptr, false));
    }
    if (auto metadata = row.text(col_metadata)) {
        task.metadata = decode_metadata(nlohmann::json::parse(*metadata, nullptr, false));
    }

    if (auto started = row.text(col_started_at)) task.started_at = parse_timestamp(*started);
    if (auto completed = row.text(col_completed_at)) task.completed_at = parse_timestamp(*completed);
    return task;
}

[[nodiscard]] std::string dump_json(const nlohmann::json& j, int indent = -1) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

void DatabaseCloser::operator()(sqlite3* db) const noexcept {
    if (sqlite3_close_v2(db) != SQLITE_OK) {
        spdlog::warn("Closing task database failed: {}", sqlite3_errmsg(db));
    }
}

TaskStore::TaskStore(StoreConfig config)
    : config_(std::move(config))
    , db_path_(config_.data_dir / fs::path(core::DATABASE_FILENAME))
    , backup_path_(config_.data_dir / fs::path(core::BACKUP_FILENAME)) {}

TaskStore::~TaskStore() {
    close();
}

core::Result<void> TaskStore::open() {
    std::error_code ec;
    fs::create_directories(config_.data_dir, ec);
    if (ec) {
        return core::fail(core::Errc::storage_error,
                          "cannot create " + config_.data_dir.string() + ": " + ec.message());
    }

    auto opened = open_database()
        .and_then([this] { return check_integrity(); })
        .and_then([this] { return create_schema(); });
    if (!opened) {
        spdlog::warn("Task database {} is unusable: {}", db_path_.string(),
                     opened.error().describe());
        if (auto recovered = recover(opened.error().message); !recovered) {
            return recovered;
        }
    }

    last_backup_ = std::chrono::steady_clock::now();
    spdlog::debug("Task database ready at {}", db_path_.string());
    return {};
}

void TaskStore::close() noexcept {
    db_.reset();
}

void TaskStore::save(const core::DownloadTask& task) {
    auto written = write(task);
    if (!written) {
        spdlog::warn("Saving task {} failed: {}", task.id, written.error().describe());
        auto recovered = recover(written.error().message);
        written = recovered ? write(task) : recovered;
    }

    if (!written) {
        healthy_ = false;
        ++failed_writes_;
        spdlog::error("Task {} was not persisted after recovery: {}", task.id,
                      written.error().describe());
        return;
    }

    healthy_ = true;
    backup_if_due();
}

core::Result<std::vector<core::DownloadTask>> TaskStore::load_all() {
    last_rc_ = SQLITE_OK;
    auto tasks = check_integrity().and_then([this] { return read_all(); });
    if (!tasks && (is_corruption(last_rc_) || !db_)) {
        spdlog::warn("Loading tasks failed: {}", tasks.error().describe());
        if (auto recovered = recover(tasks.error().message); !recovered) {
            return std::unexpected(recovered.error());
        }
        tasks = read_all();
    }
    return tasks;
}

core::Result<void> TaskStore::remove(std::string_view id) {
    if (!db_) return core::fail(core::Errc::storage_error, "task store is not open");

    Statement stmt(db_.get(), "UPDATE downloads SET status = 'removed', updated_at = ?1 WHERE id = ?2");
    if (!stmt.prepared()) return std::unexpected(sqlite_error("prepare delete", stmt.rc()));

    stmt.bind_text(1, format_timestamp(core::now_ms()));
    stmt.bind_text(2, id);
    if (int rc = stmt.step(); rc != SQLITE_DONE) {
        return std::unexpected(sqlite_error("delete task", rc));
    }
    if (sqlite3_changes(db_.get()) == 0) {
        return core::fail(core::Errc::not_found, std::string(id));
    }
    return {};
}

core::Result<std::size_t> TaskStore::backup_snapshot() {
    auto tasks = read_all();
    if (!tasks) return std::unexpected(tasks.error());
    if (tasks->empty()) {
        spdlog::debug("No tasks to back up, keeping previous backup");
        return 0;
    }

    nlohmann::json doc = {
        {"version", BACKUP_FORMAT_VERSION},
        {"createdAt", format_timestamp(core::now_ms())},
        {"tasks", nlohmann::json::array()},
    };
    for (const auto& task : *tasks) {
        doc["tasks"].push_back(encode_task(task));
    }

    fs::path tmp = backup_path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return core::fail(core::Errc::storage_error, "cannot write " + tmp.string());
        }
        out << dump_json(doc, 2) << '\n';
        out.flush();
        if (!out) {
            return core::fail(core::Errc::storage_error, "short write to " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, backup_path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return core::fail(core::Errc::storage_error,
                          "cannot replace " + backup_path_.string() + ": " + ec.message());
    }

    last_backup_ = std::chrono::steady_clock::now();
    spdlog::debug("Backed up {} task(s) to {}", tasks->size(), backup_path_.string());
    return tasks->size();
}

core::Result<std::size_t> TaskStore::restore_from_snapshot() {
    if (!db_) return core::fail(core::Errc::storage_error, "task store is not open");

    std::error_code ec;
    if (!fs::exists(backup_path_, ec)) {
        spdlog::info("No backup at {}, starting empty", backup_path_.string());
        return 0;
    }

    std::ifstream in(backup_path_, std::ios::binary);
    if (!in) {
        return core::fail(core::Errc::storage_error, "cannot read " + backup_path_.string());
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return core::fail(core::Errc::storage_error, "backup is not a JSON object");
    }
    auto entries = doc.find("tasks");
    if (entries == doc.end() || !entries->is_array()) {
        return core::fail(core::Errc::storage_error, "backup has no task list");
    }

    if (auto begun = exec("BEGIN"); !begun) return std::unexpected(begun.error());

    std::size_t restored = 0;
    for (const auto& entry : *entries) {
        auto task = decode_task(entry);
        if (!task) {
            spdlog::warn("Skipping backup entry: {}", task.error().describe());
            continue;
        }
        if (auto written = write(*task); !written) {
            if (auto rolled = exec("ROLLBACK"); !rolled) {
                spdlog::error("Rollback failed: {}", rolled.error().describe());
            }
            return std::unexpected(written.error());
        }
        ++restored;
    }

    if (auto committed = exec("COMMIT"); !committed) {
        return std::unexpected(committed.error());
    }
    spdlog::info("Restored {} task(s) from {}", restored, backup_path_.string());
    return restored;
}

core::Result<void> TaskStore::open_database() {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(db_path_.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    DatabaseHandle handle(raw);
    if (rc != SQLITE_OK) {
        last_rc_ = rc;
        std::string msg = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        return core::fail(core::Errc::storage_error, "open " + db_path_.string() + ": " + msg);
    }

    db_ = std::move(handle);
    sqlite3_busy_timeout(db_.get(), BUSY_TIMEOUT_MS);
    return exec("PRAGMA journal_mode=WAL").and_then([this] {
        return exec("PRAGMA synchronous=NORMAL");
    });
}

core::Result<void> TaskStore::check_integrity() {
    if (!db_) return core::fail(core::Errc::storage_error, "task store is not open");

    Statement stmt(db_.get(), "PRAGMA quick_check(1)");
    if (!stmt.prepared()) return std::unexpected(sqlite_error("integrity check", stmt.rc()));

    int rc = stmt.step();
    if (rc != SQLITE_ROW) return std::unexpected(sqlite_error("integrity check", rc));

    auto verdict = stmt.text(0).value_or("");
    if (verdict != "ok") {
        last_rc_ = SQLITE_CORRUPT;
        return core::fail(core::Errc::storage_error, "integrity check failed: " + verdict);
    }
    return {};
}

core::Result<void> TaskStore::create_schema() {
    return exec(SCHEMA_SQL);
}

core::Result<void> TaskStore::recover(std::string_view reason) {
    spdlog::warn("Recovering task database ({})", reason);

    if (db_) {
        if (auto saved = backup_snapshot(); !saved) {
            spdlog::warn("Pre-recovery backup skipped: {}", saved.error().describe());
        }
    }
    close();

    auto rebuilt = quarantine()
        .and_then([this] { return open_database(); })
        .and_then([this] { return create_schema(); });
    if (!rebuilt) {
        spdlog::error("Task database recovery failed: {}", rebuilt.error().describe());
        close();
        return rebuilt;
    }

    if (auto restored = restore_from_snapshot(); !restored) {
        spdlog::warn("Restore from backup failed: {}", restored.error().describe());
    }
    return {};
}

core::Result<void> TaskStore::quarantine() {
    std::error_code ec;
    if (!fs::exists(db_path_, ec)) return {};

    auto target = quarantine_path();
    fs::rename(db_path_, target, ec);
    if (ec) {
        return core::fail(core::Errc::storage_error,
                          "cannot quarantine " + db_path_.string() + ": " + ec.message());
    }

    for (const char* suffix : {"-wal", "-shm", "-journal"}) {
        fs::path side = db_path_;
        side += suffix;
        if (!fs::exists(side, ec)) continue;

        fs::path side_target = target;
        side_target += suffix;
        fs::rename(side, side_target, ec);
        if (ec && !fs::remove(side, ec)) {
            return core::fail(core::Errc::storage_error, "cannot clear " + side.string());
        }
    }

    last_quarantine_ = target;
    spdlog::warn("Corrupt task database moved to {}", target.string());
    return {};
}

fs::path TaskStore::quarantine_path() const {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        core::Clock::now().time_since_epoch()).count();
    std::string base = db_path_.string() + ".corrupt." + std::to_string(secs);

    fs::path candidate = base;
    std::error_code ec;
    for (int n = 1; fs::exists(candidate, ec); ++n) {
        candidate = base + "." + std::to_string(n);
    }
    return candidate;
}

core::Result<void> TaskStore::write(const core::DownloadTask& task) {
    if (!db_) return core::fail(core::Errc::storage_error, "task store is not open");

    Statement stmt(db_.get(), UPSERT_SQL);
    if (!stmt.prepared()) return std::unexpected(sqlite_error("prepare save", stmt.rc()));

    stmt.bind_text(1, task.id);
    stmt.bind_opt_text(2, task.remote_handle);
    stmt.bind_text(3, task.source_url);
    stmt.bind_text(4, task.filename);
    stmt.bind_text(5, task.destination);
    stmt.bind_opt_u64(6, task.total_size);
    stmt.bind_u64(7, task.completed_size);
    stmt.bind_text(8, core::to_string(task.status));
    stmt.bind_u64(9, task.segments);
    stmt.bind_opt_u64(10, task.speed_limit);
    stmt.bind_opt_text(11, task.error_message);
    if (task.checksum) {
        stmt.bind_text(12, core::to_string(task.checksum->type));
        stmt.bind_text(13, task.checksum->value);
    } else {
        stmt.bind_opt_text(12, std::nullopt);
        stmt.bind_opt_text(13, std::nullopt);
    }
    stmt.bind_text(14, dump_json(encode_post_actions(task.post_actions)));
    stmt.bind_text(15, dump_json(encode_metadata(task.metadata)));
    stmt.bind_text(16, format_timestamp(task.created_at));
    stmt.bind_opt_text(17, task.started_at
        ? std::optional<std::string>(format_timestamp(*task.started_at)) : std::nullopt);
    stmt.bind_opt_text(18, task.completed_at
        ? std::optional<std::string>(format_timestamp(*task.completed_at)) : std::nullopt);
    stmt.bind_text(19, format_timestamp(core::now_ms()));

    if (int rc = stmt.step(); rc != SQLITE_DONE) {
        return std::unexpected(sqlite_error("save task " + task.id, rc));
    }
    return {};
}

core::Result<std::vector<core::DownloadTask>> TaskStore::read_all() {
    if (!db_) return core::fail(core::Errc::storage_error, "task store is not open");

    Statement stmt(db_.get(), SELECT_SQL);
    if (!stmt.prepared()) return std::unexpected(sqlite_error("prepare load", stmt.rc()));

    std::vector<core::DownloadTask> tasks;
    int rc = SQLITE_OK;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        if (auto task = decode_row(stmt)) {
            tasks.push_back(std::move(*task));
        } else {
            spdlog::warn("Skipping malformed task row");
        }
    }
    if (rc != SQLITE_DONE) return std::unexpected(sqlite_error("load tasks", rc));
    return tasks;
}

core::Result<void> TaskStore::exec(const char* sql) {
    if (!db_) return core::fail(core::Errc::storage_error, "task store is not open");

    char* err = nullptr;
    int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        last_rc_ = rc;
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        return core::fail(core::Errc::storage_error, msg);
    }
    return {};
}

core::Error TaskStore::sqlite_error(std::string_view what, int rc) {
    last_rc_ = rc;
    std::string msg(what);
    msg += ": ";
    msg += db_ ? sqlite3_errmsg(db_.get()) : sqlite3_errstr(rc);
    return core::Error(core::Errc::storage_error, std::move(msg));
}

void TaskStore::backup_if_due() {
    auto now = std::chrono::steady_clock::now();
    if (now - last_backup_ < config_.backup_interval) return;

    last_backup_ = now;
    if (auto saved = backup_snapshot(); !saved) {
        spdlog::warn("Periodic backup failed: {}", saved.error().describe());
    }
}

} // namespace conduit::storage
