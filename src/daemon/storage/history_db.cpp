#include "history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* COLUMNS =
    "id, session_id, started_at, stopped_at, audio_path, duration, segments, "
    "device, capture_rate, target_rate";

std::string get_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

HistoryEntry read_row(sqlite3_stmt* stmt) {
    HistoryEntry e;
    e.id = sqlite3_column_int64(stmt, 0);
    e.session_id = get_text(stmt, 1);
    e.started_at = get_text(stmt, 2);
    e.stopped_at = get_text(stmt, 3);
    e.audio_path = get_text(stmt, 4);
    e.duration = sqlite3_column_double(stmt, 5);
    e.segments = sqlite3_column_int64(stmt, 6);
    e.device = get_text(stmt, 7);
    e.capture_rate = sqlite3_column_int64(stmt, 8);
    e.target_rate = sqlite3_column_int64(stmt, 9);
    return e;
}

} // namespace

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL lets readers (the client) query while the daemon writes.
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;
    return prepare();
}

bool HistoryDb::open_readonly(const std::string& path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return prepare();
}

bool HistoryDb::prepare() {
    const char* insert_sql =
        "INSERT OR REPLACE INTO recordings (session_id, started_at, stopped_at, audio_path, "
        "duration, segments, device, capture_rate, target_rate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    auto recent_sql = std::string("SELECT ") + COLUMNS + " FROM recordings ORDER BY id DESC LIMIT ?";
    auto find_sql = std::string("SELECT ") + COLUMNS + " FROM recordings WHERE session_id = ?";

    if (sqlite3_prepare_v2(db_, recent_sql.c_str(), -1, &recent_stmt_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, find_sql.c_str(), -1, &find_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare query failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    // A read-only handle has no use for the insert statement.
    if (!sqlite3_db_readonly(db_, "main") &&
        sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (find_stmt_) { sqlite3_finalize(find_stmt_); find_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const RecordingSummary& rec) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, rec.session_id.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(2, rec.started_at);
    bind_nullable(3, rec.stopped_at);
    bind_nullable(4, rec.path.value_or(""));
    sqlite3_bind_double(insert_stmt_, 5, rec.duration_s);
    sqlite3_bind_int64(insert_stmt_, 6, static_cast<sqlite3_int64>(rec.segments));
    bind_nullable(7, rec.device_name);
    sqlite3_bind_int64(insert_stmt_, 8, rec.capture_rate);
    sqlite3_bind_int64(insert_stmt_, 9, rec.target_rate);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        entries.push_back(read_row(recent_stmt_));
    }

    return entries;
}

std::optional<HistoryEntry> HistoryDb::find(const std::string& session_id) {
    if (!find_stmt_) return std::nullopt;

    sqlite3_reset(find_stmt_);
    sqlite3_bind_text(find_stmt_, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(find_stmt_) != SQLITE_ROW) return std::nullopt;
    return read_row(find_stmt_);
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS recordings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL UNIQUE,
            started_at TEXT,
            stopped_at TEXT,
            audio_path TEXT,
            duration REAL,
            segments INTEGER,
            device TEXT,
            capture_rate INTEGER,
            target_rate INTEGER,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now'))
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
