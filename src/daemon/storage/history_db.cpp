#include "history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO transitions (session_id, project, from_state, to_state, sound) "
        "VALUES (?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, session_id, project, from_state, to_state, sound "
        "FROM transitions ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const TransitionEvent& event, const std::string& project,
                       const std::string& sound) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, event.session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, project.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 3, status_record::to_string(event.from), -1, SQLITE_STATIC);
    sqlite3_bind_text(insert_stmt_, 4, status_record::to_string(event.to), -1, SQLITE_STATIC);
    if (sound.empty()) sqlite3_bind_null(insert_stmt_, 5);
    else sqlite3_bind_text(insert_stmt_, 5, sound.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

int64_t HistoryDb::count() {
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM transitions", -1, &stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare count failed: {}", sqlite3_errmsg(db_));
        return 0;
    }
    int64_t n = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int64(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    return n;
}

int HistoryDb::prune(int keep) {
    if (!db_ || keep < 0) return 0;

    const char* sql =
        "DELETE FROM transitions WHERE id NOT IN "
        "(SELECT id FROM transitions ORDER BY id DESC LIMIT ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare prune failed: {}", sqlite3_errmsg(db_));
        return 0;
    }
    sqlite3_bind_int(stmt, 1, keep);

    int removed = 0;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        removed = sqlite3_changes(db_);
    } else {
        std::println(stderr, "db: prune failed: {}", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return removed;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.session_id = get_text(recent_stmt_, 2);
        e.project = get_text(recent_stmt_, 3);
        e.from_state = get_text(recent_stmt_, 4);
        e.to_state = get_text(recent_stmt_, 5);
        e.sound = get_text(recent_stmt_, 6);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transitions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%SZ','now')),
            session_id TEXT NOT NULL,
            project TEXT,
            from_state TEXT NOT NULL,
            to_state TEXT NOT NULL,
            sound TEXT
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
