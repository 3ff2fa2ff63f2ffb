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

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO transcriptions (text, provider, duration_ms, language, audio_duration) "
        "VALUES (?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, text, provider, duration_ms, language, audio_duration "
        "FROM transcriptions ORDER BY id DESC LIMIT ?";

    const char* trim_sql =
        "DELETE FROM transcriptions WHERE id NOT IN "
        "(SELECT id FROM transcriptions ORDER BY id DESC LIMIT ?)";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, trim_sql, -1, &trim_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare trim failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (trim_stmt_) { sqlite3_finalize(trim_stmt_); trim_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const TranscriptionResult& r) {
    if (!insert_stmt_) return false;

    auto provider = std::string(to_string(r.provider));

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, r.text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, provider.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert_stmt_, 3, static_cast<sqlite3_int64>(r.duration_ms));
    if (r.language && !r.language->empty()) {
        sqlite3_bind_text(insert_stmt_, 4, r.language->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(insert_stmt_, 4);
    }
    sqlite3_bind_double(insert_stmt_, 5, r.audio_duration_s);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return trim();
}

bool HistoryDb::trim() {
    if (max_entries_ <= 0) return true;

    sqlite3_reset(trim_stmt_);
    sqlite3_bind_int(trim_stmt_, 1, max_entries_);
    if (sqlite3_step(trim_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: trim failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
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
        e.text = get_text(recent_stmt_, 2);
        e.provider = get_text(recent_stmt_, 3);
        e.duration_ms = sqlite3_column_int64(recent_stmt_, 4);
        e.language = get_text(recent_stmt_, 5);
        e.audio_duration = sqlite3_column_double(recent_stmt_, 6);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::clear() {
    if (!db_) return false;

    char* err = nullptr;
    int rc = sqlite3_exec(db_, "DELETE FROM transcriptions;", nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: clear failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            text TEXT NOT NULL,
            provider TEXT NOT NULL,
            duration_ms INTEGER,
            language TEXT,
            audio_duration REAL
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
