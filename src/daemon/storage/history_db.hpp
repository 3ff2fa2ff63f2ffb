#pragma once

#include "providers/provider_types.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string text;
    std::string provider;
    int64_t duration_ms;
    std::string language;
    double audio_duration;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Keep at most this many rows; older ones are dropped after each insert.
    void set_max_entries(int max_entries) { max_entries_ = max_entries; }

    bool insert(const TranscriptionResult& result);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 10);

    bool clear();

private:
    bool create_tables();
    bool trim();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* trim_stmt_ = nullptr;
    int max_entries_ = 100;
};
