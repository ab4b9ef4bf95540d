#pragma once

#include "session.hpp"

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string session_id;
    std::string started_at;
    std::string stopped_at;
    std::string audio_path; // empty: nothing was captured
    double duration;
    int64_t segments;
    std::string device;
    int64_t capture_rate;
    int64_t target_rate;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    // Opens an existing database without creating or migrating it.
    bool open_readonly(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const RecordingSummary& rec);

    std::vector<HistoryEntry> recent(int limit = 10);
    std::optional<HistoryEntry> find(const std::string& session_id);

private:
    bool create_tables();
    bool prepare();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* find_stmt_ = nullptr;
};
