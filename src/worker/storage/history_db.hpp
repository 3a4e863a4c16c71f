#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct JobRecord {
    std::string audio_path;
    std::string srt_path;
    bool ok = false;
    std::string error;
    int64_t cue_count = 0;
    double processing_time = 0.0;
    std::string backend;
};

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    JobRecord job;
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

    bool insert(const JobRecord& job);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
