#pragma once

#include "transition_detector.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string session_id;
    std::string project;
    std::string from_state;
    std::string to_state;
    std::string sound;
};

// Append-only log of session status changes.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const TransitionEvent& event, const std::string& project, const std::string& sound);

    std::vector<HistoryEntry> recent(int limit = 10);

    int64_t count();
    // Deletes all but the newest `keep` rows. Returns the number removed.
    int prune(int keep);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
