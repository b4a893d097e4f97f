#pragma once

#include "egress/egress_guard.hpp"

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

struct AuditRecord {
    int64_t id = 0;
    std::string timestamp;
    std::string destination;
    std::string category;
    int64_t byte_estimate = 0;
    std::string reason;
    bool allowed = false;
};

// Append-only SQLite log of egress decisions. Triggers reject UPDATE and
// DELETE on the table.
class AuditStore {
public:
    AuditStore();
    ~AuditStore();

    AuditStore(const AuditStore&) = delete;
    AuditStore& operator=(const AuditStore&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    bool append(const EgressDecision& decision);

    // Newest first.
    std::vector<AuditRecord> recent(int limit = 20);
    int64_t count();

private:
    bool create_schema();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
