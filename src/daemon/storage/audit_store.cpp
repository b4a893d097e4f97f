#include "storage/audit_store.hpp"

#include "log.hpp"

#include <filesystem>

namespace fs = std::filesystem;

AuditStore::AuditStore() = default;

AuditStore::~AuditStore() {
    close();
}

bool AuditStore::open(const std::string& path) {
    std::lock_guard lock(mutex_);
    if (db_) return true;

    std::error_code ec;
    fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        logging::error("db", "failed to open " + path + ": " + sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    char* err = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) != SQLITE_OK) {
        logging::error("db", std::string("WAL mode unavailable: ") + (err ? err : "unknown"));
        sqlite3_free(err);
    }

    auto fail = [this](const char* what) {
        logging::error("db", std::string(what) + ": " + sqlite3_errmsg(db_));
        if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
        if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    };

    if (!create_schema()) return fail("create schema failed");

    const char* insert_sql =
        "INSERT INTO egress_audit (timestamp, destination, category, byte_estimate, reason, allowed) "
        "VALUES (?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, destination, category, byte_estimate, reason, allowed "
        "FROM egress_audit ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        return fail("prepare insert failed");
    }
    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        return fail("prepare recent failed");
    }
    return true;
}

void AuditStore::close() {
    std::lock_guard lock(mutex_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool AuditStore::is_open() const {
    std::lock_guard lock(mutex_);
    return db_ != nullptr;
}

bool AuditStore::append(const EgressDecision& d) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return false;

    auto ts = format_timestamp(d.timestamp);

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, ts.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, d.destination.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 3, category_name(d.category), -1, SQLITE_STATIC);
    sqlite3_bind_int64(insert_stmt_, 4, static_cast<sqlite3_int64>(d.byte_estimate));
    sqlite3_bind_text(insert_stmt_, 5, d.reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(insert_stmt_, 6, d.allowed ? 1 : 0);

    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        logging::error("db", std::string("audit insert failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<AuditRecord> AuditStore::recent(int limit) {
    std::lock_guard lock(mutex_);
    std::vector<AuditRecord> records;
    if (!recent_stmt_) return records;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto text = [this](int col) -> std::string {
        auto* p = sqlite3_column_text(recent_stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        records.push_back({
            .id = sqlite3_column_int64(recent_stmt_, 0),
            .timestamp = text(1),
            .destination = text(2),
            .category = text(3),
            .byte_estimate = sqlite3_column_int64(recent_stmt_, 4),
            .reason = text(5),
            .allowed = sqlite3_column_int(recent_stmt_, 6) != 0,
        });
    }
    return records;
}

int64_t AuditStore::count() {
    std::lock_guard lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM egress_audit", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int64_t n = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int64(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    return n;
}

bool AuditStore::create_schema() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS egress_audit (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL,
            destination TEXT NOT NULL,
            category TEXT NOT NULL,
            byte_estimate INTEGER NOT NULL,
            reason TEXT NOT NULL,
            allowed INTEGER NOT NULL
        );
        CREATE TRIGGER IF NOT EXISTS egress_audit_no_update
            BEFORE UPDATE ON egress_audit
            BEGIN SELECT RAISE(ABORT, 'egress_audit is append-only'); END;
        CREATE TRIGGER IF NOT EXISTS egress_audit_no_delete
            BEFORE DELETE ON egress_audit
            BEGIN SELECT RAISE(ABORT, 'egress_audit is append-only'); END;
    )";

    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        logging::error("db", std::string("create schema failed: ") + (err ? err : "unknown"));
        sqlite3_free(err);
        return false;
    }
    return true;
}
