#include <catch2/catch_test_macros.hpp>

#include "egress/egress_guard.hpp"
#include "storage/audit_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <sqlite3.h>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("ls_test_audit_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

EgressDecision decision(uint64_t seq, bool allowed, const std::string& dest = "https://api.openai.com/v1") {
    return {
        .sequence = seq,
        .destination = dest,
        .category = EgressCategory::Transcription,
        .byte_estimate = 1000 * seq,
        .reason = allowed ? "cloud opt-in for api.openai.com" : "local-only mode",
        .allowed = allowed,
        .timestamp = std::chrono::system_clock::now(),
    };
}

// Runs a statement through a separate connection; returns the sqlite result code.
int exec_raw(const std::string& path, const char* sql) {
    sqlite3* db = nullptr;
    sqlite3_open(path.c_str(), &db);
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, nullptr);
    sqlite3_close(db);
    return rc;
}

} // namespace

TEST_CASE("AuditStore", "[audit]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        AuditStore store;
        REQUIRE(store.open(tmp.path));
        REQUIRE(store.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("OpenCreatesParentDirectory") {
        auto dir = std::filesystem::temp_directory_path() / ("ls_test_audit_dir_" + std::to_string(getpid()));
        {
            AuditStore store;
            REQUIRE(store.open((dir / "nested" / "audit.db").string()));
        }
        REQUIRE(std::filesystem::exists(dir / "nested" / "audit.db"));
        std::filesystem::remove_all(dir);
    }

    SECTION("AppendAndRecent") {
        TmpDb tmp;
        AuditStore store;
        REQUIRE(store.open(tmp.path));

        REQUIRE(store.append(decision(1, false)));
        REQUIRE(store.append(decision(2, true)));
        REQUIRE(store.append(decision(3, false, "https://evil.example/")));
        REQUIRE(store.count() == 3);

        auto rows = store.recent(10);
        REQUIRE(rows.size() == 3);
        // Newest first
        REQUIRE(rows[0].destination == "https://evil.example/");
        REQUIRE_FALSE(rows[0].allowed);
        REQUIRE(rows[1].allowed);
        REQUIRE(rows[1].byte_estimate == 2000);
        REQUIRE(rows[1].category == "transcription");
        REQUIRE(rows[2].reason == "local-only mode");
        REQUIRE(rows[0].timestamp.size() == 24);
        REQUIRE(rows[0].timestamp.back() == 'Z');
    }

    SECTION("RecentRespectsLimit") {
        TmpDb tmp;
        AuditStore store;
        REQUIRE(store.open(tmp.path));
        for (uint64_t i = 1; i <= 10; ++i) REQUIRE(store.append(decision(i, i % 2 == 0)));

        auto rows = store.recent(3);
        REQUIRE(rows.size() == 3);
        REQUIRE(rows[0].byte_estimate == 10000);
    }

    SECTION("RowsCannotBeChanged") {
        TmpDb tmp;
        {
            AuditStore store;
            REQUIRE(store.open(tmp.path));
            REQUIRE(store.append(decision(1, false)));
        }

        REQUIRE(exec_raw(tmp.path, "UPDATE egress_audit SET allowed = 1") != SQLITE_OK);
        REQUIRE(exec_raw(tmp.path, "DELETE FROM egress_audit") != SQLITE_OK);

        AuditStore store;
        REQUIRE(store.open(tmp.path));
        REQUIRE(store.count() == 1);
        REQUIRE_FALSE(store.recent(1)[0].allowed);
    }

    SECTION("PersistsAcrossReopen") {
        TmpDb tmp;
        {
            AuditStore store;
            REQUIRE(store.open(tmp.path));
            REQUIRE(store.append(decision(1, true)));
        }
        AuditStore store;
        REQUIRE(store.open(tmp.path));
        REQUIRE(store.count() == 1);
    }

    SECTION("AppendWhenClosedFails") {
        AuditStore store;
        REQUIRE_FALSE(store.is_open());
        REQUIRE_FALSE(store.append(decision(1, false)));
        REQUIRE(store.recent().empty());
    }

    SECTION("GuardSinkPersistsEveryDecision") {
        TmpDb tmp;
        AuditStore store;
        REQUIRE(store.open(tmp.path));

        EgressGuard guard;
        guard.add_sink([&](const EgressDecision& d) { store.append(d); });
        (void)guard.authorize({.destination = "https://api.openai.com/v1"});
        (void)guard.authorize({.destination = "https://example.org/"});

        REQUIRE(store.count() == 2);
        REQUIRE(store.count() == static_cast<int64_t>(guard.decision_count()));
    }
}
