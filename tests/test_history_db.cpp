#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("vs_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

TransitionEvent event(const std::string& id, SessionStatus from, SessionStatus to) {
    return {.session_id = id, .from = from, .to = to};
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(event("vibestatus-a.json", SessionStatus::Working, SessionStatus::Idle),
                          "webapp", "Glass"));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].session_id == "vibestatus-a.json");
        REQUIRE(entries[0].project == "webapp");
        REQUIRE(entries[0].from_state == "working");
        REQUIRE(entries[0].to_state == "idle");
        REQUIRE(entries[0].sound == "Glass");
    }

    SECTION("NoSoundStoredAsNull") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(event("s", SessionStatus::Idle, SessionStatus::Working), "p", ""));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].sound.empty());
        REQUIRE(entries[0].to_state == "working");
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(event("s" + std::to_string(i), SessionStatus::Working,
                                    SessionStatus::NeedsInput), "p", "Purr"));
        }

        REQUIRE(db.recent(2).size() == 2);
        REQUIRE(db.recent(10).size() == 5);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(event("first", SessionStatus::Working, SessionStatus::Idle), "p", ""));
        REQUIRE(db.insert(event("second", SessionStatus::Idle, SessionStatus::Working), "p", ""));
        REQUIRE(db.insert(event("third", SessionStatus::Working, SessionStatus::NeedsInput), "p", ""));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].session_id == "third");
        REQUIRE(entries[0].to_state == "needs_input");
        REQUIRE(entries[1].session_id == "second");
        REQUIRE(entries[2].session_id == "first");
    }

    SECTION("SurvivesReopen") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert(event("s", SessionStatus::Working, SessionStatus::Idle), "p", "Glass"));
        }

        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.recent(10).size() == 1);
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(event("s", SessionStatus::Working, SessionStatus::Idle), "p", ""));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].timestamp.size() == 20);
        REQUIRE(entries[0].timestamp.back() == 'Z');
    }

    SECTION("ClosedDbRejectsInsert") {
        HistoryDb db;
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.insert(event("s", SessionStatus::Working, SessionStatus::Idle), "p", ""));
        REQUIRE(db.recent(5).empty());
    }
}

TEST_CASE("HistoryDb retention", "[history]") {
    TmpDb tmp;
    HistoryDb db;
    REQUIRE(db.open(tmp.path));

    for (int i = 0; i < 6; ++i) {
        REQUIRE(db.insert(event("s" + std::to_string(i), SessionStatus::Working, SessionStatus::Idle), "p", ""));
    }
    REQUIRE(db.count() == 6);

    SECTION("PruneKeepsNewest") {
        REQUIRE(db.prune(4) == 2);
        REQUIRE(db.count() == 4);

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 4);
        REQUIRE(entries.front().session_id == "s5");
        REQUIRE(entries.back().session_id == "s2");
    }

    SECTION("PruneBelowLimitIsNoop") {
        REQUIRE(db.prune(100) == 0);
        REQUIRE(db.count() == 6);
    }

    SECTION("PruneToZeroEmptiesTable") {
        REQUIRE(db.prune(0) == 6);
        REQUIRE(db.recent(10).empty());
    }
}
