#include <catch2/catch_test_macros.hpp>

#include "status_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("vs_test_writer_" + std::to_string(getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }

    ~TmpDir() { fs::remove_all(path); }
};

std::string slurp(const std::string& path) {
    std::ifstream f(path);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

const TimePoint kNow{std::chrono::seconds{1'750'000'000}};

} // namespace

TEST_CASE("Hook payload mapping", "[writer]") {

    SECTION("PromptSubmitMeansWorking") {
        auto u = hook_update(R"({"hook_event_name":"UserPromptSubmit","session_id":"s1","cwd":"/home/me/webapp"})", kNow);
        REQUIRE(u);
        REQUIRE(u->session_id == "s1");
        REQUIRE(u->record.state == SessionStatus::Working);
        REQUIRE(u->record.message == "Processing...");
        REQUIRE(u->record.project == "webapp");
        REQUIRE(u->record.timestamp == kNow);
    }

    SECTION("StopMeansIdle") {
        auto u = hook_update(R"({"hook_event_name":"Stop","session_id":"s1","cwd":"/srv/api/"})", kNow);
        REQUIRE(u);
        REQUIRE(u->record.state == SessionStatus::Idle);
        REQUIRE(u->record.message == "Ready");
        REQUIRE(u->record.project == "api");
    }

    SECTION("IdlePromptNotificationMeansNeedsInput") {
        auto u = hook_update(R"({"hook_event_name":"Notification","notification_type":"idle_prompt"})", kNow);
        REQUIRE(u);
        REQUIRE(u->record.state == SessionStatus::NeedsInput);
        REQUIRE(u->session_id == "status");
        REQUIRE(u->record.project == "Unknown");
    }

    SECTION("OtherEventsIgnored") {
        REQUIRE_FALSE(hook_update(R"({"hook_event_name":"Notification","message":"permission"})", kNow));
        REQUIRE_FALSE(hook_update(R"({"hook_event_name":"PreToolUse"})", kNow));
        REQUIRE_FALSE(hook_update("[1,2]", kNow));
        REQUIRE_FALSE(hook_update("garbage", kNow));
    }
}

TEST_CASE("Status file writing", "[writer]") {
    TmpDir dir;
    Config::Watch watch{.directory = dir.path.string(), .prefix = "vibestatus-", .suffix = ".json"};

    SECTION("FileNameSanitized") {
        REQUIRE(status_file_name(watch, "abc-123_x.y") == "vibestatus-abc-123_x.y.json");
        REQUIRE(status_file_name(watch, "a/b c") == "vibestatus-a_b_c.json");
        REQUIRE(status_file_name(watch, "") == "vibestatus-status.json");
    }

    SECTION("WrittenRecordDecodes") {
        StatusRecord r{.state = SessionStatus::NeedsInput, .message = "Waiting for input",
                       .timestamp = kNow, .project = "webapp", .owner_pid = 4242};

        auto path = write_status_file(watch, "s1", r);
        REQUIRE(path);
        REQUIRE(*path == (dir.path / "vibestatus-s1.json").string());

        auto decoded = status_record::decode(slurp(*path), TimePoint{});
        REQUIRE(decoded);
        REQUIRE(*decoded == r);
    }

    SECTION("NoTempFileLeftBehind") {
        StatusRecord r{.state = SessionStatus::Working, .timestamp = kNow};
        REQUIRE(write_status_file(watch, "s1", r));
        REQUIRE(write_status_file(watch, "s1", r));

        int count = 0;
        for (const auto& entry : fs::directory_iterator(dir.path)) {
            REQUIRE(entry.path().filename().string() == "vibestatus-s1.json");
            count++;
        }
        REQUIRE(count == 1);
    }

    SECTION("MissingDirectoryFails") {
        watch.directory = (dir.path / "missing").string();
        auto res = write_status_file(watch, "s1", StatusRecord{});
        REQUIRE_FALSE(res);
        REQUIRE_FALSE(res.error().empty());
    }
}
