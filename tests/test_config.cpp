#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "vs_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.watch.directory == "/tmp");
        REQUIRE(cfg.watch.prefix == "vibestatus-");
        REQUIRE(cfg.watch.suffix == ".json");
        REQUIRE(cfg.timing.poll_interval_ms == 500);
        REQUIRE(cfg.timing.liveness_interval_ms == 2000);
        REQUIRE(cfg.timing.debounce_ms == 100);
        REQUIRE(cfg.timing.session_timeout() == std::chrono::seconds(300));
        REQUIRE(cfg.sound.enabled);
        REQUIRE(cfg.sound.on_idle == "Glass");
        REQUIRE(cfg.sound.on_needs_input == "Purr");
        REQUIRE(cfg.sound.player.empty());
        REQUIRE(cfg.history.enabled);
        REQUIRE(cfg.history.max_entries == 1000);
        REQUIRE(cfg.agents == std::vector<std::string>{"claude"});
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "watch": { "directory": "/run/user/1000", "prefix": "agent-", "suffix": ".status" },
            "timing": {
                "poll_interval_ms": 1000,
                "liveness_interval_ms": 5000,
                "debounce_ms": 250,
                "session_timeout_s": 60
            },
            "sound": { "enabled": false, "on_idle": "Ping", "on_needs_input": "Sosumi", "player": "paplay" },
            "history": { "enabled": false, "max_entries": 50 },
            "agents": ["claude", "codex"]
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.watch.directory == "/run/user/1000");
        REQUIRE(cfg.watch.prefix == "agent-");
        REQUIRE(cfg.watch.suffix == ".status");
        REQUIRE(cfg.timing.poll_interval() == std::chrono::milliseconds(1000));
        REQUIRE(cfg.timing.liveness_interval() == std::chrono::milliseconds(5000));
        REQUIRE(cfg.timing.debounce() == std::chrono::milliseconds(250));
        REQUIRE(cfg.timing.session_timeout() == std::chrono::seconds(60));
        REQUIRE_FALSE(cfg.sound.enabled);
        REQUIRE(cfg.sound.on_idle == "Ping");
        REQUIRE(cfg.sound.on_needs_input == "Sosumi");
        REQUIRE(cfg.sound.player == "paplay");
        REQUIRE_FALSE(cfg.history.enabled);
        REQUIRE(cfg.history.max_entries == 50);
        REQUIRE(cfg.agents == std::vector<std::string>{"claude", "codex"});
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "timing": { "debounce_ms": 20 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.timing.debounce_ms == 20);
        // Other fields retain defaults
        REQUIRE(cfg.timing.poll_interval_ms == 500);
        REQUIRE(cfg.watch.prefix == "vibestatus-");
        REQUIRE(cfg.sound.on_idle == "Glass");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.watch.directory == "/tmp");
        REQUIRE(cfg.timing.session_timeout_s == 300);
    }

    SECTION("ZeroIntervalsRejected") {
        TmpFile f(R"({ "timing": { "poll_interval_ms": 0, "session_timeout_s": 0, "debounce_ms": 0 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.timing.poll_interval_ms == 500);
        REQUIRE(cfg.timing.session_timeout_s == 300);
        // Zero debounce just means "no coalescing delay".
        REQUIRE(cfg.timing.debounce_ms == 0);
    }

    SECTION("NegativeIntervalsRejected") {
        TmpFile f(R"({ "timing": { "poll_interval_ms": -1, "liveness_interval_ms": -5,
                                   "debounce_ms": -1, "session_timeout_s": -10 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.timing.poll_interval_ms == 500);
        REQUIRE(cfg.timing.liveness_interval_ms == 2000);
        REQUIRE(cfg.timing.debounce_ms == 100);
        REQUIRE(cfg.timing.session_timeout_s == 300);
    }

    SECTION("OversizedIntervalRejected") {
        TmpFile f(R"({ "timing": { "poll_interval_ms": 4294967296 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.timing.poll_interval_ms == 500);
    }

    SECTION("WrongTypeKeepsEarlierFields") {
        TmpFile f(R"({ "watch": { "prefix": "x-" }, "timing": { "poll_interval_ms": "fast" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.watch.prefix == "x-");
        REQUIRE(cfg.timing.poll_interval_ms == 500);
    }

    SECTION("RelativeDirectoryResolved") {
        Config cfg;
        cfg.watch.directory = "sessions/../status";
        cfg.resolve_paths();
        REQUIRE(cfg.watch.directory == (std::filesystem::current_path() / "status").string());
    }

    SECTION("AbsoluteDirectoryUnchanged") {
        Config cfg;
        cfg.watch.directory = "/var/tmp/vibe";
        cfg.resolve_paths();
        REQUIRE(cfg.watch.directory == "/var/tmp/vibe");
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/vs_test_nonexistent_config_file.json");
        REQUIRE(cfg.watch.directory == "/tmp");
        REQUIRE(cfg.sound.enabled);
    }
}
