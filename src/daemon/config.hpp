#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Watch {
        std::string directory = "/tmp";
        std::string prefix = "vibestatus-";
        std::string suffix = ".json";
    } watch;

    struct Timing {
        uint32_t poll_interval_ms = 500;
        uint32_t liveness_interval_ms = 2000;
        uint32_t debounce_ms = 100;
        uint32_t session_timeout_s = 300;

        std::chrono::milliseconds poll_interval() const { return std::chrono::milliseconds(poll_interval_ms); }
        std::chrono::milliseconds liveness_interval() const { return std::chrono::milliseconds(liveness_interval_ms); }
        std::chrono::milliseconds debounce() const { return std::chrono::milliseconds(debounce_ms); }
        std::chrono::seconds session_timeout() const { return std::chrono::seconds(session_timeout_s); }
    } timing;

    struct Sound {
        bool enabled = true;
        std::string on_idle = "Glass";
        std::string on_needs_input = "Purr";
        std::string player; // command run as `<player> <sound-id>`; empty = log only
    } sound;

    struct History {
        bool enabled = true;
        // Older transitions are pruned at startup and as new ones arrive.
        int max_entries = 1000;
    } history;

    // Process names that count as the worker family (substring match on comm).
    std::vector<std::string> agents = {"claude"};

    // Anchors a relative watch.directory to the current working directory.
    // Must run before daemonize() moves the process to "/".
    void resolve_paths();

    static Config load(const std::string& path);
    static Config load_default();
};
