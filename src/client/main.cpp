#include "config.hpp"
#include "platform/linux/procfs_detector.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"
#include "status_record.hpp"
#include "status_writer.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <unistd.h>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                       Show aggregate status");
    std::println(stderr, "  sessions                     List tracked sessions");
    std::println(stderr, "  history [--limit N]          Show recent state transitions");
    std::println(stderr, "  watch                        Print every status change");
    std::println(stderr, "  emit <state> [options]       Write a status file (working|idle|needs_input)");
    std::println(stderr, "      --session ID  --message TEXT  --project NAME  --pid N");
    std::println(stderr, "  hook                         Write a status file from a hook event on stdin");
    std::println(stderr, "Common options:");
    std::println(stderr, "  --config PATH                Config file (watch directory, prefix, agents)");
    std::println(stderr, "  --dir DIR                    Override the status directory");
}

static void print_sessions(const json& sessions) {
    if (sessions.empty()) {
        std::println("No active sessions");
        return;
    }
    for (auto& s : sessions) {
        std::println("{:<12} {:<20} {}", s.value("status", ""), s.value("project", ""), s.value("id", ""));
        if (s.contains("message")) {
            std::println("             {}", s["message"].get<std::string>());
        }
    }
}

static TimePoint now_seconds() {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

static int write_record(const Config& config, const std::string& session, const StatusRecord& record) {
    auto res = write_status_file(config.watch, session, record);
    if (!res) {
        std::println(stderr, "Error: {}", res.error());
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string state_arg;
    std::string session;
    std::string message;
    std::string project;
    std::string config_path;
    std::string dir;
    int pid = 0;
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--session" && i + 1 < argc) {
            session = argv[++i];
        } else if (arg == "--message" && i + 1 < argc) {
            message = argv[++i];
        } else if (arg == "--project" && i + 1 < argc) {
            project = argv[++i];
        } else if (arg == "--pid" && i + 1 < argc) {
            pid = std::atoi(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--dir" && i + 1 < argc) {
            dir = argv[++i];
        } else if (state_arg.empty() && !arg.starts_with("--")) {
            state_arg = arg;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    // Commands that write status files work without a running daemon.
    if (command == "emit" || command == "hook") {
        Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
        if (!dir.empty()) config.watch.directory = dir;

        if (command == "emit") {
            auto state = status_record::parse_status(state_arg);
            if (!state) {
                std::println(stderr, "Unknown state: '{}' (expected working, idle or needs_input)", state_arg);
                return 1;
            }

            StatusRecord record;
            record.state = *state;
            record.timestamp = now_seconds();
            if (!message.empty()) record.message = message;
            if (!project.empty()) record.project = project;
            if (pid > 0) record.owner_pid = pid;
            return write_record(config, session.empty() ? "status" : session, record);
        }

        std::string payload{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
        auto update = hook_update(payload, now_seconds());
        if (!update) return 0; // not a state-changing event

        ProcfsDetector detector(config.agents);
        auto owner = pid > 0 ? DetectionResult{"", pid} : detector.find_agent_ancestor(getppid());
        if (owner.found()) update->record.owner_pid = owner.pid;

        return write_record(config, update->session_id, update->record);
    }

    json cmd;
    if (command == "status") {
        cmd = {{"cmd", "status"}};
    } else if (command == "sessions") {
        cmd = {{"cmd", "sessions"}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "watch") {
        cmd = {{"cmd", "subscribe"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is vibestatusd running?");
        return 1;
    }

    json response;
    if (!client.request(cmd, response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("Status: {} ({})", response.value("text", ""), response.value("aggregate", ""));
        std::println("Active sessions: {}", response.value("active_session_count", 0));
        std::println("Agent running: {}", response.value("agent_running", false) ? "yes" : "no");
        if (response.value("error_count", 0) > 0) {
            std::println("Scan errors: {}", response["error_count"].get<int>());
        }
    } else if (command == "sessions") {
        print_sessions(response.value("sessions", json::array()));
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] {} ({}): {} -> {}{}",
                         entry.value("timestamp", ""), entry.value("session_id", ""),
                         entry.value("project", ""), entry.value("from", ""), entry.value("to", ""),
                         entry.value("sound", "").empty() ? "" : "  [" + entry.value("sound", "") + "]");
        }
    } else if (command == "watch") {
        // First reply is the current state; every later line is a change.
        do {
            std::println("{} ({} session{})", response.value("text", ""),
                         response.value("active_session_count", 0),
                         response.value("active_session_count", 0) == 1 ? "" : "s");
            std::fflush(stdout);
        } while (client.recv(response, -1));
    }

    return 0;
}
