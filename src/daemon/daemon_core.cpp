#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <format>
#include <print>

nlohmann::json session_to_json(const Session& session) {
    nlohmann::json j = {
        {"id", session.id},
        {"status", status_record::to_string(session.status)},
        {"project", session.project},
        {"last_seen", status_record::format_timestamp(session.last_seen)},
    };
    if (session.message) j["message"] = *session.message;
    if (session.owner_pid) j["owner_pid"] = *session.owner_pid;
    return j;
}

nlohmann::json state_to_json(const PublishedState& state) {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& s : state.sessions) {
        sessions.push_back(session_to_json(s));
    }
    return {
        {"aggregate", to_string(state.aggregate)},
        {"text", status_text(state.aggregate)},
        {"active_session_count", state.active_session_count},
        {"agent_running", state.agent_running},
        {"sessions", std::move(sessions)},
    };
}

DaemonCore::DaemonCore(Config config, bool verbose,
                       ProcessDetector& detector, IpcServer& ipc, SoundPlayer& sound,
                       NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      ipc_(ipc), sound_(sound),
      engine_(config_, verbose_, detector, std::move(notify)) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    if (config_.history.enabled) {
        auto data = platform::data_dir();
        std::string db_path = !data.empty() ? data + "/history.db" : "/tmp/vibestatus/history.db";
        if (!history_db_.open(db_path)) {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
        } else if (int removed = history_db_.prune(config_.history.max_entries); removed > 0) {
            log(std::format("Pruned {} old transition(s)", removed));
        }
    }

    engine_.set_listeners({
        .on_publish = [this](const PublishedState& s) { on_publish(s); },
        .on_sound = [this](const std::string& id) { on_sound(id); },
        .on_transition = [this](const TransitionEvent& e, const Session& s) { on_transition(e, s); },
    });

    // Populate state before the first client can ask for it.
    engine_.check_liveness();
    engine_.run_cycle();
    engine_.start();
    return true;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd, int client_fd) {
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "sessions") return handle_sessions(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "subscribe") return handle_subscribe(cmd, client_fd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    auto s = engine_.current();
    return {
        {"status", "ok"},
        {"aggregate", to_string(s.aggregate)},
        {"text", status_text(s.aggregate)},
        {"active_session_count", s.active_session_count},
        {"agent_running", s.agent_running},
        {"error_count", engine_.last_error_count()},
    };
}

nlohmann::json DaemonCore::handle_sessions(const nlohmann::json& /*cmd*/) {
    auto s = engine_.current();
    nlohmann::json resp = {{"status", "ok"}, {"sessions", nlohmann::json::array()}};
    for (const auto& session : s.sessions) {
        resp["sessions"].push_back(session_to_json(session));
    }
    return resp;
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    if (!history_db_.is_open()) {
        return {{"status", "error"}, {"message", "history disabled"}};
    }

    int limit = cmd.value("limit", 10);
    auto entries = history_db_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"session_id", e.session_id},
            {"project", e.project},
            {"from", e.from_state},
            {"to", e.to_state},
            {"sound", e.sound},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_subscribe(const nlohmann::json& /*cmd*/, int client_fd) {
    if (std::ranges::find(subscribers_, client_fd) == subscribers_.end()) {
        subscribers_.push_back(client_fd);
    }
    auto resp = state_to_json(engine_.current());
    resp["status"] = "ok";
    return resp;
}

void DaemonCore::on_engine_result() {
    engine_.on_cycle_complete();
}

void DaemonCore::on_poll_tick() {
    engine_.request_cycle(CycleTrigger::Timer);
}

void DaemonCore::on_liveness_tick() {
    engine_.request_liveness_check();
}

void DaemonCore::on_directory_changed() {
    engine_.request_cycle(CycleTrigger::DirectoryChange);
}

void DaemonCore::remove_subscriber(int fd) {
    std::erase(subscribers_, fd);
}

void DaemonCore::on_publish(const PublishedState& state) {
    if (subscribers_.empty()) return;

    auto msg = state_to_json(state);
    msg["status"] = "ok";
    msg["event"] = "state";

    // A failed push may have left half a line on the wire, so the
    // connection is closed rather than kept for requests.
    std::erase_if(subscribers_, [&](int fd) {
        if (ipc_.send_response(fd, msg)) return false;
        log(std::format("Dropping subscriber fd {}", fd));
        ipc_.close_client(fd);
        return true;
    });
}

void DaemonCore::on_sound(const std::string& sound_id) {
    auto res = sound_.play(sound_id);
    if (!res) {
        log("Sound playback failed: " + res.error());
    }
}

void DaemonCore::on_transition(const TransitionEvent& event, const Session& session) {
    log(std::format("{} ({}): {} -> {}", event.session_id, session.project,
                    status_record::to_string(event.from), status_record::to_string(event.to)));

    if (!history_db_.is_open()) return;

    SoundIds sounds{config_.sound.on_idle, config_.sound.on_needs_input};
    auto sound = config_.sound.enabled ? sound_for(event, sounds) : std::nullopt;
    if (!history_db_.insert(event, session.project, sound.value_or(""))) return;

    if (++inserts_since_prune_ >= kPruneEvery) {
        inserts_since_prune_ = 0;
        history_db_.prune(config_.history.max_entries);
    }
}

void DaemonCore::shutdown() {
    engine_.stop();
    subscribers_.clear();
    history_db_.close();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[vibestatus] {}", msg);
    }
}
