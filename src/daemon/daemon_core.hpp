#pragma once

#include "config.hpp"
#include "platform/ipc_server.hpp"
#include "platform/process_detector.hpp"
#include "platform/sound_player.hpp"
#include "status_engine.hpp"
#include "storage/history_db.hpp"

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

nlohmann::json session_to_json(const Session& session);
nlohmann::json state_to_json(const PublishedState& state);

// Platform-independent daemon logic: owns the engine, answers IPC commands
// and fans published state out to subscribed clients.
class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               ProcessDetector& detector, IpcServer& ipc, SoundPlayer& sound,
               NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd, int client_fd);

    // Engine worker signalled through the notify callback.
    void on_engine_result();

    void on_poll_tick();
    void on_liveness_tick();
    void on_directory_changed();

    void remove_subscriber(int fd);

    PublishedState state() const { return engine_.current(); }

    void shutdown();

private:
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_sessions(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_subscribe(const nlohmann::json& cmd, int client_fd);

    void on_publish(const PublishedState& state);
    void on_sound(const std::string& sound_id);
    void on_transition(const TransitionEvent& event, const Session& session);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    IpcServer& ipc_;
    SoundPlayer& sound_;

    StatusEngine engine_;
    HistoryDb history_db_;

    std::vector<int> subscribers_;

    static constexpr int kPruneEvery = 100;
    int inserts_since_prune_ = 0;
};
