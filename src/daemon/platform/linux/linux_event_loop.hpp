#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/command_sound_player.hpp"
#include "platform/linux/inotify_watcher.hpp"
#include "platform/linux/procfs_detector.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <chrono>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    static int make_timer(std::chrono::milliseconds interval);
    // Reads an eventfd/timerfd counter. False if nothing was pending.
    static bool drain_counter(int fd);
    void handle_client(int fd);
    void drop_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    ProcfsDetector detector_;
    UnixSocketServer ipc_server_;
    CommandSoundPlayer sound_player_;
    InotifyWatcher watcher_;

    // Portable business logic
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int poll_timer_fd_ = -1;
    int liveness_timer_fd_ = -1;

    std::atomic<bool> running_{false};
};
