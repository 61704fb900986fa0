#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      detector_(config_.agents),
      sound_player_(config_.sound.player),
      core_(config_, verbose_, detector_, ipc_server_, sound_player_,
            // NotifyCallback, called from the engine worker thread
            [this]() {
                uint64_t val = 1;
                ::write(worker_event_fd_, &val, sizeof(val));
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (poll_timer_fd_ >= 0) ::close(poll_timer_fd_);
    if (liveness_timer_fd_ >= 0) ::close(liveness_timer_fd_);
}

bool LinuxEventLoop::drain_counter(int fd) {
    uint64_t count;
    return ::read(fd, &count, sizeof(count)) == static_cast<ssize_t>(sizeof(count));
}

int LinuxEventLoop::make_timer(std::chrono::milliseconds interval) {
    int fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) return -1;

    auto secs = std::chrono::duration_cast<std::chrono::seconds>(interval);
    auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(interval - secs);
    timespec ts{.tv_sec = static_cast<time_t>(secs.count()), .tv_nsec = static_cast<long>(nsecs.count())};
    itimerspec spec{.it_interval = ts, .it_value = ts};
    if (timerfd_settime(fd, 0, &spec, nullptr) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool LinuxEventLoop::init() {
    // Worker notification eventfd; must exist before the engine starts.
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Directory watch is optional; the poll timer covers for it.
    if (watcher_.watch(config_.watch.directory, config_.watch.prefix, config_.watch.suffix)) {
        log("Watching " + config_.watch.directory);
    } else {
        log("Directory watch unavailable, polling only");
    }

    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    poll_timer_fd_ = make_timer(config_.timing.poll_interval());
    liveness_timer_fd_ = make_timer(config_.timing.liveness_interval());
    if (poll_timer_fd_ < 0 || liveness_timer_fd_ < 0) {
        std::println(stderr, "timerfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    for (int fd : {signal_fd_, ipc_server_.server_fd(), worker_event_fd_,
                   poll_timer_fd_, liveness_timer_fd_}) {
        if (!add_fd(fd, EPOLLIN)) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
    }

    if (watcher_.event_fd() >= 0 && !add_fd(watcher_.event_fd(), EPOLLIN)) {
        log("Directory watch could not be registered, polling only");
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info{};
                if (::read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == poll_timer_fd_ || fd == liveness_timer_fd_) {
                // Missed expirations collapse into one tick.
                if (!drain_counter(fd)) continue;
                if (fd == poll_timer_fd_) core_.on_poll_tick();
                else core_.on_liveness_tick();
                continue;
            }

            if (fd == worker_event_fd_) {
                drain_counter(worker_event_fd_);
                core_.on_engine_result();
                continue;
            }

            if (fd == watcher_.event_fd()) {
                if (watcher_.read_events()) {
                    core_.on_directory_changed();
                }
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd;
                while ((client_fd = ipc_server_.accept_client()) >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            handle_client(fd);
        }
    }

    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    nlohmann::json cmd;
    while (ipc_server_.read_command(fd, cmd)) {
        std::string cmd_str = cmd.value("cmd", "");
        auto response = core_.handle_command(cmd_str, cmd, fd);
        if (!ipc_server_.send_response(fd, response)) {
            drop_client(fd);
            return;
        }
    }

    if (!ipc_server_.is_connected(fd)) {
        drop_client(fd);
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_subscriber(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[vibestatus] {}", msg);
    }
}
