#pragma once

#include "aggregator.hpp"
#include "config.hpp"
#include "directory_scanner.hpp"
#include "platform/process_detector.hpp"
#include "session_store.hpp"
#include "transition_detector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

enum class CycleTrigger { Timer, DirectoryChange, ProcessStarted };

struct PublishedState {
    AggregateStatus aggregate = AggregateStatus::NotRunning;
    std::vector<Session> sessions; // sorted by project, then id
    size_t active_session_count = 0;
    bool agent_running = false;

    bool operator==(const PublishedState&) const = default;
};

// Runs scan -> transition detection -> aggregation cycles on a background
// thread and publishes the result on the consumer thread. The consumer is
// whoever calls on_cycle_complete() after the notify callback fires.
class StatusEngine {
public:
    using Clock = std::function<TimePoint()>;
    using NotifyCallback = std::function<void()>;
    using PublishCallback = std::function<void(const PublishedState&)>;
    using SoundCallback = std::function<void(const std::string& sound_id)>;
    using TransitionCallback = std::function<void(const TransitionEvent&, const Session&)>;

    struct Listeners {
        PublishCallback on_publish;
        SoundCallback on_sound;
        TransitionCallback on_transition;
    };

    StatusEngine(Config config, bool verbose, ProcessDetector& detector,
                 NotifyCallback notify, Clock clock = system_now);
    ~StatusEngine();

    StatusEngine(const StatusEngine&) = delete;
    StatusEngine& operator=(const StatusEngine&) = delete;

    // Must be called before start().
    void set_listeners(Listeners listeners);

    void start();
    // Idempotent. No listener fires once this returns.
    void stop();
    bool running() const;

    // Thread-safe. DirectoryChange requests are debounced, the others run
    // as soon as the worker is free.
    void request_cycle(CycleTrigger trigger);
    void request_liveness_check();

    // Consumer thread: publish everything the worker finished.
    void on_cycle_complete();

    // Runs one cycle on the calling thread and publishes it.
    void run_cycle();
    void check_liveness();

    PublishedState current() const;
    int last_error_count() const { return last_error_count_.load(std::memory_order_relaxed); }
    uint64_t cycles_run() const { return cycles_run_.load(std::memory_order_relaxed); }

    static TimePoint system_now();

private:
    struct WorkResult {
        enum class Kind { Cycle, Liveness } kind = Kind::Cycle;
        uint64_t seq = 0;
        PublishedState state;
        Transitions transitions;
        int error_count = 0;
        bool agent_running = false;
        bool no_sessions = false;
    };

    void worker_loop(std::stop_token st);
    std::optional<WorkResult> run_cycle_body();
    WorkResult run_liveness_body();
    void push_result(WorkResult result);

    void apply(const WorkResult& result);
    void apply_cycle(const WorkResult& result);
    void apply_liveness(const WorkResult& result);
    void publish_if_changed(PublishedState next);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    ProcessDetector& detector_;
    NotifyCallback notify_;
    Clock clock_;
    Listeners listeners_;

    ScanOptions scan_options_;
    SoundIds sounds_;
    DirectoryScanner scanner_;

    // Only touched inside a cycle body (cycle_mutex_ held).
    std::mutex cycle_mutex_;
    SessionStore store_;
    StatusMap previous_statuses_;
    uint64_t next_seq_ = 0;

    // Pending work and finished results, shared with the worker.
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    bool started_ = false;
    bool stopped_ = false;
    bool cycle_pending_ = false;
    bool liveness_pending_ = false;
    std::chrono::steady_clock::time_point cycle_due_;
    std::deque<WorkResult> completed_;

    // Consumer side.
    std::mutex apply_mutex_;
    uint64_t applied_seq_ = 0;
    bool agent_running_ = false;
    bool has_published_ = false;
    int logged_error_count_ = 0;

    mutable std::mutex state_mutex_;
    PublishedState published_;

    std::atomic<int> last_error_count_{0};
    std::atomic<uint64_t> cycles_run_{0};

    std::jthread worker_;
};
