#include "status_engine.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <print>
#include <tuple>
#include <utility>

StatusEngine::StatusEngine(Config config, bool verbose, ProcessDetector& detector,
                           NotifyCallback notify, Clock clock)
    : config_(std::move(config)), verbose_(verbose),
      detector_(detector),
      notify_(std::move(notify)),
      clock_(std::move(clock)),
      scan_options_{
          .directory = config_.watch.directory,
          .prefix = config_.watch.prefix,
          .suffix = config_.watch.suffix,
          .session_timeout = config_.timing.session_timeout(),
      },
      sounds_{config_.sound.on_idle, config_.sound.on_needs_input},
      scanner_(detector_) {}

StatusEngine::~StatusEngine() {
    stop();
}

TimePoint StatusEngine::system_now() {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

void StatusEngine::set_listeners(Listeners listeners) {
    listeners_ = std::move(listeners);
}

void StatusEngine::start() {
    {
        std::lock_guard lock(mutex_);
        if (started_ && !stopped_) return;
        started_ = true;
        stopped_ = false;
        cycle_pending_ = false;
        liveness_pending_ = false;
        completed_.clear();
    }

    worker_ = std::jthread([this](std::stop_token st) { worker_loop(st); });
    log(std::format("Engine started, watching {}/{}*{}",
                    scan_options_.directory, scan_options_.prefix, scan_options_.suffix));
}

void StatusEngine::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        cycle_pending_ = false;
        liveness_pending_ = false;
    }

    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }

    // Waits out an apply() that is already delivering.
    std::lock_guard apply_lock(apply_mutex_);
    std::lock_guard lock(mutex_);
    completed_.clear();
}

bool StatusEngine::running() const {
    std::lock_guard lock(mutex_);
    return started_ && !stopped_;
}

void StatusEngine::request_cycle(CycleTrigger trigger) {
    {
        std::lock_guard lock(mutex_);
        if (!started_ || stopped_) return;

        auto now = std::chrono::steady_clock::now();
        if (trigger == CycleTrigger::DirectoryChange) {
            // Coalesce into whatever is already pending.
            if (!cycle_pending_) {
                cycle_pending_ = true;
                cycle_due_ = now + config_.timing.debounce();
            }
        } else {
            if (!cycle_pending_ || cycle_due_ > now) cycle_due_ = now;
            cycle_pending_ = true;
        }
    }
    cv_.notify_one();
}

void StatusEngine::request_liveness_check() {
    {
        std::lock_guard lock(mutex_);
        if (!started_ || stopped_) return;
        liveness_pending_ = true;
    }
    cv_.notify_one();
}

void StatusEngine::worker_loop(std::stop_token st) {
    while (!st.stop_requested()) {
        bool do_cycle = false;
        bool do_liveness = false;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, st, [this] { return cycle_pending_ || liveness_pending_; });
            if (st.stop_requested()) return;

            if (cycle_pending_ && !liveness_pending_) {
                auto due = cycle_due_;
                cv_.wait_until(lock, st, due, [this] {
                    return liveness_pending_ || !cycle_pending_ ||
                           std::chrono::steady_clock::now() >= cycle_due_;
                });
                if (st.stop_requested()) return;
            }

            do_liveness = std::exchange(liveness_pending_, false);
            if (cycle_pending_ && std::chrono::steady_clock::now() >= cycle_due_) {
                cycle_pending_ = false;
                do_cycle = true;
            }
        }

        if (do_liveness) {
            push_result(run_liveness_body());
        }
        if (do_cycle) {
            if (auto result = run_cycle_body()) {
                push_result(std::move(*result));
            }
        }
    }
}

std::optional<StatusEngine::WorkResult> StatusEngine::run_cycle_body() {
    std::lock_guard lock(cycle_mutex_);

    try {
        auto now = clock_();
        auto scan = scanner_.scan(scan_options_, now);

        StatusMap current;
        for (const auto& [id, session] : scan.sessions) {
            current.emplace(id, session.status);
        }

        WorkResult result;
        result.kind = WorkResult::Kind::Cycle;
        result.transitions = detect_transitions(previous_statuses_, current);
        result.state.aggregate = aggregate(scan.sessions);
        result.error_count = scan.error_count;

        store_.replace(std::move(scan.sessions));
        previous_statuses_ = std::move(current);

        auto snapshot = store_.snapshot();
        result.state.sessions.reserve(snapshot->size());
        for (const auto& [id, session] : *snapshot) {
            result.state.sessions.push_back(session);
        }
        std::ranges::sort(result.state.sessions, [](const Session& a, const Session& b) {
            return std::tie(a.project, a.id) < std::tie(b.project, b.id);
        });
        result.state.active_session_count = result.state.sessions.size();

        result.seq = ++next_seq_;
        last_error_count_.store(scan.error_count, std::memory_order_relaxed);
        cycles_run_.fetch_add(1, std::memory_order_relaxed);
        return result;
    } catch (const std::exception& e) {
        std::println(stderr, "engine: cycle skipped: {}", e.what());
        return std::nullopt;
    }
}

StatusEngine::WorkResult StatusEngine::run_liveness_body() {
    WorkResult result;
    result.kind = WorkResult::Kind::Liveness;

    auto agent = detector_.find_agent();
    result.agent_running = agent.found();

    std::lock_guard lock(cycle_mutex_);
    store_.expire(clock_(), scan_options_.session_timeout);
    result.no_sessions = store_.empty();
    result.seq = ++next_seq_;
    return result;
}

void StatusEngine::push_result(WorkResult result) {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        completed_.push_back(std::move(result));
    }
    if (notify_) notify_();
}

void StatusEngine::on_cycle_complete() {
    std::lock_guard apply_lock(apply_mutex_);

    std::deque<WorkResult> ready;
    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            completed_.clear();
            return;
        }
        ready.swap(completed_);
    }

    for (const auto& result : ready) {
        apply(result);
    }
}

void StatusEngine::run_cycle() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
    }

    auto result = run_cycle_body();
    if (!result) return;

    std::lock_guard apply_lock(apply_mutex_);
    apply(*result);
}

void StatusEngine::check_liveness() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
    }

    auto result = run_liveness_body();

    std::lock_guard apply_lock(apply_mutex_);
    apply(result);
}

void StatusEngine::apply(const WorkResult& result) {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
    }

    // A later cycle already published; this one carries older data.
    if (result.seq <= applied_seq_) return;
    applied_seq_ = result.seq;

    if (result.kind == WorkResult::Kind::Cycle) {
        apply_cycle(result);
    } else {
        apply_liveness(result);
    }
}

void StatusEngine::apply_cycle(const WorkResult& result) {
    if (result.error_count != logged_error_count_) {
        log(std::format("Scan reported {} error(s)", result.error_count));
        logged_error_count_ = result.error_count;
    }

    PublishedState next = result.state;
    next.agent_running = agent_running_;
    publish_if_changed(std::move(next));

    if (listeners_.on_transition) {
        for (const auto& event : result.transitions.events) {
            auto it = std::ranges::find(result.state.sessions, event.session_id, &Session::id);
            if (it != result.state.sessions.end()) {
                listeners_.on_transition(event, *it);
            }
        }
    }

    if (!config_.sound.enabled || !listeners_.on_sound) return;

    auto sound = requested_sound(result.transitions, sounds_);
    if (sound && !sound->empty()) {
        log("Requesting sound " + *sound);
        listeners_.on_sound(*sound);
    }
}

void StatusEngine::apply_liveness(const WorkResult& result) {
    bool was_running = agent_running_;
    agent_running_ = result.agent_running;

    if (agent_running_ != was_running) {
        log(agent_running_ ? "Agent process detected" : "No agent process running");
    }

    PublishedState next = current();
    next.agent_running = agent_running_;
    if (!agent_running_ && result.no_sessions) {
        next.aggregate = AggregateStatus::NotRunning;
        next.sessions.clear();
        next.active_session_count = 0;
    }
    publish_if_changed(next);

    if (agent_running_ && !was_running && next.aggregate == AggregateStatus::NotRunning) {
        request_cycle(CycleTrigger::ProcessStarted);
    }
}

void StatusEngine::publish_if_changed(PublishedState next) {
    {
        std::lock_guard lock(state_mutex_);
        if (has_published_ && next == published_) return;
        published_ = next;
        has_published_ = true;
    }

    log(std::format("Status: {} ({} session{})", to_string(next.aggregate),
                    next.active_session_count, next.active_session_count == 1 ? "" : "s"));

    if (listeners_.on_publish) {
        listeners_.on_publish(next);
    }
}

PublishedState StatusEngine::current() const {
    std::lock_guard lock(state_mutex_);
    return published_;
}

void StatusEngine::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[vibestatus] {}", msg);
    }
}
