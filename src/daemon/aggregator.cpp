#include "aggregator.hpp"

AggregateStatus aggregate(const SessionMap& sessions) {
    bool any_working = false;
    bool any_idle = false;

    for (const auto& [id, session] : sessions) {
        switch (session.status) {
            case SessionStatus::NeedsInput:
                return AggregateStatus::NeedsInput;
            case SessionStatus::Working:
                any_working = true;
                break;
            case SessionStatus::Idle:
                any_idle = true;
                break;
        }
    }

    if (any_working) return AggregateStatus::Working;
    if (any_idle) return AggregateStatus::Idle;
    return AggregateStatus::NotRunning;
}

const char* to_string(AggregateStatus status) {
    switch (status) {
        case AggregateStatus::Working: return "working";
        case AggregateStatus::Idle: return "idle";
        case AggregateStatus::NeedsInput: return "needs_input";
        case AggregateStatus::NotRunning: return "not_running";
    }
    return "not_running";
}

const char* status_text(AggregateStatus status) {
    switch (status) {
        case AggregateStatus::Working: return "Working...";
        case AggregateStatus::Idle: return "Ready";
        case AggregateStatus::NeedsInput: return "Input needed";
        case AggregateStatus::NotRunning: return "Not running";
    }
    return "Not running";
}
