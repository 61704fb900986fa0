#pragma once

#include "session_store.hpp"

#include <optional>
#include <string>
#include <vector>

struct TransitionEvent {
    std::string session_id;
    SessionStatus from;
    SessionStatus to;
};

struct Transitions {
    bool play_idle_sound = false;
    bool play_needs_input_sound = false;
    // Every status change of a session seen in both maps, sounding or not.
    std::vector<TransitionEvent> events;
};

struct SoundIds {
    std::string on_idle;
    std::string on_needs_input;
};

// Sounds fire only when a session leaves `working`. Sessions missing from
// `previous` never trigger.
Transitions detect_transitions(const StatusMap& previous, const StatusMap& current);

// Sound a single event would trigger on its own, if any.
std::optional<std::string> sound_for(const TransitionEvent& event, const SoundIds& sounds);

// At most one sound per cycle; needs_input wins over idle.
std::optional<std::string> requested_sound(const Transitions& transitions, const SoundIds& sounds);
