#include "transition_detector.hpp"

Transitions detect_transitions(const StatusMap& previous, const StatusMap& current) {
    Transitions result;

    for (const auto& [id, status] : current) {
        auto it = previous.find(id);
        if (it == previous.end()) continue;

        SessionStatus before = it->second;
        if (before == status) continue;

        result.events.push_back({id, before, status});

        if (before != SessionStatus::Working) continue;
        if (status == SessionStatus::NeedsInput) {
            result.play_needs_input_sound = true;
        } else if (status == SessionStatus::Idle) {
            result.play_idle_sound = true;
        }
    }

    return result;
}

std::optional<std::string> requested_sound(const Transitions& transitions, const SoundIds& sounds) {
    if (transitions.play_needs_input_sound) return sounds.on_needs_input;
    if (transitions.play_idle_sound) return sounds.on_idle;
    return std::nullopt;
}

std::optional<std::string> sound_for(const TransitionEvent& event, const SoundIds& sounds) {
    if (event.from != SessionStatus::Working) return std::nullopt;
    if (event.to == SessionStatus::NeedsInput) return sounds.on_needs_input;
    if (event.to == SessionStatus::Idle) return sounds.on_idle;
    return std::nullopt;
}
