#pragma once

#include <expected>
#include <string>

class SoundPlayer {
public:
    virtual ~SoundPlayer() = default;
    // Starts playback and returns without waiting for it to finish.
    virtual std::expected<void, std::string> play(const std::string& sound_id) = 0;
};
