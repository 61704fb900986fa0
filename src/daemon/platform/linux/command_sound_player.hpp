#pragma once

#include "platform/sound_player.hpp"

#include <string>

// Runs `<player> <sound-id>` detached. An empty player only logs.
class CommandSoundPlayer : public SoundPlayer {
public:
    explicit CommandSoundPlayer(std::string player);

    std::expected<void, std::string> play(const std::string& sound_id) override;

private:
    std::string player_;
};
