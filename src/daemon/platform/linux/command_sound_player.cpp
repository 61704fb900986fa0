#include "platform/linux/command_sound_player.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/wait.h>
#include <unistd.h>

CommandSoundPlayer::CommandSoundPlayer(std::string player)
    : player_(std::move(player)) {}

std::expected<void, std::string> CommandSoundPlayer::play(const std::string& sound_id) {
    if (player_.empty()) {
        std::println(stderr, "sound: {} (no player configured)", sound_id);
        return {};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Fork again so the player is reparented and we never wait on it.
        pid_t grandchild = ::fork();
        if (grandchild != 0) ::_exit(grandchild < 0 ? 1 : 0);

        ::setsid();
        ::execlp(player_.c_str(), player_.c_str(), sound_id.c_str(), nullptr);
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected("could not start " + player_);
    }

    return {};
}
