#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace platform {

namespace {

constexpr const char* kAppName = "vibestatus";

// $<xdg_var>/vibestatus, else $HOME/<home_relative>/vibestatus.
std::string xdg_path(const char* xdg_var, const char* home_relative) {
    if (const char* xdg = std::getenv(xdg_var); xdg && *xdg) {
        return std::string(xdg) + "/" + kAppName;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/" + home_relative + "/" + kAppName;
}

} // namespace

std::string config_dir() {
    return xdg_path("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_path("XDG_DATA_HOME", ".local/share");
}

std::string runtime_dir() {
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) return xdg;
    return "/tmp";
}

std::string ipc_endpoint() {
    auto dir = runtime_dir();
    // /tmp is shared between users, so the uid keeps sockets apart.
    if (dir == "/tmp") return std::string("/tmp/") + kAppName + "-" + std::to_string(::getuid()) + ".sock";
    return dir + "/" + kAppName + ".sock";
}

std::string pid_file() {
    auto dir = runtime_dir();
    if (dir == "/tmp") return std::string("/tmp/") + kAppName + "-" + std::to_string(::getuid()) + ".pid";
    return dir + "/" + kAppName + ".pid";
}

} // namespace platform
