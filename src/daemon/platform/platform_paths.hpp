#pragma once

#include <string>

namespace platform {

// Per-user configuration directory, empty if it cannot be determined.
std::string config_dir();

// Per-user data directory (transition history).
std::string data_dir();

// Volatile per-user directory for the socket and pid file. Falls back to /tmp.
std::string runtime_dir();

// Socket path the daemon listens on.
std::string ipc_endpoint();

std::string pid_file();

} // namespace platform
