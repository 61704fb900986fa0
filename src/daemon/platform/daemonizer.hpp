#pragma once

#include <expected>
#include <string>

namespace platform {

// Detach from the terminal. Returns in the grandchild only; an error means
// the first fork failed and nothing was detached.
std::expected<void, std::string> daemonize();

} // namespace platform
