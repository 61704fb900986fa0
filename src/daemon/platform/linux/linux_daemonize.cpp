#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

std::expected<void, std::string> daemonize() {
    pid_t pid = ::fork();
    if (pid < 0) return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    if (pid > 0) ::_exit(0);

    // From here on there is nobody left to report to.
    if (::setsid() < 0) ::_exit(1);

    pid = ::fork();
    if (pid < 0) ::_exit(1);
    if (pid > 0) ::_exit(0);

    ::umask(077);
    if (::chdir("/") < 0) ::_exit(1);

    if (!std::freopen("/dev/null", "r", stdin) ||
        !std::freopen("/dev/null", "w", stdout) ||
        !std::freopen("/dev/null", "w", stderr)) {
        ::_exit(1);
    }
    return {};
}

} // namespace platform
