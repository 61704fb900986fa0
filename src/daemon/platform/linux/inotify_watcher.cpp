#include "platform/linux/inotify_watcher.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/inotify.h>
#include <unistd.h>

InotifyWatcher::InotifyWatcher() = default;

InotifyWatcher::~InotifyWatcher() {
    if (fd_ >= 0) ::close(fd_);
}

bool InotifyWatcher::watch(const std::string& directory, const std::string& prefix,
                           const std::string& suffix) {
    prefix_ = prefix;
    suffix_ = suffix;

    if (fd_ < 0) {
        fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (fd_ < 0) {
            std::println(stderr, "watch: inotify_init1 failed: {}", std::strerror(errno));
            return false;
        }
    }

    // Hook scripts often write with `>` (modify) or via rename (moved_to).
    uint32_t mask = IN_CREATE | IN_CLOSE_WRITE | IN_MODIFY | IN_MOVED_TO |
                    IN_MOVED_FROM | IN_DELETE;
    wd_ = ::inotify_add_watch(fd_, directory.c_str(), mask);
    if (wd_ < 0) {
        std::println(stderr, "watch: cannot watch {}: {}", directory, std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    return true;
}

bool InotifyWatcher::read_events() {
    if (fd_ < 0) return false;

    alignas(inotify_event) char buf[4096];
    bool relevant = false;

    while (true) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break; // EAGAIN: drained
        }
        if (n == 0) break;

        for (ssize_t off = 0; off < n;) {
            auto* ev = reinterpret_cast<const inotify_event*>(buf + off);
            if (ev->mask & IN_Q_OVERFLOW) {
                relevant = true;
            } else if (ev->len > 0 && matches(ev->name)) {
                relevant = true;
            }
            off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
        }
    }

    return relevant;
}

bool InotifyWatcher::matches(const std::string& name) const {
    return name.size() >= prefix_.size() + suffix_.size() &&
           name.starts_with(prefix_) && name.ends_with(suffix_);
}
