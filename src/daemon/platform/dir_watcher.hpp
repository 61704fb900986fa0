#pragma once

#include <string>

// Approximate change notifications for one directory.
class DirWatcher {
public:
    virtual ~DirWatcher() = default;
    virtual bool watch(const std::string& directory, const std::string& prefix,
                       const std::string& suffix) = 0;
    virtual int event_fd() const = 0;
    // Drains pending events. True if any of them touched a matching file.
    virtual bool read_events() = 0;
};
