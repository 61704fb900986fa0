#pragma once

#include "platform/dir_watcher.hpp"

#include <string>

class InotifyWatcher : public DirWatcher {
public:
    InotifyWatcher();
    ~InotifyWatcher() override;

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    bool watch(const std::string& directory, const std::string& prefix,
               const std::string& suffix) override;
    int event_fd() const override { return fd_; }
    bool read_events() override;

private:
    bool matches(const std::string& name) const;

    int fd_ = -1;
    int wd_ = -1;
    std::string prefix_;
    std::string suffix_;
};
