#pragma once

#include <string>

struct DetectionResult {
    std::string agent;
    int pid = 0;

    bool found() const { return pid > 0; }
};

class ProcessDetector {
public:
    virtual ~ProcessDetector() = default;

    // False for pid <= 0 and for processes that exited (zombies included).
    virtual bool is_alive(int pid) const = 0;

    // First running process whose name matches a known agent.
    virtual DetectionResult find_agent() const = 0;
};
