#pragma once

#include "platform/process_detector.hpp"

#include <string>
#include <vector>

class ProcfsDetector : public ProcessDetector {
public:
    explicit ProcfsDetector(std::vector<std::string> known_agents);

    bool is_alive(int pid) const override;
    DetectionResult find_agent() const override;

    // Nearest ancestor of `pid` (itself included) that is a known agent.
    DetectionResult find_agent_ancestor(int pid) const;

private:
    static std::string read_comm(int pid);
    // Single-letter state from /proc/{pid}/stat, '\0' if unreadable.
    static char read_state(int pid);
    static int read_ppid(int pid);
    bool is_agent(const std::string& comm, std::string& agent) const;
    static std::vector<int> list_pids();

    std::vector<std::string> known_agents_;
};
