#include "platform/linux/procfs_detector.hpp"

#include <cerrno>
#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

ProcfsDetector::ProcfsDetector(std::vector<std::string> known_agents)
    : known_agents_(std::move(known_agents)) {}

bool ProcfsDetector::is_alive(int pid) const {
    if (pid <= 0) return false;

    if (::kill(pid, 0) != 0 && errno != EPERM) return false;

    // An exited child that nobody reaped still answers kill().
    char state = read_state(pid);
    return state != 'Z' && state != 'X';
}

DetectionResult ProcfsDetector::find_agent() const {
    if (known_agents_.empty()) return {};

    int self = static_cast<int>(::getpid());
    for (int pid : list_pids()) {
        if (pid == self) continue;

        std::string agent;
        if (is_agent(read_comm(pid), agent)) return {agent, pid};
    }
    return {};
}

DetectionResult ProcfsDetector::find_agent_ancestor(int pid) const {
    // Bounded walk; pid 1 has ppid 0.
    for (int depth = 0; pid > 1 && depth < 64; depth++) {
        std::string agent;
        if (is_agent(read_comm(pid), agent)) return {agent, pid};
        pid = read_ppid(pid);
    }
    return {};
}

bool ProcfsDetector::is_agent(const std::string& comm, std::string& agent) const {
    if (comm.empty()) return false;
    for (const auto& known : known_agents_) {
        if (!known.empty() && comm.find(known) != std::string::npos) {
            agent = known;
            return true;
        }
    }
    return false;
}

std::string ProcfsDetector::read_comm(int pid) {
    std::ifstream f(std::format("/proc/{}/comm", pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

char ProcfsDetector::read_state(int pid) {
    std::ifstream f(std::format("/proc/{}/stat", pid));
    if (!f.is_open()) return '\0';
    std::string line;
    std::getline(f, line);

    // "pid (comm) S ..." where comm may itself contain ')'.
    auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size()) return '\0';
    return line[close + 2];
}

int ProcfsDetector::read_ppid(int pid) {
    std::ifstream f(std::format("/proc/{}/stat", pid));
    if (!f.is_open()) return 0;
    std::string line;
    std::getline(f, line);

    auto close = line.rfind(')');
    if (close == std::string::npos) return 0;

    // ") S ppid ..."
    std::istringstream rest(line.substr(close + 1));
    char state = 0;
    int ppid = 0;
    if (!(rest >> state >> ppid)) return 0;
    return ppid;
}

std::vector<int> ProcfsDetector::list_pids() {
    std::vector<int> pids;

    std::error_code ec;
    for (auto& entry : fs::directory_iterator("/proc", ec)) {
        auto name = entry.path().filename().string();
        int pid = 0;
        auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (err != std::errc() || ptr != name.data() + name.size()) continue;
        pids.push_back(pid);
    }

    return pids;
}
