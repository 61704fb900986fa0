#include <catch2/catch_test_macros.hpp>

#include "platform/linux/procfs_detector.hpp"

#include <chrono>
#include <csignal>
#include <fstream>
#include <string>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

std::string own_comm() {
    std::ifstream f("/proc/self/comm");
    std::string comm;
    std::getline(f, comm);
    return comm;
}

// Forked child that renames itself and sleeps until killed.
struct NamedChild {
    pid_t pid = -1;

    explicit NamedChild(const std::string& name) {
        pid = ::fork();
        if (pid == 0) {
            ::prctl(PR_SET_NAME, name.c_str(), 0, 0, 0);
            while (true) ::pause();
        }
    }

    ~NamedChild() {
        if (pid > 0) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
        }
    }
};

} // namespace

TEST_CASE("ProcfsDetector", "[detector]") {

    SECTION("SelfIsAlive") {
        ProcfsDetector detector({});
        REQUIRE(detector.is_alive(static_cast<int>(::getpid())));
    }

    SECTION("NonPositivePidIsNotAlive") {
        ProcfsDetector detector({});
        REQUIRE_FALSE(detector.is_alive(0));
        REQUIRE_FALSE(detector.is_alive(-1));
    }

    SECTION("ReapedChildIsNotAlive") {
        ProcfsDetector detector({});
        pid_t pid = ::fork();
        if (pid == 0) ::_exit(0);
        REQUIRE(pid > 0);
        REQUIRE(::waitpid(pid, nullptr, 0) == pid);
        REQUIRE_FALSE(detector.is_alive(static_cast<int>(pid)));
    }

    SECTION("ZombieChildIsNotAlive") {
        ProcfsDetector detector({});
        pid_t pid = ::fork();
        if (pid == 0) ::_exit(0);
        REQUIRE(pid > 0);

        siginfo_t info{};
        REQUIRE(::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) == 0);
        REQUIRE_FALSE(detector.is_alive(static_cast<int>(pid)));
        ::waitpid(pid, nullptr, 0);
    }

    SECTION("FindsAgentByProcessName") {
        std::string name = "vsagent" + std::to_string(::getpid() % 100000);
        NamedChild child(name);
        REQUIRE(child.pid > 0);

        ProcfsDetector detector({name});
        DetectionResult result;
        for (int i = 0; i < 200 && !result.found(); ++i) {
            result = detector.find_agent();
            if (!result.found()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        REQUIRE(result.found());
        REQUIRE(result.pid == child.pid);
        REQUIRE(result.agent == name);
    }

    SECTION("NoAgentsConfigured") {
        ProcfsDetector detector({});
        REQUIRE_FALSE(detector.find_agent().found());
    }

    SECTION("UnknownAgentNotFound") {
        ProcfsDetector detector({"vs-no-such-proc"});
        REQUIRE_FALSE(detector.find_agent().found());
    }

    SECTION("AncestorIncludesSelf") {
        auto comm = own_comm();
        REQUIRE_FALSE(comm.empty());

        ProcfsDetector detector({comm});
        auto result = detector.find_agent_ancestor(static_cast<int>(::getpid()));
        REQUIRE(result.found());
        REQUIRE(result.pid == ::getpid());
    }

    SECTION("AncestorWalksUpFromChild") {
        auto comm = own_comm();
        NamedChild child("vs-child-proc");
        REQUIRE(child.pid > 0);

        ProcfsDetector detector({comm});
        auto result = detector.find_agent_ancestor(static_cast<int>(child.pid));
        REQUIRE(result.found());
        // The child may not have renamed itself yet, in which case it still
        // carries our name.
        REQUIRE((result.pid == ::getpid() || result.pid == child.pid));
    }
}
