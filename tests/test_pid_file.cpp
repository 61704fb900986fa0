#include <catch2/catch_test_macros.hpp>

#include "platform/linux/pid_file.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct TmpPath {
    std::string path;

    TmpPath() {
        path = (fs::temp_directory_path() / ("vs_test_pid_" + std::to_string(getpid())) / "d.pid").string();
        fs::remove_all(fs::path(path).parent_path());
    }

    ~TmpPath() { fs::remove_all(fs::path(path).parent_path()); }
};

int dead_pid() {
    pid_t pid = ::fork();
    if (pid == 0) ::_exit(0);
    ::waitpid(pid, nullptr, 0);
    return static_cast<int>(pid);
}

} // namespace

TEST_CASE("PidFile", "[pidfile]") {
    TmpPath tmp;

    SECTION("AcquireWritesOwnPid") {
        PidFile pf(tmp.path);
        REQUIRE(pf.acquire());
        REQUIRE(pf.acquired());
        REQUIRE(PidFile::read_pid(tmp.path) == ::getpid());

        // Idempotent.
        REQUIRE(pf.acquire());
    }

    SECTION("ReleaseRemovesFile") {
        {
            PidFile pf(tmp.path);
            REQUIRE(pf.acquire());
        }
        REQUIRE_FALSE(fs::exists(tmp.path));
    }

    SECTION("LiveOwnerBlocks") {
        fs::create_directories(fs::path(tmp.path).parent_path());
        std::ofstream(tmp.path) << ::getppid() << '\n';

        PidFile pf(tmp.path);
        auto res = pf.acquire();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("already running") != std::string::npos);
        REQUIRE_FALSE(pf.acquired());

        // Someone else's file stays put.
        pf.release();
        REQUIRE(fs::exists(tmp.path));
    }

    SECTION("StaleFileTakenOver") {
        fs::create_directories(fs::path(tmp.path).parent_path());
        std::ofstream(tmp.path) << dead_pid() << '\n';

        PidFile pf(tmp.path);
        REQUIRE(pf.acquire());
        REQUIRE(PidFile::read_pid(tmp.path) == ::getpid());
    }

    SECTION("GarbageFileTakenOver") {
        fs::create_directories(fs::path(tmp.path).parent_path());
        std::ofstream(tmp.path) << "not a pid";

        PidFile pf(tmp.path);
        REQUIRE(pf.acquire());
    }
}
