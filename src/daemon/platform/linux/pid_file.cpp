#include "platform/linux/pid_file.hpp"

#include <cerrno>
#include <filesystem>
#include <format>
#include <fstream>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

PidFile::PidFile(std::string path) : path_(std::move(path)) {}

PidFile::~PidFile() {
    release();
}

int PidFile::read_pid(const std::string& path) {
    std::ifstream in(path);
    int pid = 0;
    if (!(in >> pid)) return 0;
    return pid;
}

std::expected<void, std::string> PidFile::acquire() {
    if (acquired_) return {};

    std::error_code ec;
    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(std::format("cannot create {}: {}", parent.string(), ec.message()));
    }

    int existing = read_pid(path_);
    if (existing > 0 && existing != ::getpid() &&
        (::kill(existing, 0) == 0 || errno == EPERM)) {
        return std::unexpected(std::format("already running with pid {}", existing));
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        return std::unexpected("cannot write " + path_);
    }
    out << ::getpid() << '\n';
    if (!out.flush()) {
        return std::unexpected("cannot write " + path_);
    }

    acquired_ = true;
    return {};
}

void PidFile::release() {
    if (!acquired_) return;

    // Only remove what we wrote; a successor may already own the file.
    if (read_pid(path_) == ::getpid()) {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    acquired_ = false;
}
