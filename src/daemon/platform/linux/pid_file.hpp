#pragma once

#include <expected>
#include <string>

// Single-instance guard. A file naming a process that no longer exists is
// taken over.
class PidFile {
public:
    explicit PidFile(std::string path);
    ~PidFile();

    PidFile(const PidFile&) = delete;
    PidFile& operator=(const PidFile&) = delete;

    std::expected<void, std::string> acquire();
    void release();

    bool acquired() const { return acquired_; }
    const std::string& path() const { return path_; }

    // Pid recorded in the file, 0 if missing or unreadable.
    static int read_pid(const std::string& path);

private:
    std::string path_;
    bool acquired_ = false;
};
