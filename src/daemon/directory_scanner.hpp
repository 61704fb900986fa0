#pragma once

#include "platform/process_detector.hpp"
#include "session_store.hpp"

#include <chrono>
#include <string>

struct ScanOptions {
    std::string directory;
    std::string prefix;
    std::string suffix;
    std::chrono::seconds session_timeout{300};
};

struct ScanResult {
    SessionMap sessions;
    int error_count = 0;
};

// Reads every <prefix>*<suffix> file in the shared directory. Files whose
// owner died or whose timestamp is older than the timeout are deleted.
class DirectoryScanner {
public:
    explicit DirectoryScanner(const ProcessDetector& detector);

    ScanResult scan(const ScanOptions& options, TimePoint now) const;

    bool matches(const std::string& filename, const ScanOptions& options) const;

private:
    static bool read_file(const std::string& path, std::string& out);
    static void remove_file(const std::string& path);

    const ProcessDetector& detector_;
};
