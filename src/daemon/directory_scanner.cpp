#include "directory_scanner.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <print>

namespace fs = std::filesystem;

DirectoryScanner::DirectoryScanner(const ProcessDetector& detector)
    : detector_(detector) {}

bool DirectoryScanner::matches(const std::string& filename, const ScanOptions& options) const {
    return filename.size() >= options.prefix.size() + options.suffix.size() &&
           filename.starts_with(options.prefix) &&
           filename.ends_with(options.suffix);
}

ScanResult DirectoryScanner::scan(const ScanOptions& options, TimePoint now) const {
    ScanResult result;

    std::error_code ec;
    fs::directory_iterator it(options.directory, ec);
    if (ec) {
        result.error_count = 1;
        return result;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            result.error_count++;
            break;
        }

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        auto name = it->path().filename().string();
        if (!matches(name, options)) continue;

        auto path = it->path().string();
        std::string bytes;
        if (!read_file(path, bytes)) {
            result.error_count++;
            continue;
        }

        // Writer is probably mid-write; look again next cycle.
        if (bytes.empty()) continue;

        auto record = status_record::decode(bytes, now);
        if (!record) {
            result.error_count++;
            continue;
        }

        if (record->owner_pid && *record->owner_pid > 0 &&
            !detector_.is_alive(*record->owner_pid)) {
            remove_file(path);
            continue;
        }

        if (now - record->timestamp >= options.session_timeout) {
            remove_file(path);
            continue;
        }

        result.sessions.emplace(name, make_session(name, *record));
    }

    return result;
}

bool DirectoryScanner::read_file(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return !f.bad();
}

void DirectoryScanner::remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::println(stderr, "scanner: could not remove {}: {}", path, ec.message());
    }
}
