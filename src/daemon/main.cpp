#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/pid_file.hpp"
#include "platform/platform_paths.hpp"

#include <expected>
#include <print>
#include <string>

namespace {

constexpr const char* kVersion = "0.1.0";

struct Options {
    bool foreground = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
    std::string config_path;
    std::string directory;
};

void usage() {
    std::println("Usage: vibestatusd [options]");
    std::println("Options:");
    std::println("  -f, --foreground    Run in foreground (don't daemonize)");
    std::println("  -v, --verbose       Log cycles, transitions and sounds to stderr");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -d, --dir DIR       Watch DIR instead of the configured directory");
    std::println("      --version       Print the version");
    std::println("  -h, --help          Show this help");
}

std::expected<Options, std::string> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= argc) return std::unexpected(arg + " needs a value");
            return std::string(argv[++i]);
        };

        if (arg == "--foreground" || arg == "-f") {
            opts.foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.config_path = *v;
        } else if (arg == "--dir" || arg == "-d") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.directory = *v;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            return std::unexpected("unknown option: " + arg);
        }
    }
    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        std::println(stderr, "vibestatusd: {}", opts.error());
        usage();
        return 1;
    }
    if (opts->help) {
        usage();
        return 0;
    }
    if (opts->version) {
        std::println("vibestatusd {}", kVersion);
        return 0;
    }

    Config config = opts->config_path.empty() ? Config::load_default()
                                              : Config::load(opts->config_path);
    if (!opts->directory.empty()) config.watch.directory = opts->directory;
    config.resolve_paths();

    if (!opts->foreground) {
        if (auto res = platform::daemonize(); !res) {
            std::println(stderr, "vibestatusd: {}", res.error());
            return 1;
        }
    }

    // After daemonize(), so the file names the process that keeps running.
    PidFile pid_file(platform::pid_file());
    if (auto res = pid_file.acquire(); !res) {
        std::println(stderr, "vibestatusd: {}", res.error());
        return 1;
    }

    if (opts->verbose) {
        std::println(stderr, "[vibestatus] Starting (watching {}/{}*{}, timeout {}s)",
                     config.watch.directory, config.watch.prefix, config.watch.suffix,
                     config.timing.session_timeout_s);
    }

    LinuxEventLoop loop(std::move(config), opts->verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
