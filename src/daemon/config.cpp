#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Copies obj[key] into out when present. Type mismatches throw json::exception.
template <typename T>
void read_field(const json& obj, const char* key, T& out) {
    if (auto it = obj.find(key); it != obj.end()) {
        out = it->get<T>();
    }
}

// Reads a duration as a signed number so negative input is caught instead
// of wrapping. Values below min (zero would disarm a timer or expire every
// session on sight) keep the default.
void read_interval(const json& obj, const char* key, uint32_t& out, int64_t min) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    auto value = it->get<int64_t>();
    if (value < min || value > std::numeric_limits<uint32_t>::max()) {
        std::println(stderr, "config: timing.{} out of range ({}), using {}", key, value, out);
        return;
    }
    out = static_cast<uint32_t>(value);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (auto it = j.find("watch"); it != j.end()) {
            read_field(*it, "directory", cfg.watch.directory);
            read_field(*it, "prefix", cfg.watch.prefix);
            read_field(*it, "suffix", cfg.watch.suffix);
        }

        if (auto it = j.find("timing"); it != j.end()) {
            read_interval(*it, "poll_interval_ms", cfg.timing.poll_interval_ms, 1);
            read_interval(*it, "liveness_interval_ms", cfg.timing.liveness_interval_ms, 1);
            read_interval(*it, "debounce_ms", cfg.timing.debounce_ms, 0);
            read_interval(*it, "session_timeout_s", cfg.timing.session_timeout_s, 1);
        }

        if (auto it = j.find("sound"); it != j.end()) {
            read_field(*it, "enabled", cfg.sound.enabled);
            read_field(*it, "on_idle", cfg.sound.on_idle);
            read_field(*it, "on_needs_input", cfg.sound.on_needs_input);
            read_field(*it, "player", cfg.sound.player);
        }

        if (auto it = j.find("history"); it != j.end()) {
            read_field(*it, "enabled", cfg.history.enabled);
            read_field(*it, "max_entries", cfg.history.max_entries);
        }

        read_field(j, "agents", cfg.agents);

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    const Config defaults;
    if (cfg.watch.directory.empty()) cfg.watch.directory = defaults.watch.directory;
    if (cfg.history.max_entries < 0) cfg.history.max_entries = defaults.history.max_entries;

    return cfg;
}

void Config::resolve_paths() {
    fs::path dir(watch.directory);
    if (dir.is_absolute()) return;

    std::error_code ec;
    auto abs = fs::absolute(dir, ec);
    if (ec) {
        std::println(stderr, "config: cannot resolve {}: {}", watch.directory, ec.message());
        return;
    }
    watch.directory = abs.lexically_normal().string();
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
