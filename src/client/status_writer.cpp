#include "status_writer.hpp"

#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string project_from_cwd(const std::string& cwd) {
    if (cwd.empty()) return "Unknown";
    auto p = fs::path(cwd).lexically_normal();
    auto name = p.filename().string();
    if (name.empty()) name = p.parent_path().filename().string();
    return name.empty() ? "Unknown" : name;
}

} // namespace

std::optional<HookUpdate> hook_update(std::string_view payload, TimePoint now) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::exception&) {
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;

    std::string event = j.value("hook_event_name", "");

    StatusRecord record;
    record.timestamp = now;
    if (event == "UserPromptSubmit") {
        record.state = SessionStatus::Working;
        record.message = "Processing...";
    } else if (event == "Stop") {
        record.state = SessionStatus::Idle;
        record.message = "Ready";
    } else if (event == "Notification" && payload.find("idle_prompt") != std::string_view::npos) {
        record.state = SessionStatus::NeedsInput;
        record.message = "Waiting for input";
    } else {
        return std::nullopt;
    }

    record.project = project_from_cwd(j.value("cwd", ""));

    std::string session = j.value("session_id", "");
    return HookUpdate{session.empty() ? "status" : session, std::move(record)};
}

std::string status_file_name(const Config::Watch& watch, const std::string& session_id) {
    std::string safe = session_id;
    for (auto& c : safe) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.') c = '_';
    }
    if (safe.empty()) safe = "status";
    return watch.prefix + safe + watch.suffix;
}

std::expected<std::string, std::string> write_status_file(const Config::Watch& watch,
                                                          const std::string& session_id,
                                                          const StatusRecord& record) {
    auto name = status_file_name(watch, session_id);
    auto final_path = fs::path(watch.directory) / name;
    auto tmp_path = fs::path(watch.directory) / std::format(".{}.{}.tmp", name, ::getpid());

    {
        std::ofstream f(tmp_path, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) {
            return std::unexpected("cannot create " + tmp_path.string());
        }
        f << status_record::encode(record) << '\n';
        if (!f.good()) {
            std::error_code ec;
            fs::remove(tmp_path, ec);
            return std::unexpected("write failed for " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        auto reason = std::format("rename to {} failed: {}", final_path.string(), ec.message());
        fs::remove(tmp_path, ec);
        return std::unexpected(reason);
    }
    return final_path.string();
}
