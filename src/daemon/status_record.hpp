#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

enum class SessionStatus { Working, Idle, NeedsInput };

using TimePoint = std::chrono::sys_seconds;

// One status file as written by the hook script.
struct StatusRecord {
    SessionStatus state = SessionStatus::Idle;
    std::optional<std::string> message;
    TimePoint timestamp{};
    std::string project = "Unknown";
    std::optional<int> owner_pid;

    bool operator==(const StatusRecord&) const = default;
};

namespace status_record {

// Parses a status file. `now` fills a missing or unparseable timestamp.
std::expected<StatusRecord, std::string> decode(std::string_view bytes, TimePoint now);

std::string encode(const StatusRecord& record);

// Accepts only "YYYY-MM-DDTHH:MM:SSZ".
std::optional<TimePoint> parse_timestamp(std::string_view text);
std::string format_timestamp(TimePoint tp);

std::optional<SessionStatus> parse_status(std::string_view text);
const char* to_string(SessionStatus status);

} // namespace status_record
