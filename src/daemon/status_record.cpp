#include "status_record.hpp"

#include <cctype>
#include <cstdint>
#include <format>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace status_record {

namespace {

bool read_digits(std::string_view text, size_t pos, size_t count, int& out) {
    out = 0;
    for (size_t i = pos; i < pos + count; i++) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        out = out * 10 + (text[i] - '0');
    }
    return true;
}

} // namespace

std::optional<SessionStatus> parse_status(std::string_view text) {
    if (text == "working") return SessionStatus::Working;
    if (text == "idle") return SessionStatus::Idle;
    if (text == "needs_input") return SessionStatus::NeedsInput;
    return std::nullopt;
}

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Working: return "working";
        case SessionStatus::Idle: return "idle";
        case SessionStatus::NeedsInput: return "needs_input";
    }
    return "idle";
}

std::optional<TimePoint> parse_timestamp(std::string_view text) {
    // 2025-01-01T00:00:00Z
    if (text.size() != 20) return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':' || text[19] != 'Z') {
        return std::nullopt;
    }

    int year, month, day, hour, minute, second;
    if (!read_digits(text, 0, 4, year) || !read_digits(text, 5, 2, month) ||
        !read_digits(text, 8, 2, day) || !read_digits(text, 11, 2, hour) ||
        !read_digits(text, 14, 2, minute) || !read_digits(text, 17, 2, second)) {
        return std::nullopt;
    }

    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) return std::nullopt;

    return std::chrono::sys_days{ymd} + std::chrono::hours{hour} +
           std::chrono::minutes{minute} + std::chrono::seconds{second};
}

std::string format_timestamp(TimePoint tp) {
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", tp);
}

std::expected<StatusRecord, std::string> decode(std::string_view bytes, TimePoint now) {
    if (bytes.empty()) {
        return std::unexpected("empty input");
    }

    json j;
    try {
        j = json::parse(bytes);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("malformed json: ") + e.what());
    }

    if (!j.is_object()) {
        return std::unexpected("status record is not an object");
    }

    auto it = j.find("state");
    if (it == j.end() || !it->is_string()) {
        return std::unexpected("missing state");
    }

    auto state = parse_status(it->get_ref<const std::string&>());
    if (!state) {
        return std::unexpected("unknown state: " + it->get<std::string>());
    }

    StatusRecord record;
    record.state = *state;
    record.timestamp = now;

    if (auto m = j.find("message"); m != j.end() && m->is_string()) {
        record.message = m->get<std::string>();
    }

    if (auto t = j.find("timestamp"); t != j.end() && t->is_string()) {
        if (auto ts = parse_timestamp(t->get_ref<const std::string&>())) {
            record.timestamp = *ts;
        }
    }

    if (auto p = j.find("project"); p != j.end() && p->is_string()) {
        record.project = p->get<std::string>();
    }

    // A pid that does not fit in int would alias some unrelated process.
    if (auto pid = j.find("owner_pid"); pid != j.end() && pid->is_number_integer()) {
        if (pid->is_number_unsigned()) {
            auto v = pid->get<uint64_t>();
            if (v <= static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                record.owner_pid = static_cast<int>(v);
            }
        } else {
            auto v = pid->get<int64_t>();
            if (v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max()) {
                record.owner_pid = static_cast<int>(v);
            }
        }
    }

    return record;
}

std::string encode(const StatusRecord& record) {
    json j = {
        {"state", to_string(record.state)},
        {"timestamp", format_timestamp(record.timestamp)},
        {"project", record.project},
    };
    if (record.message) j["message"] = *record.message;
    if (record.owner_pid) j["owner_pid"] = *record.owner_pid;
    return j.dump();
}

} // namespace status_record
