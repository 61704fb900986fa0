#pragma once

#include "config.hpp"
#include "status_record.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct HookUpdate {
    std::string session_id;
    StatusRecord record;
};

// Maps a worker hook payload (JSON on stdin) to a status update. Events that
// do not change the session state yield nullopt.
std::optional<HookUpdate> hook_update(std::string_view payload, TimePoint now);

// "<prefix><session><suffix>", with characters unsafe in file names replaced.
std::string status_file_name(const Config::Watch& watch, const std::string& session_id);

// Writes via a hidden temp file and rename so readers never see a partial
// record. Returns the final path.
std::expected<std::string, std::string> write_status_file(const Config::Watch& watch,
                                                          const std::string& session_id,
                                                          const StatusRecord& record);
