#pragma once

#include "status_record.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// A tracked worker session, keyed by its status file name.
struct Session {
    std::string id;
    SessionStatus status = SessionStatus::Idle;
    std::string project;
    std::optional<std::string> message;
    std::optional<int> owner_pid;
    TimePoint last_seen{};

    bool operator==(const Session&) const = default;
};

using SessionMap = std::map<std::string, Session>;
using StatusMap = std::map<std::string, SessionStatus>;

Session make_session(std::string id, const StatusRecord& record);

// Current session set. Writers swap in a whole new map; readers hold an
// immutable snapshot that later writes never touch.
class SessionStore {
public:
    SessionStore();

    void replace(SessionMap sessions);

    // Drops sessions with now - last_seen >= timeout. Returns the evicted ids.
    std::vector<std::string> expire(TimePoint now, std::chrono::seconds timeout);

    std::shared_ptr<const SessionMap> snapshot() const;
    StatusMap statuses() const;

    size_t size() const;
    bool empty() const { return size() == 0; }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const SessionMap> sessions_;
};
