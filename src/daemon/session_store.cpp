#include "session_store.hpp"

Session make_session(std::string id, const StatusRecord& record) {
    return Session{
        .id = std::move(id),
        .status = record.state,
        .project = record.project,
        .message = record.message,
        .owner_pid = record.owner_pid,
        .last_seen = record.timestamp,
    };
}

SessionStore::SessionStore()
    : sessions_(std::make_shared<const SessionMap>()) {}

void SessionStore::replace(SessionMap sessions) {
    auto next = std::make_shared<const SessionMap>(std::move(sessions));
    std::lock_guard lock(mutex_);
    sessions_ = std::move(next);
}

std::vector<std::string> SessionStore::expire(TimePoint now, std::chrono::seconds timeout) {
    auto current = snapshot();

    std::vector<std::string> evicted;
    SessionMap kept;
    for (const auto& [id, session] : *current) {
        if (now - session.last_seen >= timeout) {
            evicted.push_back(id);
        } else {
            kept.emplace(id, session);
        }
    }

    if (!evicted.empty()) {
        replace(std::move(kept));
    }
    return evicted;
}

std::shared_ptr<const SessionMap> SessionStore::snapshot() const {
    std::lock_guard lock(mutex_);
    return sessions_;
}

StatusMap SessionStore::statuses() const {
    auto current = snapshot();
    StatusMap result;
    for (const auto& [id, session] : *current) {
        result.emplace(id, session.status);
    }
    return result;
}

size_t SessionStore::size() const {
    return snapshot()->size();
}
