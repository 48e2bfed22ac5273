/// @file session_store.cpp
/// @brief In-memory session store

#include "security/session_store.h"

namespace promptguard::security {

SessionRecord InMemorySessionStore::CreateSession(
    std::string session_id,
    std::unordered_map<std::string, std::string> attributes) {
    SessionRecord record;
    record.session_id = session_id;
    record.created_at = std::chrono::system_clock::now();
    record.attributes = std::move(attributes);

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[std::move(session_id)] = record;
    return record;
}

std::optional<SessionRecord> InMemorySessionStore::GetSession(std::string_view session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(std::string(session_id));
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemorySessionStore::RemoveSession(std::string_view session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(std::string(session_id)) > 0;
}

size_t InMemorySessionStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace promptguard::security
