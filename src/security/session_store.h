#pragma once

/// @file session_store.h
/// @brief Conversation session collaborator
///
/// The pipeline only looks sessions up and removes them by identifier; it
/// never touches session contents.

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace promptguard::security {

/// @brief Snapshot of a stored session
struct SessionRecord {
    std::string session_id;
    std::chrono::system_clock::time_point created_at;
    std::unordered_map<std::string, std::string> attributes;
};

/// @brief Abstract base class for session stores
///
/// Both operations must be idempotent and safe to call concurrently.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    /// @brief Look a session up; nullopt when it does not exist
    virtual std::optional<SessionRecord> GetSession(std::string_view session_id) = 0;

    /// @brief Remove a session; false when nothing was removed
    virtual bool RemoveSession(std::string_view session_id) = 0;
};

/// @brief Thread-safe in-process session store
class InMemorySessionStore : public SessionStore {
public:
    InMemorySessionStore() = default;

    /// @brief Create (or replace) a session
    SessionRecord CreateSession(std::string session_id,
                                std::unordered_map<std::string, std::string> attributes = {});

    std::optional<SessionRecord> GetSession(std::string_view session_id) override;
    bool RemoveSession(std::string_view session_id) override;

    size_t Count() const;

private:
    std::unordered_map<std::string, SessionRecord> sessions_;
    mutable std::mutex mutex_;
};

}  // namespace promptguard::security
