#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sqlite3.h"

namespace termgate::session {

struct ContextMessage {
    std::string role;
    std::string content;
    std::string timestamp;
};

// Conversation context per chat session, persisted in SQLite. A session
// keeps its newest max_messages rows.
class ContextStore {
public:
    ContextStore(std::string db_path, std::size_t max_messages);
    ~ContextStore();
    ContextStore(const ContextStore&) = delete;
    ContextStore& operator=(const ContextStore&) = delete;

    bool IsOpen() const { return db_ != nullptr; }

    // Creates the session when needed and refreshes its activity time.
    void Touch(const std::string& session_id);
    void Append(const std::string& session_id, const std::string& role, const std::string& content);

    // Oldest first. A limit of 0 or nullopt returns everything kept.
    std::vector<ContextMessage> Fetch(const std::string& session_id,
                                      std::optional<std::size_t> limit = std::nullopt) const;

    bool Exists(const std::string& session_id) const;
    bool Clear(const std::string& session_id);

    // Removes sessions idle for longer than ttl; returns how many.
    std::size_t ExpireIdle(std::chrono::seconds ttl,
                           std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    std::size_t ActiveCount() const;

private:
    void EnsureSchema();
    void TouchLocked(const std::string& session_id, std::int64_t now_ms);
    bool DeleteLocked(const std::string& session_id);
    static bool Exec(sqlite3* db, const std::string& sql);
    static std::string SafeText(const unsigned char* text);

    std::string db_path_;
    std::size_t max_messages_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace termgate::session
