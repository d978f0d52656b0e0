#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "terminal/process_handle.hpp"

namespace termgate::terminal {

enum class SessionKind {
    kOneShot,
    kInteractive
};

inline const char* ToString(SessionKind kind) {
    switch (kind) {
        case SessionKind::kOneShot: return "one-shot";
        case SessionKind::kInteractive: return "interactive";
    }
    return "unknown";
}

struct Session {
    std::string id;
    SessionKind kind = SessionKind::kOneShot;
    std::unique_ptr<ProcessHandle> process;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
    std::chrono::system_clock::time_point last_activity = created_at;
    std::string working_dir;
    std::unordered_map<std::string, std::string> env;
    // Serializes I/O on this session; last_activity is guarded by it too.
    std::mutex io_mutex;
};

struct SessionInfo {
    std::string id;
    SessionKind kind = SessionKind::kOneShot;
    int pid = -1;
    std::chrono::system_clock::time_point created_at;
};

// Owns every live child process. An entry is only removed together with the
// termination (or confirmed exit) and reaping of its process, under the
// registry lock.
class SessionRegistry {
public:
    SessionRegistry() = default;
    ~SessionRegistry();
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // False when the id is taken; the caller keeps ownership and must
    // terminate the process itself.
    bool Insert(const std::shared_ptr<Session>& session);

    std::shared_ptr<Session> Find(const std::string& id) const;
    bool Contains(const std::string& id) const;

    // Kills the process group, reaps the leader and erases the entry.
    // False when the id is unknown.
    bool Terminate(const std::string& id);

    // Erases the entry only if its process has exited on its own.
    bool RemoveIfExited(const std::string& id);

    // Removes interactive sessions whose process exited; returns the count.
    std::size_t ReapExited();

    // Terminates every entry; returns the count.
    std::size_t TerminateAll();

    std::size_t Size() const;
    std::size_t Count(SessionKind kind) const;
    std::vector<SessionInfo> List() const;

private:
    static void TerminateProcess(Session& session);

    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::mutex mutex_;
};

}  // namespace termgate::terminal
