#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "terminal/session_registry.hpp"

namespace termgate::terminal {

struct InteractiveSettings {
    std::string shell = "/bin/bash";
    std::chrono::milliseconds read_timeout{100};
    std::size_t read_chunk_bytes = 4096;
};

struct CreateSessionResult {
    bool success = false;
    std::string session_id;
    int pid = -1;
    std::string error;
};

class InteractiveSessionManager {
public:
    InteractiveSessionManager(SessionRegistry& registry, InteractiveSettings settings);

    // An empty shell uses the configured default.
    CreateSessionResult Create(const std::string& session_id, const std::string& shell = "");

    // Writes input and returns whatever output shows up within the read
    // bound (possibly empty). nullopt for an unknown session, or after a
    // communication failure which also ends the session.
    std::optional<std::string> Send(const std::string& session_id, const std::string& input);

    bool Kill(const std::string& session_id);

    // Sessions run on pipes, not a pseudo-terminal, so there is nothing to
    // resize; reports whether the session exists.
    bool Resize(const std::string& session_id, int cols, int rows);

    bool Exists(const std::string& session_id) const;
    std::size_t ActiveCount() const;

    // Terminates every registered process. Used at shutdown.
    void Cleanup();

    const InteractiveSettings& Settings() const { return settings_; }

private:
    std::shared_ptr<Session> FindInteractive(const std::string& session_id) const;

    SessionRegistry& registry_;
    InteractiveSettings settings_;
};

}  // namespace termgate::terminal
