#include "terminal/session_registry.hpp"

#include "utils/logging.hpp"

namespace termgate::terminal {

SessionRegistry::~SessionRegistry() {
    TerminateAll();
}

bool SessionRegistry::Insert(const std::shared_ptr<Session>& session) {
    if (!session || !session->process) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.emplace(session->id, session).second;
}

std::shared_ptr<Session> SessionRegistry::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.find(id) != sessions_.end();
}

void SessionRegistry::TerminateProcess(Session& session) {
    try {
        session.process->Terminate();
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "session", "terminate failed",
                   {{"id", session.id}, {"error", ex.what()}});
    }
}

bool SessionRegistry::Terminate(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    TerminateProcess(*it->second);
    utils::Log(utils::LogLevel::kDebug, "session", "terminated",
               {{"id", id},
                {"kind", ToString(it->second->kind)},
                {"pid", std::to_string(it->second->process->Pid())}});
    sessions_.erase(it);
    return true;
}

bool SessionRegistry::RemoveIfExited(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || !it->second->process->TryReap()) {
        return false;
    }
    // Leader is gone; sweep whatever it left in its group.
    TerminateProcess(*it->second);
    sessions_.erase(it);
    return true;
}

std::size_t SessionRegistry::ReapExited() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto& session = *it->second;
        if (session.kind == SessionKind::kInteractive && session.process->TryReap()) {
            TerminateProcess(session);
            utils::Log(utils::LogLevel::kInfo, "session", "shell exited",
                       {{"id", session.id},
                        {"exit_code", std::to_string(session.process->ExitCode().value_or(-1))}});
            it = sessions_.erase(it);
            ++removed;
            continue;
        }
        ++it;
    }
    return removed;
}

std::size_t SessionRegistry::TerminateAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto count = sessions_.size();
    for (auto& [id, session] : sessions_) {
        TerminateProcess(*session);
    }
    sessions_.clear();
    return count;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::size_t SessionRegistry::Count(SessionKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, session] : sessions_) {
        if (session->kind == kind) {
            ++count;
        }
    }
    return count;
}

std::vector<SessionInfo> SessionRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionInfo> infos;
    infos.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        infos.push_back(SessionInfo{id, session->kind, session->process->Pid(), session->created_at});
    }
    return infos;
}

}  // namespace termgate::terminal
