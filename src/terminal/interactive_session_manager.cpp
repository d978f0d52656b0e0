#include "terminal/interactive_session_manager.hpp"

#include <filesystem>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace termgate::terminal {

InteractiveSessionManager::InteractiveSessionManager(SessionRegistry& registry,
                                                     InteractiveSettings settings)
    : registry_(registry)
    , settings_(std::move(settings)) {}

std::shared_ptr<Session> InteractiveSessionManager::FindInteractive(const std::string& session_id) const {
    auto session = registry_.Find(session_id);
    if (!session || session->kind != SessionKind::kInteractive) {
        return nullptr;
    }
    return session;
}

CreateSessionResult InteractiveSessionManager::Create(const std::string& session_id,
                                                      const std::string& shell) {
    CreateSessionResult result{};
    result.session_id = session_id;
    if (session_id.empty()) {
        result.error = "Session id is required";
        return result;
    }
    if (registry_.Contains(session_id)) {
        result.error = "Session already exists: " + session_id;
        return result;
    }

    SpawnOptions options{};
    options.executable = shell.empty() ? settings_.shell : shell;
    options.pipe_stdin = true;
    std::error_code ec;
    options.working_dir = std::filesystem::current_path(ec).string();

    auto session = std::make_shared<Session>();
    session->id = session_id;
    session->kind = SessionKind::kInteractive;
    session->working_dir = options.working_dir;
    try {
        session->process = ProcessHandle::Spawn(options);
    } catch (const SpawnError& ex) {
        result.error = ex.what();
        utils::Log(utils::LogLevel::kWarn, "session", "spawn failed",
                   {{"id", session_id}, {"shell", options.executable}, {"error", ex.what()}});
        return result;
    }

    if (!registry_.Insert(session)) {
        // Lost a race against another Create with the same id.
        session->process->Terminate();
        result.error = "Session already exists: " + session_id;
        return result;
    }

    result.success = true;
    result.pid = session->process->Pid();
    utils::Log(utils::LogLevel::kInfo, "session", "created",
               {{"id", session_id}, {"pid", std::to_string(result.pid)}, {"shell", options.executable}});
    return result;
}

std::optional<std::string> InteractiveSessionManager::Send(const std::string& session_id,
                                                           const std::string& input) {
    auto session = FindInteractive(session_id);
    if (!session) {
        return std::nullopt;
    }

    std::unique_lock<std::mutex> io_lock(session->io_mutex);
    session->last_activity = utils::Now();
    auto& process = *session->process;

    std::string error;
    if (!process.WriteInput(input, error)) {
        io_lock.unlock();
        utils::Log(utils::LogLevel::kWarn, "session", "write failed, closing session",
                   {{"id", session_id}, {"error", error}});
        registry_.Terminate(session_id);
        return std::nullopt;
    }

    const auto chunk = process.ReadOutput(settings_.read_timeout, settings_.read_chunk_bytes);
    io_lock.unlock();
    if (chunk.failed) {
        utils::Log(utils::LogLevel::kWarn, "session", "read failed, closing session",
                   {{"id", session_id}, {"error", chunk.error}});
        registry_.Terminate(session_id);
        return std::nullopt;
    }

    auto output = utils::SanitizeUtf8(chunk.out + chunk.err);
    if (registry_.RemoveIfExited(session_id)) {
        utils::Log(utils::LogLevel::kInfo, "session", "shell exited",
                   {{"id", session_id}, {"exit_code", std::to_string(process.ExitCode().value_or(-1))}});
    }
    return output;
}

bool InteractiveSessionManager::Kill(const std::string& session_id) {
    if (!FindInteractive(session_id)) {
        return false;
    }
    const bool removed = registry_.Terminate(session_id);
    if (removed) {
        utils::Log(utils::LogLevel::kInfo, "session", "killed", {{"id", session_id}});
    }
    return removed;
}

bool InteractiveSessionManager::Resize(const std::string& session_id, int cols, int rows) {
    const bool exists = FindInteractive(session_id) != nullptr;
    utils::Log(utils::LogLevel::kDebug, "session", "resize ignored",
               {{"id", session_id}, {"cols", std::to_string(cols)}, {"rows", std::to_string(rows)}});
    return exists;
}

bool InteractiveSessionManager::Exists(const std::string& session_id) const {
    return FindInteractive(session_id) != nullptr;
}

std::size_t InteractiveSessionManager::ActiveCount() const {
    return registry_.Count(SessionKind::kInteractive);
}

void InteractiveSessionManager::Cleanup() {
    const auto count = registry_.TerminateAll();
    utils::Log(utils::LogLevel::kInfo, "session", "cleanup finished", {{"terminated", std::to_string(count)}});
}

}  // namespace termgate::terminal
