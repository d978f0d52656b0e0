#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "terminal/session_registry.hpp"

namespace termgate::terminal {

enum class ExecMode {
    // Shell words of the command are executed directly; no shell involved.
    kArgv,
    // The raw string is handed to /bin/sh -c. Pipes and redirection work, and
    // so does command injection: the validator cannot see through it.
    kShell
};

enum class ErrorKind {
    kNone,
    kPolicyViolation,
    kSpawnFailure,
    kTimeout,
    kInternal
};

const char* ToString(ErrorKind kind);

struct CommandRequest {
    std::string raw;
    std::optional<std::string> working_dir;
    std::unordered_map<std::string, std::string> env;
    std::optional<int> timeout_s;
    ExecMode mode = ExecMode::kArgv;
};

struct ExecutionResult {
    bool success = false;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string output;
    bool truncated = false;
    std::optional<std::string> error;
    ErrorKind error_kind = ErrorKind::kNone;
};

struct ExecutorSettings {
    std::size_t max_output = 10000;
    std::chrono::seconds default_timeout{30};
    std::vector<std::string> allowed_commands;
    std::vector<std::string> forbidden_patterns;
};

class OneShotExecutor {
public:
    OneShotExecutor(SessionRegistry& registry, ExecutorSettings settings);

    // Never throws; never leaves a registry entry or a live child behind.
    ExecutionResult Execute(const CommandRequest& request, const std::string& session_id);

    const ExecutorSettings& Settings() const { return settings_; }

    static constexpr const char* kTruncationMarker = "\n... [output truncated]";

private:
    std::string NextExecutionId(const std::string& session_id);
    std::string FinishStream(const std::string& raw, bool& truncated) const;

    SessionRegistry& registry_;
    ExecutorSettings settings_;
    std::atomic<unsigned long> counter_{0};
};

}  // namespace termgate::terminal
