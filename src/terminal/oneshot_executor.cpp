#include "terminal/oneshot_executor.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>

#include "terminal/command_validator.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace termgate::terminal {
namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr auto kPollSlice = std::chrono::milliseconds(50);
constexpr int kMaxDrainRounds = 64;

void AppendCapped(std::string& target, const std::string& data, std::size_t cap) {
    if (target.size() >= cap) {
        return;
    }
    target.append(data, 0, std::min(data.size(), cap - target.size()));
}

// Removes the registry entry (and with it the process) when the call returns.
class RegistrationGuard {
public:
    RegistrationGuard(SessionRegistry& registry, std::string id)
        : registry_(registry)
        , id_(std::move(id)) {}

    ~RegistrationGuard() {
        registry_.Terminate(id_);
    }

    RegistrationGuard(const RegistrationGuard&) = delete;
    RegistrationGuard& operator=(const RegistrationGuard&) = delete;

private:
    SessionRegistry& registry_;
    std::string id_;
};

}  // namespace

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "none";
        case ErrorKind::kPolicyViolation: return "policy_violation";
        case ErrorKind::kSpawnFailure: return "spawn_failure";
        case ErrorKind::kTimeout: return "timeout";
        case ErrorKind::kInternal: return "internal";
    }
    return "unknown";
}

OneShotExecutor::OneShotExecutor(SessionRegistry& registry, ExecutorSettings settings)
    : registry_(registry)
    , settings_(std::move(settings)) {}

std::string OneShotExecutor::NextExecutionId(const std::string& session_id) {
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return session_id + "_" + std::to_string(micros) + "_" + std::to_string(++counter_);
}

std::string OneShotExecutor::FinishStream(const std::string& raw, bool& truncated) const {
    auto text = utils::SanitizeUtf8(raw);
    if (utils::Utf8Length(text) > settings_.max_output) {
        text = utils::Utf8Prefix(text, settings_.max_output) + kTruncationMarker;
        truncated = true;
    }
    return text;
}

ExecutionResult OneShotExecutor::Execute(const CommandRequest& request, const std::string& session_id) {
    ExecutionResult result{};
    const auto verdict = CommandValidator::Validate(
        request.raw,
        settings_.allowed_commands,
        settings_.forbidden_patterns);
    if (!verdict.allowed) {
        result.error = verdict.reason.value_or("Command rejected");
        result.error_kind = ErrorKind::kPolicyViolation;
        utils::Log(utils::LogLevel::kWarn, "exec", "rejected",
                   {{"session", session_id}, {"reason", *result.error}});
        return result;
    }

    std::error_code ec;
    std::string working_dir;
    if (request.working_dir && !request.working_dir->empty()
        && std::filesystem::is_directory(*request.working_dir, ec)) {
        working_dir = *request.working_dir;
    } else {
        working_dir = std::filesystem::current_path(ec).string();
    }

    const auto timeout = request.timeout_s && *request.timeout_s > 0
        ? std::chrono::seconds(*request.timeout_s)
        : settings_.default_timeout;

    SpawnOptions options{};
    if (request.mode == ExecMode::kShell) {
        options.executable = "/bin/sh";
        options.args = {"-c", request.raw};
    } else {
        options.executable = verdict.tokens.front();
        options.args.assign(verdict.tokens.begin() + 1, verdict.tokens.end());
    }
    options.working_dir = working_dir;
    options.env = request.env;

    auto session = std::make_shared<Session>();
    session->id = NextExecutionId(session_id);
    session->kind = SessionKind::kOneShot;
    session->working_dir = working_dir;
    session->env = request.env;
    try {
        session->process = ProcessHandle::Spawn(options);
    } catch (const SpawnError& ex) {
        result.error = ex.what();
        result.error_kind = ErrorKind::kSpawnFailure;
        utils::Log(utils::LogLevel::kWarn, "exec", "spawn failed",
                   {{"session", session_id}, {"error", ex.what()}});
        return result;
    }
    if (!registry_.Insert(session)) {
        session->process->Terminate();
        result.error = "Execution id already registered: " + session->id;
        result.error_kind = ErrorKind::kInternal;
        return result;
    }
    RegistrationGuard guard(registry_, session->id);

    utils::Log(utils::LogLevel::kInfo, "exec", "start",
               {{"id", session->id},
                {"pid", std::to_string(session->process->Pid())},
                {"mode", request.mode == ExecMode::kShell ? "shell" : "argv"},
                {"cwd", working_dir}});

    // Raw capture bound: enough bytes for max_output code points plus one.
    const auto cap = settings_.max_output * 4 + 4;
    std::string out_raw;
    std::string err_raw;
    bool timed_out = false;
    auto& process = *session->process;

    auto absorb = [&](const OutputChunk& chunk) {
        AppendCapped(out_raw, chunk.out, cap);
        AppendCapped(err_raw, chunk.err, cap);
        if (chunk.failed) {
            utils::Log(utils::LogLevel::kWarn, "exec", "read failed",
                       {{"id", session->id}, {"error", chunk.error}});
        }
    };
    auto drain = [&]() {
        for (int round = 0; round < kMaxDrainRounds && !process.OutputClosed(); ++round) {
            const auto chunk = process.ReadOutput(std::chrono::milliseconds(0), kReadChunk);
            absorb(chunk);
            if (chunk.out.empty() && chunk.err.empty()) {
                break;
            }
        }
    };

    try {
        const auto started = std::chrono::steady_clock::now();
        const auto deadline = started + timeout;
        while (true) {
            if (process.OutputClosed() && process.TryReap()) {
                break;
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                timed_out = true;
                break;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            const auto wait = std::min(remaining, std::chrono::milliseconds(kPollSlice));
            if (process.OutputClosed()) {
                std::this_thread::sleep_for(wait);
                continue;
            }
            absorb(process.ReadOutput(wait, kReadChunk));
            if (!process.OutputClosed() && process.TryReap()) {
                // The leader is gone but something it spawned holds the pipes open.
                drain();
                break;
            }
        }

        if (timed_out) {
            registry_.Terminate(session->id);
            drain();
            result.error = "Command timed out after " + std::to_string(timeout.count()) + " seconds";
            result.error_kind = ErrorKind::kTimeout;
            result.exit_code = -1;
            result.success = false;
        } else {
            result.exit_code = process.ExitCode().value_or(-1);
            result.success = result.exit_code == 0;
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        utils::Log(timed_out ? utils::LogLevel::kWarn : utils::LogLevel::kInfo, "exec",
                   timed_out ? "timed out" : "finished",
                   {{"id", session->id},
                    {"exit_code", std::to_string(result.exit_code)},
                    {"elapsed_ms", std::to_string(elapsed.count())}});
    } catch (const std::exception& ex) {
        result.success = false;
        result.exit_code = -1;
        result.error = ex.what();
        result.error_kind = ErrorKind::kInternal;
        utils::Log(utils::LogLevel::kError, "exec", "execution failed",
                   {{"id", session->id}, {"error", ex.what()}});
    }

    result.stdout_text = FinishStream(out_raw, result.truncated);
    result.stderr_text = FinishStream(err_raw, result.truncated);
    result.output = result.stdout_text;
    if (!result.stderr_text.empty()) {
        result.output += "\n[stderr]:\n" + result.stderr_text;
    }
    return result;
}

}  // namespace termgate::terminal
