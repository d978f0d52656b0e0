#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

#include "config/config_loader.hpp"
#include "httplib.h"
#include "providers/model_client.hpp"
#include "server/http_api.hpp"
#include "server/websocket_server.hpp"
#include "session/context_store.hpp"
#include "terminal/connection_bridge.hpp"
#include "terminal/interactive_session_manager.hpp"
#include "terminal/oneshot_executor.hpp"
#include "terminal/session_registry.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

std::filesystem::path GetPidFilePath() {
    return termgate::config::GetHomePath() / ".termgate" / "gateway.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    std::ifstream input(GetPidFilePath());
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    std::error_code ec;
    std::filesystem::remove(GetPidFilePath(), ec);
}

bool WaitForExit(pid_t pid, std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!IsProcessRunning(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return !IsProcessRunning(pid);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

termgate::terminal::ExecutorSettings MakeExecutorSettings(const termgate::config::Config& config) {
    termgate::terminal::ExecutorSettings settings{};
    settings.max_output = static_cast<std::size_t>(std::max(config.terminal.max_output, 0));
    settings.default_timeout = std::chrono::seconds(std::max(config.terminal.timeout_s, 1));
    settings.allowed_commands = config.terminal.allowed_commands;
    settings.forbidden_patterns = config.terminal.forbidden_patterns;
    return settings;
}

termgate::terminal::InteractiveSettings MakeInteractiveSettings(const termgate::config::Config& config) {
    termgate::terminal::InteractiveSettings settings{};
    settings.shell = config.terminal.shell;
    settings.read_timeout = std::chrono::milliseconds(std::max(config.terminal.read_timeout_ms, 0));
    settings.read_chunk_bytes = static_cast<std::size_t>(std::max(config.terminal.read_chunk_bytes, 1));
    return settings;
}

void ApplyLogSettings(const termgate::config::Config& config) {
    termgate::utils::LogConfig log_config{};
    log_config.min_level = termgate::utils::ParseLogLevel(config.log.level, termgate::utils::LogLevel::kInfo);
    termgate::utils::SetLogConfig(log_config);
}

int RunGateway() {
    auto config = termgate::config::LoadConfig();
    ApplyLogSettings(config);

    const auto running_pid = ReadPidFile();
    if (running_pid && *running_pid != ::getpid() && IsProcessRunning(*running_pid)) {
        std::cout << "termgate gateway already running (pid " << *running_pid << ")." << std::endl;
        return 1;
    }
    if (!WritePidFile(::getpid())) {
        termgate::utils::Log(termgate::utils::LogLevel::kWarn, "gateway", "failed to write pid file",
                             {{"path", GetPidFilePath().string()}});
    }

    termgate::terminal::SessionRegistry registry;
    termgate::terminal::OneShotExecutor executor(registry, MakeExecutorSettings(config));
    termgate::terminal::InteractiveSessionManager sessions(registry, MakeInteractiveSettings(config));
    termgate::terminal::ConnectionBridge bridge(sessions);
    termgate::session::ContextStore context(config.context.db_path,
                                            static_cast<std::size_t>(std::max(config.context.max_messages, 1)));
    auto model = termgate::providers::CreateModelClient(config);

    termgate::server::HttpApi api(config, executor, sessions, context, *model);
    httplib::Server http_server;
    api.Register(http_server);
    termgate::server::WebSocketServer ws_server(bridge);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    std::atomic<bool> http_failed{false};
    const std::string host = config.server.host;
    const int port = config.server.port;
    std::thread http_thread([&http_server, &http_failed, host, port]() {
        if (!http_server.listen(host, port)) {
            termgate::utils::Log(termgate::utils::LogLevel::kError, "http", "failed to listen",
                                 {{"host", host}, {"port", std::to_string(port)}});
            http_failed.store(true);
        }
    });
    const bool ws_ok = ws_server.Start(host, config.server.ws_port);

    termgate::utils::Log(termgate::utils::LogLevel::kInfo, "gateway", "started",
                         {{"http", host + ":" + std::to_string(port)},
                          {"ws", host + ":" + std::to_string(config.server.ws_port)},
                          {"model", model->ModelName()}});
    std::cout << "termgate gateway started. Press Ctrl+C to stop." << std::endl;

    const auto sweep_interval = std::chrono::seconds(std::max(config.context.cleanup_interval_s, 1));
    auto next_sweep = std::chrono::steady_clock::now() + sweep_interval;
    while (g_signal == 0 && ws_ok && !http_failed.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        registry.ReapExited();
        if (std::chrono::steady_clock::now() >= next_sweep) {
            context.ExpireIdle(std::chrono::seconds(config.context.ttl_s));
            next_sweep = std::chrono::steady_clock::now() + sweep_interval;
        }
    }

    termgate::utils::Log(termgate::utils::LogLevel::kInfo, "gateway", "shutting down",
                         {{"signal", std::to_string(static_cast<int>(g_signal))}});
    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    // Killing the shells first releases any bridge blocked writing to one.
    sessions.Cleanup();
    ws_server.Stop();
    sessions.Cleanup();
    RemovePidFile();
    return (ws_ok && !http_failed.load()) ? 0 : 1;
}

int StopGateway() {
    const auto pid = ReadPidFile();
    if (!pid || !IsProcessRunning(*pid)) {
        std::cout << "termgate gateway not running." << std::endl;
        return 1;
    }
    ::kill(*pid, SIGTERM);
    if (!WaitForExit(*pid, std::chrono::seconds(8))) {
        std::cout << "termgate gateway did not exit in time." << std::endl;
        return 1;
    }
    return 0;
}

int RunExec(int argc, char** argv) {
    auto config = termgate::config::LoadConfig();
    ApplyLogSettings(config);

    termgate::terminal::CommandRequest request{};
    request.mode = config.terminal.shell_by_default ? termgate::terminal::ExecMode::kShell
                                                    : termgate::terminal::ExecMode::kArgv;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--shell") {
            request.mode = termgate::terminal::ExecMode::kShell;
        } else if (arg == "--argv") {
            request.mode = termgate::terminal::ExecMode::kArgv;
        } else if (arg == "--cwd" && i + 1 < argc) {
            request.working_dir = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            try {
                request.timeout_s = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cout << "Invalid --timeout value." << std::endl;
                return 2;
            }
        } else if (request.raw.empty()) {
            request.raw = arg;
        } else {
            std::cout << "Unexpected argument: " << arg << std::endl;
            return 2;
        }
    }
    if (request.raw.empty()) {
        std::cout << "Usage: termgate exec \"<command>\" [--shell|--argv] [--cwd DIR] [--timeout N]" << std::endl;
        return 2;
    }

    termgate::terminal::SessionRegistry registry;
    termgate::terminal::OneShotExecutor executor(registry, MakeExecutorSettings(config));
    const auto result = executor.Execute(request, "cli");
    std::cout << termgate::server::ToJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    if (result.error_kind != termgate::terminal::ErrorKind::kNone) {
        return 1;
    }
    return result.exit_code;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "gateway") {
        return RunGateway();
    }
    if (argc >= 2 && std::string(argv[1]) == "stop") {
        return StopGateway();
    }
    if (argc >= 2 && std::string(argv[1]) == "exec") {
        return RunExec(argc, argv);
    }

    std::cout << "Usage: termgate gateway | termgate stop | termgate exec \"<command>\"" << std::endl;
    return 1;
}
