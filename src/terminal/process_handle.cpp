#include "terminal/process_handle.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/process/v1/extend.hpp>

#include "utils/logging.hpp"

namespace termgate::terminal {
namespace bp = boost::process::v1;
namespace {

constexpr int kWritePollMs = 100;
constexpr std::size_t kPendingOutputCap = 1 << 20;
std::once_flag g_sigpipe_once;

void MakeParentEnd(int fd) {
    if (fd < 0) {
        return;
    }
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
}

std::string ResolveExecutable(const std::string& executable) {
    if (executable.empty()) {
        throw SpawnError("No executable given");
    }
    if (executable.find('/') != std::string::npos) {
        return executable;
    }
    const auto found = bp::search_path(executable);
    if (found.empty()) {
        throw SpawnError("Command not found: " + executable);
    }
    return found.string();
}

// Reads until EAGAIN, EOF, or `limit` bytes are in `target`.
void DrainFd(int fd, bool& open, std::string& target, std::size_t limit, OutputChunk& chunk) {
    std::array<char, 4096> buffer{};
    while (open && target.size() < limit) {
        const auto wanted = std::min(buffer.size(), limit - target.size());
        const auto n = ::read(fd, buffer.data(), wanted);
        if (n > 0) {
            target.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            open = false;
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            chunk.failed = true;
            chunk.error = std::strerror(errno);
            open = false;
        }
        break;
    }
}

}  // namespace

std::unique_ptr<ProcessHandle> ProcessHandle::Spawn(const SpawnOptions& options) {
    // Writes to a dead child must surface as EPIPE rather than kill us.
    std::call_once(g_sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    const auto executable = ResolveExecutable(options.executable);
    const auto working_dir = options.working_dir.empty()
        ? std::filesystem::current_path().string()
        : options.working_dir;

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : options.env) {
        env[key] = value;
    }

    // SIG_IGN survives exec; children get the default disposition back.
    auto restore_sigpipe = [](auto&) { std::signal(SIGPIPE, SIG_DFL); };

    std::unique_ptr<ProcessHandle> handle(new ProcessHandle());
    try {
        if (options.pipe_stdin) {
            handle->child_ = bp::child(
                bp::exe = executable,
                bp::args = options.args,
                env,
                bp::start_dir = working_dir,
                bp::std_in < handle->in_pipe_,
                bp::std_out > handle->out_pipe_,
                bp::std_err > handle->err_pipe_,
                handle->group_,
                bp::limit_handles,
                bp::extend::on_exec_setup = restore_sigpipe);
        } else {
            handle->child_ = bp::child(
                bp::exe = executable,
                bp::args = options.args,
                env,
                bp::start_dir = working_dir,
                bp::std_in < bp::null,
                bp::std_out > handle->out_pipe_,
                bp::std_err > handle->err_pipe_,
                handle->group_,
                bp::limit_handles,
                bp::extend::on_exec_setup = restore_sigpipe);
        }
    } catch (const bp::process_error& ex) {
        throw SpawnError(ex.what());
    }

    handle->pid_ = handle->child_.id();
    // Reaping is done here with waitpid; the child object must not try again.
    handle->child_.detach();

    if (options.pipe_stdin) {
        handle->in_fd_ = handle->in_pipe_.native_sink();
    }
    handle->out_fd_ = handle->out_pipe_.native_source();
    handle->err_fd_ = handle->err_pipe_.native_source();
    MakeParentEnd(handle->in_fd_);
    MakeParentEnd(handle->out_fd_);
    MakeParentEnd(handle->err_fd_);
    handle->out_open_ = handle->out_fd_ >= 0;
    handle->err_open_ = handle->err_fd_ >= 0;
    return handle;
}

ProcessHandle::~ProcessHandle() {
    Terminate();
}

void ProcessHandle::RecordStatus(int status) {
    exited_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
}

bool ProcessHandle::TryReap() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exited_ || pid_ <= 0) {
        return true;
    }
    int status = 0;
    const auto waited = ::waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        RecordStatus(status);
    } else if (waited < 0 && errno == ECHILD) {
        exited_ = true;
    }
    return exited_;
}

bool ProcessHandle::HasExited() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exited_;
}

std::optional<int> ProcessHandle::ExitCode() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!exited_) {
        return std::nullopt;
    }
    return exit_code_;
}

void ProcessHandle::Terminate() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid_ <= 0) {
        return;
    }
    if (!group_killed_) {
        group_killed_ = true;
        // Also takes down background jobs left behind by an exited leader.
        std::error_code ec;
        group_.terminate(ec);
        if (ec && ec.value() != ESRCH) {
            utils::Log(utils::LogLevel::kDebug, "session", "group kill failed",
                       {{"pid", std::to_string(pid_)}, {"error", ec.message()}});
        }
    }
    while (!exited_) {
        int status = 0;
        const auto waited = ::waitpid(pid_, &status, 0);
        if (waited == pid_) {
            RecordStatus(status);
        } else if (waited < 0 && errno != EINTR) {
            exited_ = true;
        }
    }
}

bool ProcessHandle::WriteInput(const std::string& data, std::string& error) {
    if (in_fd_ < 0) {
        error = "stdin is not connected";
        return false;
    }
    std::size_t written = 0;
    while (written < data.size()) {
        const auto n = ::write(in_fd_, data.data() + written, data.size() - written);
        if (n >= 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            error = std::strerror(errno);
            return false;
        }
        // Pipe full: wait for the child to read. Its output is drained
        // meanwhile so a child blocked on a full stdout cannot stall us.
        if (TryReap()) {
            error = "process exited";
            return false;
        }
        if (!WaitWritable(error)) {
            return false;
        }
    }
    return true;
}

bool ProcessHandle::WaitWritable(std::string& error) {
    std::vector<pollfd> fds{pollfd{in_fd_, POLLOUT, 0}};
    if (out_open_) {
        fds.push_back(pollfd{out_fd_, POLLIN, 0});
    }
    if (err_open_) {
        fds.push_back(pollfd{err_fd_, POLLIN, 0});
    }
    const auto rc = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), kWritePollMs);
    if (rc < 0) {
        if (errno == EINTR) {
            return true;
        }
        error = std::strerror(errno);
        return false;
    }
    if (fds[0].revents & (POLLERR | POLLNVAL)) {
        error = "process input closed";
        return false;
    }
    OutputChunk drained{};
    for (std::size_t i = 1; i < fds.size(); ++i) {
        if (fds[i].revents == 0) {
            continue;
        }
        if (fds[i].fd == out_fd_) {
            DrainFd(out_fd_, out_open_, drained.out, kPendingOutputCap, drained);
        } else {
            DrainFd(err_fd_, err_open_, drained.err, kPendingOutputCap, drained);
        }
    }
    if (drained.failed) {
        error = drained.error;
        return false;
    }
    KeepPending(pending_out_, drained.out);
    KeepPending(pending_err_, drained.err);
    return true;
}

void ProcessHandle::KeepPending(std::string& pending, const std::string& data) {
    const auto room = kPendingOutputCap > pending.size() ? kPendingOutputCap - pending.size() : 0;
    if (data.size() > room) {
        utils::Log(utils::LogLevel::kDebug, "session", "pending output full, dropping bytes",
                   {{"pid", std::to_string(pid_)}, {"dropped", std::to_string(data.size() - room)}});
    }
    pending.append(data, 0, std::min(room, data.size()));
}

OutputChunk ProcessHandle::ReadOutput(std::chrono::milliseconds wait, std::size_t max_bytes) {
    OutputChunk chunk{};
    chunk.out.swap(pending_out_);
    chunk.err.swap(pending_err_);
    if (!chunk.out.empty() || !chunk.err.empty()) {
        wait = std::chrono::milliseconds(0);
    }
    std::vector<pollfd> fds;
    if (out_open_) {
        fds.push_back(pollfd{out_fd_, POLLIN, 0});
    }
    if (err_open_) {
        fds.push_back(pollfd{err_fd_, POLLIN, 0});
    }
    if (fds.empty()) {
        chunk.closed = true;
        return chunk;
    }
    const auto out_limit = chunk.out.size() + max_bytes;
    const auto err_limit = chunk.err.size() + max_bytes;

    const auto rc = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), static_cast<int>(wait.count()));
    if (rc < 0) {
        if (errno != EINTR) {
            chunk.failed = true;
            chunk.error = std::strerror(errno);
        }
        return chunk;
    }
    for (const auto& entry : fds) {
        if (entry.revents == 0) {
            continue;
        }
        if (entry.fd == out_fd_) {
            DrainFd(out_fd_, out_open_, chunk.out, out_limit, chunk);
        } else {
            DrainFd(err_fd_, err_open_, chunk.err, err_limit, chunk);
        }
    }
    chunk.closed = OutputClosed();
    return chunk;
}

}  // namespace termgate::terminal
