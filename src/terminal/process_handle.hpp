#pragma once

#include <boost/process/v1.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace termgate::terminal {

class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SpawnOptions {
    // Absolute path, relative path, or a bare name looked up in PATH.
    std::string executable;
    std::vector<std::string> args;
    std::string working_dir;
    std::unordered_map<std::string, std::string> env;
    bool pipe_stdin = false;
};

struct OutputChunk {
    std::string out;
    std::string err;
    bool closed = false;
    bool failed = false;
    std::string error;
};

// Owns one child process running in its own process group, the parent ends of
// its pipes, and the obligation to reap it. Read/Write calls must be
// serialized by the caller; Terminate and TryReap may be called from any
// thread.
class ProcessHandle {
public:
    // Throws SpawnError with the OS error text.
    static std::unique_ptr<ProcessHandle> Spawn(const SpawnOptions& options);

    ~ProcessHandle();
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    int Pid() const { return pid_; }

    // Non-blocking exit check; reaps the leader when it has exited.
    bool TryReap();
    bool HasExited() const;
    // Exit code, or 128 + signal for a signalled process.
    std::optional<int> ExitCode() const;

    // Kills the whole process group and reaps the leader. Idempotent.
    void Terminate();

    // Blocks while the input pipe is full, for as long as the child is alive.
    // Fails only on a real I/O error or once the child has exited.
    bool WriteInput(const std::string& data, std::string& error);

    // Returns output drained during a blocked write first. Otherwise waits up
    // to `wait` for stdout or stderr, then reads what is immediately
    // available, at most max_bytes per stream.
    OutputChunk ReadOutput(std::chrono::milliseconds wait, std::size_t max_bytes);

    bool OutputClosed() const { return !out_open_ && !err_open_; }

private:
    ProcessHandle() = default;

    void RecordStatus(int status);
    bool WaitWritable(std::string& error);
    void KeepPending(std::string& pending, const std::string& data);

    boost::process::v1::child child_;
    boost::process::v1::group group_;
    boost::process::v1::pipe in_pipe_;
    boost::process::v1::pipe out_pipe_;
    boost::process::v1::pipe err_pipe_;

    int pid_ = -1;
    int in_fd_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    bool out_open_ = false;
    bool err_open_ = false;
    std::string pending_out_;
    std::string pending_err_;

    mutable std::mutex state_mutex_;
    bool exited_ = false;
    bool group_killed_ = false;
    int exit_code_ = -1;
};

}  // namespace termgate::terminal
