#pragma once

#include "process/Environment.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace rcs::process
{

enum class OutputStream
{
    Stdout,
    Stderr
};

char const *to_string(OutputStream stream) noexcept;

struct CommandLine
{
    std::string program;
    std::vector<std::string> args;
};

struct SyncResult
{
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;

    // stdout followed by stderr.
    std::string combined() const { return stdout_text + stderr_text; }
};

// Runs a command to completion and collects both output streams. Blocks the
// calling thread. With no environment the child inherits the caller's.
// Throws std::system_error if the process cannot be started.
SyncResult run_sync(CommandLine const &command,
                    std::optional<EnvironmentMap> const &environment);

// Handle for one asynchronously running child with captured stdout/stderr.
//
// Output chunks arrive on two reader threads, one per stream, so a sink may
// be called concurrently for different streams but never concurrently for
// the same one. on_exit runs after the process was reaped and both streams
// reported their end.
class ChildProcess
{
  public:
    struct Callbacks
    {
        std::function<void(OutputStream, std::string_view)> on_output;
        std::function<void(OutputStream)> on_stream_closed;
        std::function<void(int)> on_exit;
    };

    ChildProcess() = default;
    ChildProcess(ChildProcess const &) = delete;
    ChildProcess &operator=(ChildProcess const &) = delete;
    ~ChildProcess();

    // Throws std::system_error if the process cannot be started and
    // std::logic_error if this handle already owns a process.
    void start(CommandLine const &command,
               std::optional<EnvironmentMap> const &environment,
               Callbacks callbacks);

    pid_t pid() const noexcept { return pid_; }
    bool is_running() const noexcept;
    std::optional<int> exit_code() const;

    // SIGKILL to the child's process group. No-op once the child exited.
    bool kill() noexcept;
    // SIGTERM to the child's process group. No-op once the child exited.
    bool terminate() noexcept;

    // Blocks until the child exited and both streams were drained.
    // Must not be called from one of the callbacks.
    void wait();

  private:
    bool send_signal(int signal) noexcept;
    void read_stream(int fd, OutputStream stream);
    void reap();

    Callbacks callbacks_;
    pid_t pid_ = -1;
    std::thread stdout_reader_;
    std::thread stderr_reader_;
    std::thread reaper_;
    mutable std::mutex state_mutex_;
    std::atomic<bool> running_{false};
    bool exited_ = false;
    std::optional<int> exit_code_;
};

} // namespace rcs::process
