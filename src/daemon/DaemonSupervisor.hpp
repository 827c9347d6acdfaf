#pragma once

#include "daemon/EventBus.hpp"
#include "daemon/Events.hpp"
#include "daemon/LogSignalDetector.hpp"
#include "daemon/SerialExecutor.hpp"
#include "process/Environment.hpp"
#include "process/LineFramer.hpp"
#include "process/Subprocess.hpp"
#include "utils/Log.hpp"

#include <exception>
#include <future>
#include <mutex>
#include <string>

namespace rcs::daemon
{

// Supervises one `rclone rcd` process.
//
// Both output streams are framed into lines, each line is parsed into a
// LogMessage and published as LogMessageEvent. Readiness and start failure
// are detected from those records:
//   - DaemonReadyEvent once, with the serving address; ready() resolves.
//   - DaemonStartFailedEvent once; the process is killed first and ready()
//     fails with DriverError(DaemonStartFailed).
// Events are delivered from a single worker thread in arrival order.
// Handlers must not call stop() or destroy the supervisor.
//
// Nothing is retried. A daemon that exits without announcing either outcome
// leaves ready() pending until the supervisor is destroyed, so waiters need
// their own timeout.
class DaemonSupervisor
{
  public:
    DaemonSupervisor(process::CommandLine command,
                     process::EnvironmentMap environment);
    DaemonSupervisor(DaemonSupervisor const &) = delete;
    DaemonSupervisor &operator=(DaemonSupervisor const &) = delete;
    ~DaemonSupervisor();

    // Subscribe before start() to see every record.
    EventBus &events() noexcept { return events_; }

    // Throws DriverError(ProcessSpawnFailed) when the binary cannot run.
    void start();

    // Kills a still running daemon, waits for it and delivers pending events.
    void stop();

    std::shared_future<std::string> ready() const { return ready_future_; }

    process::ChildProcess &process() noexcept { return process_; }
    process::CommandLine const &command() const noexcept { return command_; }
    process::EnvironmentMap const &environment() const noexcept
    {
        return environment_;
    }

  private:
    void handle_line(process::OutputStream stream, std::string const &line);
    void dispatch_line(process::OutputStream stream, std::string_view line);

    // A throwing handler is logged; events published after it and the
    // supervisor's own bookkeeping still go ahead.
    template <typename T> void deliver(T const &event)
    {
        try
        {
            events_.publish(event);
        }
        catch (std::exception const &ex)
        {
            RCS_LOG_ERROR("event handler threw: {}", ex.what());
        }
        catch (...)
        {
            RCS_LOG_ERROR("event handler threw a non-standard exception");
        }
    }

    process::CommandLine command_;
    process::EnvironmentMap environment_;

    EventBus events_;
    SerialExecutor executor_;
    LogSignalDetector detector_;
    std::promise<std::string> ready_promise_;
    std::shared_future<std::string> ready_future_;

    // Each framer is only touched by its stream's reader thread.
    process::LineFramer stdout_framer_;
    process::LineFramer stderr_framer_;

    std::mutex lifecycle_mutex_;
    bool started_ = false;
    bool stopped_ = false;

    // Declared last: its reader threads feed the framers and the executor.
    process::ChildProcess process_;
};

} // namespace rcs::daemon
