#include "daemon/DaemonSupervisor.hpp"

#include "driver/Errors.hpp"
#include "utils/Log.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace rcs::daemon
{

DaemonSupervisor::DaemonSupervisor(process::CommandLine command,
                                   process::EnvironmentMap environment)
    : command_(std::move(command)), environment_(std::move(environment)),
      ready_future_(ready_promise_.get_future().share()),
      stdout_framer_([this](std::string_view line)
                     { dispatch_line(process::OutputStream::Stdout, line); }),
      stderr_framer_([this](std::string_view line)
                     { dispatch_line(process::OutputStream::Stderr, line); })
{
}

DaemonSupervisor::~DaemonSupervisor()
{
    stop();
}

void DaemonSupervisor::start()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_)
    {
        return;
    }
    started_ = true;
    executor_.start();

    process::ChildProcess::Callbacks callbacks;
    callbacks.on_output = [this](process::OutputStream stream,
                                 std::string_view chunk)
    {
        auto &framer = stream == process::OutputStream::Stdout
                           ? stdout_framer_
                           : stderr_framer_;
        framer.push(chunk);
    };
    callbacks.on_stream_closed = [this](process::OutputStream stream)
    {
        auto &framer = stream == process::OutputStream::Stdout
                           ? stdout_framer_
                           : stderr_framer_;
        framer.finish();
    };
    callbacks.on_exit = [this](int exit_code)
    {
        executor_.post(
            [this, exit_code]
            {
                RCS_LOG_INFO("rclone rcd exited with status {}", exit_code);
                deliver(DaemonExitedEvent{exit_code});
            });
    };

    try
    {
        process_.start(command_, environment_, std::move(callbacks));
    }
    catch (std::system_error const &ex)
    {
        RCS_LOG_ERROR("unable to launch {}: {}", command_.program, ex.what());
        throw driver::DriverError(driver::ErrorKind::ProcessSpawnFailed,
                                  ex.what());
    }
    RCS_LOG_INFO("launched {} rcd (pid {})", command_.program, process_.pid());
}

void DaemonSupervisor::stop()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_)
    {
        return;
    }
    stopped_ = true;
    if (process_.kill())
    {
        RCS_LOG_INFO("killed rclone rcd (pid {})", process_.pid());
    }
    process_.wait();
    executor_.shutdown();
}

void DaemonSupervisor::dispatch_line(process::OutputStream stream,
                                     std::string_view line)
{
    executor_.post([this, stream, text = std::string(line)]
                   { handle_line(stream, text); });
}

void DaemonSupervisor::handle_line(process::OutputStream stream,
                                   std::string const &line)
{
    auto message = parse_log_line(line);
    auto signal = detector_.observe(message);

    // Settle the lifecycle before any handler runs.
    if (signal && signal->kind == LifecycleSignal::Ready)
    {
        RCS_LOG_INFO("rclone rcd serving on {}", signal->payload);
        ready_promise_.set_value(signal->payload);
    }
    else if (signal)
    {
        RCS_LOG_ERROR("rclone rcd failed to start: {}", signal->payload);
        process_.kill();
        ready_promise_.set_exception(std::make_exception_ptr(
            driver::DriverError(driver::ErrorKind::DaemonStartFailed,
                                signal->payload)));
    }

    deliver(LogMessageEvent{std::move(message), stream});
    if (!signal)
    {
        return;
    }
    if (signal->kind == LifecycleSignal::Ready)
    {
        deliver(DaemonReadyEvent{signal->payload});
    }
    else
    {
        deliver(DaemonStartFailedEvent{signal->payload});
    }
}

} // namespace rcs::daemon
