#pragma once

#include "daemon/LogMessage.hpp"
#include "process/Subprocess.hpp"

#include <string>

namespace rcs::daemon
{

// One per line read from either output stream of the daemon.
struct LogMessageEvent
{
    LogMessage message;
    process::OutputStream stream = process::OutputStream::Stdout;
};

// The remote control server announced its address.
struct DaemonReadyEvent
{
    std::string address;
};

// The daemon reported that its remote control server could not start. The
// process has already been killed when this is published.
struct DaemonStartFailedEvent
{
    std::string message;
};

struct DaemonExitedEvent
{
    int exit_code = -1;
};

} // namespace rcs::daemon
