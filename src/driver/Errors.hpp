#pragma once

#include <stdexcept>
#include <string>

namespace rcs::driver
{

enum class ErrorKind
{
    PathNotFound,
    VersionDetectionFailed,
    ConfigFileDetectionFailed,
    ProcessSpawnFailed,
    DaemonStartFailed,
    CommandTransportFailed,
    CommandAborted,
};

constexpr char const *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::PathNotFound:
        return "PathNotFound";
    case ErrorKind::VersionDetectionFailed:
        return "VersionDetectionFailed";
    case ErrorKind::ConfigFileDetectionFailed:
        return "ConfigFileDetectionFailed";
    case ErrorKind::ProcessSpawnFailed:
        return "ProcessSpawnFailed";
    case ErrorKind::DaemonStartFailed:
        return "DaemonStartFailed";
    case ErrorKind::CommandTransportFailed:
        return "CommandTransportFailed";
    case ErrorKind::CommandAborted:
        return "CommandAborted";
    }
    return "Unknown";
}

class DriverError : public std::runtime_error
{
  public:
    DriverError(ErrorKind kind, std::string const &message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

} // namespace rcs::driver
