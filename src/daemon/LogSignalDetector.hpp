#pragma once

#include "daemon/LogMessage.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rcs::daemon
{

// Source file of rclone's remote control server, as reported in "source".
inline constexpr std::string_view kReadySourcePrefix = "rcserver/rcserver.go";
inline constexpr std::string_view kReadyMessagePrefix = "Serving remote control";
// The address is everything after this sentence. The offset is tied to
// rclone's exact wording; a reworded announcement yields a wrong address.
inline constexpr std::string_view kReadyAnnouncement = "Serving remote control on ";
inline constexpr std::string_view kStartFailureMarker =
    "Failed to start remote control:";

enum class LifecycleSignal
{
    Ready,
    StartFailed
};

struct DetectedSignal
{
    LifecycleSignal kind;
    // Ready: the serving address. StartFailed: the whole log message.
    std::string payload;
};

// Watches daemon log records for the first readiness or start failure
// announcement. Once either was seen it stops looking.
class LogSignalDetector
{
  public:
    enum class State
    {
        Awaiting,
        Resolved
    };

    std::optional<DetectedSignal> observe(LogMessage const &message);

    State state() const noexcept { return state_; }

  private:
    State state_ = State::Awaiting;
};

} // namespace rcs::daemon
