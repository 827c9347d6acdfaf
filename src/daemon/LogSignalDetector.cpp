#include "daemon/LogSignalDetector.hpp"

#include <algorithm>

namespace rcs::daemon
{

std::optional<DetectedSignal> LogSignalDetector::observe(
    LogMessage const &message)
{
    if (state_ == State::Resolved)
    {
        return std::nullopt;
    }
    std::string_view const source = message.source;
    std::string_view const msg = message.msg;
    if (source.starts_with(kReadySourcePrefix) &&
        msg.starts_with(kReadyMessagePrefix))
    {
        state_ = State::Resolved;
        auto const offset = std::min(kReadyAnnouncement.size(), msg.size());
        return DetectedSignal{LifecycleSignal::Ready,
                              std::string(msg.substr(offset))};
    }
    if (msg.find(kStartFailureMarker) != std::string_view::npos)
    {
        state_ = State::Resolved;
        return DetectedSignal{LifecycleSignal::StartFailed, message.msg};
    }
    return std::nullopt;
}

} // namespace rcs::daemon
