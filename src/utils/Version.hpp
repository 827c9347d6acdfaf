#pragma once

namespace rcs::version
{

// Compile-time helpers derived from RCS_BUILD_VERSION that keep user-facing
// strings consistent.
inline constexpr char const kSemanticVersion[] = RCS_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] =
    "rclone-supervisor " RCS_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] =
    "rclone-supervisor/" RCS_BUILD_VERSION;

} // namespace rcs::version
