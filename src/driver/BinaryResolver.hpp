#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace rcs::driver
{

enum class HostPlatform
{
    Windows,
    Posix
};

constexpr HostPlatform host_platform() noexcept
{
#if defined(_WIN32)
    return HostPlatform::Windows;
#else
    return HostPlatform::Posix;
#endif
}

// "rclone.exe" on Windows, "rclone" everywhere else.
char const *platform_binary_name(HostPlatform platform = host_platform()) noexcept;

// Without an explicit path the bare executable name is returned and left to
// the PATH search at spawn time. An explicit path must exist (PathNotFound
// otherwise); a directory gets the executable name appended, anything else
// is returned unchanged.
std::filesystem::path resolve_binary(
    std::optional<std::filesystem::path> const &explicit_path,
    HostPlatform platform = host_platform());

} // namespace rcs::driver
