#include "driver/BinaryResolver.hpp"
#include "driver/Errors.hpp"

#include <system_error>

namespace rcs::driver
{

char const *platform_binary_name(HostPlatform platform) noexcept
{
    return platform == HostPlatform::Windows ? "rclone.exe" : "rclone";
}

std::filesystem::path resolve_binary(
    std::optional<std::filesystem::path> const &explicit_path,
    HostPlatform platform)
{
    if (!explicit_path || explicit_path->empty())
    {
        return platform_binary_name(platform);
    }

    std::error_code ec;
    if (!std::filesystem::exists(*explicit_path, ec) || ec)
    {
        throw DriverError(ErrorKind::PathNotFound,
                          "Path: " + explicit_path->string() +
                              " does not exist");
    }
    // A symlink to a directory is taken as the binary itself.
    if (std::filesystem::is_directory(
            std::filesystem::symlink_status(*explicit_path, ec)))
    {
        return *explicit_path / platform_binary_name(platform);
    }
    return *explicit_path;
}

} // namespace rcs::driver
