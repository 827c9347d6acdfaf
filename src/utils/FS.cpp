#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>
#include <ShlObj.h>
#endif

namespace rcs::utils
{

namespace
{
constexpr char kAppDirectoryName[] = "rclone-supervisor";

std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate, ec))
    {
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> env_path(char const *key)
{
    auto const *value = std::getenv(key);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}
} // namespace

std::optional<std::filesystem::path> app_data_root()
{
#if defined(_WIN32)
    PWSTR local_app = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, KF_FLAG_CREATE,
                                       nullptr, &local_app)) &&
        local_app)
    {
        std::filesystem::path path(local_app);
        CoTaskMemFree(local_app);
        path /= kAppDirectoryName;
        if (auto ensured = ensure_directory(path))
        {
            return *ensured;
        }
    }
#elif defined(__APPLE__)
    if (auto home = env_path("HOME"))
    {
        auto path = *home / "Library" / "Logs" / kAppDirectoryName;
        if (auto ensured = ensure_directory(path))
        {
            return *ensured;
        }
    }
#else
    std::optional<std::filesystem::path> base = env_path("XDG_STATE_HOME");
    if (!base)
    {
        if (auto home = env_path("HOME"))
        {
            base = *home / ".local" / "state";
        }
    }
    if (base)
    {
        if (auto ensured = ensure_directory(*base / kAppDirectoryName))
        {
            return *ensured;
        }
    }
#endif
    return std::nullopt;
}

char const *null_device() noexcept
{
#if defined(_WIN32)
    return "NUL";
#else
    return "/dev/null";
#endif
}

} // namespace rcs::utils
