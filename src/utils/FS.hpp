#pragma once

#include <filesystem>
#include <optional>

namespace rcs::utils
{

std::optional<std::filesystem::path> app_data_root();

// Path of the platform null device ("/dev/null" or "NUL").
char const *null_device() noexcept;

} // namespace rcs::utils
