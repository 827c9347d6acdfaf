#include "driver/BinaryResolver.hpp"
#include "driver/Errors.hpp"

#include "TestUtils.hpp"

#include <fstream>

#include <doctest/doctest.h>

using rcs::driver::HostPlatform;
using rcs::driver::resolve_binary;

TEST_CASE("platform_binary_name follows the platform")
{
    CHECK(std::string(rcs::driver::platform_binary_name(HostPlatform::Windows)) ==
          "rclone.exe");
    CHECK(std::string(rcs::driver::platform_binary_name(HostPlatform::Posix)) ==
          "rclone");
}

TEST_CASE("resolve_binary falls back to the bare name")
{
    CHECK(resolve_binary(std::nullopt, HostPlatform::Posix) == "rclone");
    CHECK(resolve_binary(std::filesystem::path(), HostPlatform::Windows) ==
          "rclone.exe");
}

TEST_CASE("resolve_binary appends the name to a directory")
{
    auto root = rcs::tests::make_temp_root("resolver-dir");
    CHECK(resolve_binary(root, HostPlatform::Posix) == root / "rclone");
    CHECK(resolve_binary(root, HostPlatform::Windows) == root / "rclone.exe");
}

TEST_CASE("resolve_binary keeps an existing file path")
{
    auto root = rcs::tests::make_temp_root("resolver-file");
    auto file = root / "custom-rclone";
    {
        std::ofstream out(file);
        out << "#!/bin/sh\n";
    }
    CHECK(resolve_binary(file, HostPlatform::Posix) == file);
}

TEST_CASE("resolve_binary rejects a missing path")
{
    auto root = rcs::tests::make_temp_root("resolver-missing");
    auto missing = root / "nope";
    try
    {
        resolve_binary(missing, HostPlatform::Posix);
        FAIL("expected DriverError");
    }
    catch (rcs::driver::DriverError const &ex)
    {
        CHECK(ex.kind() == rcs::driver::ErrorKind::PathNotFound);
        CHECK(std::string(ex.what()).find(missing.string()) != std::string::npos);
    }
}
