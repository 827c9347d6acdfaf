#pragma once

#include "daemon/DaemonSupervisor.hpp"
#include "process/Environment.hpp"
#include "process/Subprocess.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rcs::driver
{

struct DriverConfig
{
    std::optional<std::filesystem::path> binary_path;
    std::optional<std::filesystem::path> config_file;
};

struct DaemonOptions
{
    // Applied on top of the baseline; RCLONE_USE_JSON_LOG cannot be changed.
    process::EnvironmentMap overrides;
    // Put the parent environment underneath the baseline. Off by default, the
    // daemon then sees nothing but the layered variables.
    bool inherit_environment = false;
    // Runs before the process starts so no early record is missed.
    std::function<void(daemon::EventBus &)> subscribe;
};

// Baseline for `rclone rcd`: no prompts, JSON logs and read/write timeouts of
// one year so the control server never idles out.
process::EnvironmentMap rcd_baseline_environment(std::string const &config_file);

// Layers base (optional parent environment + baseline), caller overrides and
// the forced RCLONE_USE_JSON_LOG=true, in that order of precedence.
process::EnvironmentMap make_rcd_environment(std::string const &config_file,
                                             DaemonOptions const &options);

// Entry point to one rclone installation. The binary is resolved once at
// construction; every other call runs it again, so version and config file
// always reflect the installation as it is now.
//
// version(), version_at_least(), config_file() and command() block until the
// subprocess exits. They are one-shot calls, not meant for latency-critical
// paths.
class RcloneDriver
{
  public:
    // Throws DriverError(PathNotFound) for an explicit binary path that does
    // not exist.
    explicit RcloneDriver(DriverConfig config);

    std::filesystem::path const &binary() const noexcept { return binary_; }
    DriverConfig const &config() const noexcept { return config_; }

    // Canonical semantic version of the installed rclone, e.g. "1.60.0".
    // Throws DriverError(VersionDetectionFailed).
    std::string version() const;

    // Probes again on every call. Throws DriverError(VersionDetectionFailed)
    // when either side is not a semantic version.
    bool version_at_least(std::string_view min_version) const;

    // The configured file when one was given, default_config_file()
    // otherwise.
    std::filesystem::path config_file() const;

    // Asks rclone for its default config file path.
    // Throws DriverError(ConfigFileDetectionFailed).
    std::filesystem::path default_config_file() const;

    process::CommandLine command_line(std::vector<std::string> args) const;

    // Runs an arbitrary rclone subcommand to completion.
    // Throws DriverError(ProcessSpawnFailed).
    process::SyncResult command(
        std::vector<std::string> args,
        std::optional<process::EnvironmentMap> environment = std::nullopt) const;

    // Starts an arbitrary rclone subcommand with captured output.
    // Throws DriverError(ProcessSpawnFailed).
    std::unique_ptr<process::ChildProcess> command_async(
        std::vector<std::string> args,
        process::ChildProcess::Callbacks callbacks,
        std::optional<process::EnvironmentMap> environment = std::nullopt) const;

    // Launches `rclone rcd` under supervision and returns the running
    // supervisor. Resolves the config file first, so ConfigFileDetectionFailed
    // may be thrown besides ProcessSpawnFailed.
    std::unique_ptr<daemon::DaemonSupervisor> rcd(
        DaemonOptions const &options = {}) const;

  private:
    DriverConfig config_;
    std::filesystem::path binary_;
};

} // namespace rcs::driver
