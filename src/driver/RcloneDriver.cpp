#include "driver/RcloneDriver.hpp"

#include "driver/BinaryResolver.hpp"
#include "driver/Errors.hpp"
#include "utils/Endpoint.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Semver.hpp"

#include <system_error>
#include <utility>

namespace rcs::driver
{

namespace
{

constexpr char kServerTimeout[] = "8760h0m0s";

// Lines of text, split on "\n" with a trailing "\r" removed.
std::vector<std::string_view> split_lines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (true)
    {
        auto newline = text.find('\n', start);
        auto line = text.substr(start, newline == std::string_view::npos
                                           ? std::string_view::npos
                                           : newline - start);
        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (newline == std::string_view::npos)
        {
            break;
        }
        start = newline + 1;
    }
    return lines;
}

std::string_view last_token(std::string_view line)
{
    auto end = line.find_last_not_of(" \t");
    if (end == std::string_view::npos)
    {
        return {};
    }
    auto begin = line.find_last_of(" \t", end);
    begin = begin == std::string_view::npos ? 0 : begin + 1;
    return line.substr(begin, end - begin + 1);
}

} // namespace

process::EnvironmentMap rcd_baseline_environment(std::string const &config_file)
{
    return {
        {"RCLONE_AUTO_CONFIRM", "false"},
        {"RCLONE_CONFIG", config_file},
        {"RCLONE_PASSWORD", "false"},
        {"RCLONE_RC_SERVER_WRITE_TIMEOUT", kServerTimeout},
        {"RCLONE_RC_SERVER_READ_TIMEOUT", kServerTimeout},
        {"RCLONE_RC_WEB_GUI", "false"},
        {"RCLONE_RC_NO_AUTH", "false"},
        {"RCLONE_LOG_FORMAT", ""},
        {"RCLONE_LOG_LEVEL", "NOTICE"},
    };
}

process::EnvironmentMap make_rcd_environment(std::string const &config_file,
                                             DaemonOptions const &options)
{
    auto base = rcd_baseline_environment(config_file);
    if (options.inherit_environment)
    {
        base = process::layer_environment(process::current_environment(), base,
                                          {});
    }
    return process::layer_environment(base, options.overrides,
                                      {{"RCLONE_USE_JSON_LOG", "true"}});
}

RcloneDriver::RcloneDriver(DriverConfig config)
    : config_(std::move(config)), binary_(resolve_binary(config_.binary_path))
{
}

std::string RcloneDriver::version() const
{
    process::SyncResult result;
    try
    {
        // A broken or missing user config must not break the probe.
        result = process::run_sync(
            command_line({"version"}),
            process::EnvironmentMap{{"RCLONE_CONFIG", utils::null_device()}});
    }
    catch (std::system_error const &ex)
    {
        throw DriverError(ErrorKind::VersionDetectionFailed,
                          std::string("Cannot detect Rclone version: ") +
                              ex.what());
    }

    auto const output = net::trim_whitespace(result.combined());
    auto const first_line = split_lines(output).front();
    if (auto cleaned = utils::clean_semver(last_token(first_line)))
    {
        return *cleaned;
    }
    RCS_LOG_WARN("unrecognised `{} version` output: {}", binary_.string(),
                 std::string(first_line));
    throw DriverError(ErrorKind::VersionDetectionFailed,
                      "Cannot detect Rclone version.");
}

bool RcloneDriver::version_at_least(std::string_view min_version) const
{
    auto minimum = utils::parse_semver(min_version);
    if (!minimum)
    {
        throw DriverError(ErrorKind::VersionDetectionFailed,
                          "Invalid minimum version: " +
                              std::string(min_version));
    }
    auto installed = utils::parse_semver(version());
    if (!installed)
    {
        throw DriverError(ErrorKind::VersionDetectionFailed,
                          "Cannot detect Rclone version.");
    }
    return *installed >= *minimum;
}

std::filesystem::path RcloneDriver::config_file() const
{
    if (config_.config_file && !config_.config_file->empty())
    {
        return *config_.config_file;
    }
    return default_config_file();
}

std::filesystem::path RcloneDriver::default_config_file() const
{
    process::SyncResult result;
    try
    {
        result = process::run_sync(command_line({"config", "file"}),
                                   std::nullopt);
    }
    catch (std::system_error const &ex)
    {
        throw DriverError(ErrorKind::ConfigFileDetectionFailed,
                          std::string("Cannot detect default Rclone file: ") +
                              ex.what());
    }

    // "Configuration file is stored at:\n<path>\n"
    auto const output = net::trim_whitespace(result.combined());
    auto const lines = split_lines(output);
    std::string path =
        lines.size() > 1 ? net::trim_whitespace(lines[1]) : std::string();
    if (path.empty())
    {
        throw DriverError(ErrorKind::ConfigFileDetectionFailed,
                          "Cannot detect default Rclone file.");
    }
    return path;
}

process::CommandLine RcloneDriver::command_line(
    std::vector<std::string> args) const
{
    return process::CommandLine{binary_.string(), std::move(args)};
}

process::SyncResult RcloneDriver::command(
    std::vector<std::string> args,
    std::optional<process::EnvironmentMap> environment) const
{
    try
    {
        return process::run_sync(command_line(std::move(args)), environment);
    }
    catch (std::system_error const &ex)
    {
        throw DriverError(ErrorKind::ProcessSpawnFailed, ex.what());
    }
}

std::unique_ptr<process::ChildProcess> RcloneDriver::command_async(
    std::vector<std::string> args, process::ChildProcess::Callbacks callbacks,
    std::optional<process::EnvironmentMap> environment) const
{
    auto child = std::make_unique<process::ChildProcess>();
    try
    {
        child->start(command_line(std::move(args)), environment,
                     std::move(callbacks));
    }
    catch (std::system_error const &ex)
    {
        throw DriverError(ErrorKind::ProcessSpawnFailed, ex.what());
    }
    return child;
}

std::unique_ptr<daemon::DaemonSupervisor> RcloneDriver::rcd(
    DaemonOptions const &options) const
{
    auto environment = make_rcd_environment(config_file().string(), options);
    auto supervisor = std::make_unique<daemon::DaemonSupervisor>(
        command_line({"rcd"}), std::move(environment));
    if (options.subscribe)
    {
        options.subscribe(supervisor->events());
    }
    supervisor->start();
    return supervisor;
}

} // namespace rcs::driver
