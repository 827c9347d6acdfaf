#include "app/SupervisorMain.hpp"
#include "daemon/DaemonSupervisor.hpp"
#include "driver/Errors.hpp"
#include "driver/RcloneDriver.hpp"
#include "rpc/RemoteCommand.hpp"
#include "utils/Endpoint.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace
{

constexpr std::chrono::milliseconds kDefaultReadyTimeout{10000};

std::optional<std::string> read_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::string(value);
}

std::chrono::milliseconds ready_timeout()
{
    auto raw = read_env("RCS_READY_TIMEOUT_MS");
    if (!raw)
    {
        return kDefaultReadyTimeout;
    }
    long long value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc() || ptr != raw->data() + raw->size() || value <= 0)
    {
        RCS_LOG_WARN("ignoring invalid RCS_READY_TIMEOUT_MS={}", *raw);
        return kDefaultReadyTimeout;
    }
    return std::chrono::milliseconds(value);
}

// Mirrors one daemon record into our own log at a matching level.
void mirror_daemon_record(rcs::daemon::LogMessageEvent const &event)
{
    auto const &message = event.message;
    std::string_view const level = message.level;
    if (level == "error" || level == "critical")
    {
        RCS_LOG_ERROR("[rclone {}] {}", message.source, message.msg);
    }
    else if (level == "warning")
    {
        RCS_LOG_WARN("[rclone {}] {}", message.source, message.msg);
    }
    else if (level == "debug")
    {
        RCS_LOG_DEBUG("[rclone {}] {}", message.source, message.msg);
    }
    else
    {
        RCS_LOG_INFO("[rclone {}] {}", message.source, message.msg);
    }
}

int run_remote_command(rcs::rpc::ServerInfo const &server,
                       std::string_view endpoint,
                       std::optional<std::string_view> payload_text)
{
    std::optional<rcs::rpc::CommandResult> call;
    if (payload_text)
    {
        auto parsed = rcs::json::Document::parse(*payload_text);
        if (!parsed.is_valid())
        {
            rcs::log::print_status("payload is not valid JSON: {}", *payload_text);
            return 1;
        }
        call.emplace(rcs::rpc::remote_command(
            server, endpoint, rcs::json::MutableDocument::from(parsed)));
    }
    else
    {
        call.emplace(rcs::rpc::remote_command(server, endpoint));
    }

    auto &future = call->result();
    while (future.wait_for(std::chrono::milliseconds(100)) !=
           std::future_status::ready)
    {
        if (rcs::runtime::should_shutdown())
        {
            call->abort();
        }
    }
    auto document = future.get();
    rcs::log::print_status("{}", document.write(true));
    return 0;
}

} // namespace

namespace rcs::app
{

int supervisor_main(int argc, char *argv[])
{
    try
    {
        rcs::runtime::install_shutdown_signal_handlers();
        RCS_LOG_INFO("{} starting", rcs::version::kDisplayVersion);

        rcs::driver::DriverConfig config;
        if (auto binary = read_env("RCS_RCLONE_BINARY"))
        {
            config.binary_path = *binary;
        }
        if (auto config_file = read_env("RCS_RCLONE_CONFIG"))
        {
            config.config_file = *config_file;
        }

        rcs::driver::RcloneDriver driver(config);
        rcs::log::print_status("rclone binary: {}", driver.binary().string());
        rcs::log::print_status("rclone version: {}", driver.version());
        auto const config_file = driver.config_file();
        rcs::log::print_status("rclone config: {}", config_file.string());

        rcs::driver::DaemonOptions options;
        rcs::rpc::ServerInfo server;
        auto user = read_env("RCS_RC_USER");
        auto pass = read_env("RCS_RC_PASS");
        if (user && pass)
        {
            options.overrides["RCLONE_RC_USER"] = *user;
            options.overrides["RCLONE_RC_PASS"] = *pass;
            server.auth = *user + ":" + *pass;
        }
        else
        {
            // Without credentials, calls that need auth are refused unless
            // authentication is switched off.
            options.overrides["RCLONE_RC_NO_AUTH"] = "true";
        }
        options.subscribe = [](rcs::daemon::EventBus &events)
        {
            events.subscribe<rcs::daemon::LogMessageEvent>(mirror_daemon_record);
            events.subscribe<rcs::daemon::DaemonExitedEvent>(
                [](rcs::daemon::DaemonExitedEvent const &)
                { rcs::runtime::request_shutdown(); });
        };

        auto daemon = driver.rcd(options);
        auto ready = daemon->ready();
        if (ready.wait_for(ready_timeout()) != std::future_status::ready)
        {
            rcs::log::print_status("rclone rcd did not report readiness in time");
            daemon->stop();
            return 1;
        }
        server.uri = ready.get();

        auto [host, port] = rcs::net::parse_url_host_port(server.uri);
        if (!host.empty() && !rcs::net::is_loopback_host(host))
        {
            RCS_LOG_WARN("rclone rcd is serving on non-loopback host {}", host);
        }
        rcs::log::print_status("rclone rcd serving on {}", server.uri);

        int status = 0;
        if (argc > 1)
        {
            std::optional<std::string_view> payload;
            if (argc > 2)
            {
                payload = argv[2];
            }
            status = run_remote_command(server, argv[1], payload);
        }
        else
        {
            rcs::log::print_status("rclone rcd running; CTRL+C to stop.");
            while (!rcs::runtime::wait_for_shutdown(std::chrono::seconds(1)))
            {
            }
            RCS_LOG_INFO("Shutdown requested; stopping rclone rcd");
        }

        daemon->stop();
        if (auto code = daemon->process().exit_code())
        {
            RCS_LOG_INFO("rclone rcd exit status {}", *code);
        }
        return status;
    }
    catch (rcs::driver::DriverError const &ex)
    {
        RCS_LOG_ERROR("{}: {}", rcs::driver::to_string(ex.kind()), ex.what());
        rcs::log::print_status("rclone-supervisor failed: {}", ex.what());
    }
    catch (std::exception const &ex)
    {
        RCS_LOG_ERROR("unexpected failure: {}", ex.what());
        rcs::log::print_status("rclone-supervisor failed: {}", ex.what());
    }
    return 1;
}

} // namespace rcs::app

int main(int argc, char *argv[])
{
    return rcs::app::supervisor_main(argc, argv);
}
