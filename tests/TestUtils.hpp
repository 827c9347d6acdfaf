#pragma once

#include "process/Environment.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rcs::tests
{

inline std::filesystem::path make_temp_root(std::string_view tag)
{
    auto root =
        std::filesystem::temp_directory_path() / "rcs-tests" / std::string(tag);
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

// Imitates the rclone subcommands the driver uses. `rcd` behaviour is picked
// by FAKE_RCD_MODE so one script serves every supervisor test.
inline constexpr char kFakeRcloneScript[] = R"SH(#!/bin/sh
case "$1" in
  version)
    echo "rclone v1.60.0"
    echo "- os/version: fake"
    echo "- go/version: go1.19"
    ;;
  config)
    echo "Configuration file is stored at:"
    echo "  /home/fake/.config/rclone/rclone.conf  "
    ;;
  rcd)
    case "$FAKE_RCD_MODE" in
      ready)
        echo '{"level":"notice","msg":"Serving remote control on http://127.0.0.1:5572/","source":"rcserver/rcserver.go:72","time":"2026-01-01T00:00:00Z"}'
        echo '{"level":"notice","msg":"Serving remote control on http://127.0.0.1:9999/","source":"rcserver/rcserver.go:72","time":"2026-01-01T00:00:01Z"}'
        exec sleep 30
        ;;
      fail)
        echo '{"level":"error","msg":"Failed to start remote control: address already in use","source":"rcd/rcd.go:55","time":"2026-01-01T00:00:00Z"}'
        echo '{"level":"notice","msg":"Serving remote control on http://127.0.0.1:5572/","source":"rcserver/rcserver.go:72","time":"2026-01-01T00:00:01Z"}'
        exec sleep 30
        ;;
      env)
        echo "{\"level\":\"info\",\"msg\":\"$RCLONE_USE_JSON_LOG|$RCLONE_LOG_LEVEL|$RCLONE_CONFIG|$RCLONE_AUTO_CONFIRM\",\"source\":\"fake\",\"time\":\"t\"}"
        ;;
      split)
        printf '{"level":"info","msg":"first ha'
        sleep 1
        printf 'lf","source":"fake","time":"t"}\n\n'
        printf 'tail without newline'
        ;;
      *)
        printf 'panic: something bad' >&2
        exit 2
        ;;
    esac
    ;;
  *)
    echo "unknown command $1" >&2
    exit 1
    ;;
esac
)SH";

// An rclone that runs but whose answers cannot be understood.
inline constexpr char kUnreadableRcloneScript[] = R"SH(#!/bin/sh
case "$1" in
  version)
    echo "rclone DEV-build"
    ;;
  config)
    echo "Configuration file is stored at:"
    ;;
  *)
    exit 1
    ;;
esac
)SH";

inline std::filesystem::path write_fake_rclone(
    std::filesystem::path const &dir, char const *script = kFakeRcloneScript)
{
    auto path = dir / "rclone";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << script;
    }
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec,
                                 std::filesystem::perm_options::replace);
    return path;
}

// Environment for a fake rcd: the mode plus PATH so the script finds sleep.
inline process::EnvironmentMap fake_rcd_environment(std::string const &mode)
{
    process::EnvironmentMap environment{{"FAKE_RCD_MODE", mode}};
    if (auto const *path = std::getenv("PATH"))
    {
        environment["PATH"] = path;
    }
    else
    {
        environment["PATH"] = "/usr/bin:/bin";
    }
    return environment;
}

// Thread-safe sink for events delivered on another thread.
template <typename T> class Collector
{
  public:
    void add(T value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(value));
        }
        cv_.notify_all();
    }

    bool wait_for_count(std::size_t count, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout,
                            [&] { return items_.size() >= count; });
    }

    std::vector<T> snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<T> items_;
};

} // namespace rcs::tests
