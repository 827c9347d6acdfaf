#pragma once

#include <chrono>
#include <cstdio>
#include <exception>
#include <ctime>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace rcs::log
{

// Non-templated file append (defined in Log.cpp).
void append_log_line_to_file(std::string const &line);

// If RCS_ENABLE_LOGGING is defined and non-zero, it takes absolute
// precedence over RCS_BUILD_MINIMAL. This allows enabling logs temporarily
// in minimal builds for diagnostics.
#if (defined(RCS_ENABLE_LOGGING) && (RCS_ENABLE_LOGGING)) ||                  \
    !defined(RCS_BUILD_MINIMAL)
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    const auto now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    // The file copy is best effort; a full disk must not take the caller down.
    try
    {
        append_log_line_to_file(final);
    }
    catch (std::exception const &)
    {
    }
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

} // namespace rcs::log

#if (defined(RCS_ENABLE_LOGGING) && (RCS_ENABLE_LOGGING)) ||                  \
    !defined(RCS_BUILD_MINIMAL)
#define RCS_LOG_INFO(fmt, ...) rcs::log::write_line('I', fmt, ##__VA_ARGS__)
#define RCS_LOG_DEBUG(fmt, ...) rcs::log::write_line('D', fmt, ##__VA_ARGS__)
#define RCS_LOG_WARN(fmt, ...) rcs::log::write_line('W', fmt, ##__VA_ARGS__)
#define RCS_LOG_ERROR(fmt, ...) rcs::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#define RCS_LOG_INFO(fmt, ...) (void)0
#define RCS_LOG_DEBUG(fmt, ...) (void)0
#define RCS_LOG_WARN(fmt, ...) (void)0
#define RCS_LOG_ERROR(fmt, ...) (void)0
#endif
