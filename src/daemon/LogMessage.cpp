#include "daemon/LogMessage.hpp"

#include "utils/Json.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace rcs::daemon
{

namespace
{

std::string member_or_empty(yyjson_val *object, char const *key)
{
    if (auto value = rcs::json::string_member(object, key))
    {
        return std::string(*value);
    }
    return {};
}

} // namespace

std::string current_timestamp()
{
    auto const now = std::chrono::system_clock::now();
    auto const millis = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    char buffer[32]{};
    auto length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buffer + length, sizeof(buffer) - length, ".%03dZ", millis);
    return buffer;
}

LogMessage parse_log_line(std::string_view line)
{
    auto doc = rcs::json::Document::parse(line);
    auto *root = doc.root();
    if (root != nullptr && yyjson_is_obj(root))
    {
        LogMessage message;
        message.level = member_or_empty(root, "level");
        message.msg = member_or_empty(root, "msg");
        message.source = member_or_empty(root, "source");
        message.time = member_or_empty(root, "time");
        return message;
    }

    LogMessage fallback;
    fallback.level = "error";
    fallback.msg = std::string(line);
    fallback.time = current_timestamp();
    return fallback;
}

} // namespace rcs::daemon
