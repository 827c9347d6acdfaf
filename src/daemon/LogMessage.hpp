#pragma once

#include <string>
#include <string_view>

namespace rcs::daemon
{

// One structured log record emitted by rclone with RCLONE_USE_JSON_LOG set.
// level is kept verbatim ("error", "warning", "notice", "info", "debug").
struct LogMessage
{
    std::string level;
    std::string msg;
    std::string source;
    std::string time;
};

// Never fails: a line that is not a JSON object becomes an "error" record
// whose msg is the raw line, with an empty source and the current time.
LogMessage parse_log_line(std::string_view line);

// UTC "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string current_timestamp();

} // namespace rcs::daemon
