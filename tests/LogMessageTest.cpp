#include "daemon/LogMessage.hpp"
#include "daemon/LogSignalDetector.hpp"

#include <string>
#include <utility>

#include <doctest/doctest.h>

using rcs::daemon::LifecycleSignal;
using rcs::daemon::LogMessage;
using rcs::daemon::LogSignalDetector;
using rcs::daemon::parse_log_line;

namespace
{

LogMessage ready_record(std::string msg)
{
    return LogMessage{"notice", std::move(msg), "rcserver/rcserver.go:72",
                      "2026-01-01T00:00:00Z"};
}

} // namespace

TEST_CASE("parse_log_line reads structured records")
{
    auto message = parse_log_line(
        R"({"level":"notice","msg":"hello","source":"cmd/x.go:1","time":"t0","extra":1})");
    CHECK(message.level == "notice");
    CHECK(message.msg == "hello");
    CHECK(message.source == "cmd/x.go:1");
    CHECK(message.time == "t0");
}

TEST_CASE("parse_log_line leaves missing fields empty")
{
    auto message = parse_log_line(R"({"msg":"only a message"})");
    CHECK(message.level.empty());
    CHECK(message.msg == "only a message");
    CHECK(message.source.empty());
    CHECK(message.time.empty());
}

TEST_CASE("parse_log_line turns plain text into an error record")
{
    auto message = parse_log_line("panic: runtime error");
    CHECK(message.level == "error");
    CHECK(message.msg == "panic: runtime error");
    CHECK(message.source.empty());
    REQUIRE(message.time.size() == 24);
    CHECK(message.time.back() == 'Z');
    CHECK(message.time[10] == 'T');

    CHECK(parse_log_line("[1,2]").level == "error");
    CHECK(parse_log_line("").msg.empty());
}

TEST_CASE("LogSignalDetector extracts the serving address")
{
    LogSignalDetector detector;
    CHECK_FALSE(detector.observe(LogMessage{"notice", "Serving remote control",
                                            "cmd/other.go:1", ""})
                    .has_value());

    auto signal =
        detector.observe(ready_record("Serving remote control on http://127.0.0.1:5572/"));
    REQUIRE(signal.has_value());
    CHECK(signal->kind == LifecycleSignal::Ready);
    CHECK(signal->payload == "http://127.0.0.1:5572/");
    CHECK(detector.state() == LogSignalDetector::State::Resolved);

    CHECK_FALSE(detector.observe(ready_record("Serving remote control on http://x/"))
                    .has_value());
}

TEST_CASE("LogSignalDetector reports a start failure once")
{
    LogSignalDetector detector;
    auto const text =
        std::string("Failed to start remote control: listen tcp: address in use");
    auto signal = detector.observe(LogMessage{"error", text, "rcd/rcd.go:55", ""});
    REQUIRE(signal.has_value());
    CHECK(signal->kind == LifecycleSignal::StartFailed);
    CHECK(signal->payload == text);

    CHECK_FALSE(detector.observe(ready_record("Serving remote control on http://x/"))
                    .has_value());
}

TEST_CASE("LogSignalDetector tolerates a short announcement")
{
    LogSignalDetector detector;
    auto signal = detector.observe(ready_record("Serving remote control"));
    REQUIRE(signal.has_value());
    CHECK(signal->payload.empty());
}
