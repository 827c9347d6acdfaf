#pragma once

#include "utils/Json.hpp"

#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace rcs::rpc
{

// Address of one running rcd instance. auth is "user:password" and is sent
// as HTTP Basic credentials when not empty; uri is the base URL announced by
// the daemon, e.g. "http://127.0.0.1:5572/".
struct ServerInfo
{
    std::string auth;
    std::string uri;
};

// One in-flight remote control call.
//
// result() yields the decoded JSON body. It fails with DriverError:
//   CommandAborted          abort() was called before the call settled,
//   CommandTransportFailed  connection error, connection closed before a
//                           response, or a body that is not JSON.
// The HTTP status is not interpreted; rclone reports errors as JSON bodies.
// An aborted call never reports a transport failure.
//
// Destroying a pending CommandResult aborts it.
class CommandResult
{
  public:
    // Shared with the transport thread; defined in RemoteCommand.cpp.
    struct State;

    CommandResult(CommandResult &&other) noexcept;
    CommandResult &operator=(CommandResult &&other) noexcept;
    CommandResult(CommandResult const &) = delete;
    CommandResult &operator=(CommandResult const &) = delete;
    ~CommandResult();

    // Idempotent; no effect once the result settled.
    void abort() noexcept;

    std::future<json::Document> &result() noexcept { return future_; }

  private:
    CommandResult(std::shared_ptr<State> state, std::future<json::Document> future,
                  std::thread worker);
    void release() noexcept;

    std::shared_ptr<State> state_;
    std::future<json::Document> future_;
    std::thread worker_;

    friend CommandResult start_remote_command(ServerInfo const &server,
                                              std::string_view endpoint,
                                              std::string body);
};

// POSTs to server.uri + endpoint with an empty JSON object as body.
CommandResult remote_command(ServerInfo const &server, std::string_view endpoint);

CommandResult remote_command(ServerInfo const &server, std::string_view endpoint,
                             json::MutableDocument const &payload);

} // namespace rcs::rpc
