#include "rpc/RemoteCommand.hpp"

#include "driver/Errors.hpp"
#include "utils/Base64.hpp"
#include "utils/Endpoint.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <mongoose.h>

#include <atomic>
#include <exception>
#include <utility>

namespace rcs::rpc
{

namespace
{

constexpr int kPollIntervalMs = 20;

std::string build_http_request(std::string const &url, ServerInfo const &server,
                               std::string_view body)
{
    std::string request;
    request.reserve(256 + body.size());
    request += "POST ";
    request += mg_url_uri(url.c_str());
    request += " HTTP/1.1\r\nHost: ";
    request += net::host_header_for_url(url);
    request += "\r\nUser-Agent: ";
    request += rcs::version::kUserAgentVersion;
    request += "\r\nContent-Type: application/json\r\nContent-Length: ";
    request += std::to_string(body.size());
    if (!server.auth.empty())
    {
        request += "\r\nAuthorization: ";
        request += utils::basic_authorization(server.auth);
    }
    request += "\r\nConnection: close\r\n\r\n";
    request.append(body);
    return request;
}

} // namespace

struct CommandResult::State
{
    std::string url;
    std::string request;
    std::promise<json::Document> promise;
    std::atomic<bool> settled{false};
    std::atomic<bool> abort_requested{false};
    bool request_sent = false;

    bool try_settle()
    {
        bool expected = false;
        return settled.compare_exchange_strong(expected, true);
    }

    void succeed(json::Document document)
    {
        if (try_settle())
        {
            promise.set_value(std::move(document));
        }
    }

    void fail(driver::ErrorKind kind, std::string const &message)
    {
        if (try_settle())
        {
            if (kind == driver::ErrorKind::CommandTransportFailed)
            {
                RCS_LOG_WARN("remote command {} failed: {}", url, message);
            }
            promise.set_exception(
                std::make_exception_ptr(driver::DriverError(kind, message)));
        }
    }
};

namespace
{

void http_client_handler(struct mg_connection *conn, int ev, void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *state = static_cast<CommandResult::State *>(conn->fn_data);
    if (state == nullptr)
    {
        return;
    }

    if (ev == MG_EV_CONNECT && !state->request_sent)
    {
        if (mg_url_is_ssl(state->url.c_str()))
        {
            struct mg_tls_opts opts = {};
            opts.name = mg_url_host(state->url.c_str());
            mg_tls_init(conn, &opts);
        }
        mg_send(conn, state->request.data(), state->request.size());
        state->request_sent = true;
    }
    else if (ev == MG_EV_HTTP_MSG)
    {
        auto *hm = static_cast<struct mg_http_message *>(ev_data);
        auto document =
            json::Document::parse(std::string_view(hm->body.buf, hm->body.len));
        if (document.is_valid())
        {
            state->succeed(std::move(document));
        }
        else
        {
            state->fail(driver::ErrorKind::CommandTransportFailed,
                        "response is not JSON (HTTP " +
                            std::to_string(mg_http_status(hm)) + ")");
        }
        conn->is_closing = 1;
    }
    else if (ev == MG_EV_ERROR)
    {
        auto const *message = static_cast<char const *>(ev_data);
        state->fail(driver::ErrorKind::CommandTransportFailed,
                    message ? message : "connection error");
    }
    else if (ev == MG_EV_CLOSE)
    {
        state->fail(driver::ErrorKind::CommandTransportFailed,
                    "connection closed before a response");
    }
}

void run_request(std::shared_ptr<CommandResult::State> state)
{
    mg_mgr mgr;
    mg_mgr_init(&mgr);
    auto *conn = mg_http_connect(&mgr, state->url.c_str(), http_client_handler,
                                 state.get());
    if (conn == nullptr)
    {
        state->fail(driver::ErrorKind::CommandTransportFailed,
                    "unable to connect to " + state->url);
    }
    while (conn != nullptr &&
           !state->settled.load(std::memory_order_acquire) &&
           !state->abort_requested.load(std::memory_order_acquire))
    {
        mg_mgr_poll(&mgr, kPollIntervalMs);
    }
    // Closes a connection left open by abort(); the close event finds the
    // call already settled.
    mg_mgr_free(&mgr);
}

} // namespace

CommandResult start_remote_command(ServerInfo const &server,
                                   std::string_view endpoint, std::string body)
{
    auto state = std::make_shared<CommandResult::State>();
    state->url = server.uri + std::string(endpoint);
    state->request = build_http_request(state->url, server, body);
    auto future = state->promise.get_future();
    std::thread worker(run_request, state);
    return CommandResult(std::move(state), std::move(future), std::move(worker));
}

CommandResult::CommandResult(std::shared_ptr<State> state,
                             std::future<json::Document> future,
                             std::thread worker)
    : state_(std::move(state)), future_(std::move(future)),
      worker_(std::move(worker))
{
}

CommandResult::CommandResult(CommandResult &&other) noexcept = default;

CommandResult &CommandResult::operator=(CommandResult &&other) noexcept
{
    if (this != &other)
    {
        release();
        state_ = std::move(other.state_);
        future_ = std::move(other.future_);
        worker_ = std::move(other.worker_);
    }
    return *this;
}

CommandResult::~CommandResult()
{
    release();
}

void CommandResult::release() noexcept
{
    abort();
    if (worker_.joinable())
    {
        worker_.join();
    }
}

void CommandResult::abort() noexcept
{
    if (!state_ || state_->settled.load(std::memory_order_acquire))
    {
        return;
    }
    state_->abort_requested.store(true, std::memory_order_release);
    if (state_->try_settle())
    {
        RCS_LOG_DEBUG("remote command {} aborted", state_->url);
        state_->promise.set_exception(std::make_exception_ptr(
            driver::DriverError(driver::ErrorKind::CommandAborted,
                                "remote command aborted")));
    }
}

CommandResult remote_command(ServerInfo const &server, std::string_view endpoint)
{
    return start_remote_command(server, endpoint, "{}");
}

CommandResult remote_command(ServerInfo const &server, std::string_view endpoint,
                             json::MutableDocument const &payload)
{
    return start_remote_command(server, endpoint, payload.write());
}

} // namespace rcs::rpc
