#include "driver/Errors.hpp"
#include "rpc/RemoteCommand.hpp"
#include "utils/Base64.hpp"
#include "utils/Endpoint.hpp"
#include "utils/Json.hpp"

#include "TestUtils.hpp"

#include <mongoose.h>

#include <arpa/inet.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <thread>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using rcs::driver::DriverError;
using rcs::driver::ErrorKind;

namespace
{

enum class ReplyMode
{
    Json,
    PlainText,
    Hold,
    Close
};

struct RecordedRequest
{
    std::string method;
    std::string uri;
    std::string body;
    std::string authorization;
    std::string content_type;
    std::string host;
};

// Minimal stand-in for rcd's remote control listener on an ephemeral port.
class FakeRcServer
{
  public:
    explicit FakeRcServer(ReplyMode mode) : mode_(mode)
    {
        mg_mgr_init(&mgr_);
        listener_ = mg_http_listen(&mgr_, "http://127.0.0.1:0",
                                   &FakeRcServer::handle_event, this);
        REQUIRE(listener_ != nullptr);
        port_ = static_cast<std::uint16_t>(ntohs(listener_->loc.port));
        worker_ = std::thread(
            [this]
            {
                while (!stop_.load())
                {
                    mg_mgr_poll(&mgr_, 10);
                }
            });
    }

    ~FakeRcServer()
    {
        stop_.store(true);
        if (worker_.joinable())
        {
            worker_.join();
        }
        mg_mgr_free(&mgr_);
    }

    std::string uri() const
    {
        return "http://127.0.0.1:" + std::to_string(port_) + "/";
    }

    rcs::tests::Collector<RecordedRequest> &requests() { return requests_; }

  private:
    static std::string header_value(struct mg_http_message *hm, char const *name)
    {
        if (auto *header = mg_http_get_header(hm, name); header != nullptr)
        {
            return std::string(header->buf, header->len);
        }
        return {};
    }

    static void handle_event(struct mg_connection *conn, int ev, void *ev_data)
    {
        auto *self = static_cast<FakeRcServer *>(conn->fn_data);
        if (self == nullptr || ev != MG_EV_HTTP_MSG)
        {
            return;
        }
        auto *hm = static_cast<struct mg_http_message *>(ev_data);
        RecordedRequest request;
        request.method.assign(hm->method.buf, hm->method.len);
        request.uri.assign(hm->uri.buf, hm->uri.len);
        request.body.assign(hm->body.buf, hm->body.len);
        request.authorization = header_value(hm, "Authorization");
        request.content_type = header_value(hm, "Content-Type");
        request.host = header_value(hm, "Host");
        self->requests_.add(request);

        switch (self->mode_)
        {
        case ReplyMode::Json:
            mg_http_reply(conn, 200, "Content-Type: application/json\r\n",
                          "{\"echo\":%.*s}", static_cast<int>(hm->body.len),
                          hm->body.buf);
            break;
        case ReplyMode::PlainText:
            mg_http_reply(conn, 404, "Content-Type: text/plain\r\n",
                          "not found");
            break;
        case ReplyMode::Hold:
            break;
        case ReplyMode::Close:
            conn->is_closing = 1;
            break;
        }
    }

    ReplyMode mode_;
    mg_mgr mgr_{};
    mg_connection *listener_ = nullptr;
    std::uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread worker_;
    rcs::tests::Collector<RecordedRequest> requests_;
};

ErrorKind failure_kind(std::future<rcs::json::Document> &future)
{
    try
    {
        future.get();
    }
    catch (DriverError const &ex)
    {
        return ex.kind();
    }
    FAIL("expected DriverError");
    return ErrorKind::CommandTransportFailed;
}

} // namespace

TEST_CASE("remote_command posts the payload and decodes the reply")
{
    FakeRcServer server(ReplyMode::Json);
    rcs::rpc::ServerInfo info{"admin:secret", server.uri()};

    auto payload = rcs::json::MutableDocument::from(
        rcs::json::Document::parse(R"({"fs":"remote:","remote":"dir"})"));
    auto call = rcs::rpc::remote_command(info, "operations/list", payload);

    auto &future = call.result();
    REQUIRE(future.wait_for(10s) == std::future_status::ready);
    auto document = future.get();
    REQUIRE(document.is_valid());
    auto *echo = yyjson_obj_get(document.root(), "echo");
    REQUIRE(echo != nullptr);
    CHECK(rcs::json::string_member(echo, "fs") ==
          std::optional<std::string_view>("remote:"));

    auto const requests = server.requests().snapshot();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "POST");
    CHECK(requests[0].uri == "/operations/list");
    CHECK(requests[0].content_type == "application/json");
    CHECK(requests[0].host == server.uri().substr(7, server.uri().size() - 8));

    CHECK(requests[0].authorization == "Basic YWRtaW46c2VjcmV0");
}

TEST_CASE("remote_command without payload sends an empty object")
{
    FakeRcServer server(ReplyMode::Json);
    rcs::rpc::ServerInfo info{"", server.uri()};

    auto call = rcs::rpc::remote_command(info, "core/version");
    REQUIRE(call.result().wait_for(10s) == std::future_status::ready);
    CHECK(call.result().get().is_valid());

    auto const requests = server.requests().snapshot();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].body == "{}");
    CHECK(requests[0].authorization.empty());
}

TEST_CASE("remote_command fails on a body that is not JSON")
{
    FakeRcServer server(ReplyMode::PlainText);
    auto call = rcs::rpc::remote_command({"", server.uri()}, "missing/endpoint");
    REQUIRE(call.result().wait_for(10s) == std::future_status::ready);
    CHECK(failure_kind(call.result()) == ErrorKind::CommandTransportFailed);
}

TEST_CASE("remote_command fails when the server closes without replying")
{
    FakeRcServer server(ReplyMode::Close);
    auto call = rcs::rpc::remote_command({"", server.uri()}, "core/quit");
    REQUIRE(call.result().wait_for(10s) == std::future_status::ready);
    CHECK(failure_kind(call.result()) == ErrorKind::CommandTransportFailed);
}

TEST_CASE("remote_command fails when nothing listens")
{
    std::string uri;
    {
        FakeRcServer closed(ReplyMode::Json);
        uri = closed.uri();
    }
    auto call = rcs::rpc::remote_command({"", uri}, "core/version");
    REQUIRE(call.result().wait_for(10s) == std::future_status::ready);
    CHECK(failure_kind(call.result()) == ErrorKind::CommandTransportFailed);
}

TEST_CASE("CommandResult::abort settles a pending call")
{
    FakeRcServer server(ReplyMode::Hold);
    auto call = rcs::rpc::remote_command({"", server.uri()}, "core/slow");
    REQUIRE(server.requests().wait_for_count(1, 10s));

    CHECK(call.result().wait_for(50ms) == std::future_status::timeout);
    call.abort();
    call.abort();
    REQUIRE(call.result().wait_for(1s) == std::future_status::ready);
    CHECK(failure_kind(call.result()) == ErrorKind::CommandAborted);
}

TEST_CASE("CommandResult::abort after completion changes nothing")
{
    FakeRcServer server(ReplyMode::Json);
    auto call = rcs::rpc::remote_command({"", server.uri()}, "rc/noop");
    REQUIRE(call.result().wait_for(10s) == std::future_status::ready);
    call.abort();
    CHECK(call.result().get().is_valid());
}

TEST_CASE("destroying a pending CommandResult aborts it")
{
    FakeRcServer server(ReplyMode::Hold);
    std::future<rcs::json::Document> orphan;
    {
        auto call = rcs::rpc::remote_command({"", server.uri()}, "core/slow");
        REQUIRE(server.requests().wait_for_count(1, 10s));
        orphan = std::move(call.result());
    }
    REQUIRE(orphan.wait_for(1s) == std::future_status::ready);
    CHECK(failure_kind(orphan) == ErrorKind::CommandAborted);
}

TEST_CASE("announced addresses split into host and port")
{
    auto [host, port] = rcs::net::parse_url_host_port("http://127.0.0.1:5572/");
    CHECK(host == "127.0.0.1");
    CHECK(port == "5572");
    CHECK(rcs::net::is_loopback_host(host));

    auto [v6_host, v6_port] = rcs::net::parse_url_host_port("http://[::1]:5572/");
    CHECK(v6_host == "::1");
    CHECK(v6_port == "5572");
    CHECK(rcs::net::is_loopback_host(v6_host));

    CHECK_FALSE(rcs::net::is_loopback_host("0.0.0.0"));
    CHECK(rcs::net::parse_url_host_port("").first.empty());
}

TEST_CASE("host_header_for_url keeps IPv6 literals bracketed")
{
    CHECK(rcs::net::host_header_for_url("http://[::1]:5572/") == "[::1]:5572");
    CHECK(rcs::net::host_header_for_url("http://127.0.0.1:5572/") ==
          "127.0.0.1:5572");
    CHECK(rcs::net::host_header_for_url("https://rc.example.com/") ==
          "rc.example.com");
}

TEST_CASE("basic_authorization pads the encoded credentials")
{
    CHECK(rcs::utils::basic_authorization("admin:secret") ==
          "Basic YWRtaW46c2VjcmV0");
    CHECK(rcs::utils::encode_base64("user:p@ss") == "dXNlcjpwQHNz");
    CHECK(rcs::utils::encode_base64("a") == "YQ==");
    CHECK(rcs::utils::encode_base64("ab") == "YWI=");
    CHECK(rcs::utils::encode_base64("").empty());
}
