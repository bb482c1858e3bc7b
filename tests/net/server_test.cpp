#include <gtest/gtest.h>

#include <speedline/net/server.hpp>

#include "support/log_capture.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace speedline;
using namespace speedline::test_support;

namespace http = boost::beast::http;
using boost::asio::ip::tcp;

namespace
{

class locked_observer : public transfer_observer
{
public:
    void on_transfer_started(const transfer_session&) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++started_;
    }

    void on_transfer_finished(const transfer_session& session) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_.push_back(session.state());
    }

    std::size_t started() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    std::vector<transfer_state> finished() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

private:
    mutable std::mutex mutex_;
    std::size_t started_{0};
    std::vector<transfer_state> finished_;
};

bool wait_for(const std::function<bool()>& condition, std::chrono::milliseconds timeout = std::chrono::seconds{5})
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return condition();
}

// Blocking HTTP client on its own io_context.
class test_client
{
public:
    explicit test_client(const tcp::endpoint& endpoint)
      : socket_(ioc_)
    {
        socket_.connect(endpoint);
    }

    http::response<http::string_body> send(http::request<http::string_body> req)
    {
        req.prepare_payload();
        http::write(socket_, req);
        return read();
    }

    http::response<http::string_body> get(const std::string& target)
    {
        http::request<http::string_body> req{http::verb::get, target, 11};
        req.set(http::field::host, "localhost");
        return send(std::move(req));
    }

    http::response<http::string_body> read()
    {
        http::response_parser<http::string_body> parser;
        parser.body_limit(256 * 1024 * 1024);
        http::read(socket_, buffer_, parser);
        return parser.release();
    }

    void write_raw(const std::string& bytes)
    {
        boost::asio::write(socket_, boost::asio::buffer(bytes));
    }

    // True once the server has closed its side.
    bool at_eof()
    {
        char byte;
        boost::system::error_code ec;
        socket_.read_some(boost::asio::buffer(&byte, 1), ec);
        return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset;
    }

    tcp::socket& socket() { return socket_; }
    boost::beast::flat_buffer& buffer() { return buffer_; }

private:
    boost::asio::io_context ioc_;
    tcp::socket socket_;
    boost::beast::flat_buffer buffer_;
};

class ServerTest : public ::testing::Test
{
protected:
    server_config make_config()
    {
        server_config config;
        config.listen_address = "127.0.0.1";
        config.listen_port = 0;
        config.limits.default_download_size = 1000;
        config.limits.max_download_size = 64 * 1024 * 1024;
        config.limits.max_upload_size = 2 * 1024 * 1024;
        config.rate_limit.max_requests = 1000;
        return config;
    }

    void start(server_config config)
    {
        server_ = std::make_shared<net::server>(ioc_, std::move(config), &observer_);
        server_->start();
        endpoint_ = server_->local_endpoint();
        runner_ = std::thread([this]() { ioc_.run(); });
    }

    void TearDown() override
    {
        if (!server_)
            return;

        boost::asio::post(ioc_, [this]() { server_->stop(); });
        runner_.join();
    }

    boost::asio::io_context ioc_;
    std::shared_ptr<net::server> server_;
    std::thread runner_;
    tcp::endpoint endpoint_;
    locked_observer observer_;
};

} // namespace

TEST_F(ServerTest, DownloadStreamsRequestedSize)
{
    start(make_config());
    test_client client{endpoint_};

    auto res = client.get("/download?size=100000");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_length], "100000");
    EXPECT_EQ(res[http::field::content_type], "application/octet-stream");
    EXPECT_EQ(res[http::field::cache_control], "no-store");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
    EXPECT_EQ(res["RateLimit-Limit"], "1000");
    EXPECT_EQ(res.body().size(), 100000u);

    ASSERT_TRUE(wait_for([this] { return observer_.finished().size() == 1; }));
    EXPECT_EQ(observer_.finished().front(), transfer_state::completed);
}

TEST_F(ServerTest, DownloadSizeFallsBackAndClamps)
{
    auto config = make_config();
    config.limits.max_download_size = 50000;
    start(config);
    test_client client{endpoint_};

    EXPECT_EQ(client.get("/download").body().size(), 1000u);
    EXPECT_EQ(client.get("/download?size=0").body().size(), 1000u);
    EXPECT_EQ(client.get("/download?size=abc").body().size(), 1000u);
    EXPECT_EQ(client.get("/download?size=999999999").body().size(), 50000u);
}

TEST_F(ServerTest, KeepAliveServesSequentialRequests)
{
    start(make_config());
    test_client client{endpoint_};

    for (int i = 0; i < 3; ++i)
    {
        auto res = client.get("/download?size=300000");
        EXPECT_EQ(res.result(), http::status::ok);
        EXPECT_EQ(res.body().size(), 300000u);
        EXPECT_TRUE(res.keep_alive());
    }
    EXPECT_EQ(server_->active_connection_count(), 1u);
}

TEST_F(ServerTest, UploadReportsReceivedBytes)
{
    start(make_config());
    test_client client{endpoint_};

    http::request<http::string_body> req{http::verb::post, "/upload", 11};
    req.set(http::field::host, "localhost");
    req.set(http::field::content_type, "application/octet-stream");
    req.body() = std::string(1024 * 1024, 'x');

    auto res = client.send(std::move(req));

    EXPECT_EQ(res.result(), http::status::ok);
    auto body = nlohmann::json::parse(res.body());
    EXPECT_EQ(body["bytes"], 1048576);
    EXPECT_TRUE(body["millis"].is_number_integer());
}

TEST_F(ServerTest, EmptyUploadIsAccepted)
{
    start(make_config());
    test_client client{endpoint_};

    http::request<http::string_body> req{http::verb::post, "/upload", 11};
    req.set(http::field::host, "localhost");

    auto res = client.send(std::move(req));

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(nlohmann::json::parse(res.body())["bytes"], 0);
}

TEST_F(ServerTest, OversizedUploadIsRejected)
{
    auto config = make_config();
    config.limits.max_upload_size = 300;
    start(config);
    test_client client{endpoint_};

    // Small enough to arrive in one segment, so nothing is left unread when
    // the server closes.
    client.write_raw("POST /upload HTTP/1.1\r\nHost: localhost\r\nContent-Length: 400\r\n\r\n" +
                     std::string(400, 'y'));
    auto res = client.read();

    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_FALSE(res.keep_alive());
    auto body = nlohmann::json::parse(res.body());
    EXPECT_EQ(body["message"], "Payload too large");
    EXPECT_EQ(body["max"], 300);

    EXPECT_TRUE(client.at_eof());
    ASSERT_TRUE(wait_for([this] { return observer_.finished().size() == 1; }));
    EXPECT_EQ(observer_.finished().front(), transfer_state::oversized);
}

TEST_F(ServerTest, ExpectContinueIsAcknowledged)
{
    start(make_config());
    test_client client{endpoint_};

    client.write_raw("POST /upload HTTP/1.1\r\nHost: localhost\r\nContent-Length: 5\r\n"
                     "Expect: 100-continue\r\n\r\n");

    http::response<http::empty_body> interim;
    http::read(client.socket(), client.buffer(), interim);
    EXPECT_EQ(interim.result(), http::status::continue_);

    client.write_raw("hello");
    auto res = client.read();

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(nlohmann::json::parse(res.body())["bytes"], 5);
}

TEST_F(ServerTest, UnknownRouteIsNotFound)
{
    start(make_config());
    test_client client{endpoint_};

    auto res = client.get("/nope");

    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(res.body(), R"({"error":"Not found"})");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

TEST_F(ServerTest, WrongMethodIsRejectedWithAllow)
{
    start(make_config());
    test_client client{endpoint_};

    http::request<http::string_body> req{http::verb::put, "/download", 11};
    req.set(http::field::host, "localhost");
    auto res = client.send(std::move(req));

    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(res[http::field::allow], "GET, OPTIONS");
}

TEST_F(ServerTest, PreflightAnswersWithCorsHeaders)
{
    start(make_config());
    test_client client{endpoint_};

    http::request<http::string_body> req{http::verb::options, "/upload", 11};
    req.set(http::field::host, "localhost");
    req.set(http::field::origin, "http://example.com");
    auto res = client.send(std::move(req));

    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
    EXPECT_EQ(res[http::field::access_control_allow_methods], "POST, OPTIONS");
    EXPECT_EQ(res[http::field::access_control_allow_headers], "Content-Type");
}

TEST_F(ServerTest, BasePathMountsEndpoints)
{
    auto config = make_config();
    config.base_path = "/api";
    start(config);
    test_client client{endpoint_};

    EXPECT_EQ(client.get("/api/download?size=10").body().size(), 10u);
    EXPECT_EQ(client.get("/download?size=10").result(), http::status::not_found);
}

TEST_F(ServerTest, RateLimitRejectsExcessRequests)
{
    auto config = make_config();
    config.rate_limit.max_requests = 2;
    start(config);
    test_client client{endpoint_};

    EXPECT_EQ(client.get("/download?size=1")["RateLimit-Remaining"], "1");
    EXPECT_EQ(client.get("/download?size=1")["RateLimit-Remaining"], "0");

    auto res = client.get("/download?size=1");
    EXPECT_EQ(res.result(), http::status::too_many_requests);
    EXPECT_EQ(res.body(), R"({"error":"Too many requests, please try again later"})");
    EXPECT_FALSE(res[http::field::retry_after].empty());
    EXPECT_EQ(res["RateLimit-Policy"], "2;w=60");
}

TEST_F(ServerTest, MalformedRequestIsBadRequest)
{
    start(make_config());
    test_client client{endpoint_};

    client.write_raw("this is not http\r\n\r\n");
    auto res = client.read();

    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(res.body(), R"({"error":"Bad request"})");
    EXPECT_TRUE(client.at_eof());
}

TEST_F(ServerTest, ClientAbortEndsDownloadOnce)
{
    log_capture logs{LogLevel::Warning};
    start(make_config());

    {
        test_client client{endpoint_};
        client.write_raw("GET /download?size=50000000 HTTP/1.1\r\nHost: localhost\r\n\r\n");

        std::vector<char> scratch(64 * 1024);
        client.socket().read_some(boost::asio::buffer(scratch));
    }

    ASSERT_TRUE(wait_for([this] { return observer_.finished().size() == 1; }));
    EXPECT_EQ(observer_.finished().front(), transfer_state::aborted);
    EXPECT_TRUE(wait_for([this] { return server_->active_connection_count() == 0; }));
    EXPECT_EQ(logs.count(LogLevel::Warning, "/download abort"), 1u);

    // The server keeps serving new clients.
    test_client next{endpoint_};
    EXPECT_EQ(next.get("/download?size=10").body().size(), 10u);
}

TEST_F(ServerTest, ClientDisconnectMidUploadAbortsOnce)
{
    log_capture logs{LogLevel::Warning};
    start(make_config());

    {
        test_client client{endpoint_};
        client.write_raw("POST /upload HTTP/1.1\r\nHost: localhost\r\nContent-Length: 1000\r\n\r\n" +
                         std::string(500, 'z'));
        ASSERT_TRUE(wait_for([this] { return observer_.started() == 1; }));
    }

    ASSERT_TRUE(wait_for([this] { return observer_.finished().size() == 1; }));
    EXPECT_EQ(observer_.finished().front(), transfer_state::aborted);
    EXPECT_TRUE(wait_for([this] { return server_->active_connection_count() == 0; }));
    EXPECT_EQ(logs.count(LogLevel::Warning, "/upload abort"), 1u);

    test_client next{endpoint_};
    EXPECT_EQ(next.get("/download?size=10").body().size(), 10u);
}

TEST_F(ServerTest, StopClosesOpenConnections)
{
    start(make_config());
    test_client client{endpoint_};
    client.get("/download?size=1");
    EXPECT_EQ(server_->active_connection_count(), 1u);

    boost::asio::post(ioc_, [this]() { server_->stop(); });
    EXPECT_TRUE(client.at_eof());
    EXPECT_TRUE(wait_for([this] { return server_->active_connection_count() == 0; }));
}
