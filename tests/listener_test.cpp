// tests/listener_test.cpp
// End to end over loopback: a real Listener, a Beast client
#include <gtest/gtest.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "listener.hpp"
#include "logger.hpp"

namespace {

class ListenerTest : public ::testing::Test {
protected:
    net::io_context ioc{1};
    std::shared_ptr<Listener> listener;
    std::thread worker;
    std::ostringstream captured;

    std::mutex blocksMutex;
    std::vector<std::string> blocks;

    void SetUp() override {
        Logger::setColors(false);
        Logger::setStream(captured);

        HandlerOptions options;
        options.sink = [this](const std::string& block) {
            std::lock_guard<std::mutex> lock(blocksMutex);
            blocks.push_back(block);
        };

        listener = std::make_shared<Listener>(
            ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}, options, 64);
        listener->run();
        worker = std::thread([this] { ioc.run(); });
    }

    void TearDown() override {
        ioc.stop();
        worker.join();
        listener->stop();
        Logger::setStream(std::cout);
        Logger::setColors(true);
    }

    tcp::socket connect(net::io_context& client) {
        tcp::socket socket{client};
        socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), listener->port()});
        return socket;
    }

    // Sends raw bytes and parses whatever single response comes back
    StringResponse exchangeRaw(const std::string& raw) {
        net::io_context client;
        auto socket = connect(client);
        net::write(socket, net::buffer(raw));

        beast::flat_buffer buffer;
        StringResponse res;
        http::read(socket, buffer, res);
        return res;
    }

    StringResponse exchange(StringRequest req) {
        net::io_context client;
        auto socket = connect(client);
        req.set(http::field::host, "127.0.0.1");
        req.prepare_payload();
        http::write(socket, req);

        beast::flat_buffer buffer;
        StringResponse res;
        http::read(socket, buffer, res);
        return res;
    }

    std::vector<std::string> loggedBlocks() {
        std::lock_guard<std::mutex> lock(blocksMutex);
        return blocks;
    }
};

} // namespace

TEST_F(ListenerTest, BindsEphemeralPort) {
    EXPECT_NE(listener->port(), 0);
}

TEST_F(ListenerTest, GetStatusEndToEnd) {
    StringRequest req{http::verb::get, "/status", 11};
    req.set("X-Test", "1");

    auto res = exchange(std::move(req));

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "text/plain");
    EXPECT_EQ(res.body(), "GET request received");

    auto logged = loggedBlocks();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_NE(logged[0].find("Path: /status\n"), std::string::npos);
    EXPECT_NE(logged[0].find("  X-Test: 1\n"), std::string::npos);
}

TEST_F(ListenerTest, PostWebhookEndToEnd) {
    StringRequest req{http::verb::post, "/webhook", 11};
    req.body() = "{\"a\":1}";

    auto res = exchange(std::move(req));

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "POST request received");

    auto logged = loggedBlocks();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_NE(logged[0].find("  Content-Length: 7\n"), std::string::npos);
    EXPECT_NE(logged[0].find("Body:\n{\"a\":1}\n"), std::string::npos);
}

TEST_F(ListenerTest, PostWithoutContentLengthHasEmptyBody) {
    auto res = exchangeRaw("POST /hook HTTP/1.1\r\nHost: x\r\n\r\n");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "POST request received");

    auto logged = loggedBlocks();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_NE(logged[0].find("Body:\n\n"), std::string::npos);
}

TEST_F(ListenerTest, PostWithZeroContentLength) {
    auto res = exchangeRaw("POST /hook HTTP/1.1\r\nHost: x\r\nContent-Length: 0\r\n\r\n");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "POST request received");
}

TEST_F(ListenerTest, PostChunkedBodyIsDecoded) {
    auto res = exchangeRaw("POST /chunked HTTP/1.1\r\nHost: x\r\nTransfer-Encoding: chunked\r\n\r\n"
                           "3\r\nabc\r\n0\r\n\r\n");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "POST request received");

    auto logged = loggedBlocks();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_NE(logged[0].find("  Transfer-Encoding: chunked\n"), std::string::npos);
    EXPECT_NE(logged[0].find("Body:\nabc\n"), std::string::npos);
}

TEST_F(ListenerTest, MalformedContentLengthGetsBadRequest) {
    auto res = exchangeRaw("POST /hook HTTP/1.1\r\nHost: x\r\nContent-Length: seven\r\n\r\n");

    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(res[http::field::content_type], "text/plain");
    EXPECT_TRUE(loggedBlocks().empty());

    // The listener keeps serving afterwards
    auto next = exchange(StringRequest{http::verb::get, "/after", 11});
    EXPECT_EQ(next.result(), http::status::ok);
}

TEST_F(ListenerTest, InvalidUtf8BodyGetsBadRequest) {
    std::string raw = "POST /bin HTTP/1.1\r\nHost: x\r\nContent-Length: 2\r\n\r\n\xC3\x28";
    auto res = exchangeRaw(raw);

    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_TRUE(loggedBlocks().empty());
}

TEST_F(ListenerTest, BodyOverLimitGetsPayloadTooLarge) {
    StringRequest req{http::verb::post, "/big", 11};
    req.body() = std::string(65, 'x');

    auto res = exchange(std::move(req));

    EXPECT_EQ(res.result(), http::status::payload_too_large);
}

TEST_F(ListenerTest, UnsupportedMethodGetsNotImplemented) {
    auto res = exchange(StringRequest{http::verb::delete_, "/thing", 11});

    EXPECT_EQ(res.result(), http::status::not_implemented);
    EXPECT_EQ(res.body(), "Unsupported method ('DELETE')");
}

TEST_F(ListenerTest, KeepAliveServesSeveralRequests) {
    net::io_context client;
    auto socket = connect(client);
    beast::flat_buffer buffer;

    for (int i = 0; i < 3; ++i) {
        StringRequest req{http::verb::get, "/n" + std::to_string(i), 11};
        req.set(http::field::host, "127.0.0.1");
        http::write(socket, req);

        StringResponse res;
        http::read(socket, buffer, res);
        EXPECT_EQ(res.result(), http::status::ok);
        EXPECT_TRUE(res.keep_alive());
    }

    auto logged = loggedBlocks();
    ASSERT_EQ(logged.size(), 3u);
    EXPECT_NE(logged[2].find("Path: /n2\n"), std::string::npos);
}

TEST_F(ListenerTest, ClientDisconnectMidBodyDoesNotStopListener) {
    {
        net::io_context client;
        auto socket = connect(client);
        net::write(socket, net::buffer(std::string(
            "POST /cut HTTP/1.1\r\nHost: x\r\nContent-Length: 50\r\n\r\npartial")));
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    auto res = exchange(StringRequest{http::verb::get, "/still-up", 11});
    EXPECT_EQ(res.result(), http::status::ok);
}

TEST(ListenerStartup, PortInUseThrows) {
    net::io_context ioc{1};
    std::ostringstream captured;
    Logger::setColors(false);
    Logger::setStream(captured);

    auto first = std::make_shared<Listener>(
        ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}, HandlerOptions{}, 1024);

    // Plain bind without SO_REUSEPORT still fails on a listening port
    tcp::endpoint taken{net::ip::make_address("127.0.0.1"), first->port()};
    EXPECT_THROW(std::make_shared<Listener>(ioc, taken, HandlerOptions{}, 1024),
                 boost::system::system_error);
    EXPECT_NE(captured.str().find("[Error] Listener bind error"), std::string::npos);

    Logger::setStream(std::cout);
    Logger::setColors(true);
}
