/**
 * @file websocket_transport_test.cpp
 * @brief URL parsing plus WebsocketTransport against a loopback Beast server
 */

#include "connection/websocket_transport.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <string>
#include <vector>

using namespace lightfleet::connection;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

// ----------------------------------------------------------------------------
// parse_websocket_url
// ----------------------------------------------------------------------------

TEST(WebsocketUrlTest, HostOnlyDefaultsPortAndTarget) {
    WebsocketUrl url;
    std::string error;
    ASSERT_TRUE(parse_websocket_url("ws://wled-porch.local", url, error)) << error;
    EXPECT_EQ(url.host, "wled-porch.local");
    EXPECT_EQ(url.port, "80");
    EXPECT_EQ(url.target, "/");
}

TEST(WebsocketUrlTest, PortAndPath) {
    WebsocketUrl url;
    std::string error;
    ASSERT_TRUE(parse_websocket_url("ws://192.168.1.40:8080/ws", url, error)) << error;
    EXPECT_EQ(url.host, "192.168.1.40");
    EXPECT_EQ(url.port, "8080");
    EXPECT_EQ(url.target, "/ws");
}

TEST(WebsocketUrlTest, BracketedIpv6) {
    WebsocketUrl url;
    std::string error;
    ASSERT_TRUE(parse_websocket_url("ws://[::1]:81/ws", url, error)) << error;
    EXPECT_EQ(url.host, "::1");
    EXPECT_EQ(url.port, "81");

    ASSERT_TRUE(parse_websocket_url("ws://[fe80::1]/ws", url, error)) << error;
    EXPECT_EQ(url.host, "fe80::1");
    EXPECT_EQ(url.port, "80");
}

TEST(WebsocketUrlTest, RejectsMalformed) {
    WebsocketUrl url;
    std::string error;
    EXPECT_FALSE(parse_websocket_url("http://host/ws", url, error));
    EXPECT_NE(error.find("ws://"), std::string::npos);
    EXPECT_FALSE(parse_websocket_url("ws:///ws", url, error));
    EXPECT_FALSE(parse_websocket_url("ws://host:/ws", url, error));
    EXPECT_FALSE(parse_websocket_url("ws://[::1/ws", url, error));
    EXPECT_FALSE(parse_websocket_url("ws://[::1]x/ws", url, error));
}

// ----------------------------------------------------------------------------
// WebsocketTransport
// ----------------------------------------------------------------------------

namespace {

// Accepts one client, greets it, echoes one message back, then closes
class LoopbackWebsocketServer {
public:
    explicit LoopbackWebsocketServer(asio::io_context &io)
        : acceptor_(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)), ws_(tcp::socket(io)) {
        acceptor_.async_accept(ws_.next_layer(), [this](const beast::error_code &ec) {
            if (ec) {
                return;
            }
            ws_.async_accept([this](const beast::error_code &accept_ec) {
                if (accept_ec) {
                    return;
                }
                ws_.text(true);
                greeting_ = "{\"info\":{\"mac\":\"aabbccddeeff\"}}";
                ws_.async_write(asio::buffer(greeting_), [this](const beast::error_code &write_ec, size_t) {
                    if (!write_ec) {
                        read_one();
                    }
                });
            });
        });
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }
    const std::string &received() const { return received_; }

    void stop() {
        beast::error_code ignored;
        acceptor_.close(ignored);
        beast::get_lowest_layer(ws_).close(ignored);
    }

private:
    void read_one() {
        ws_.async_read(buffer_, [this](const beast::error_code &ec, size_t) {
            if (ec) {
                return;
            }
            received_ = beast::buffers_to_string(buffer_.data());
            ws_.async_close(websocket::close_code::normal, [](const beast::error_code &) {});
        });
    }

    tcp::acceptor acceptor_;
    websocket::stream<tcp::socket> ws_;
    beast::flat_buffer buffer_;
    std::string greeting_;
    std::string received_;
};

}  // namespace

class WebsocketTransportTest : public ::testing::Test {
protected:
    template <typename Pred>
    bool run_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred() && std::chrono::steady_clock::now() < deadline) {
            io.restart();
            io.run_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    asio::io_context io;
};

TEST_F(WebsocketTransportTest, InvalidUrlFailsImmediately) {
    WebsocketTransport transport(io, std::chrono::milliseconds(500));
    bool failed = false;
    TransportHandlers handlers;
    handlers.on_failure = [&](TransportError error, const std::string &) {
        failed = true;
        EXPECT_EQ(error, TransportError::OPEN_FAILURE);
    };
    transport.open("http://nope", handlers);
    EXPECT_TRUE(failed);
}

TEST_F(WebsocketTransportTest, ClosedPortReportsOpenFailure) {
    uint16_t closed_port = 0;
    {
        tcp::acceptor probe(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        closed_port = probe.local_endpoint().port();
    }

    WebsocketTransport transport(io, std::chrono::milliseconds(500));
    bool failed = false;
    bool opened = false;
    TransportError reported = TransportError::READ_FAILURE;
    TransportHandlers handlers;
    handlers.on_open = [&] { opened = true; };
    handlers.on_failure = [&](TransportError error, const std::string &) {
        failed = true;
        reported = error;
    };
    transport.open("ws://127.0.0.1:" + std::to_string(closed_port) + "/ws", handlers);

    ASSERT_TRUE(run_until([&] { return failed; }));
    EXPECT_FALSE(opened);
    EXPECT_EQ(reported, TransportError::OPEN_FAILURE);
}

TEST_F(WebsocketTransportTest, ExchangesMessagesAndSeesNormalClose) {
    LoopbackWebsocketServer server(io);
    WebsocketTransport transport(io, std::chrono::seconds(2));

    bool opened = false;
    bool closed = false;
    uint16_t close_code = 0;
    std::vector<std::string> messages;
    TransportHandlers handlers;
    handlers.on_open = [&] { opened = true; };
    handlers.on_message = [&](const std::string &text) { messages.push_back(text); };
    handlers.on_close = [&](uint16_t code, const std::string &) {
        closed = true;
        close_code = code;
    };
    handlers.on_failure = [&](TransportError, const std::string &message) { ADD_FAILURE() << message; };

    // Queued until the handshake completes
    transport.send("{\"on\":true}");
    transport.open("ws://127.0.0.1:" + std::to_string(server.port()) + "/ws", handlers);
    transport.send("{\"on\":true}");

    ASSERT_TRUE(run_until([&] { return closed; }));
    EXPECT_TRUE(opened);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_NE(messages[0].find("aabbccddeeff"), std::string::npos);
    EXPECT_EQ(server.received(), "{\"on\":true}");
    EXPECT_EQ(close_code, kCloseNormal);

    server.stop();
    io.restart();
    io.poll();
}

TEST_F(WebsocketTransportTest, CloseSilencesHandlers) {
    LoopbackWebsocketServer server(io);
    WebsocketTransport transport(io, std::chrono::seconds(2));

    int callbacks = 0;
    TransportHandlers handlers;
    handlers.on_open = [&] { ++callbacks; };
    handlers.on_message = [&](const std::string &) { ++callbacks; };
    handlers.on_close = [&](uint16_t, const std::string &) { ++callbacks; };
    handlers.on_failure = [&](TransportError, const std::string &) { ++callbacks; };

    transport.open("ws://127.0.0.1:" + std::to_string(server.port()) + "/ws", handlers);
    transport.close(kCloseNormal, "");

    run_until([] { return false; }, std::chrono::milliseconds(200));
    EXPECT_EQ(callbacks, 0);

    server.stop();
    io.restart();
    io.poll();
}

TEST(WebsocketTransportFactoryTest, CreatesTransports) {
    asio::io_context io;
    auto factory = make_websocket_transport_factory(io, std::chrono::milliseconds(100));
    auto first = factory();
    auto second = factory();
    EXPECT_NE(first.get(), nullptr);
    EXPECT_NE(first.get(), second.get());
}
