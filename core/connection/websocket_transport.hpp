#pragma once

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "i_device_transport.hpp"

namespace lightfleet {
namespace connection {

struct WebsocketUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/";
};

// Accepts ws://host[:port][/path]; IPv6 hosts in brackets
bool parse_websocket_url(const std::string &url, WebsocketUrl &out, std::string &error);

/**
 * @brief IDeviceTransport over a Boost.Beast WebSocket client
 *
 * Resolve, connect and handshake are bounded by open_timeout. Once open, the
 * stream pings when idle and reports a READ_FAILURE if the device stops
 * answering within idle_timeout. Outbound messages are written one at a time
 * in send order.
 */
class WebsocketTransport : public IDeviceTransport {
public:
    WebsocketTransport(boost::asio::io_context &io, std::chrono::milliseconds open_timeout,
                       std::chrono::milliseconds idle_timeout = std::chrono::seconds(30));
    ~WebsocketTransport() override;

    void open(const std::string &url, TransportHandlers handlers) override;
    void send(const std::string &text) override;
    void close(uint16_t code, const std::string &reason) override;

private:
    class Session;

    boost::asio::io_context &io_;
    std::chrono::milliseconds open_timeout_;
    std::chrono::milliseconds idle_timeout_;
    std::shared_ptr<Session> session_;
};

TransportFactory make_websocket_transport_factory(boost::asio::io_context &io,
                                                  std::chrono::milliseconds open_timeout);

}  // namespace connection
}  // namespace lightfleet
