#include "websocket_transport.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>

#include "logging/logger.hpp"

namespace lightfleet {
namespace connection {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

bool parse_websocket_url(const std::string &url, WebsocketUrl &out, std::string &error) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        error = "unsupported URL (expected ws://): " + url;
        return false;
    }

    std::string rest = url.substr(scheme.size());
    WebsocketUrl parsed;
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        parsed.target = rest.substr(slash);
    }

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            error = "malformed IPv6 host in " + url;
            return false;
        }
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                error = "malformed authority in " + url;
                return false;
            }
            parsed.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parsed.host = authority.substr(0, colon);
            parsed.port = authority.substr(colon + 1);
        } else {
            parsed.host = authority;
        }
    }

    if (parsed.host.empty() || parsed.port.empty()) {
        error = "missing host or port in " + url;
        return false;
    }
    out = parsed;
    return true;
}

class WebsocketTransport::Session : public std::enable_shared_from_this<Session> {
public:
    Session(asio::io_context &io, std::chrono::milliseconds open_timeout, std::chrono::milliseconds idle_timeout)
        : resolver_(asio::make_strand(io)),
          ws_(resolver_.get_executor()),
          open_timeout_(open_timeout),
          idle_timeout_(idle_timeout) {}

    void start(WebsocketUrl url, TransportHandlers handlers) {
        asio::dispatch(ws_.get_executor(), [self = shared_from_this(), url = std::move(url),
                                            handlers = std::move(handlers)]() mutable {
            self->url_ = std::move(url);
            self->handlers_ = std::move(handlers);
            self->resolver_.async_resolve(
                self->url_.host, self->url_.port,
                [self](const beast::error_code &ec, tcp::resolver::results_type results) {
                    self->on_resolve(ec, std::move(results));
                });
        });
    }

    void send(std::string text) {
        asio::dispatch(ws_.get_executor(), [self = shared_from_this(), text = std::move(text)]() mutable {
            if (self->finished_) {
                return;
            }
            self->outbox_.push_back(std::move(text));
            if (self->open_ && !self->writing_) {
                self->write_next();
            }
        });
    }

    // Silences all handlers, then closes the stream
    void shutdown(uint16_t code, std::string reason) {
        asio::dispatch(ws_.get_executor(), [self = shared_from_this(), code, reason = std::move(reason)] {
            if (self->finished_) {
                return;
            }
            self->finished_ = true;
            self->handlers_ = TransportHandlers{};
            self->outbox_.clear();
            self->resolver_.cancel();

            if (self->open_) {
                self->ws_.async_close(websocket::close_reason(websocket::close_code{code}, reason), [self](const beast::error_code &) {
                    beast::error_code ignored;
                    beast::get_lowest_layer(self->ws_).socket().close(ignored);
                });
            } else {
                beast::get_lowest_layer(self->ws_).close();
            }
        });
    }

private:
    void on_resolve(const beast::error_code &ec, tcp::resolver::results_type results) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail(TransportError::OPEN_FAILURE, "resolve " + url_.host + ": " + ec.message());
            return;
        }
        beast::get_lowest_layer(ws_).expires_after(open_timeout_);
        beast::get_lowest_layer(ws_).async_connect(
            results, [self = shared_from_this()](const beast::error_code &connect_ec, const tcp::endpoint &) {
                self->on_connect(connect_ec);
            });
    }

    void on_connect(const beast::error_code &ec) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail(TransportError::OPEN_FAILURE, "connect " + url_.host + ":" + url_.port + ": " + ec.message());
            return;
        }

        // The websocket stream manages its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();
        websocket::stream_base::timeout timeouts{};
        timeouts.handshake_timeout = open_timeout_;
        timeouts.idle_timeout = idle_timeout_;
        timeouts.keep_alive_pings = true;
        ws_.set_option(timeouts);
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::request_type &req) { req.set(beast::http::field::user_agent, "lightfleet"); }));

        const std::string host_header = url_.port == "80" ? url_.host : url_.host + ":" + url_.port;
        ws_.async_handshake(host_header, url_.target,
                            [self = shared_from_this()](const beast::error_code &handshake_ec) {
                                self->on_handshake(handshake_ec);
                            });
    }

    void on_handshake(const beast::error_code &ec) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail(TransportError::OPEN_FAILURE, "handshake: " + ec.message());
            return;
        }

        open_ = true;
        ws_.text(true);
        if (handlers_.on_open) {
            handlers_.on_open();
        }
        read_next();
        if (!outbox_.empty() && !writing_) {
            write_next();
        }
    }

    void read_next() {
        ws_.async_read(buffer_, [self = shared_from_this()](const beast::error_code &ec, size_t) {
            self->on_read(ec);
        });
    }

    void on_read(const beast::error_code &ec) {
        if (finished_) {
            return;
        }
        if (ec == websocket::error::closed) {
            finished_ = true;
            auto on_close = std::move(handlers_.on_close);
            handlers_ = TransportHandlers{};
            const auto &reason = ws_.reason();
            if (on_close) {
                on_close(static_cast<uint16_t>(reason.code), std::string(reason.reason.c_str()));
            }
            return;
        }
        if (ec) {
            fail(TransportError::READ_FAILURE, "read: " + ec.message());
            return;
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (handlers_.on_message) {
            handlers_.on_message(text);
        }
        if (!finished_) {
            read_next();
        }
    }

    void write_next() {
        writing_ = true;
        ws_.async_write(asio::buffer(outbox_.front()), [self = shared_from_this()](const beast::error_code &ec, size_t) {
            self->on_write(ec);
        });
    }

    void on_write(const beast::error_code &ec) {
        writing_ = false;
        if (finished_) {
            return;
        }
        if (ec) {
            fail(TransportError::SEND_FAILURE, "write: " + ec.message());
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty()) {
            write_next();
        }
    }

    void fail(TransportError error, const std::string &message) {
        LOG_DEBUG("[Connection] ws://" << url_.host << ":" << url_.port << url_.target << " " << message);
        finished_ = true;
        auto on_failure = std::move(handlers_.on_failure);
        handlers_ = TransportHandlers{};
        outbox_.clear();
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        if (on_failure) {
            on_failure(error, message);
        }
    }

    tcp::resolver resolver_;
    websocket::stream<beast::tcp_stream> ws_;
    std::chrono::milliseconds open_timeout_;
    std::chrono::milliseconds idle_timeout_;

    WebsocketUrl url_;
    TransportHandlers handlers_;
    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    bool open_ = false;
    bool writing_ = false;
    bool finished_ = false;
};

WebsocketTransport::WebsocketTransport(asio::io_context &io, std::chrono::milliseconds open_timeout,
                                       std::chrono::milliseconds idle_timeout)
    : io_(io), open_timeout_(open_timeout), idle_timeout_(idle_timeout) {}

WebsocketTransport::~WebsocketTransport() {
    if (session_) {
        session_->shutdown(kCloseNormal, "");
    }
}

void WebsocketTransport::open(const std::string &url, TransportHandlers handlers) {
    WebsocketUrl parsed;
    std::string error;
    if (!parse_websocket_url(url, parsed, error)) {
        if (handlers.on_failure) {
            handlers.on_failure(TransportError::OPEN_FAILURE, error);
        }
        return;
    }

    if (session_) {
        session_->shutdown(kCloseNormal, "");
    }
    session_ = std::make_shared<Session>(io_, open_timeout_, idle_timeout_);
    session_->start(std::move(parsed), std::move(handlers));
}

void WebsocketTransport::send(const std::string &text) {
    if (session_) {
        session_->send(text);
    }
}

void WebsocketTransport::close(uint16_t code, const std::string &reason) {
    if (session_) {
        session_->shutdown(code, reason);
        session_.reset();
    }
}

TransportFactory make_websocket_transport_factory(asio::io_context &io, std::chrono::milliseconds open_timeout) {
    return [&io, open_timeout]() -> std::unique_ptr<IDeviceTransport> {
        return std::make_unique<WebsocketTransport>(io, open_timeout);
    };
}

}  // namespace connection
}  // namespace lightfleet
