#include "device_connection.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include "logging/logger.hpp"

namespace lightfleet {
namespace connection {

namespace asio = boost::asio;

std::shared_ptr<DeviceConnection> DeviceConnection::create(asio::io_context &io, std::string mac_address,
                                                           std::string address, TransportFactory transport_factory,
                                                           BackoffPolicy policy) {
    return std::make_shared<DeviceConnection>(Passkey{}, io, std::move(mac_address), std::move(address),
                                              std::move(transport_factory), policy);
}

DeviceConnection::DeviceConnection(Passkey, asio::io_context &io, std::string mac_address, std::string address,
                                   TransportFactory transport_factory, BackoffPolicy policy)
    : strand_(asio::make_strand(io)),
      mac_address_(std::move(mac_address)),
      address_(std::move(address)),
      transport_factory_(std::move(transport_factory)),
      policy_(policy),
      reconnect_timer_(strand_) {}

DeviceConnection::~DeviceConnection() {
    if (transport_) {
        transport_->close(kCloseNormal, "Client disconnected");
    }
}

void DeviceConnection::set_snapshot_listener(SnapshotListener listener) {
    asio::dispatch(strand_, [self = shared_from_this(), listener = std::move(listener)]() mutable {
        if (!self->destroyed_) {
            self->snapshot_listener_ = std::move(listener);
        }
    });
}

void DeviceConnection::connect() {
    asio::dispatch(strand_, [self = shared_from_this()] {
        if (!self->destroyed_) {
            self->do_connect();
        }
    });
}

void DeviceConnection::disconnect() {
    asio::dispatch(strand_, [self = shared_from_this()] { self->do_disconnect(); });
}

void DeviceConnection::destroy() {
    asio::dispatch(strand_, [self = shared_from_this()] {
        self->do_disconnect();
        self->destroyed_ = true;
        self->snapshot_listener_ = nullptr;
    });
}

void DeviceConnection::send_state(const model::StatePatch &patch) {
    std::string text = model::encode_state_patch(patch).dump();
    asio::dispatch(strand_, [self = shared_from_this(), text = std::move(text)] {
        if (self->destroyed_) {
            return;
        }
        if (self->status() != model::ConnectionStatus::CONNECTED) {
            self->do_connect();
        }
        if (!self->transport_) {
            LOG_WARN("[Connection] " << self->mac_address_ << ": dropping state change, no transport");
            return;
        }
        LOG_DEBUG("[Connection] " << self->mac_address_ << " -> " << text);
        self->transport_->send(text);
    });
}

model::ConnectionStatus DeviceConnection::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return live_.status;
}

model::LiveDeviceState DeviceConnection::live_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return live_;
}

std::optional<std::chrono::milliseconds> DeviceConnection::pending_reconnect_delay() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pending_delay_;
}

void DeviceConnection::set_status(model::ConnectionStatus status) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    live_.status = status;
}

void DeviceConnection::do_connect() {
    auto current = status();
    if (current != model::ConnectionStatus::DISCONNECTED) {
        return;
    }
    if (address_.empty()) {
        LOG_WARN("[Connection] " << mac_address_ << ": no address, not connecting");
        return;
    }

    manual_disconnect_ = false;
    reconnect_timer_.cancel();
    ++timer_token_;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending_delay_.reset();
        live_.status = model::ConnectionStatus::CONNECTING;
    }

    const uint64_t generation = ++generation_;
    ++connect_attempts_;
    transport_ = transport_factory_();
    if (!transport_) {
        LOG_ERROR("[Connection] " << mac_address_ << ": transport factory returned nothing");
        drop_transport(true);
        return;
    }

    std::weak_ptr<DeviceConnection> weak = shared_from_this();
    TransportHandlers handlers;
    handlers.on_open = [weak, generation] {
        if (auto self = weak.lock()) {
            asio::post(self->strand_, [self, generation] { self->handle_open(generation); });
        }
    };
    handlers.on_message = [weak, generation](const std::string &text) {
        if (auto self = weak.lock()) {
            asio::post(self->strand_, [self, generation, text] { self->handle_message(generation, text); });
        }
    };
    handlers.on_close = [weak, generation](uint16_t code, const std::string &reason) {
        if (auto self = weak.lock()) {
            asio::post(self->strand_,
                       [self, generation, code, reason] { self->handle_close(generation, code, reason); });
        }
    };
    handlers.on_failure = [weak, generation](TransportError error, const std::string &message) {
        if (auto self = weak.lock()) {
            asio::post(self->strand_,
                       [self, generation, error, message] { self->handle_failure(generation, error, message); });
        }
    };

    LOG_INFO("[Connection] " << mac_address_ << ": connecting to " << url() << " (retry " << retry_count_.load()
                             << ")");
    transport_->open(url(), std::move(handlers));
}

void DeviceConnection::do_disconnect() {
    manual_disconnect_ = true;
    reconnect_timer_.cancel();
    ++timer_token_;
    ++generation_;

    if (transport_) {
        transport_->close(kCloseNormal, "Client disconnected");
        transport_.reset();
        LOG_INFO("[Connection] " << mac_address_ << ": disconnected");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    pending_delay_.reset();
    live_.status = model::ConnectionStatus::DISCONNECTED;
}

void DeviceConnection::handle_open(uint64_t generation) {
    if (destroyed_ || generation != generation_) {
        return;
    }
    set_status(model::ConnectionStatus::CONNECTED);
    retry_count_ = 0;
    LOG_INFO("[Connection] " << mac_address_ << ": connected");
}

void DeviceConnection::handle_message(uint64_t generation, const std::string &text) {
    if (destroyed_ || generation != generation_) {
        return;
    }
    ++messages_received_;

    model::StateSnapshot snapshot;
    std::string error;
    if (!model::decode_state_snapshot(text, snapshot, error)) {
        ++decode_failures_;
        LOG_DEBUG("[Connection] " << mac_address_ << ": ignoring message: " << error);
        return;
    }

    bool confirmed = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        live_.snapshot = snapshot;
        live_.last_message_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::system_clock::now().time_since_epoch())
                                    .count();
        if (live_.status == model::ConnectionStatus::CONNECTING) {
            live_.status = model::ConnectionStatus::CONNECTED;
            confirmed = true;
        }
    }
    if (confirmed) {
        retry_count_ = 0;
        LOG_INFO("[Connection] " << mac_address_ << ": connected (first snapshot)");
    }

    if (snapshot_listener_) {
        snapshot_listener_(mac_address_, snapshot);
    }
}

void DeviceConnection::handle_close(uint64_t generation, uint16_t code, const std::string &reason) {
    if (destroyed_ || generation != generation_) {
        return;
    }
    const bool abnormal = code != kCloseNormal;
    if (abnormal) {
        LOG_WARN("[Connection] " << mac_address_ << ": closed by device (" << code << " " << reason << ")");
    } else {
        LOG_INFO("[Connection] " << mac_address_ << ": closed by device");
    }
    drop_transport(abnormal);
}

void DeviceConnection::handle_failure(uint64_t generation, TransportError error, const std::string &message) {
    if (destroyed_ || generation != generation_) {
        return;
    }
    LOG_WARN("[Connection] " << mac_address_ << ": " << transport_error_to_string(error) << ": " << message);
    drop_transport(true);
}

void DeviceConnection::drop_transport(bool reconnect) {
    ++generation_;
    transport_.reset();
    set_status(model::ConnectionStatus::DISCONNECTED);
    if (reconnect && !manual_disconnect_ && !destroyed_) {
        schedule_reconnect();
    }
}

void DeviceConnection::schedule_reconnect() {
    const auto delay = compute_backoff_delay(policy_, retry_count_.load());
    const uint64_t token = ++timer_token_;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending_delay_ = delay;
    }
    LOG_INFO("[Connection] " << mac_address_ << ": reconnecting in " << delay.count() << "ms");

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([weak = std::weak_ptr<DeviceConnection>(shared_from_this()),
                                 token](const boost::system::error_code &ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            self->on_reconnect_timer(token);
        }
    });
}

void DeviceConnection::on_reconnect_timer(uint64_t token) {
    if (token != timer_token_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending_delay_.reset();
    }
    if (manual_disconnect_ || destroyed_ || status() != model::ConnectionStatus::DISCONNECTED) {
        return;
    }
    ++retry_count_;
    do_connect();
}

}  // namespace connection
}  // namespace lightfleet
