#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "i_device_transport.hpp"
#include "model/device_state.hpp"
#include "reconnect_policy.hpp"

namespace lightfleet {
namespace connection {

/**
 * @brief Live command channel to one controller, with automatic reconnect
 *
 * States: DISCONNECTED (initial) -> CONNECTING -> CONNECTED. A transport
 * failure or abnormal close drops back to DISCONNECTED and schedules a
 * reconnect after compute_backoff_delay(retry_count). A normal close from the
 * device, or disconnect(), does not reconnect.
 *
 * The address is fixed for the lifetime of the object; a device that moved
 * gets a new DeviceConnection.
 *
 * Threading: all work runs on a private strand of the io_context. Public
 * methods post to it and return immediately. Accessors may be called from any
 * thread.
 */
class DeviceConnection : public std::enable_shared_from_this<DeviceConnection> {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    // Runs on the connection strand for every decoded snapshot
    using SnapshotListener = std::function<void(const std::string &mac_address, const model::StateSnapshot &)>;

    static std::shared_ptr<DeviceConnection> create(boost::asio::io_context &io, std::string mac_address,
                                                    std::string address, TransportFactory transport_factory,
                                                    BackoffPolicy policy = BackoffPolicy{});

    DeviceConnection(Passkey, boost::asio::io_context &io, std::string mac_address, std::string address,
                     TransportFactory transport_factory, BackoffPolicy policy);
    ~DeviceConnection();

    DeviceConnection(const DeviceConnection &) = delete;
    DeviceConnection &operator=(const DeviceConnection &) = delete;

    void set_snapshot_listener(SnapshotListener listener);

    // No-op while CONNECTING or CONNECTED. Clears the manual-disconnect flag.
    void connect();
    // Idempotent. Cancels a pending reconnect.
    void disconnect();
    // disconnect() and drop the listener; later callbacks are ignored
    void destroy();
    // Connects first when not CONNECTED; the transport queues the frame
    void send_state(const model::StatePatch &patch);

    const std::string &mac_address() const { return mac_address_; }
    const std::string &address() const { return address_; }
    std::string url() const { return "ws://" + address_ + "/ws"; }

    model::ConnectionStatus status() const;
    model::LiveDeviceState live_state() const;
    bool is_manually_disconnected() const { return manual_disconnect_.load(); }

    int retry_count() const { return retry_count_.load(); }
    // Delay of the reconnect currently scheduled, if any
    std::optional<std::chrono::milliseconds> pending_reconnect_delay() const;

    uint64_t connect_attempts() const { return connect_attempts_.load(); }
    uint64_t messages_received() const { return messages_received_.load(); }
    uint64_t decode_failures() const { return decode_failures_.load(); }

private:
    // Strand-only
    void do_connect();
    void do_disconnect();
    void handle_open(uint64_t generation);
    void handle_message(uint64_t generation, const std::string &text);
    void handle_close(uint64_t generation, uint16_t code, const std::string &reason);
    void handle_failure(uint64_t generation, TransportError error, const std::string &message);
    void drop_transport(bool reconnect);
    void schedule_reconnect();
    void on_reconnect_timer(uint64_t token);

    void set_status(model::ConnectionStatus status);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    const std::string mac_address_;
    const std::string address_;
    TransportFactory transport_factory_;
    BackoffPolicy policy_;

    // Strand-only
    std::unique_ptr<IDeviceTransport> transport_;
    boost::asio::steady_timer reconnect_timer_;
    uint64_t generation_ = 0;
    uint64_t timer_token_ = 0;
    bool destroyed_ = false;
    SnapshotListener snapshot_listener_;

    mutable std::mutex state_mutex_;
    model::LiveDeviceState live_;
    std::optional<std::chrono::milliseconds> pending_delay_;

    std::atomic<bool> manual_disconnect_{false};
    std::atomic<int> retry_count_{0};
    std::atomic<uint64_t> connect_attempts_{0};
    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> decode_failures_{0};
};

}  // namespace connection
}  // namespace lightfleet
