#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace lightfleet {
namespace connection {

enum class TransportError { OPEN_FAILURE, READ_FAILURE, SEND_FAILURE };

inline const char *transport_error_to_string(TransportError error) {
    switch (error) {
        case TransportError::OPEN_FAILURE:
            return "OPEN_FAILURE";
        case TransportError::READ_FAILURE:
            return "READ_FAILURE";
        case TransportError::SEND_FAILURE:
            return "SEND_FAILURE";
    }
    return "UNKNOWN";
}

// WebSocket close code for a normal, intentional closure
inline constexpr uint16_t kCloseNormal = 1000;

// Handlers may run on any thread. At most one of on_close / on_failure fires.
struct TransportHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string &text)> on_message;
    std::function<void(uint16_t code, const std::string &reason)> on_close;
    std::function<void(TransportError error, const std::string &message)> on_failure;
};

// A persistent text-message channel to one device
class IDeviceTransport {
public:
    virtual ~IDeviceTransport() = default;

    virtual void open(const std::string &url, TransportHandlers handlers) = 0;
    // Messages sent before the channel is open are queued
    virtual void send(const std::string &text) = 0;
    // No handler fires after close() returns
    virtual void close(uint16_t code, const std::string &reason) = 0;
};

using TransportFactory = std::function<std::unique_ptr<IDeviceTransport>()>;

}  // namespace connection
}  // namespace lightfleet
