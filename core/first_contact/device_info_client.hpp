#pragma once

#include <string>

#include "model/device_state.hpp"

namespace lightfleet {
namespace first_contact {

struct InfoFetchResult {
    bool success = false;
    model::DeviceInfo info;
    int http_status = 0;  // 0 when no response arrived
    std::string error_message;
};

// Fetches a controller's self-description (GET /json/info)
class IDeviceInfoClient {
public:
    virtual ~IDeviceInfoClient() = default;

    // address is a sanitized host, IP or host:port
    virtual InfoFetchResult fetch_info(const std::string &address) = 0;
};

class HttpDeviceInfoClient : public IDeviceInfoClient {
public:
    explicit HttpDeviceInfoClient(int timeout_ms = 10000);

    InfoFetchResult fetch_info(const std::string &address) override;

    int timeout_ms() const { return timeout_ms_; }

private:
    int timeout_ms_;
};

}  // namespace first_contact
}  // namespace lightfleet
