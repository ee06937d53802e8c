#include "device_info_client.hpp"

#include <httplib.h>

#include "logging/logger.hpp"

namespace lightfleet {
namespace first_contact {

namespace {
constexpr const char *kInfoPath = "/json/info";
}

HttpDeviceInfoClient::HttpDeviceInfoClient(int timeout_ms) : timeout_ms_(timeout_ms) {}

InfoFetchResult HttpDeviceInfoClient::fetch_info(const std::string &address) {
    InfoFetchResult result;

    httplib::Client client("http://" + address);
    const time_t sec = timeout_ms_ / 1000;
    const time_t usec = static_cast<time_t>(timeout_ms_ % 1000) * 1000;
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);

    LOG_DEBUG("[FirstContact] GET http://" << address << kInfoPath);
    auto response = client.Get(kInfoPath);
    if (!response) {
        result.error_message = "request to " + address + " failed: " + httplib::to_string(response.error());
        return result;
    }

    result.http_status = response->status;
    if (response->status < 200 || response->status > 299) {
        result.error_message = address + " answered HTTP " + std::to_string(response->status);
        return result;
    }

    std::string decode_error;
    if (!model::decode_device_info(response->body, result.info, decode_error)) {
        result.error_message = address + " sent an unreadable info document: " + decode_error;
        return result;
    }

    result.success = true;
    return result;
}

}  // namespace first_contact
}  // namespace lightfleet
