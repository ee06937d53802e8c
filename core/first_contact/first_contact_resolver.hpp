#pragma once

#include <memory>
#include <optional>
#include <string>

#include "device_info_client.hpp"
#include "model/device_record.hpp"
#include "registry/device_store.hpp"

namespace lightfleet {
namespace first_contact {

enum class FirstContactError {
    NONE,
    INVALID_ADDRESS,       // malformed input, not retried
    NO_IDENTITY_REPORTED,  // device answered without a MAC
    NETWORK_ERROR,         // fetch failed, bad status or undecodable body
    STORE_ERROR            // registry write rejected
};

const char *first_contact_error_to_string(FirstContactError error);

struct FirstContactResult {
    bool success = false;
    model::DeviceIdentity identity;
    FirstContactError error = FirstContactError::NONE;
    std::string error_message;
};

/**
 * @brief Turns a raw address into a Device Record write
 *
 * probe() talks to the device only; upsert() talks to the registry only, so
 * a caller can run the network half on a worker and serialize the write.
 * resolve_and_upsert() chains both for direct use (manual "add device").
 *
 * Safe for concurrent use; the store serializes writes and the last write
 * for a MAC wins.
 */
class FirstContactResolver {
public:
    FirstContactResolver(registry::IDeviceStore &store, std::shared_ptr<IDeviceInfoClient> info_client);

    FirstContactResult probe(const std::string &raw_address);
    FirstContactResult upsert(const model::DeviceIdentity &identity);
    FirstContactResult resolve_and_upsert(const std::string &raw_address);

    // Writes only the address of an already known MAC. Returns whether a
    // record with that MAC exists; false for an empty or absent hint. The
    // record's other fields are not re-verified.
    bool fast_update_address(const std::optional<std::string> &mac_hint, const std::string &raw_address);

    // Trims whitespace, drops everything up to "://" and trailing slashes
    static std::string sanitize_address(const std::string &raw);
    static bool validate_address(const std::string &address, std::string &error);

private:
    registry::IDeviceStore &store_;
    std::shared_ptr<IDeviceInfoClient> info_client_;
};

}  // namespace first_contact
}  // namespace lightfleet
