#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "fleet/fleet_controller.hpp"
#include "model/device_record.hpp"
#include "model/device_state.hpp"
#include "release/release_catalog.hpp"

namespace lightfleet {
namespace http {

/**
 * @brief JSON encoding for API responses
 *
 * Device payloads merge the persisted record with whatever the fleet knows
 * about the live connection. A record the fleet has not picked up yet is
 * reported as DISCONNECTED with no state.
 */
nlohmann::json encode_device(const model::DeviceRecord &record, const std::optional<fleet::FleetDeviceView> &view);
nlohmann::json encode_live_state(const model::LiveDeviceState &live);
nlohmann::json encode_device_state(const model::DeviceState &state);
nlohmann::json encode_info_summary(const model::DeviceInfo &info);
nlohmann::json encode_release(const release::ReleaseEntry &entry);

// User-editable fields of a Device Record: custom_name, is_hidden, branch,
// skip_update_tag. Absent fields keep their value; at least one is required.
bool decode_settings(const nlohmann::json &json, model::DeviceRecord &record, std::string &error);

}  // namespace http
}  // namespace lightfleet
