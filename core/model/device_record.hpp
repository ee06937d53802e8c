#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace lightfleet {
namespace model {

// Firmware release track a device follows. Persisted as "", "stable", "beta".
enum class Branch { UNKNOWN, STABLE, BETA };

std::string branch_to_string(Branch branch);
std::optional<Branch> string_to_branch(const std::string &value);

// MAC reported by a controller that is running its own access point
inline constexpr const char *kApModeMacAddress = "00:00:00:00:00:00";

// Persisted identity and user preferences for one controller, keyed by MAC
struct DeviceRecord {
    std::string mac_address;
    std::string address;  // host, IP or host:port; no scheme, no trailing slash
    std::string custom_name;
    std::string original_name;
    bool is_hidden = false;
    Branch branch = Branch::UNKNOWN;
    std::string skip_update_tag;
    int64_t last_seen_ms = 0;

    // custom name, then reported name, then address
    std::string display_name() const;
    bool is_ap_mode() const { return mac_address == kApModeMacAddress; }

    bool operator==(const DeviceRecord &other) const;
    bool operator!=(const DeviceRecord &other) const { return !(*this == other); }
};

// Identity a device reports about itself on first contact
struct DeviceIdentity {
    std::string mac_address;
    std::string address;
    std::string reported_name;
    std::string version;
    bool created = false;  // upsert inserted a new record
    bool updated = false;  // upsert patched an existing record
};

nlohmann::json encode_record(const DeviceRecord &record);
bool decode_record(const nlohmann::json &json, DeviceRecord &record, std::string &error);

}  // namespace model
}  // namespace lightfleet
