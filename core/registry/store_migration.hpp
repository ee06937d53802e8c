#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "model/device_record.hpp"

namespace lightfleet {
namespace registry {

// Placeholder MAC written by old versions for devices they never identified
inline constexpr const char *kUnknownMacPlaceholder = "__unknown__";

// Device entry of the version 1 store format, which kept a single name plus
// a flag telling whether the user had chosen it
struct LegacyDeviceRecord {
    std::optional<std::string> mac_address;
    std::string address;
    std::string name;
    bool is_custom_name = false;
    bool is_hidden = false;
    std::string skip_update_tag;
};

struct MigrationReport {
    size_t migrated = 0;
    size_t dropped_invalid_mac = 0;
    size_t dropped_duplicates = 0;
};

bool decode_legacy_record(const nlohmann::json &json, LegacyDeviceRecord &record, std::string &error);

// Converts version 1 entries to Device Records.
//  - entries without a MAC, or with the placeholder MAC, are dropped
//  - the first entry per MAC wins; later duplicates are dropped, not merged
//  - the old name becomes custom_name or original_name depending on the flag
//  - branch starts UNKNOWN and last_seen_ms at 0
std::vector<model::DeviceRecord> migrate_legacy_records(const std::vector<LegacyDeviceRecord> &legacy,
                                                        MigrationReport *report = nullptr);

}  // namespace registry
}  // namespace lightfleet
