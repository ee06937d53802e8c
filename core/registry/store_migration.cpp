#include "store_migration.hpp"

#include <unordered_set>

#include "logging/logger.hpp"

namespace lightfleet {
namespace registry {

namespace {

// Old stores wrote null for fields they never filled in
std::string string_or_empty(const nlohmann::json &json, const char *key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

bool bool_or_false(const nlohmann::json &json, const char *key) {
    auto it = json.find(key);
    return it != json.end() && it->is_boolean() && it->get<bool>();
}

}  // namespace

bool decode_legacy_record(const nlohmann::json &json, LegacyDeviceRecord &record, std::string &error) {
    if (!json.is_object()) {
        error = "legacy device entry must be an object";
        return false;
    }

    LegacyDeviceRecord out;
    try {
        if (json.contains("mac_address") && json["mac_address"].is_string()) {
            out.mac_address = json["mac_address"].get<std::string>();
        }
        out.address = string_or_empty(json, "address");
        out.name = string_or_empty(json, "name");
        out.is_custom_name = bool_or_false(json, "is_custom_name");
        out.is_hidden = bool_or_false(json, "is_hidden");
        out.skip_update_tag = string_or_empty(json, "skip_update_tag");
    } catch (const nlohmann::json::exception &e) {
        error = std::string("legacy device entry: ") + e.what();
        return false;
    }

    record = std::move(out);
    return true;
}

std::vector<model::DeviceRecord> migrate_legacy_records(const std::vector<LegacyDeviceRecord> &legacy,
                                                        MigrationReport *report) {
    MigrationReport local;
    std::unordered_set<std::string> migrated_macs;
    std::vector<model::DeviceRecord> out;

    for (const auto &source : legacy) {
        if (!source.mac_address || source.mac_address->empty() || *source.mac_address == kUnknownMacPlaceholder) {
            local.dropped_invalid_mac++;
            continue;
        }

        const std::string &mac = *source.mac_address;
        if (!migrated_macs.insert(mac).second) {
            LOG_WARN("[Store] Migration: dropping duplicate device with MAC " << mac);
            local.dropped_duplicates++;
            continue;
        }

        model::DeviceRecord record;
        record.mac_address = mac;
        record.address = source.address;
        record.is_hidden = source.is_hidden;
        record.skip_update_tag = source.skip_update_tag;
        if (source.is_custom_name) {
            record.custom_name = source.name;
        } else {
            record.original_name = source.name;
        }
        record.branch = model::Branch::UNKNOWN;
        record.last_seen_ms = 0;

        out.push_back(std::move(record));
        local.migrated++;
    }

    if (report != nullptr) {
        *report = local;
    }
    return out;
}

}  // namespace registry
}  // namespace lightfleet
