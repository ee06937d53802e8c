#include "device_record.hpp"

namespace lightfleet {
namespace model {

std::string branch_to_string(Branch branch) {
    switch (branch) {
        case Branch::STABLE:
            return "stable";
        case Branch::BETA:
            return "beta";
        case Branch::UNKNOWN:
        default:
            return "";
    }
}

std::optional<Branch> string_to_branch(const std::string &value) {
    if (value.empty() || value == "unknown") {
        return Branch::UNKNOWN;
    }
    if (value == "stable") {
        return Branch::STABLE;
    }
    if (value == "beta") {
        return Branch::BETA;
    }
    return std::nullopt;
}

std::string DeviceRecord::display_name() const {
    if (!custom_name.empty()) {
        return custom_name;
    }
    if (!original_name.empty()) {
        return original_name;
    }
    return address;
}

bool DeviceRecord::operator==(const DeviceRecord &other) const {
    return mac_address == other.mac_address && address == other.address && custom_name == other.custom_name &&
           original_name == other.original_name && is_hidden == other.is_hidden && branch == other.branch &&
           skip_update_tag == other.skip_update_tag && last_seen_ms == other.last_seen_ms;
}

nlohmann::json encode_record(const DeviceRecord &record) {
    return {{"mac_address", record.mac_address},
            {"address", record.address},
            {"custom_name", record.custom_name},
            {"original_name", record.original_name},
            {"is_hidden", record.is_hidden},
            {"branch", branch_to_string(record.branch)},
            {"skip_update_tag", record.skip_update_tag},
            {"last_seen_ms", record.last_seen_ms}};
}

bool decode_record(const nlohmann::json &json, DeviceRecord &record, std::string &error) {
    if (!json.is_object()) {
        error = "device record must be an object";
        return false;
    }
    if (!json.contains("mac_address") || !json["mac_address"].is_string()) {
        error = "device record missing 'mac_address'";
        return false;
    }

    DeviceRecord out;
    out.mac_address = json["mac_address"].get<std::string>();
    if (out.mac_address.empty()) {
        error = "device record has an empty 'mac_address'";
        return false;
    }

    try {
        out.address = json.value("address", std::string());
        out.custom_name = json.value("custom_name", std::string());
        out.original_name = json.value("original_name", std::string());
        out.is_hidden = json.value("is_hidden", false);
        out.skip_update_tag = json.value("skip_update_tag", std::string());
        out.last_seen_ms = json.value("last_seen_ms", static_cast<int64_t>(0));

        auto branch = string_to_branch(json.value("branch", std::string()));
        if (!branch) {
            error = "device " + out.mac_address + " has invalid branch '" + json.value("branch", std::string()) + "'";
            return false;
        }
        out.branch = *branch;
    } catch (const nlohmann::json::exception &e) {
        error = "device " + out.mac_address + ": " + e.what();
        return false;
    }

    record = std::move(out);
    return true;
}

}  // namespace model
}  // namespace lightfleet
