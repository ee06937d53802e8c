#include "json.hpp"

namespace lightfleet {
namespace http {

nlohmann::json encode_device(const model::DeviceRecord &record, const std::optional<fleet::FleetDeviceView> &view) {
    nlohmann::json json = model::encode_record(record);
    json["name"] = record.display_name();
    json["is_ap_mode"] = record.is_ap_mode();

    if (!view) {
        json["connection"] = {{"status", model::connection_status_to_string(model::ConnectionStatus::DISCONNECTED)},
                              {"retry_count", 0}};
        json["state"] = nullptr;
        json["info"] = nullptr;
        json["update_available"] = nullptr;
        return json;
    }

    json["connection"] = encode_live_state(view->live);
    json["connection"]["address"] = view->connected_address;
    json["connection"]["retry_count"] = view->retry_count;
    if (view->reconnect_in) {
        json["connection"]["reconnect_in_ms"] = view->reconnect_in->count();
    }

    if (view->live.snapshot) {
        json["state"] = encode_device_state(view->live.snapshot->state);
        json["info"] = encode_info_summary(view->live.snapshot->info);
    } else {
        json["state"] = nullptr;
        json["info"] = nullptr;
    }

    if (view->available_update) {
        json["update_available"] = *view->available_update;
    } else {
        json["update_available"] = nullptr;
    }
    return json;
}

nlohmann::json encode_live_state(const model::LiveDeviceState &live) {
    nlohmann::json json = {{"status", model::connection_status_to_string(live.status)}};
    if (live.last_message_ms > 0) {
        json["last_message_ms"] = live.last_message_ms;
    }
    return json;
}

nlohmann::json encode_device_state(const model::DeviceState &state) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto &seg : state.segments) {
        segments.push_back({{"id", seg.id},
                            {"start", seg.start},
                            {"stop", seg.stop},
                            {"on", seg.on},
                            {"bri", seg.brightness},
                            {"col", seg.colors}});
    }
    return {{"on", state.on}, {"bri", state.brightness}, {"transition", state.transition}, {"seg", segments}};
}

nlohmann::json encode_info_summary(const model::DeviceInfo &info) {
    return {{"name", info.name},
            {"version", info.version},
            {"build_id", info.build_id},
            {"architecture", info.architecture},
            {"ip", info.ip},
            {"led_count", info.led_count},
            {"uptime_s", info.uptime_s},
            {"wifi_signal", info.wifi.signal},
            {"wifi_rssi", info.wifi.rssi}};
}

nlohmann::json encode_release(const release::ReleaseEntry &entry) {
    return {{"tag_name", entry.tag_name},
            {"name", entry.name},
            {"prerelease", entry.is_prerelease},
            {"published_at_ms", entry.published_at_ms},
            {"html_url", entry.html_url}};
}

bool decode_settings(const nlohmann::json &json, model::DeviceRecord &record, std::string &error) {
    if (!json.is_object()) {
        error = "settings must be a JSON object";
        return false;
    }

    model::DeviceRecord out = record;
    int fields = 0;

    if (json.contains("custom_name")) {
        if (!json["custom_name"].is_string()) {
            error = "'custom_name' must be a string";
            return false;
        }
        out.custom_name = json["custom_name"].get<std::string>();
        ++fields;
    }
    if (json.contains("is_hidden")) {
        if (!json["is_hidden"].is_boolean()) {
            error = "'is_hidden' must be a boolean";
            return false;
        }
        out.is_hidden = json["is_hidden"].get<bool>();
        ++fields;
    }
    if (json.contains("branch")) {
        if (!json["branch"].is_string()) {
            error = "'branch' must be a string";
            return false;
        }
        auto branch = model::string_to_branch(json["branch"].get<std::string>());
        if (!branch) {
            error = "Invalid branch: '" + json["branch"].get<std::string>() + "' (must be stable, beta or empty)";
            return false;
        }
        out.branch = *branch;
        ++fields;
    }
    if (json.contains("skip_update_tag")) {
        if (json["skip_update_tag"].is_null()) {
            out.skip_update_tag.clear();
        } else if (json["skip_update_tag"].is_string()) {
            out.skip_update_tag = json["skip_update_tag"].get<std::string>();
        } else {
            error = "'skip_update_tag' must be a string or null";
            return false;
        }
        ++fields;
    }

    if (fields == 0) {
        error = "No settings given (expected custom_name, is_hidden, branch or skip_update_tag)";
        return false;
    }

    record = out;
    return true;
}

}  // namespace http
}  // namespace lightfleet
