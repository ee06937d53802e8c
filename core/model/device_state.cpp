#include "device_state.hpp"

namespace lightfleet {
namespace model {

namespace {

template <typename T>
T number_or(const nlohmann::json &json, const char *key, T fallback) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<T>();
}

std::string string_or_empty(const nlohmann::json &json, const char *key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

bool decode_segment(const nlohmann::json &json, Segment &segment) {
    if (!json.is_object()) {
        return false;
    }
    segment.id = number_or(json, "id", 0);
    segment.start = number_or(json, "start", 0);
    segment.stop = number_or(json, "stop", 0);
    auto on = json.find("on");
    segment.on = (on != json.end() && on->is_boolean()) ? on->get<bool>() : true;
    segment.brightness = number_or(json, "bri", 255);

    auto col = json.find("col");
    if (col != json.end() && col->is_array()) {
        for (const auto &slot : *col) {
            std::vector<int> channels;
            if (slot.is_array()) {
                for (const auto &channel : slot) {
                    if (channel.is_number()) {
                        channels.push_back(channel.get<int>());
                    }
                }
            }
            segment.colors.push_back(std::move(channels));
        }
    }
    return true;
}

bool decode_state(const nlohmann::json &json, DeviceState &state, std::string &error) {
    auto on = json.find("on");
    if (on != json.end() && !on->is_boolean()) {
        error = "'on' must be a boolean";
        return false;
    }
    auto bri = json.find("bri");
    if (bri != json.end() && !bri->is_number()) {
        error = "'bri' must be a number";
        return false;
    }
    if (on == json.end() && bri == json.end()) {
        error = "state has neither 'on' nor 'bri'";
        return false;
    }

    state.on = on != json.end() ? on->get<bool>() : false;
    state.brightness = bri != json.end() ? bri->get<int>() : 0;
    state.transition = number_or(json, "transition", 0);

    auto seg = json.find("seg");
    if (seg != json.end() && seg->is_array()) {
        for (const auto &item : *seg) {
            Segment segment;
            if (decode_segment(item, segment)) {
                state.segments.push_back(std::move(segment));
            }
        }
    }
    return true;
}

}  // namespace

const char *connection_status_to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::CONNECTED:
            return "CONNECTED";
        case ConnectionStatus::CONNECTING:
            return "CONNECTING";
        case ConnectionStatus::DISCONNECTED:
        default:
            return "DISCONNECTED";
    }
}

bool decode_device_info(const nlohmann::json &json, DeviceInfo &info, std::string &error) {
    if (!json.is_object()) {
        error = "info must be an object";
        return false;
    }
    auto name = json.find("name");
    if (name == json.end() || !name->is_string()) {
        error = "info missing 'name'";
        return false;
    }

    DeviceInfo out;
    out.name = name->get<std::string>();
    out.version = string_or_empty(json, "ver");
    out.build_id = number_or<int64_t>(json, "vid", 0);
    out.code_name = string_or_empty(json, "cn");
    out.release = string_or_empty(json, "release");
    out.architecture = string_or_empty(json, "arch");
    out.mac_address = string_or_empty(json, "mac");
    out.ip = string_or_empty(json, "ip");
    out.brand = string_or_empty(json, "brand");
    out.product = string_or_empty(json, "product");
    out.uptime_s = number_or<int64_t>(json, "uptime", 0);
    out.free_heap = number_or<int64_t>(json, "freeheap", number_or<int64_t>(json, "freeHeap", 0));
    out.effect_count = number_or(json, "fxcount", 0);
    out.palette_count = number_or(json, "palcount", 0);
    out.websocket_clients = number_or(json, "ws", 0);

    auto leds = json.find("leds");
    if (leds != json.end() && leds->is_object()) {
        out.led_count = number_or(*leds, "count", 0);
    }

    auto wifi = json.find("wifi");
    if (wifi != json.end() && wifi->is_object()) {
        out.wifi.bssid = string_or_empty(*wifi, "bssid");
        out.wifi.rssi = number_or(*wifi, "rssi", 0);
        out.wifi.signal = number_or(*wifi, "signal", 0);
        out.wifi.channel = number_or(*wifi, "channel", 0);
    }

    info = std::move(out);
    return true;
}

bool decode_device_info(const std::string &body, DeviceInfo &info, std::string &error) {
    nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        error = "info is not valid JSON";
        return false;
    }
    return decode_device_info(json, info, error);
}

bool decode_state_snapshot(const std::string &text, StateSnapshot &snapshot, std::string &error) {
    nlohmann::json json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        error = "message is not valid JSON";
        return false;
    }
    if (!json.is_object()) {
        error = "message must be a JSON object";
        return false;
    }

    auto info_it = json.find("info");
    if (info_it == json.end()) {
        error = "message has no 'info' object";
        return false;
    }

    StateSnapshot out;
    if (!decode_device_info(*info_it, out.info, error)) {
        return false;
    }

    auto state_it = json.find("state");
    const nlohmann::json &state_json = (state_it != json.end() && state_it->is_object()) ? *state_it : json;
    if (!decode_state(state_json, out.state, error)) {
        return false;
    }

    snapshot = std::move(out);
    return true;
}

nlohmann::json encode_state_patch(const StatePatch &patch) {
    nlohmann::json json = nlohmann::json::object();
    if (patch.on) {
        json["on"] = *patch.on;
    }
    if (patch.brightness) {
        json["bri"] = *patch.brightness;
    }
    if (patch.transition) {
        json["transition"] = *patch.transition;
    }
    return json;
}

bool decode_state_patch(const nlohmann::json &json, StatePatch &patch, std::string &error) {
    if (!json.is_object()) {
        error = "state patch must be a JSON object";
        return false;
    }

    StatePatch out;
    if (json.contains("on")) {
        if (!json["on"].is_boolean()) {
            error = "'on' must be a boolean";
            return false;
        }
        out.on = json["on"].get<bool>();
    }
    if (json.contains("bri")) {
        if (!json["bri"].is_number_integer()) {
            error = "'bri' must be an integer";
            return false;
        }
        int bri = json["bri"].get<int>();
        if (bri < 0 || bri > 255) {
            error = "'bri' must be between 0 and 255";
            return false;
        }
        out.brightness = bri;
    }
    if (json.contains("transition")) {
        if (!json["transition"].is_number_integer() || json["transition"].get<int>() < 0) {
            error = "'transition' must be a non-negative integer";
            return false;
        }
        out.transition = json["transition"].get<int>();
    }
    if (out.empty()) {
        error = "state patch has no fields (expected on, bri or transition)";
        return false;
    }

    patch = out;
    return true;
}

}  // namespace model
}  // namespace lightfleet
