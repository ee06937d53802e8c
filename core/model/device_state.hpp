#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lightfleet {
namespace model {

enum class ConnectionStatus { DISCONNECTED, CONNECTING, CONNECTED };

const char *connection_status_to_string(ConnectionStatus status);

struct Segment {
    int id = 0;
    int start = 0;
    int stop = 0;
    bool on = true;
    int brightness = 255;
    std::vector<std::vector<int>> colors;  // up to three slots, RGB or RGBW each
};

struct WifiInfo {
    std::string bssid;
    int rssi = 0;
    int signal = 0;  // percent
    int channel = 0;
};

// Device self-description, as served by GET /json/info and embedded in
// WebSocket snapshots under "info"
struct DeviceInfo {
    std::string name;
    std::string version;  // "ver"
    int64_t build_id = 0;  // "vid"
    std::string code_name;
    std::string release;
    std::string architecture;  // "arch"
    std::string mac_address;
    std::string ip;
    std::string brand;
    std::string product;
    int led_count = 0;
    int64_t uptime_s = 0;
    int64_t free_heap = 0;
    int effect_count = 0;
    int palette_count = 0;
    int websocket_clients = 0;
    WifiInfo wifi;
};

struct DeviceState {
    bool on = false;
    int brightness = 0;
    int transition = 0;
    std::vector<Segment> segments;
};

struct StateSnapshot {
    DeviceState state;
    DeviceInfo info;
};

// Outbound change request; unset fields are left out of the message
struct StatePatch {
    std::optional<bool> on;
    std::optional<int> brightness;
    std::optional<int> transition;

    bool empty() const { return !on && !brightness && !transition; }
};

// Ephemeral state owned by one connection
struct LiveDeviceState {
    ConnectionStatus status = ConnectionStatus::DISCONNECTED;
    std::optional<StateSnapshot> snapshot;
    int64_t last_message_ms = 0;
};

bool decode_device_info(const nlohmann::json &json, DeviceInfo &info, std::string &error);
bool decode_device_info(const std::string &body, DeviceInfo &info, std::string &error);

// Accepts {"state":{...},"info":{...}} or the state fields at top level next
// to "info". A message without an "info" object is rejected.
bool decode_state_snapshot(const std::string &text, StateSnapshot &snapshot, std::string &error);

nlohmann::json encode_state_patch(const StatePatch &patch);
bool decode_state_patch(const nlohmann::json &json, StatePatch &patch, std::string &error);

}  // namespace model
}  // namespace lightfleet
