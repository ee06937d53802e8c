#include "first_contact/first_contact_resolver.hpp"
#include "fleet/fleet_controller.hpp"
#include "logging/logger.hpp"
#include "registry/device_store.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace lightfleet {
namespace http {

namespace {

StatusCode first_contact_status(first_contact::FirstContactError error) {
    switch (error) {
        case first_contact::FirstContactError::INVALID_ADDRESS:
            return StatusCode::INVALID_ARGUMENT;
        case first_contact::FirstContactError::NO_IDENTITY_REPORTED:
            return StatusCode::FAILED_PRECONDITION;
        case first_contact::FirstContactError::NETWORK_ERROR:
            return StatusCode::UNAVAILABLE;
        case first_contact::FirstContactError::STORE_ERROR:
        case first_contact::FirstContactError::NONE:
            return StatusCode::INTERNAL;
    }
    return StatusCode::INTERNAL;
}

}  // namespace

//=============================================================================
// GET /v0/devices
//=============================================================================
void HttpServer::handle_get_devices(const httplib::Request &req, httplib::Response &res) {
    const bool include_hidden = req.has_param("hidden") && req.get_param_value("hidden") == "true";

    nlohmann::json devices_json = nlohmann::json::array();
    size_t hidden = 0;
    for (const auto &record : store_.fetch_all()) {
        if (record.is_hidden && !include_hidden) {
            ++hidden;
            continue;
        }
        devices_json.push_back(encode_device(record, fleet_.device(record.mac_address)));
    }

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"devices", devices_json}, {"hidden_count", hidden}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/devices/{mac}
//=============================================================================
void HttpServer::handle_get_device(const httplib::Request &req, httplib::Response &res) {
    std::string mac;
    if (!parse_mac_param(req, mac)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path parameters");
        return;
    }

    auto record = store_.find_by_mac(mac);
    if (!record) {
        send_error(res, StatusCode::NOT_FOUND, "Device not found: " + mac);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"device", encode_device(*record, fleet_.device(mac))}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/devices  {"address": "..."}
//=============================================================================
void HttpServer::handle_post_device(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_json_object(req, res, body)) {
        return;
    }
    if (!body.contains("address") || !body["address"].is_string()) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Missing or invalid 'address' field (expected string)");
        return;
    }

    const std::string address = body["address"].get<std::string>();
    auto result = resolver_.resolve_and_upsert(address);
    if (!result.success) {
        auto code = first_contact_status(result.error);
        LOG_WARN("[HTTP] Add device '" << address << "' failed: "
                                       << first_contact::first_contact_error_to_string(result.error) << ": "
                                       << result.error_message);
        nlohmann::json response = make_error_response(code, result.error_message);
        response["error"] = first_contact::first_contact_error_to_string(result.error);
        send_json(res, code, response);
        return;
    }

    // Let the fleet open the connection before answering
    fleet_.drain();

    const auto &identity = result.identity;
    auto record = store_.find_by_mac(identity.mac_address);
    if (!record) {
        // Deleted between upsert and read
        send_error(res, StatusCode::NOT_FOUND, "Device not found: " + identity.mac_address);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"created", identity.created},
                               {"updated", identity.updated},
                               {"device", encode_device(*record, fleet_.device(identity.mac_address))}};
    send_json(res, StatusCode::OK, response);
    if (identity.created) {
        res.status = kStatusCreated;
    }
}

//=============================================================================
// POST /v0/devices/{mac}/settings
//=============================================================================
void HttpServer::handle_post_device_settings(const httplib::Request &req, httplib::Response &res) {
    std::string mac;
    if (!parse_mac_param(req, mac)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path parameters");
        return;
    }

    nlohmann::json body;
    if (!parse_json_object(req, res, body)) {
        return;
    }

    auto record = store_.find_by_mac(mac);
    if (!record) {
        send_error(res, StatusCode::NOT_FOUND, "Device not found: " + mac);
        return;
    }

    std::string error;
    if (!decode_settings(body, *record, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    if (!store_.save(*record, error)) {
        send_error(res, StatusCode::INTERNAL, "Could not save settings: " + error);
        return;
    }
    LOG_INFO("[HTTP] Settings updated for " << mac);

    fleet_.drain();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"device", encode_device(*record, fleet_.device(mac))}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// DELETE /v0/devices/{mac}
//=============================================================================
void HttpServer::handle_delete_device(const httplib::Request &req, httplib::Response &res) {
    std::string mac;
    if (!parse_mac_param(req, mac)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path parameters");
        return;
    }

    if (!store_.find_by_mac(mac)) {
        send_error(res, StatusCode::NOT_FOUND, "Device not found: " + mac);
        return;
    }

    std::string error;
    if (!store_.remove(mac, error)) {
        send_error(res, StatusCode::INTERNAL, "Could not delete device: " + error);
        return;
    }
    LOG_INFO("[HTTP] Deleted device " << mac);

    // Reconcile tears the connection down
    fleet_.drain();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"mac_address", mac}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/devices/{mac}/state  {"on": bool, "bri": 0-255, "transition": int}
//=============================================================================
void HttpServer::handle_post_device_state(const httplib::Request &req, httplib::Response &res) {
    std::string mac;
    if (!parse_mac_param(req, mac)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path parameters");
        return;
    }

    nlohmann::json body;
    if (!parse_json_object(req, res, body)) {
        return;
    }

    model::StatePatch patch;
    std::string error;
    if (!model::decode_state_patch(body, patch, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    if (!fleet_.device(mac)) {
        send_error(res, StatusCode::NOT_FOUND, "Device not found: " + mac);
        return;
    }

    if (!fleet_.send_state(mac, patch, error)) {
        send_error(res, StatusCode::FAILED_PRECONDITION, error);
        return;
    }

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"mac_address", mac}, {"sent", model::encode_state_patch(patch)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/devices/refresh
//=============================================================================
void HttpServer::handle_post_refresh(const httplib::Request &, httplib::Response &res) {
    if (fleet_.is_paused()) {
        send_error(res, StatusCode::FAILED_PRECONDITION, "Fleet is paused");
        return;
    }
    fleet_.refresh_offline();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"active_connections", fleet_.active_count()}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace lightfleet
