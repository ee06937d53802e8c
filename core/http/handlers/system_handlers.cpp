#include <chrono>

#include "discovery/discovery_service.hpp"
#include "fleet/fleet_controller.hpp"
#include "logging/logger.hpp"
#include "registry/device_store.hpp"
#include "release/release_catalog.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace lightfleet {
namespace http {

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - started_at_).count();

    size_t connected = 0;
    size_t connecting = 0;
    for (const auto &view : fleet_.devices()) {
        if (view.live.status == model::ConnectionStatus::CONNECTED) {
            ++connected;
        } else if (view.live.status == model::ConnectionStatus::CONNECTING) {
            ++connecting;
        }
    }

    nlohmann::json discovery_json = {{"enabled", discovery_ != nullptr}};
    if (discovery_) {
        discovery_json["service"] = discovery_->service_name();
        discovery_json["scanning"] = discovery_->is_scanning();
        discovery_json["scans_started"] = discovery_->scans_started();
        discovery_json["scans_failed"] = discovery_->scans_failed();
        discovery_json["devices_reported"] = discovery_->devices_reported();
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"name", instance_name_},
                               {"uptime_seconds", uptime},
                               {"paused", fleet_.is_paused()},
                               {"device_count", store_.size()},
                               {"active_connections", fleet_.active_count()},
                               {"connected", connected},
                               {"connecting", connecting},
                               {"pending_bookkeeping", fleet_.pending_bookkeeping()},
                               {"release_count", catalog_.size()},
                               {"discovery", discovery_json}};

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/runtime/pause
//=============================================================================
void HttpServer::handle_post_pause(const httplib::Request &, httplib::Response &res) {
    fleet_.pause();
    fleet_.drain();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"paused", fleet_.is_paused()}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/runtime/resume
//=============================================================================
void HttpServer::handle_post_resume(const httplib::Request &, httplib::Response &res) {
    fleet_.resume();
    fleet_.drain();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"paused", fleet_.is_paused()}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/discovery/scan
//=============================================================================
void HttpServer::handle_post_discovery_scan(const httplib::Request &, httplib::Response &res) {
    if (!discovery_) {
        send_error(res, StatusCode::UNAVAILABLE, "Discovery not enabled");
        return;
    }

    const bool already_scanning = discovery_->is_scanning();
    discovery_->scan();
    LOG_INFO("[HTTP] Discovery scan requested" << (already_scanning ? " (already running)" : ""));

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"service", discovery_->service_name()},
                               {"already_scanning", already_scanning}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace lightfleet
