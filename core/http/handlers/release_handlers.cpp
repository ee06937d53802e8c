#include "fleet/fleet_controller.hpp"
#include "logging/logger.hpp"
#include "release/release_catalog.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace lightfleet {
namespace http {

//=============================================================================
// GET /v0/releases
//=============================================================================
void HttpServer::handle_get_releases(const httplib::Request &, httplib::Response &res) {
    nlohmann::json releases_json = nlohmann::json::array();
    for (const auto &entry : catalog_.entries()) {
        releases_json.push_back(encode_release(entry));
    }

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"revision", catalog_.revision()}, {"releases", releases_json}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/releases  (GitHub "list releases" JSON array)
//=============================================================================
void HttpServer::handle_post_releases(const httplib::Request &req, httplib::Response &res) {
    std::vector<release::ReleaseEntry> entries;
    std::string error;
    if (!release::decode_github_releases(req.body, entries, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    const size_t count = entries.size();
    catalog_.replace(std::move(entries));
    fleet_.recompute_updates();
    fleet_.drain();

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"revision", catalog_.revision()}, {"release_count", count}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace lightfleet
