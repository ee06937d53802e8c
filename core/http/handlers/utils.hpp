#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"

namespace lightfleet {
namespace http {

constexpr int kStatusCreated = 201;

// Helper: MAC address from the first regex group
inline bool parse_mac_param(const httplib::Request &req, std::string &mac_address) {
    if (req.matches.size() >= 2) {
        mac_address = req.matches[1].str();
        return !mac_address.empty();
    }
    return false;
}

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(), "application/json");
}

inline void send_error(httplib::Response &res, StatusCode code, const std::string &message) {
    send_json(res, code, make_error_response(code, message));
}

// Helper: Parse a JSON object body; sends 400 and returns false otherwise
inline bool parse_json_object(const httplib::Request &req, httplib::Response &res, nlohmann::json &body) {
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const std::exception &e) {
        send_error(res, StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what());
        return false;
    }
    if (!body.is_object()) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Request body must be a JSON object");
        return false;
    }
    return true;
}

}  // namespace http
}  // namespace lightfleet
