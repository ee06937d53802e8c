#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace lightfleet {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, const std::string &instance_name,
                       registry::IDeviceStore &store, fleet::FleetController &fleet,
                       first_contact::FirstContactResolver &resolver, release::ReleaseCatalog &catalog,
                       std::shared_ptr<discovery::DiscoveryService> discovery)
    : config_(config),
      instance_name_(instance_name),
      started_at_(std::chrono::steady_clock::now()),
      store_(store),
      fleet_(fleet),
      resolver_(resolver),
      catalog_(catalog),
      discovery_(std::move(discovery)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    // Create server
    server_ = std::make_unique<httplib::Server>();

    // Configure server
    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string &allowed = *matched;
        const std::string response_origin = allowed == "*" ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    // Set up routes
    setup_routes();

    // Set error handler for JSON error responses (called for HTTP errors like 404)
    // Only override content if no content has been set
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        // If content was already set by the handler, don't override it
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        } else if (res.status == kStatusInternal) {
            code = StatusCode::INTERNAL;
            message = "Internal server error";
        }

        nlohmann::json response = make_error_response(code, message);
        res.set_content(response.dump(), "application/json");
    });

    // Set exception handler
    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        nlohmann::json response = make_error_response(StatusCode::INTERNAL, msg);
        res.status = kStatusInternal;
        res.set_content(response.dump(), "application/json");
    });

    // Bind first (bind_to_port returns the actual port used, or -1 on error)
    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        return false;
    }
    port_ = config_.port;

    // Start server thread
    started_at_ = std::chrono::steady_clock::now();
    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // GET /v0/devices - List devices (?hidden=true includes hidden ones)
    server_->Get("/v0/devices",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_devices(req, res); });

    // POST /v0/devices - Add a device by address
    server_->Post("/v0/devices",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_device(req, res); });

    // POST /v0/devices/refresh - Reconnect offline devices
    server_->Post("/v0/devices/refresh",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_refresh(req, res); });

    // GET /v0/devices/:mac - One device
    server_->Get(R"(/v0/devices/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_device(req, res); });

    // DELETE /v0/devices/:mac - Forget a device
    server_->Delete(R"(/v0/devices/([^/]+))",
                    [this](const httplib::Request &req, httplib::Response &res) { handle_delete_device(req, res); });

    // POST /v0/devices/:mac/settings - User edits
    server_->Post(R"(/v0/devices/([^/]+)/settings)", [this](const httplib::Request &req, httplib::Response &res) {
        handle_post_device_settings(req, res);
    });

    // POST /v0/devices/:mac/state - Send a state change
    server_->Post(R"(/v0/devices/([^/]+)/state)", [this](const httplib::Request &req, httplib::Response &res) {
        handle_post_device_state(req, res);
    });

    // GET/POST /v0/releases - Release catalog
    server_->Get("/v0/releases",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_releases(req, res); });
    server_->Post("/v0/releases",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_releases(req, res); });

    // POST /v0/discovery/scan - Start a discovery scan now
    server_->Post("/v0/discovery/scan", [this](const httplib::Request &req, httplib::Response &res) {
        handle_post_discovery_scan(req, res);
    });

    // Runtime lifecycle and status
    server_->Get("/v0/runtime/status",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_runtime_status(req, res); });
    server_->Post("/v0/runtime/pause",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_pause(req, res); });
    server_->Post("/v0/runtime/resume",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_resume(req, res); });

    // OPTIONS catch-all for CORS preflight on all routes
    server_->Options(R"(/v0/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET    /v0/devices");
    LOG_INFO("[HTTP]   POST   /v0/devices");
    LOG_INFO("[HTTP]   POST   /v0/devices/refresh");
    LOG_INFO("[HTTP]   GET    /v0/devices/{mac}");
    LOG_INFO("[HTTP]   DELETE /v0/devices/{mac}");
    LOG_INFO("[HTTP]   POST   /v0/devices/{mac}/settings");
    LOG_INFO("[HTTP]   POST   /v0/devices/{mac}/state");
    LOG_INFO("[HTTP]   GET    /v0/releases");
    LOG_INFO("[HTTP]   POST   /v0/releases");
    LOG_INFO("[HTTP]   POST   /v0/discovery/scan");
    LOG_INFO("[HTTP]   GET    /v0/runtime/status");
    LOG_INFO("[HTTP]   POST   /v0/runtime/pause");
    LOG_INFO("[HTTP]   POST   /v0/runtime/resume");
}

}  // namespace http
}  // namespace lightfleet
