#pragma once

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"

namespace lightfleet {
namespace discovery {
class DiscoveryService;
}
namespace first_contact {
class FirstContactResolver;
}
namespace fleet {
class FleetController;
}
namespace registry {
class IDeviceStore;
}
namespace release {
class ReleaseCatalog;
}
}  // namespace lightfleet

namespace lightfleet {
namespace http {

/**
 * @brief REST adapter over the fleet
 *
 * The server runs in its own thread (listen_after_bind) and handlers execute
 * in httplib's thread pool. Handlers only touch thread-safe components; writes
 * that the fleet reacts to (add, edit, delete) wait for the fleet writer to
 * catch up so the response reflects the new state.
 *
 * Lifecycle:
 * - start() binds to the configured port and spawns the server thread
 * - stop() signals shutdown and joins the server thread
 */
class HttpServer {
public:
    // discovery may be null when disabled
    HttpServer(const runtime::HttpConfig &config, const std::string &instance_name, registry::IDeviceStore &store,
               fleet::FleetController &fleet, first_contact::FirstContactResolver &resolver,
               release::ReleaseCatalog &catalog, std::shared_ptr<discovery::DiscoveryService> discovery = nullptr);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    std::string instance_name_;
    int port_ = 0;
    std::chrono::steady_clock::time_point started_at_;

    registry::IDeviceStore &store_;
    fleet::FleetController &fleet_;
    first_contact::FirstContactResolver &resolver_;
    release::ReleaseCatalog &catalog_;
    std::shared_ptr<discovery::DiscoveryService> discovery_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Device handlers (handlers/device_handlers.cpp)
    void handle_get_devices(const httplib::Request &req, httplib::Response &res);
    void handle_get_device(const httplib::Request &req, httplib::Response &res);
    void handle_post_device(const httplib::Request &req, httplib::Response &res);
    void handle_post_device_settings(const httplib::Request &req, httplib::Response &res);
    void handle_delete_device(const httplib::Request &req, httplib::Response &res);
    void handle_post_device_state(const httplib::Request &req, httplib::Response &res);
    void handle_post_refresh(const httplib::Request &req, httplib::Response &res);

    // Release handlers (handlers/release_handlers.cpp)
    void handle_get_releases(const httplib::Request &req, httplib::Response &res);
    void handle_post_releases(const httplib::Request &req, httplib::Response &res);

    // System handlers (handlers/system_handlers.cpp)
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);
    void handle_post_pause(const httplib::Request &req, httplib::Response &res);
    void handle_post_resume(const httplib::Request &req, httplib::Response &res);
    void handle_post_discovery_scan(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace lightfleet
