#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "config.hpp"
#include "discovery/discovery_service.hpp"
#include "first_contact/first_contact_resolver.hpp"
#include "fleet/fleet_controller.hpp"
#include "http/server.hpp"
#include "registry/json_file_device_store.hpp"
#include "release/release_catalog.hpp"

namespace lightfleet {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Loads the store and catalog, starts io threads, fleet, discovery and HTTP
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stops every component. Idempotent.
    void shutdown();

    registry::IDeviceStore &get_store() { return *store_; }
    fleet::FleetController &get_fleet() { return *fleet_; }
    release::ReleaseCatalog &get_catalog() { return catalog_; }

private:
    bool init_store(std::string &error);
    bool init_releases(std::string &error);
    bool init_fleet(std::string &error);
    bool init_discovery(std::string &error);
    bool init_http(std::string &error);

    // SIGHUP: re-read the release catalog, reconnect offline devices
    void reload();

    // Restarts discovery after a cancelled scan once rescan_interval_ms passed
    void supervise_discovery();

    RuntimeConfig config_;

    boost::asio::io_context io_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> io_threads_;

    std::unique_ptr<registry::JsonFileDeviceStore> store_;
    release::ReleaseCatalog catalog_;
    std::unique_ptr<first_contact::FirstContactResolver> resolver_;
    std::unique_ptr<fleet::FleetController> fleet_;
    std::shared_ptr<discovery::DiscoveryService> discovery_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::chrono::steady_clock::time_point scan_stopped_at_;
    uint64_t scans_requested_ = 0;
    bool scan_was_active_ = false;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace lightfleet
