#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "connection/websocket_transport.hpp"
#include "first_contact/device_info_client.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace lightfleet {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing lightfleet");

    if (!init_store(error)) {
        return false;
    }

    if (!init_releases(error)) {
        return false;
    }

    // io threads carry device sockets, discovery and reconnect timers
    work_guard_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(io_));
    for (int i = 0; i < config_.runtime.io_threads; ++i) {
        io_threads_.emplace_back([this] { io_.run(); });
    }
    LOG_INFO("[Runtime] " << config_.runtime.io_threads << " io thread(s) started");

    if (!init_fleet(error)) {
        return false;
    }

    if (!init_discovery(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_store(std::string &error) {
    store_ = std::make_unique<registry::JsonFileDeviceStore>(config_.store.path);

    std::string store_error;
    if (!store_->load(store_error)) {
        error = "Device store failed to load: " + store_error;
        return false;
    }
    LOG_INFO("[Runtime] Device store loaded (" << store_->size() << " device(s))");
    return true;
}

bool Runtime::init_releases(std::string &error) {
    if (config_.releases.catalog_path.empty()) {
        LOG_INFO("[Runtime] No release catalog configured");
        return true;
    }

    std::string catalog_error;
    if (!catalog_.load_file(config_.releases.catalog_path, catalog_error)) {
        error = "Release catalog failed to load: " + catalog_error;
        return false;
    }
    return true;
}

bool Runtime::init_fleet(std::string &) {
    auto info_client = std::make_shared<first_contact::HttpDeviceInfoClient>(config_.first_contact.timeout_ms);
    resolver_ = std::make_unique<first_contact::FirstContactResolver>(*store_, info_client);

    fleet::FleetOptions options;
    options.backoff.base = std::chrono::milliseconds(config_.connection.reconnect_base_ms);
    options.backoff.cap = std::chrono::milliseconds(config_.connection.reconnect_cap_ms);
    options.first_contact_workers = config_.first_contact.workers;
    options.bookkeeping_flush_interval_ms = config_.bookkeeping.flush_interval_ms;

    auto transport_factory = connection::make_websocket_transport_factory(
        io_, std::chrono::milliseconds(config_.connection.open_timeout_ms));

    fleet_ = std::make_unique<fleet::FleetController>(io_, *store_, *resolver_, catalog_, transport_factory, options);
    fleet_->on_update_changed([](const std::string &mac, const std::optional<std::string> &tag) {
        if (tag) {
            LOG_INFO("[Runtime] Update available for " << mac << ": " << *tag);
        }
    });
    fleet_->start();
    return true;
}

bool Runtime::init_discovery(std::string &) {
    if (!config_.discovery.enabled) {
        LOG_INFO("[Runtime] Discovery disabled in config");
        return true;
    }

    discovery::DiscoveryOptions options;
    options.service_type = config_.discovery.service_type;
    options.domain = config_.discovery.domain;
    options.retry_interval_ms = config_.discovery.retry_interval_ms;
    options.probe_timeout_ms = config_.discovery.probe_timeout_ms;

    fleet::FleetController *fleet = fleet_.get();
    discovery_ = discovery::DiscoveryService::create(
        io_, options, [fleet](const std::string &address, const std::optional<std::string> &mac_hint) {
            fleet->handle_discovered(address, mac_hint);
        });
    LOG_INFO("[Runtime] Discovery browsing " << discovery_->service_name());
    return true;
}

bool Runtime::init_http(std::string &error) {
    // Create and start HTTP server if enabled
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, config_.runtime.name, *store_, *fleet_,
                                                          *resolver_, catalog_, discovery_);

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    if (discovery_) {
        scans_requested_ = discovery_->scans_started() + 1;
        discovery_->scan();
        scan_was_active_ = true;
    }

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Check for shutdown signal
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }

        if (SignalHandler::consume_reload_request()) {
            reload();
        }

        supervise_discovery();
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::reload() {
    LOG_INFO("[Runtime] Reload requested");
    if (!config_.releases.catalog_path.empty()) {
        std::string error;
        if (catalog_.load_file(config_.releases.catalog_path, error)) {
            fleet_->recompute_updates();
        } else {
            LOG_ERROR("[Runtime] Release catalog reload failed, keeping revision " << catalog_.revision() << ": "
                                                                                   << error);
        }
    }
    fleet_->refresh_offline();
}

void Runtime::supervise_discovery() {
    if (!discovery_) {
        return;
    }

    // A requested scan counts as active until the service has attempted it
    if (discovery_->is_scanning() || discovery_->scans_started() < scans_requested_) {
        scan_was_active_ = true;
        return;
    }

    auto now = std::chrono::steady_clock::now();
    if (scan_was_active_) {
        scan_was_active_ = false;
        scan_stopped_at_ = now;
        LOG_WARN("[Runtime] Discovery stopped, restarting in " << config_.discovery.rescan_interval_ms << "ms");
        return;
    }

    if (now - scan_stopped_at_ >= std::chrono::milliseconds(config_.discovery.rescan_interval_ms)) {
        LOG_INFO("[Runtime] Restarting discovery");
        scans_requested_ = discovery_->scans_started() + 1;
        discovery_->scan();
        scan_was_active_ = true;
    }
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    // Stop HTTP server
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (discovery_) {
        LOG_INFO("[Runtime] Stopping discovery");
        discovery_->cancel();
    }

    // Flushes bookkeeping and closes every device connection
    if (fleet_) {
        LOG_INFO("[Runtime] Stopping fleet");
        fleet_->stop();
    }

    work_guard_.reset();
    // Let close frames go out before the io threads are stopped
    for (int i = 0; i < 20 && !io_.stopped(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    io_.stop();
    for (auto &thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    io_threads_.clear();
}

}  // namespace runtime
}  // namespace lightfleet
