#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "service_browser.hpp"

namespace lightfleet {
namespace discovery {

struct DiscoveryOptions {
    std::string service_type = "_wled._tcp";
    std::string domain = "local";
    int retry_interval_ms = 10000;  // Re-probe advertised but unreachable instances
    int probe_timeout_ms = 3000;
};

// address is "ip" or "ip:port" (port omitted when 80)
using DiscoveryCallback =
    std::function<void(const std::string &address, const std::optional<std::string> &mac_hint)>;

/**
 * @brief DNS-SD browser for lighting controllers on the local network
 *
 * Browsing and resolving are delegated to an IServiceBrowser (avahi by
 * default). Each resolved instance is confirmed with a TCP connect probe and
 * then reported through the callback together with its "mac" TXT entry.
 * Instances whose probe fails are probed again every retry interval while
 * they stay advertised. A removed instance is forgotten, so it is reported
 * again when it comes back.
 *
 * A browser failure cancels the scan; is_scanning() turns false and the owner
 * decides when to scan again. Instances are forgotten when a scan ends.
 *
 * All state lives on a strand of the supplied io_context.
 */
class DiscoveryService : public std::enable_shared_from_this<DiscoveryService> {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    static std::shared_ptr<DiscoveryService> create(boost::asio::io_context &io, DiscoveryOptions options,
                                                    DiscoveryCallback callback);
    static std::shared_ptr<DiscoveryService> create(boost::asio::io_context &io, DiscoveryOptions options,
                                                    DiscoveryCallback callback, ServiceBrowserFactory browsers);

    DiscoveryService(Passkey, boost::asio::io_context &io, DiscoveryOptions options, DiscoveryCallback callback,
                     ServiceBrowserFactory browsers);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService &) = delete;
    DiscoveryService &operator=(const DiscoveryService &) = delete;

    // Starts browsing without blocking; ignored while a scan is active
    void scan();
    void cancel();

    bool is_scanning() const { return scanning_.load(); }
    uint64_t scans_started() const { return scans_started_.load(); }
    uint64_t scans_failed() const { return scans_failed_.load(); }
    uint64_t devices_reported() const { return devices_reported_.load(); }

    const std::string &service_name() const { return service_name_; }

private:
    struct Instance {
        std::string name;
        std::string ip;
        uint16_t port = 0;
        std::optional<std::string> mac_hint;
        bool probing = false;
        bool reported = false;
    };

    void start_scan();
    void stop_scan();
    void fail(const std::string &what);

    void handle_resolved(uint64_t generation, const ResolvedService &service);
    void handle_removed(uint64_t generation, const std::string &name);
    void handle_failure(uint64_t generation, const std::string &error);

    void schedule_retry();
    void start_probe(const std::string &key);
    void finish_probe(uint64_t generation, const std::string &key, const std::string &address, bool success,
                      const std::string &error);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    DiscoveryOptions options_;
    DiscoveryCallback callback_;
    ServiceBrowserFactory browsers_;
    std::string service_name_;

    std::unique_ptr<IServiceBrowser> browser_;
    boost::asio::steady_timer retry_timer_;

    std::map<std::string, Instance> instances_;  // lowercase instance name
    uint64_t generation_ = 0;

    std::atomic<bool> scanning_{false};
    std::atomic<uint64_t> scans_started_{0};
    std::atomic<uint64_t> scans_failed_{0};
    std::atomic<uint64_t> devices_reported_{0};
};

}  // namespace discovery
}  // namespace lightfleet
