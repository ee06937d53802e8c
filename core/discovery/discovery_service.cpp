#include "discovery_service.hpp"

#include <algorithm>
#include <cctype>

#include "avahi_service_browser.hpp"
#include "logging/logger.hpp"

namespace lightfleet {
namespace discovery {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr const char *kMacTxtKey = "mac";
constexpr uint16_t kDefaultHttpPort = 80;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string format_address(const std::string &ip, uint16_t port) {
    if (port == kDefaultHttpPort) {
        return ip;
    }
    return ip + ":" + std::to_string(port);
}

}  // namespace

std::shared_ptr<DiscoveryService> DiscoveryService::create(asio::io_context &io, DiscoveryOptions options,
                                                           DiscoveryCallback callback) {
    return create(io, std::move(options), std::move(callback), &make_avahi_browser);
}

std::shared_ptr<DiscoveryService> DiscoveryService::create(asio::io_context &io, DiscoveryOptions options,
                                                           DiscoveryCallback callback, ServiceBrowserFactory browsers) {
    return std::make_shared<DiscoveryService>(Passkey{}, io, std::move(options), std::move(callback),
                                              std::move(browsers));
}

DiscoveryService::DiscoveryService(Passkey, asio::io_context &io, DiscoveryOptions options,
                                   DiscoveryCallback callback, ServiceBrowserFactory browsers)
    : strand_(asio::make_strand(io)),
      options_(std::move(options)),
      callback_(std::move(callback)),
      browsers_(std::move(browsers)),
      service_name_(options_.service_type + "." + options_.domain),
      retry_timer_(strand_) {}

DiscoveryService::~DiscoveryService() {
    retry_timer_.cancel();
    if (browser_) {
        browser_->stop();
    }
}

void DiscoveryService::scan() {
    asio::dispatch(strand_, [self = shared_from_this()] { self->start_scan(); });
}

void DiscoveryService::cancel() {
    asio::dispatch(strand_, [self = shared_from_this()] {
        if (self->scanning_.load()) {
            LOG_INFO("[Discovery] Scan cancelled");
            self->stop_scan();
        }
    });
}

void DiscoveryService::start_scan() {
    if (scanning_.load()) {
        return;
    }
    scans_started_++;
    const uint64_t generation = ++generation_;
    instances_.clear();

    browser_ = browsers_ ? browsers_() : nullptr;
    if (!browser_) {
        fail("no service browser available");
        return;
    }

    // Browser callbacks arrive on the browser's thread; hop onto the strand.
    // The lock happens on the strand so the service is never released there.
    std::weak_ptr<DiscoveryService> weak = shared_from_this();
    auto strand = strand_;
    IServiceBrowser::Handlers handlers;
    handlers.on_resolved = [weak, strand, generation](const ResolvedService &service) {
        asio::post(strand, [weak, generation, service] {
            if (auto self = weak.lock()) {
                self->handle_resolved(generation, service);
            }
        });
    };
    handlers.on_removed = [weak, strand, generation](const std::string &name) {
        asio::post(strand, [weak, generation, name] {
            if (auto self = weak.lock()) {
                self->handle_removed(generation, name);
            }
        });
    };
    handlers.on_failure = [weak, strand, generation](const std::string &error) {
        asio::post(strand, [weak, generation, error] {
            if (auto self = weak.lock()) {
                self->handle_failure(generation, error);
            }
        });
    };

    std::string error;
    if (!browser_->start(options_.service_type, options_.domain, std::move(handlers), error)) {
        fail(error);
        return;
    }

    scanning_.store(true);
    LOG_INFO("[Discovery] Browsing for " << service_name_);
    schedule_retry();
}

void DiscoveryService::stop_scan() {
    ++generation_;
    scanning_.store(false);
    retry_timer_.cancel();
    if (browser_) {
        browser_->stop();
        browser_.reset();
    }
    instances_.clear();
}

void DiscoveryService::fail(const std::string &what) {
    LOG_ERROR("[Discovery] Scan failed: " << what);
    scans_failed_++;
    stop_scan();
}

void DiscoveryService::handle_resolved(uint64_t generation, const ResolvedService &service) {
    if (generation != generation_) {
        return;
    }

    boost::system::error_code ec;
    asio::ip::make_address(service.address, ec);
    if (ec) {
        LOG_WARN("[Discovery] Instance " << service.name << " has unusable address " << service.address);
        return;
    }

    const std::string key = lower(service.name);
    auto inserted = instances_.emplace(key, Instance{});
    Instance &instance = inserted.first->second;
    if (inserted.second) {
        instance.name = service.name;
        LOG_DEBUG("[Discovery] Instance seen: " << service.name << " (" << service.host << ")");
    }
    if (instance.reported || instance.probing) {
        return;
    }

    instance.ip = service.address;
    instance.port = service.port == 0 ? kDefaultHttpPort : service.port;
    instance.mac_hint.reset();
    auto mac = service.txt.find(kMacTxtKey);
    if (mac != service.txt.end() && !mac->second.empty()) {
        instance.mac_hint = mac->second;
    }

    start_probe(key);
}

void DiscoveryService::handle_removed(uint64_t generation, const std::string &name) {
    if (generation != generation_) {
        return;
    }
    if (instances_.erase(lower(name)) > 0) {
        LOG_DEBUG("[Discovery] Instance left: " << name);
    }
}

void DiscoveryService::handle_failure(uint64_t generation, const std::string &error) {
    if (generation != generation_) {
        return;
    }
    fail(error);
}

void DiscoveryService::schedule_retry() {
    retry_timer_.expires_after(std::chrono::milliseconds(options_.retry_interval_ms));
    const uint64_t generation = generation_;
    retry_timer_.async_wait([self = shared_from_this(), generation](const boost::system::error_code &ec) {
        if (ec || generation != self->generation_) {
            return;
        }
        for (auto &entry : self->instances_) {
            if (!entry.second.reported && !entry.second.probing && !entry.second.ip.empty()) {
                self->start_probe(entry.first);
            }
        }
        self->schedule_retry();
    });
}

void DiscoveryService::start_probe(const std::string &key) {
    auto it = instances_.find(key);
    if (it == instances_.end()) {
        return;
    }
    Instance &instance = it->second;
    instance.probing = true;

    const uint64_t generation = generation_;
    const std::string reported_address = format_address(instance.ip, instance.port);

    auto socket = std::make_shared<tcp::socket>(strand_);
    auto deadline = std::make_shared<asio::steady_timer>(strand_);
    deadline->expires_after(std::chrono::milliseconds(options_.probe_timeout_ms));
    deadline->async_wait([socket](const boost::system::error_code &timer_ec) {
        if (!timer_ec) {
            boost::system::error_code ignored;
            socket->close(ignored);
        }
    });

    socket->async_connect(tcp::endpoint(asio::ip::make_address(instance.ip), instance.port),
                          [self = shared_from_this(), socket, deadline, generation, key,
                           reported_address](const boost::system::error_code &connect_ec) {
                              deadline->cancel();
                              boost::system::error_code ignored;
                              socket->close(ignored);
                              self->finish_probe(generation, key, reported_address, !connect_ec,
                                                 connect_ec ? connect_ec.message() : std::string());
                          });
}

void DiscoveryService::finish_probe(uint64_t generation, const std::string &key, const std::string &address,
                                    bool success, const std::string &error) {
    if (generation != generation_) {
        return;
    }
    auto it = instances_.find(key);
    if (it == instances_.end()) {
        return;
    }
    Instance &instance = it->second;
    instance.probing = false;

    if (!success) {
        LOG_DEBUG("[Discovery] Probe of " << address << " failed: " << error);
        return;
    }

    instance.reported = true;
    devices_reported_++;
    LOG_INFO("[Discovery] Found " << instance.name << " at " << address
                                  << (instance.mac_hint ? " (mac " + *instance.mac_hint + ")" : std::string()));
    if (callback_) {
        callback_(address, instance.mac_hint);
    }
}

}  // namespace discovery
}  // namespace lightfleet
