#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "discovery/service_browser.hpp"

namespace lightfleet::tests {

using namespace lightfleet;

/**
 * @brief Shared view of every browser a DiscoveryService created
 *
 * Tests announce services through the handlers of the most recently started
 * browser. Nothing fires once that browser was stopped.
 */
struct FakeBrowserHub {
    mutable std::mutex mutex;
    discovery::IServiceBrowser::Handlers handlers;
    std::string service_type;
    std::string domain;
    int created = 0;
    int started = 0;
    int stopped = 0;
    bool running = false;
    std::string start_error;  // non-empty makes start() fail

    void announce(const std::string &name, const std::string &address, uint16_t port,
                  std::map<std::string, std::string> txt = {}) {
        auto handler = handler_copy(&discovery::IServiceBrowser::Handlers::on_resolved);
        if (!handler) return;
        discovery::ResolvedService service;
        service.name = name;
        service.host = "wled-" + name + ".local";
        service.address = address;
        service.port = port;
        service.txt = std::move(txt);
        handler(service);
    }

    void remove(const std::string &name) {
        auto handler = handler_copy(&discovery::IServiceBrowser::Handlers::on_removed);
        if (handler) handler(name);
    }

    void fail(const std::string &error) {
        auto handler = handler_copy(&discovery::IServiceBrowser::Handlers::on_failure);
        if (handler) handler(error);
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex);
        return running;
    }

    int stop_count() const {
        std::lock_guard<std::mutex> lock(mutex);
        return stopped;
    }

private:
    template <typename Member>
    Member handler_copy(Member discovery::IServiceBrowser::Handlers::*member) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) {
            return Member{};
        }
        return handlers.*member;
    }
};

class FakeServiceBrowser : public discovery::IServiceBrowser {
public:
    explicit FakeServiceBrowser(std::shared_ptr<FakeBrowserHub> hub) : hub_(std::move(hub)) {}
    ~FakeServiceBrowser() override { stop(); }

    bool start(const std::string &service_type, const std::string &domain, Handlers handlers,
               std::string &error) override {
        std::lock_guard<std::mutex> lock(hub_->mutex);
        hub_->started++;
        if (!hub_->start_error.empty()) {
            error = hub_->start_error;
            return false;
        }
        hub_->service_type = service_type;
        hub_->domain = domain;
        hub_->handlers = std::move(handlers);
        hub_->running = true;
        active_ = true;
        return true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(hub_->mutex);
        if (!active_) return;
        active_ = false;
        hub_->running = false;
        hub_->handlers = Handlers{};
        hub_->stopped++;
    }

private:
    std::shared_ptr<FakeBrowserHub> hub_;
    bool active_ = false;
};

inline discovery::ServiceBrowserFactory make_fake_browser_factory(const std::shared_ptr<FakeBrowserHub> &hub) {
    return [hub]() -> std::unique_ptr<discovery::IServiceBrowser> {
        {
            std::lock_guard<std::mutex> lock(hub->mutex);
            hub->created++;
        }
        return std::make_unique<FakeServiceBrowser>(hub);
    };
}

}  // namespace lightfleet::tests
