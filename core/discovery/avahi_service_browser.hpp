#pragma once

#include <memory>
#include <string>

#include "service_browser.hpp"

struct AvahiThreadedPoll;
struct AvahiClient;
struct AvahiServiceBrowser;

namespace lightfleet {
namespace discovery {

/**
 * @brief IServiceBrowser on the host's avahi-daemon
 *
 * Runs an avahi threaded poll loop for the lifetime of a browse. Every new
 * instance is resolved to an IPv4 address; instances that fail to resolve are
 * skipped. Losing the daemon connection is reported through on_failure.
 */
class AvahiBrowser : public IServiceBrowser {
public:
    AvahiBrowser() = default;
    ~AvahiBrowser() override;

    AvahiBrowser(const AvahiBrowser &) = delete;
    AvahiBrowser &operator=(const AvahiBrowser &) = delete;

    bool start(const std::string &service_type, const std::string &domain, Handlers handlers,
               std::string &error) override;
    void stop() override;

private:
    friend struct AvahiCallbacks;

    AvahiThreadedPoll *poll_ = nullptr;
    AvahiClient *client_ = nullptr;
    ::AvahiServiceBrowser *browser_ = nullptr;
    bool running_ = false;
    Handlers handlers_;
};

std::unique_ptr<IServiceBrowser> make_avahi_browser();

}  // namespace discovery
}  // namespace lightfleet
