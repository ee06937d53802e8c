#include "avahi_service_browser.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>
#include <avahi-common/thread-watch.h>

#include <algorithm>
#include <cctype>

#include "logging/logger.hpp"

namespace lightfleet {
namespace discovery {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::map<std::string, std::string> decode_txt(AvahiStringList *txt) {
    std::map<std::string, std::string> out;
    for (AvahiStringList *item = txt; item != nullptr; item = avahi_string_list_get_next(item)) {
        char *key = nullptr;
        char *value = nullptr;
        size_t size = 0;
        if (avahi_string_list_get_pair(item, &key, &value, &size) < 0 || key == nullptr) {
            continue;
        }
        out[lower(key)] = value != nullptr ? std::string(value, size) : std::string();
        avahi_free(key);
        avahi_free(value);
    }
    return out;
}

}  // namespace

// C callbacks; all of them run on the threaded poll's thread
struct AvahiCallbacks {
    static void on_client(AvahiClient *client, AvahiClientState state, void *userdata) {
        auto *self = static_cast<AvahiBrowser *>(userdata);
        if (state == AVAHI_CLIENT_FAILURE && self->handlers_.on_failure) {
            self->handlers_.on_failure(std::string("avahi client: ") + avahi_strerror(avahi_client_errno(client)));
        }
    }

    static void on_browse(::AvahiServiceBrowser *browser, AvahiIfIndex interface, AvahiProtocol protocol,
                          AvahiBrowserEvent event, const char *name, const char *type, const char *domain,
                          AvahiLookupResultFlags, void *userdata) {
        auto *self = static_cast<AvahiBrowser *>(userdata);
        switch (event) {
            case AVAHI_BROWSER_NEW: {
                AvahiServiceResolver *resolver = avahi_service_resolver_new(
                    avahi_service_browser_get_client(browser), interface, protocol, name, type, domain,
                    AVAHI_PROTO_INET, static_cast<AvahiLookupFlags>(0), &AvahiCallbacks::on_resolve, self);
                if (resolver == nullptr) {
                    LOG_WARN("[Discovery] Cannot resolve " << name << ": "
                                                           << avahi_strerror(avahi_client_errno(
                                                                  avahi_service_browser_get_client(browser))));
                }
                break;
            }
            case AVAHI_BROWSER_REMOVE:
                if (self->handlers_.on_removed) {
                    self->handlers_.on_removed(name);
                }
                break;
            case AVAHI_BROWSER_FAILURE:
                if (self->handlers_.on_failure) {
                    self->handlers_.on_failure(
                        std::string("avahi browser: ") +
                        avahi_strerror(avahi_client_errno(avahi_service_browser_get_client(browser))));
                }
                break;
            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                break;
        }
    }

    static void on_resolve(AvahiServiceResolver *resolver, AvahiIfIndex, AvahiProtocol, AvahiResolverEvent event,
                           const char *name, const char *, const char *, const char *host_name,
                           const AvahiAddress *address, uint16_t port, AvahiStringList *txt, AvahiLookupResultFlags,
                           void *userdata) {
        auto *self = static_cast<AvahiBrowser *>(userdata);
        if (event == AVAHI_RESOLVER_FOUND && address != nullptr) {
            char text[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(text, sizeof(text), address);

            ResolvedService service;
            service.name = name != nullptr ? name : "";
            service.host = host_name != nullptr ? host_name : "";
            service.address = text;
            service.port = port;
            service.txt = decode_txt(txt);
            if (self->handlers_.on_resolved) {
                self->handlers_.on_resolved(service);
            }
        } else {
            LOG_DEBUG("[Discovery] Resolving " << (name != nullptr ? name : "?") << " failed: "
                                               << avahi_strerror(avahi_client_errno(
                                                      avahi_service_resolver_get_client(resolver))));
        }
        avahi_service_resolver_free(resolver);
    }
};

AvahiBrowser::~AvahiBrowser() { stop(); }

bool AvahiBrowser::start(const std::string &service_type, const std::string &domain, Handlers handlers,
                         std::string &error) {
    stop();
    handlers_ = std::move(handlers);

    poll_ = avahi_threaded_poll_new();
    if (poll_ == nullptr) {
        error = "cannot create avahi poll loop";
        return false;
    }

    int client_error = 0;
    client_ = avahi_client_new(avahi_threaded_poll_get(poll_), static_cast<AvahiClientFlags>(0),
                               &AvahiCallbacks::on_client, this, &client_error);
    if (client_ == nullptr) {
        error = std::string("cannot connect to avahi-daemon: ") + avahi_strerror(client_error);
        stop();
        return false;
    }

    browser_ = avahi_service_browser_new(client_, AVAHI_IF_UNSPEC, AVAHI_PROTO_INET, service_type.c_str(),
                                         domain.c_str(), static_cast<AvahiLookupFlags>(0), &AvahiCallbacks::on_browse,
                                         this);
    if (browser_ == nullptr) {
        error = std::string("cannot browse ") + service_type + ": " + avahi_strerror(avahi_client_errno(client_));
        stop();
        return false;
    }

    if (avahi_threaded_poll_start(poll_) < 0) {
        error = "cannot start avahi poll loop";
        stop();
        return false;
    }
    running_ = true;
    return true;
}

void AvahiBrowser::stop() {
    if (poll_ != nullptr && running_) {
        avahi_threaded_poll_stop(poll_);
    }
    running_ = false;
    if (browser_ != nullptr) {
        avahi_service_browser_free(browser_);
        browser_ = nullptr;
    }
    if (client_ != nullptr) {
        avahi_client_free(client_);
        client_ = nullptr;
    }
    if (poll_ != nullptr) {
        avahi_threaded_poll_free(poll_);
        poll_ = nullptr;
    }
    handlers_ = Handlers{};
}

std::unique_ptr<IServiceBrowser> make_avahi_browser() { return std::make_unique<AvahiBrowser>(); }

}  // namespace discovery
}  // namespace lightfleet
