#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace lightfleet {
namespace discovery {

/**
 * @brief One resolved DNS-SD service instance
 *
 * txt keys are lowercased; a key without '=' maps to an empty value.
 */
struct ResolvedService {
    std::string name;  // instance name, e.g. "Porch"
    std::string host;  // e.g. "wled-porch.local"
    std::string address;
    uint16_t port = 0;
    std::map<std::string, std::string> txt;
};

/**
 * @brief Browses and resolves instances of one service type
 *
 * Handlers are called from the browser's own thread. After stop() returns
 * no handler runs again.
 */
class IServiceBrowser {
public:
    struct Handlers {
        std::function<void(const ResolvedService &)> on_resolved;
        std::function<void(const std::string &name)> on_removed;
        std::function<void(const std::string &error)> on_failure;
    };

    virtual ~IServiceBrowser() = default;

    // Returns false with error when browsing could not start
    virtual bool start(const std::string &service_type, const std::string &domain, Handlers handlers,
                       std::string &error) = 0;
    virtual void stop() = 0;
};

using ServiceBrowserFactory = std::function<std::unique_ptr<IServiceBrowser>()>;

}  // namespace discovery
}  // namespace lightfleet
