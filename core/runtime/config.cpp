#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

#include "logging/logger.hpp"

namespace lightfleet {
namespace runtime {

namespace {

template <typename T>
void read_if_present(const YAML::Node &section, const char *key, T &target) {
    if (section[key]) {
        target = section[key].as<T>();
    }
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    if (config.runtime.io_threads < 1 || config.runtime.io_threads > 64) {
        error = "runtime.io_threads must be between 1 and 64";
        return false;
    }

    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    if (config.store.path.empty()) {
        error = "store.path must not be empty";
        return false;
    }

    if (config.discovery.enabled) {
        if (config.discovery.service_type.empty() || config.discovery.service_type[0] != '_') {
            error = "discovery.service_type must look like '_name._tcp'";
            return false;
        }
        if (config.discovery.domain.empty()) {
            error = "discovery.domain must not be empty";
            return false;
        }
        if (config.discovery.retry_interval_ms < 1000) {
            error = "discovery.retry_interval_ms must be >= 1000ms";
            return false;
        }
        if (config.discovery.rescan_interval_ms < 1000) {
            error = "discovery.rescan_interval_ms must be >= 1000ms";
            return false;
        }
        if (config.discovery.probe_timeout_ms < 100) {
            error = "discovery.probe_timeout_ms must be >= 100ms";
            return false;
        }
    }

    if (config.first_contact.timeout_ms < 100) {
        error = "first_contact.timeout_ms must be >= 100ms";
        return false;
    }
    if (config.first_contact.workers < 1 || config.first_contact.workers > 64) {
        error = "first_contact.workers must be between 1 and 64";
        return false;
    }

    if (config.connection.reconnect_base_ms < 1) {
        error = "connection.reconnect_base_ms must be >= 1ms";
        return false;
    }
    if (config.connection.reconnect_cap_ms < config.connection.reconnect_base_ms) {
        error = "connection.reconnect_cap_ms must be >= reconnect_base_ms";
        return false;
    }
    if (config.connection.open_timeout_ms < 100) {
        error = "connection.open_timeout_ms must be >= 100ms";
        return false;
    }

    if (config.bookkeeping.flush_interval_ms < 0) {
        error = "bookkeeping.flush_interval_ms must be >= 0 (0 disables periodic flush)";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"runtime",    "http",        "store",    "discovery", "first_contact",
                                                     "connection", "bookkeeping", "releases", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["runtime"]) {
            read_if_present(yaml["runtime"], "name", config.runtime.name);
            read_if_present(yaml["runtime"], "io_threads", config.runtime.io_threads);
        }

        // Load HTTP config
        if (yaml["http"]) {
            read_if_present(yaml["http"], "enabled", config.http.enabled);
            read_if_present(yaml["http"], "bind", config.http.bind);
            read_if_present(yaml["http"], "port", config.http.port);

            // CORS allowlist (supports scalar or sequence)
            if (yaml["http"]["cors_allowed_origins"]) {
                const auto &origins_node = yaml["http"]["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            read_if_present(yaml["http"], "cors_allow_credentials", config.http.cors_allow_credentials);
            read_if_present(yaml["http"], "thread_pool_size", config.http.thread_pool_size);
        }

        if (yaml["store"]) {
            read_if_present(yaml["store"], "path", config.store.path);
        }

        if (yaml["discovery"]) {
            const auto &node = yaml["discovery"];
            read_if_present(node, "enabled", config.discovery.enabled);
            read_if_present(node, "service_type", config.discovery.service_type);
            read_if_present(node, "domain", config.discovery.domain);
            read_if_present(node, "retry_interval_ms", config.discovery.retry_interval_ms);
            read_if_present(node, "rescan_interval_ms", config.discovery.rescan_interval_ms);
            read_if_present(node, "probe_timeout_ms", config.discovery.probe_timeout_ms);
        }

        if (yaml["first_contact"]) {
            read_if_present(yaml["first_contact"], "timeout_ms", config.first_contact.timeout_ms);
            read_if_present(yaml["first_contact"], "workers", config.first_contact.workers);
        }

        if (yaml["connection"]) {
            const auto &node = yaml["connection"];
            read_if_present(node, "reconnect_base_ms", config.connection.reconnect_base_ms);
            read_if_present(node, "reconnect_cap_ms", config.connection.reconnect_cap_ms);
            read_if_present(node, "open_timeout_ms", config.connection.open_timeout_ms);
        }

        if (yaml["bookkeeping"]) {
            read_if_present(yaml["bookkeeping"], "flush_interval_ms", config.bookkeeping.flush_interval_ms);
        }

        if (yaml["releases"]) {
            read_if_present(yaml["releases"], "catalog_path", config.releases.catalog_path);
        }

        // Load logging config
        if (yaml["logging"]) {
            read_if_present(yaml["logging"], "level", config.logging.level);
        }

        if (!validate_config(config, error)) {
            return false;
        }

        if (!config.runtime.name.empty()) {
            LOG_INFO("[Config] Instance: " << config.runtime.name);
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Store: " << config.store.path);

        std::stringstream discovery_msg;
        discovery_msg << "[Config] Discovery: " << (config.discovery.enabled ? "enabled" : "disabled");
        if (config.discovery.enabled) {
            discovery_msg << " (" << config.discovery.service_type << "." << config.discovery.domain << ")";
        }
        LOG_INFO(discovery_msg.str());

        LOG_INFO("[Config] Reconnect backoff: " << config.connection.reconnect_base_ms << "ms .. "
                                                << config.connection.reconnect_cap_ms << "ms");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace lightfleet
