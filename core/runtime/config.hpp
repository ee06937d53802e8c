#pragma once

#include <string>
#include <vector>

namespace lightfleet {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

// Runtime section configuration (runtime: in YAML)
struct RuntimeModeConfig {
    std::string name;    // Instance identifier, shown in /v0/runtime/status
    int io_threads = 2;  // Threads running the shared io_context (1-64)
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Worker thread pool size
};

struct StoreConfig {
    std::string path = "lightfleet-devices.json";
};

struct DiscoveryConfig {
    bool enabled = true;
    std::string service_type = "_wled._tcp";
    std::string domain = "local";
    int retry_interval_ms = 10000;   // Re-probe advertised but unreachable devices
    int rescan_interval_ms = 30000;  // Restart delay after a scan was cancelled
    int probe_timeout_ms = 3000;     // TCP confirm of an advertised endpoint
};

struct FirstContactConfig {
    int timeout_ms = 10000;  // GET /json/info
    int workers = 4;         // Parallel probes of discovered devices
};

struct ConnectionConfig {
    int reconnect_base_ms = 2500;
    int reconnect_cap_ms = 60000;
    int open_timeout_ms = 10000;  // Resolve + connect + WebSocket handshake
};

struct BookkeepingConfig {
    int flush_interval_ms = 30000;  // Batched last-seen writes
};

struct ReleasesConfig {
    std::string catalog_path;  // GitHub releases JSON; empty = start with no catalog
};

struct RuntimeConfig {
    RuntimeModeConfig runtime;
    HttpConfig http;
    StoreConfig store;
    DiscoveryConfig discovery;
    FirstContactConfig first_contact;
    ConnectionConfig connection;
    BookkeepingConfig bookkeeping;
    ReleasesConfig releases;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace lightfleet
