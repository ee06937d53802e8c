// lightfleet runtime
// Config-based runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "lightfleet.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: lightfleet-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: lightfleet.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("lightfleet runtime starting...");
    LOG_INFO("Loading config: " << config_path);

    lightfleet::runtime::RuntimeConfig config;
    std::string error;

    if (!lightfleet::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    lightfleet::logging::Logger::set_level(lightfleet::logging::string_to_level(config.logging.level));

    // Install before initialize so a signal during startup still stops the loop
    lightfleet::runtime::SignalHandler::install();

    lightfleet::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        runtime.shutdown();
        return 1;
    }

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Devices: " << runtime.get_store().size());
    LOG_INFO("  Releases: " << runtime.get_catalog().size());
    LOG_INFO("  Discovery: " << (config.discovery.enabled ? "enabled" : "disabled"));

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
