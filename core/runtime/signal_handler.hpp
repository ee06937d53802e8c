#pragma once

#include <atomic>

namespace lightfleet {
namespace runtime {

/**
 * @brief Process signals polled by the runtime main loop
 *
 * SIGINT / SIGTERM request shutdown. SIGHUP (where the platform has it)
 * requests a reload: re-read the release catalog and reconnect offline
 * devices.
 */
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();
    // True once per received SIGHUP
    static bool consume_reload_request();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
    static std::atomic<bool> reload_requested_;
};

}  // namespace runtime
}  // namespace lightfleet
