#include "signal_handler.hpp"

#include <csignal>

namespace lightfleet {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<bool> SignalHandler::reload_requested_{false};

void SignalHandler::install() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
#ifdef SIGHUP
    std::signal(SIGHUP, handle_signal);
#endif
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

bool SignalHandler::consume_reload_request() { return reload_requested_.exchange(false); }

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: only atomic operations allowed
#ifdef SIGHUP
    if (signal == SIGHUP) {
        reload_requested_.store(true);
        return;
    }
#endif
    (void)signal;
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace lightfleet
