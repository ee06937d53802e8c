#include "reconnect_policy.hpp"

namespace lightfleet {
namespace connection {

std::chrono::milliseconds compute_backoff_delay(const BackoffPolicy &policy, int retry_count) {
    if (policy.base.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    if (retry_count < 0) {
        retry_count = 0;
    }

    const auto cap = policy.cap.count() > 0 ? policy.cap.count() : policy.base.count();
    long long delay = policy.base.count();
    for (int i = 0; i < retry_count; ++i) {
        if (delay >= cap) {
            break;
        }
        delay *= 2;
    }
    return std::chrono::milliseconds(delay < cap ? delay : cap);
}

}  // namespace connection
}  // namespace lightfleet
