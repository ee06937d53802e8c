#pragma once

#include <chrono>

namespace lightfleet {
namespace connection {

struct BackoffPolicy {
    std::chrono::milliseconds base{2500};
    std::chrono::milliseconds cap{60000};
};

// min(base * 2^retry_count, cap); negative counts are treated as 0
std::chrono::milliseconds compute_backoff_delay(const BackoffPolicy &policy, int retry_count);

}  // namespace connection
}  // namespace lightfleet
