#include "runtime/backoff.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace storyloop::runtime {

std::chrono::milliseconds backoff_delay(const std::uint32_t attempt,
                                        const core::config::RetryPolicy& policy) {
    const std::uint32_t exponent = attempt > 0 ? attempt - 1 : 0;
    if (exponent == 0) {
        return std::chrono::milliseconds(
            std::min(policy.initial_delay_ms, policy.max_delay_ms));
    }

    const double ceiling = static_cast<double>(policy.max_delay_ms);
    const double raw = static_cast<double>(policy.initial_delay_ms) *
                       std::pow(policy.backoff_multiplier, exponent);
    // pow overflows to inf for large attempts; the ceiling absorbs it.
    double clamped = std::isnan(raw) ? ceiling : std::min(raw, ceiling);
    clamped = std::max(clamped, 0.0);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(clamped)));
}

Sleeper thread_sleeper() {
    return [](const std::chrono::milliseconds delay) {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    };
}

}  // namespace storyloop::runtime
