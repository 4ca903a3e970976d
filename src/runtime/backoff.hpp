#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include "core/config/loop_config.hpp"

namespace storyloop::runtime {

// min(initial * multiplier^(attempt - 1), max). Attempt 1 yields exactly the
// initial delay; attempt 0 is treated as 1.
std::chrono::milliseconds backoff_delay(std::uint32_t attempt,
                                        const core::config::RetryPolicy& policy);

// Timed suspension used by the loop. Injected so tests never block.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper thread_sleeper();

}  // namespace storyloop::runtime
