#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace storyloop::core::time {

using Clock = std::chrono::system_clock;

std::int64_t now_unix_ms();

// UTC, millisecond precision: 2026-01-31T08:15:02.123Z
std::string to_iso8601(Clock::time_point tp);
std::string now_iso8601();

// Calendar date of `tp` in UTC: 2026-01-31
std::string to_date(Clock::time_point tp);

}  // namespace storyloop::core::time
