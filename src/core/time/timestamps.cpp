#include "core/time/timestamps.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace storyloop::core::time {

namespace {

std::tm to_utc(const Clock::time_point tp) {
    const std::time_t seconds = Clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return utc;
}

}  // namespace

std::int64_t now_unix_ms() {
    const auto now = Clock::now();
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count());
}

std::string to_iso8601(const Clock::time_point tp) {
    const std::tm utc = to_utc(tp);
    const auto since_epoch = tp.time_since_epoch();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch) -
        std::chrono::duration_cast<std::chrono::seconds>(since_epoch);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3)
        << std::setfill('0') << millis.count() << "Z";
    return out.str();
}

std::string now_iso8601() {
    return to_iso8601(Clock::now());
}

std::string to_date(const Clock::time_point tp) {
    const std::tm utc = to_utc(tp);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%d");
    return out.str();
}

}  // namespace storyloop::core::time
