#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace daily_dash {
namespace jsonutil {

using TimePoint = std::chrono::system_clock::time_point;

// UTC, millisecond precision: 2024-05-01T08:30:00.250Z
std::string time_to_iso(TimePoint tp);

// Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM[:SS[.fff]] with optional Z or +HH:MM / -HHMM.
// A missing offset is read as UTC.
std::optional<TimePoint> parse_iso8601(const std::string& s);

// RFC 822 / RFC 2822 dates as used by RSS pubDate, weekday optional.
std::optional<TimePoint> parse_rfc822(const std::string& s);

// Tries ISO 8601 first, then RFC 822.
std::optional<TimePoint> parse_any_date(const std::string& s);

int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(int64_t ms);

}
}
