#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace tickback::core {

// Monotonic clock for wall-time measurements (not wall clock).
uint64_t now_ns();

// Wall clock (UTC) in nanoseconds since epoch.
uint64_t unix_now_ns();

// Format UTC timestamp to ISO-8601 with nanoseconds: YYYY-MM-DD HH:MM:SS.nnnnnnnnn+00
void format_utc(uint64_t ts_ns, char* out, size_t out_len);

// Same, for the microsecond timestamps carried by market data: YYYY-MM-DD HH:MM:SS.uuuuuu+00
std::string to_utc_us(int64_t ts_us);

// Calendar day (days since 1970-01-01 UTC) containing ts_us; floors towards negative infinity.
int64_t utc_day(int64_t ts_us);

// YYYY-MM-DD for a day index returned by utc_day().
std::string format_day(int64_t day);

} // namespace tickback::core
