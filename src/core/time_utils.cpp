#include "core/time_utils.hpp"

#include "core/types.h"

#include <chrono>
#include <ctime>
#include <cstdio>

namespace tickback::core {

uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

uint64_t unix_now_ns() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

namespace {

void to_tm(int64_t secs, std::tm* tm) {
    time_t t = static_cast<time_t>(secs);
#ifdef _WIN32
    gmtime_s(tm, &t);
#else
    gmtime_r(&t, tm);
#endif
}

int64_t floor_div(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) --q;
    return q;
}

} // namespace

void format_utc(uint64_t ts_ns, char* out, size_t out_len) {
    if (!out || out_len == 0) return;

    std::tm tm{};
    to_tm(static_cast<int64_t>(ts_ns / 1000000000ULL), &tm);
    uint32_t ns = static_cast<uint32_t>(ts_ns % 1000000000ULL);

    char base[32];
    strftime(base, sizeof(base), "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(out, out_len, "%s.%09u+00", base, ns);
}

std::string to_utc_us(int64_t ts_us) {
    const int64_t secs = floor_div(ts_us, TICKBACK_US_PER_SECOND);
    const int64_t us = ts_us - secs * TICKBACK_US_PER_SECOND;

    std::tm tm{};
    to_tm(secs, &tm);

    char base[32];
    strftime(base, sizeof(base), "%Y-%m-%d %H:%M:%S", &tm);
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s.%06lld+00", base, static_cast<long long>(us));
    return std::string(buffer);
}

int64_t utc_day(int64_t ts_us) {
    return floor_div(ts_us, TICKBACK_US_PER_DAY);
}

std::string format_day(int64_t day) {
    std::tm tm{};
    to_tm(day * (TICKBACK_US_PER_DAY / TICKBACK_US_PER_SECOND), &tm);
    char buffer[16];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return std::string(buffer);
}

} // namespace tickback::core
