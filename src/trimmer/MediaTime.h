#pragma once

#include <cstdint>
#include <cmath>

// Rational media time: value / timescale seconds.
struct MediaTime {
    int64_t value = 0;
    int32_t timescale = DefaultTimescale;

    static constexpr int32_t DefaultTimescale = 600;

    MediaTime() = default;
    MediaTime(int64_t v, int32_t ts) : value(v), timescale(ts) {}

    static MediaTime fromSeconds(double seconds, int32_t ts = DefaultTimescale) {
        return MediaTime(static_cast<int64_t>(std::llround(seconds * ts)), ts);
    }

    bool isValid() const { return timescale > 0; }
    bool isZero() const { return value == 0; }
    double seconds() const { return isValid() ? static_cast<double>(value) / timescale : 0.0; }

    bool operator<(const MediaTime& o) const { return compare(o) < 0; }
    bool operator>(const MediaTime& o) const { return compare(o) > 0; }
    bool operator<=(const MediaTime& o) const { return compare(o) <= 0; }
    bool operator>=(const MediaTime& o) const { return compare(o) >= 0; }
    bool operator==(const MediaTime& o) const { return compare(o) == 0; }
    bool operator!=(const MediaTime& o) const { return compare(o) != 0; }

private:
    // Cross-multiplied so different timescales compare exactly
    int compare(const MediaTime& o) const {
        long double lhs = static_cast<long double>(value) * o.timescale;
        long double rhs = static_cast<long double>(o.value) * timescale;
        return lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
    }
};
