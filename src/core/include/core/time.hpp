#pragma once
#include <cstdint>
#include <string>

namespace tlc {

// Rational value used for frame rates (30/1, 30000/1001, ...).
struct TimeRational {
    int64_t num{0}; // numerator
    int32_t den{1}; // denominator ( >0 )
    
    bool operator==(const TimeRational& other) const {
        return num * other.den == other.num * den;
    }
    bool operator!=(const TimeRational& other) const { return !(*this == other); }

    double to_double() const { return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den); }
};

using FrameRate = TimeRational;

TimeRational make_time(int64_t num, int32_t den) noexcept;

// GCD reduction with a positive denominator; 0/x becomes 0/1.
TimeRational normalize(const TimeRational& in) noexcept;

// Accepts integral and common fractional rates (29.97 -> 30000/1001, 23.976 -> 24000/1001).
FrameRate frame_rate_from_double(double fps) noexcept;

// Timeline frame index -> seconds. A non-positive rate is treated as 30 fps.
double frames_to_seconds(int64_t frame, const FrameRate& fps) noexcept;

// Duration of one frame in seconds.
double frame_duration(const FrameRate& fps) noexcept;

// Filter-graph rate argument: "30" or "30000/1001".
std::string format_rate(const FrameRate& fps);

// Fixed decimals, e.g. format_fixed(2.0, 3) == "2.000".
std::string format_fixed(double value, int decimals);

// Shortest decimal form with at most `max_decimals` digits: 5 -> "5", 1.25 -> "1.25".
std::string format_seconds(double value, int max_decimals = 6);

// Round to `decimals` places (used for enable windows so that both edges agree).
double round_to(double value, int decimals) noexcept;

// Human readable string for logs (e.g., 00:01:02.500)
std::string format_timecode(double seconds);

} // namespace tlc
