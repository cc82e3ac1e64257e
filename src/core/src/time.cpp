#include "core/time.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <numeric>

namespace tlc {

TimeRational make_time(int64_t num, int32_t den) noexcept {
    if(den == 0) den = 1;
    return normalize(TimeRational{num, den});
}

TimeRational normalize(const TimeRational& in) noexcept {
    if(in.den == 0) return TimeRational{0,1};
    int64_t num = in.num;
    int32_t den = in.den;
    if(den < 0) { den = -den; num = -num; }
    if(num == 0) return TimeRational{0,1};
    auto g = std::gcd(num < 0 ? -num : num, static_cast<int64_t>(den));
    if(g <= 1) return TimeRational{num, den};
    num /= g;
    den = static_cast<int32_t>(den / g);
    return TimeRational{num, den};
}

FrameRate frame_rate_from_double(double fps) noexcept {
    if(!(fps > 0.0) || !std::isfinite(fps)) return FrameRate{30, 1};
    double rounded = std::round(fps);
    if(std::fabs(fps - rounded) < 1e-6) return FrameRate{static_cast<int64_t>(rounded), 1};
    // NTSC style rates
    double ntsc = std::round(fps * 1.001);
    if(std::fabs(fps - ntsc / 1.001) < 1e-3) return FrameRate{static_cast<int64_t>(ntsc) * 1000, 1001};
    return normalize(FrameRate{static_cast<int64_t>(std::llround(fps * 1000.0)), 1000});
}

double frames_to_seconds(int64_t frame, const FrameRate& fps) noexcept {
    double rate = fps.to_double();
    if(rate <= 0.0) rate = 30.0;
    return static_cast<double>(frame) / rate;
}

double frame_duration(const FrameRate& fps) noexcept {
    return frames_to_seconds(1, fps);
}

std::string format_rate(const FrameRate& fps) {
    auto n = normalize(fps);
    if(n.num <= 0) return "30";
    if(n.den == 1) return std::to_string(n.num);
    return std::to_string(n.num) + "/" + std::to_string(n.den);
}

std::string format_fixed(double value, int decimals) {
    if(std::fabs(value) < 0.5 * std::pow(10.0, -decimals)) value = 0.0; // no "-0.000"
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

std::string format_seconds(double value, int max_decimals) {
    std::string s = format_fixed(value, max_decimals);
    if(s.find('.') == std::string::npos) return s;
    while(!s.empty() && s.back() == '0') s.pop_back();
    if(!s.empty() && s.back() == '.') s.pop_back();
    if(s == "-0") s = "0";
    return s;
}

double round_to(double value, int decimals) noexcept {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::string format_timecode(double seconds) {
    if(seconds < 0.0) seconds = 0.0;
    auto total_ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
    int64_t hours = total_ms / 3'600'000;
    int64_t minutes = (total_ms % 3'600'000) / 60'000;
    int64_t secs = (total_ms % 60'000) / 1000;
    int64_t ms = total_ms % 1000;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ':'
        << std::setw(2) << minutes << ':'
        << std::setw(2) << secs << '.'
        << std::setw(3) << ms;
    return oss.str();
}

} // namespace tlc
