#include "core/time.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace nle {

Seconds snap_to_grid(Seconds t, Seconds grid_interval) noexcept {
    if(grid_interval <= 0.0) return t;
    return std::round(t / grid_interval) * grid_interval;
}

int64_t to_samples(Seconds t, uint32_t sample_rate) noexcept {
    return static_cast<int64_t>(std::llround(t * static_cast<double>(sample_rate)));
}

std::string format_time(Seconds seconds) {
    if(!std::isfinite(seconds)) return "00:00";
    if(seconds < 0.0) seconds = 0.0;
    auto total = static_cast<int64_t>(std::floor(seconds));
    int64_t hours = total / 3600;
    int64_t minutes = (total % 3600) / 60;
    int64_t secs = total % 60;

    std::ostringstream oss;
    oss << std::setfill('0');
    if(hours > 0) oss << std::setw(2) << hours << ':';
    oss << std::setw(2) << minutes << ':' << std::setw(2) << secs;
    return oss.str();
}

std::string format_timecode(Seconds seconds, double frame_rate) {
    if(!std::isfinite(seconds) || seconds < 0.0) seconds = 0.0;
    if(frame_rate <= 0.0) frame_rate = 30.0;

    auto total_seconds = static_cast<int64_t>(seconds);
    int64_t hours = total_seconds / 3600;
    int64_t minutes = (total_seconds % 3600) / 60;
    int64_t secs = total_seconds % 60;
    double fractional = seconds - static_cast<double>(total_seconds);
    auto frame = static_cast<int64_t>(std::floor(fractional * frame_rate + 0.5));
    if(frame >= static_cast<int64_t>(std::ceil(frame_rate))) frame = static_cast<int64_t>(std::ceil(frame_rate)) - 1;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ':'
        << std::setw(2) << minutes << ':'
        << std::setw(2) << secs << '.'
        << std::setw(2) << frame;
    return oss.str();
}

VisibleRange visible_time_range(double scroll_left_px, double width_px, double zoom) noexcept {
    return VisibleRange{ pixels_to_time(scroll_left_px, zoom), pixels_to_time(scroll_left_px + width_px, zoom) };
}

} // namespace nle
