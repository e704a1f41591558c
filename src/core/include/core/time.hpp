#pragma once
#include <cstdint>
#include <string>

namespace nle {

// Timeline and source positions are plain seconds. Edits compare with TIME_EPSILON
// instead of exact equality so values that went through arithmetic still match.
using Seconds = double;

inline constexpr Seconds TIME_EPSILON = 0.01;

inline bool nearly_equal(Seconds a, Seconds b, Seconds eps = TIME_EPSILON) noexcept {
    Seconds d = a - b;
    return (d < 0 ? -d : d) < eps;
}

inline Seconds clamp_time(Seconds v, Seconds lo, Seconds hi) noexcept {
    return v < lo ? lo : (v > hi ? hi : v);
}

// Zoom is expressed in pixels per second.
inline double time_to_pixels(Seconds t, double zoom) noexcept { return t * zoom; }
inline Seconds pixels_to_time(double px, double zoom) noexcept { return zoom > 0.0 ? px / zoom : 0.0; }

// Nearest multiple of grid_interval. Non-positive intervals return t unchanged.
Seconds snap_to_grid(Seconds t, Seconds grid_interval) noexcept;

// Audio sample index for a time at the given rate (rounded to nearest).
int64_t to_samples(Seconds t, uint32_t sample_rate) noexcept;

// "MM:SS" or "HH:MM:SS" once an hour is reached. Non-finite input formats as "00:00".
std::string format_time(Seconds seconds);

// "HH:MM:SS.FF" at the given frame rate, used by the probe tool and log lines.
std::string format_timecode(Seconds seconds, double frame_rate = 30.0);

struct VisibleRange { Seconds start = 0.0; Seconds end = 0.0; };
VisibleRange visible_time_range(double scroll_left_px, double width_px, double zoom) noexcept;

} // namespace nle
