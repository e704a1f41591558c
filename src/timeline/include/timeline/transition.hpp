#pragma once
#include "timeline/model.hpp"
#include "core/config.hpp"

namespace nle::timeline {

struct TransitionWindow {
    Seconds start = 0.0;   // from.end - duration
    Seconds end = 0.0;     // from.end
};

// Window of the clip's outgoing crossfade, if it has one
std::optional<TransitionWindow> transition_window(const Clip& from);

// (playhead - (from.end - duration)) / duration, unclamped: < 0 before, > 1 after the window.
// Clips without a transition report 0.
double crossfade_progress(const Clip& from, Seconds playhead);
inline double clamp_progress(double p) { return p < 0.0 ? 0.0 : (p > 1.0 ? 1.0 : p); }

bool in_transition(const Clip& from, Seconds playhead);

Seconds clamp_transition_duration(Seconds duration, const core::EditorConfig& cfg = {});

// Clip on the same track whose transition targets clip_id
const Clip* incoming_transition_source(const Track& track, const ClipId& clip_id);

struct VisualBlend {
    std::optional<Clip> primary;      // fades 1 - p while crossfading
    std::optional<Clip> secondary;    // fades p
    double primary_opacity = 1.0;
    double secondary_opacity = 0.0;
    double progress = 0.0;

    bool blending() const { return secondary.has_value(); }
};

// Which media clips the preview draws at the playhead and with what opacity
VisualBlend resolve_visual_blend(const Track& track, Seconds playhead);

// Caption opacity at the playhead including its fade-in/out ramps (0 outside the clip)
double caption_alpha(const Clip& clip, Seconds playhead);

// Caption clips across all tracks that are visible at the playhead
std::vector<Clip> active_captions(const std::vector<Track>& tracks, Seconds playhead);

} // namespace nle::timeline
