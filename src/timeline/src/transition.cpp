#include "timeline/transition.hpp"
#include <algorithm>

namespace nle::timeline {

std::optional<TransitionWindow> transition_window(const Clip& from) {
    if(!from.transition || from.transition->duration <= 0.0) return std::nullopt;
    return TransitionWindow{from.end - from.transition->duration, from.end};
}

double crossfade_progress(const Clip& from, Seconds playhead) {
    if(!from.transition || from.transition->duration <= 0.0) return 0.0;
    return (playhead - (from.end - from.transition->duration)) / from.transition->duration;
}

bool in_transition(const Clip& from, Seconds playhead) {
    auto w = transition_window(from);
    return w && playhead >= w->start && playhead <= w->end;
}

Seconds clamp_transition_duration(Seconds duration, const core::EditorConfig& cfg) {
    return clamp_time(duration, cfg.min_transition_duration, cfg.max_transition_duration);
}

const Clip* incoming_transition_source(const Track& track, const ClipId& clip_id) {
    for(const auto& c : track.clips) {
        if(c.transition && c.transition->to_clip_id == clip_id) return &c;
    }
    return nullptr;
}

VisualBlend resolve_visual_blend(const Track& track, Seconds playhead) {
    VisualBlend blend;
    std::vector<const Clip*> active;
    for(const auto& c : track.clips) {
        if(!c.asset_id || c.is_caption()) continue;
        if(playhead >= c.start && playhead <= c.end) active.push_back(&c);
    }
    if(active.empty()) return blend;
    blend.primary = *active.front();

    const Clip* from = nullptr;
    for(const Clip* c : active) if(c->transition) { from = c; break; }
    if(!from) return blend;
    const Clip* to = nullptr;
    for(const auto& c : track.clips) if(c.id == from->transition->to_clip_id) to = &c;
    if(!to) return blend;

    auto w = transition_window(*from);
    if(w && playhead >= w->start && playhead <= w->end) {
        double p = clamp_progress(crossfade_progress(*from, playhead));
        blend.primary = *from;
        blend.primary_opacity = 1.0 - p;
        blend.secondary = *to;
        blend.secondary_opacity = p;
        blend.progress = p;
    } else if(w && playhead > w->end && playhead <= to->end) {
        blend.primary = *to;
    } else {
        blend.primary = *from;
    }
    return blend;
}

double caption_alpha(const Clip& clip, Seconds playhead) {
    if(!clip.caption || playhead < clip.start || playhead > clip.end) return 0.0;
    const auto& cap = *clip.caption;
    double t_ms = (playhead - clip.start) * 1000.0;
    double total_ms = clip.duration() * 1000.0;
    double in_alpha = cap.fade_in_ms > 0.0 ? std::min(1.0, t_ms / cap.fade_in_ms) : 1.0;
    double out_alpha = cap.fade_out_ms > 0.0 ? std::min(1.0, (total_ms - t_ms) / cap.fade_out_ms) : 1.0;
    return std::clamp(cap.opacity * std::min(in_alpha, out_alpha), 0.0, 1.0);
}

std::vector<Clip> active_captions(const std::vector<Track>& tracks, Seconds playhead) {
    std::vector<Clip> out;
    for(const auto& t : tracks) {
        for(const auto& c : t.clips) {
            if(c.caption && playhead >= c.start && playhead <= c.end) out.push_back(c);
        }
    }
    return out;
}

} // namespace nle::timeline
