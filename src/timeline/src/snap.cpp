#include "timeline/snap.hpp"
#include <cmath>

namespace nle::timeline {

namespace {
constexpr double TIE_TOLERANCE_PX = 1e-9;
}

const char* to_string(SnapTarget target) noexcept {
    switch(target) {
        case SnapTarget::None: return "none";
        case SnapTarget::Playhead: return "playhead";
        case SnapTarget::Grid: return "grid";
        case SnapTarget::ClipStart: return "clip_start";
        case SnapTarget::ClipEnd: return "clip_end";
    }
    return "none";
}

std::vector<SnapBoundary> collect_clip_boundaries(const std::vector<Track>& tracks,
                                                  const ClipId& exclude_clip_id) {
    std::vector<SnapBoundary> out;
    for(const auto& track : tracks) {
        for(const auto& clip : track.clips) {
            if(!exclude_clip_id.empty() && clip.id == exclude_clip_id) continue;
            out.push_back({clip.start, SnapTarget::ClipStart, clip.id});
            out.push_back({clip.end, SnapTarget::ClipEnd, clip.id});
        }
    }
    return out;
}

SnapResult resolve_snap(Seconds t, double zoom, Seconds playhead,
                        const std::vector<SnapBoundary>& boundaries,
                        const core::EditorConfig& cfg) {
    SnapResult best{t, SnapTarget::None, cfg.snap_threshold_px};
    if(!std::isfinite(t) || zoom <= 0.0) return best;

    auto consider = [&](Seconds candidate, SnapTarget kind) {
        double px = std::abs(t - candidate) * zoom;
        if(px >= cfg.snap_threshold_px) return;
        if(best.snapped() && px >= best.distance_px - TIE_TOLERANCE_PX) return;
        best.snapped_time = candidate;
        best.target = kind;
        best.distance_px = px;
    };

    consider(playhead, SnapTarget::Playhead);
    if(cfg.snap_grid_interval > 0.0) consider(snap_to_grid(t, cfg.snap_grid_interval), SnapTarget::Grid);
    for(const auto& b : boundaries) if(b.kind == SnapTarget::ClipStart) consider(b.time, b.kind);
    for(const auto& b : boundaries) if(b.kind == SnapTarget::ClipEnd) consider(b.time, b.kind);

    if(!best.snapped()) best.distance_px = 0.0;
    return best;
}

} // namespace nle::timeline
