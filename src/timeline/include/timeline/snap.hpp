#pragma once
#include "timeline/model.hpp"
#include "core/config.hpp"

namespace nle::timeline {

// Category tags for drag highlighting, listed in tie-break order
enum class SnapTarget { None, Playhead, Grid, ClipStart, ClipEnd };

const char* to_string(SnapTarget target) noexcept;

struct SnapBoundary {
    Seconds time = 0.0;
    SnapTarget kind = SnapTarget::ClipStart;
    ClipId clip_id;
};

struct SnapResult {
    Seconds snapped_time = 0.0;
    SnapTarget target = SnapTarget::None;
    double distance_px = 0.0;

    bool snapped() const { return target != SnapTarget::None; }
};

// Start and end of every clip on every track, skipping exclude_clip_id (the clip being dragged)
std::vector<SnapBoundary> collect_clip_boundaries(const std::vector<Track>& tracks,
                                                  const ClipId& exclude_clip_id = {});

/**
 * @brief Closest snap candidate for a dragged time
 *
 * Candidates are the playhead, the nearest grid tick and every boundary. A candidate
 * qualifies when its pixel distance at the given zoom is strictly below the configured
 * threshold. Equal distances go to the earlier category (playhead, grid, clip start, clip end).
 */
SnapResult resolve_snap(Seconds t, double zoom, Seconds playhead,
                        const std::vector<SnapBoundary>& boundaries,
                        const core::EditorConfig& cfg = {});

} // namespace nle::timeline
