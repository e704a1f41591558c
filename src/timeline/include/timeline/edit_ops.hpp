#pragma once
#include "timeline/model.hpp"
#include "core/config.hpp"

// Edit operation engine. Every function reads a project state and returns a complete new
// one; the caller commits it as a single history step. Unknown ids and clips on locked
// tracks leave the state unchanged. Transition reconciliation runs at the end of every
// clip operation so a returned state never carries a dangling or non-adjacent crossfade.
namespace nle::timeline {

enum class TrimSide { Left, Right };

struct AssetMetadataPatch {
    std::optional<int> width;
    std::optional<int> height;
    std::optional<std::string> aspect_ratio;
    std::optional<std::vector<std::string>> thumbnails;
    std::optional<std::vector<float>> waveform;
    std::map<std::string, std::string> extra;       // merged key by key
};

// Appends to the clip's track and re-sorts. Collisions are left to the caller.
// Timeline span is clamped to the source span; degenerate clips are rejected.
ProjectState insert_clip(const ProjectState& state, Clip clip, const core::EditorConfig& cfg = {});

/**
 * @brief Moves the in (Left) or out (Right) point of a clip
 *
 * Left points clamp to [0, out - min_clip_duration], right points to
 * [in + min_clip_duration, asset duration]. Right trims and rippled left trims keep
 * the start and recompute the end; a non-rippled left trim keeps the end and moves
 * the start (never below 0). With ripple, clips after the trimmed one on its track
 * shift by the duration change.
 */
ProjectState trim_clip(const ProjectState& state, const ClipId& clip_id, TrimSide side,
                       Seconds new_point, bool ripple, const core::EditorConfig& cfg = {});

// No-op unless start < position < end. The left half keeps clip_id, the right half
// takes right_id. Both halves copy every other field.
ProjectState split_clip(const ProjectState& state, const ClipId& clip_id, Seconds position,
                        const ClipId& right_id, const core::EditorConfig& cfg = {});

// Same-track ripple shifts clips that started at or after the old end by the position
// delta. Cross-track moves never ripple either track.
ProjectState move_clip(const ProjectState& state, const ClipId& clip_id, const TrackId& track_id,
                       Seconds new_start, bool ripple, const core::EditorConfig& cfg = {});

ProjectState remove_clip(const ProjectState& state, const ClipId& clip_id, bool ripple = true,
                         const core::EditorConfig& cfg = {});
// One atomic step; unknown ids are skipped
ProjectState remove_clips(const ProjectState& state, const std::vector<ClipId>& clip_ids, bool ripple = true,
                          const core::EditorConfig& cfg = {});

// Duration is clamped to the configured bounds. Target must sit flush on the same track.
ProjectState set_transition(const ProjectState& state, const ClipId& from_id, const ClipId& to_id,
                            Seconds duration, const core::EditorConfig& cfg = {});
ProjectState remove_transition(const ProjectState& state, const ClipId& clip_id,
                               const core::EditorConfig& cfg = {});

ProjectState update_caption(const ProjectState& state, const ClipId& clip_id, const CaptionPatch& patch,
                            const core::EditorConfig& cfg = {});

// Project level; asset removal never touches clips that reference the asset
ProjectState add_asset(const ProjectState& state, Asset asset);
ProjectState remove_asset(const ProjectState& state, const AssetId& asset_id);
ProjectState attach_asset_metadata(const ProjectState& state, const AssetId& asset_id, const AssetMetadataPatch& patch);
ProjectState set_aspect_ratio(const ProjectState& state, const std::string& aspect_ratio);
ProjectState set_track_muted(const ProjectState& state, const TrackId& track_id, bool muted);
ProjectState set_track_locked(const ProjectState& state, const TrackId& track_id, bool locked);

// Drops transitions whose target is missing, on another track, or no longer flush
void reconcile_transitions(ProjectState& state, const core::EditorConfig& cfg = {});

// Creates a default crossfade for each flush pair involving clip_id where the left clip
// has no outgoing transition and nothing targets the right clip yet
void auto_create_transitions(Track& track, const ClipId& clip_id, const core::EditorConfig& cfg = {});

} // namespace nle::timeline
