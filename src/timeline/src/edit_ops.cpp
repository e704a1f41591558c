#include "timeline/edit_ops.hpp"
#include "timeline/transition.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include <algorithm>
#include <cstddef>
#include <set>

namespace nle::timeline {

namespace {

struct ClipLocation {
    size_t track_index = 0;
    size_t clip_index = 0;
};

std::optional<ClipLocation> locate(const ProjectState& state, const ClipId& id) {
    for(size_t t = 0; t < state.tracks.size(); ++t) {
        const auto& clips = state.tracks[t].clips;
        for(size_t c = 0; c < clips.size(); ++c) {
            if(clips[c].id == id) return ClipLocation{t, c};
        }
    }
    return std::nullopt;
}

std::optional<size_t> track_index(const ProjectState& state, const TrackId& id) {
    for(size_t t = 0; t < state.tracks.size(); ++t) {
        if(state.tracks[t].id == id) return t;
    }
    return std::nullopt;
}

void shift(Clip& c, Seconds delta) {
    c.start += delta;
    c.end += delta;
}

ProjectState finish(ProjectState next, const core::EditorConfig& cfg) {
    reconcile_transitions(next, cfg);
    return next;
}

} // namespace

ProjectState insert_clip(const ProjectState& state, Clip clip, const core::EditorConfig& cfg) {
    auto ti = track_index(state, clip.track_id);
    if(!ti) {
        nle::log::warn("insert_clip: unknown track " + clip.track_id);
        return state;
    }
    if(state.tracks[*ti].locked) return state;
    if(clip.id.empty() || find_clip(state.tracks, clip.id)) {
        nle::log::warn("insert_clip: missing or duplicate clip id '" + clip.id + "'");
        return state;
    }
    if(!(clip.start < clip.end) || !(clip.in_point < clip.out_point)) {
        nle::log::warn("insert_clip: rejected degenerate clip " + clip.id);
        return state;
    }
    clip.start = std::max(0.0, clip.start);
    if(clip.duration() > clip.source_duration()) clip.end = clip.start + clip.source_duration();

    ProjectState next = state;
    auto& track = next.tracks[*ti];
    track.clips.push_back(std::move(clip));
    sort_clips(track);
    NLE_TL_DEBUG("insert_clip: track " + track.id + " now has " + std::to_string(track.clips.size()) + " clips");
    return finish(std::move(next), cfg);
}

ProjectState trim_clip(const ProjectState& state, const ClipId& clip_id, TrimSide side,
                       Seconds new_point, bool ripple, const core::EditorConfig& cfg) {
    auto loc = locate(state, clip_id);
    if(!loc) return state;
    if(state.tracks[loc->track_index].locked) return state;

    ProjectState next = state;
    auto& track = next.tracks[loc->track_index];
    sort_clips(track);
    auto it = std::find_if(track.clips.begin(), track.clips.end(), [&](const Clip& c){ return c.id == clip_id; });
    size_t idx = static_cast<size_t>(it - track.clips.begin());
    Clip& clip = *it;

    const Seconds old_duration = clip.duration();
    if(side == TrimSide::Left) {
        Seconds lo = 0.0;
        // a non-rippled left trim moves the start, which may not go below zero
        if(!ripple) lo = std::max(lo, clip.out_point - clip.end);
        Seconds hi = clip.out_point - cfg.min_clip_duration;
        if(hi < lo) return state;
        Seconds in = clamp_time(new_point, lo, hi);
        Seconds new_duration = clip.out_point - in;
        clip.in_point = in;
        if(ripple) {
            clip.end = clip.start + new_duration;
        } else {
            clip.start = std::max(0.0, clip.end - new_duration);
        }
    } else {
        Seconds lo = clip.in_point + cfg.min_clip_duration;
        Seconds out = std::max(new_point, lo);
        if(clip.asset_id) {
            if(const Asset* asset = find_asset(state, *clip.asset_id); asset && asset->duration) {
                if(*asset->duration < lo) return state;
                out = std::min(out, *asset->duration);
            }
        }
        clip.out_point = out;
        clip.end = clip.start + (clip.out_point - clip.in_point);
    }
    const Seconds delta = clip.duration() - old_duration;

    if(ripple && delta != 0.0) {
        for(size_t i = idx + 1; i < track.clips.size(); ++i) shift(track.clips[i], delta);
    }
    sort_clips(track);
    NLE_TL_DEBUG("trim_clip: " + clip_id + " duration delta " + std::to_string(delta));

    reconcile_transitions(next, cfg);
    auto_create_transitions(next.tracks[loc->track_index], clip_id, cfg);
    return next;
}

ProjectState split_clip(const ProjectState& state, const ClipId& clip_id, Seconds position,
                        const ClipId& right_id, const core::EditorConfig& cfg) {
    auto loc = locate(state, clip_id);
    if(!loc) return state;
    if(state.tracks[loc->track_index].locked) return state;
    const Clip& clip = state.tracks[loc->track_index].clips[loc->clip_index];
    if(!(clip.start < position && position < clip.end)) return state;
    if(right_id.empty() || find_clip(state.tracks, right_id)) {
        nle::log::warn("split_clip: right half id '" + right_id + "' is empty or taken");
        return state;
    }

    const Seconds span = clip.source_duration();
    const Seconds relative = (position - clip.start) / span;
    const Seconds split_point = clip.in_point + relative * span;

    Clip left = clip;
    left.end = position;
    left.out_point = split_point;

    Clip right = clip;
    right.id = right_id;
    right.start = position;
    right.in_point = split_point;

    ProjectState next = state;
    auto& clips = next.tracks[loc->track_index].clips;
    clips[loc->clip_index] = std::move(left);
    clips.insert(clips.begin() + static_cast<std::ptrdiff_t>(loc->clip_index) + 1, std::move(right));
    sort_clips(next.tracks[loc->track_index]);
    return finish(std::move(next), cfg);
}

ProjectState move_clip(const ProjectState& state, const ClipId& clip_id, const TrackId& track_id,
                       Seconds new_start, bool ripple, const core::EditorConfig& cfg) {
    auto loc = locate(state, clip_id);
    auto dest = track_index(state, track_id);
    if(!loc || !dest) return state;
    if(state.tracks[loc->track_index].locked || state.tracks[*dest].locked) return state;

    const Clip original = state.tracks[loc->track_index].clips[loc->clip_index];
    const Seconds start = std::max(0.0, new_start);
    const Seconds delta = start - original.start;

    ProjectState next = state;
    if(*dest == loc->track_index) {
        auto& track = next.tracks[*dest];
        for(auto& c : track.clips) {
            if(c.id == clip_id) {
                shift(c, delta);
            } else if(ripple && c.start >= original.end - cfg.adjacency_epsilon * 0.5) {
                shift(c, delta);
            }
        }
        sort_clips(track);
    } else {
        auto& src = next.tracks[loc->track_index].clips;
        src.erase(src.begin() + static_cast<std::ptrdiff_t>(loc->clip_index));
        Clip moved = original;
        moved.track_id = track_id;
        shift(moved, delta);
        auto& dst = next.tracks[*dest];
        dst.clips.push_back(std::move(moved));
        sort_clips(dst);
    }
    NLE_TL_DEBUG("move_clip: " + clip_id + " -> " + track_id + " @ " + std::to_string(start));

    reconcile_transitions(next, cfg);
    auto_create_transitions(next.tracks[*dest], clip_id, cfg);
    return next;
}

ProjectState remove_clip(const ProjectState& state, const ClipId& clip_id, bool ripple,
                         const core::EditorConfig& cfg) {
    return remove_clips(state, std::vector<ClipId>{clip_id}, ripple, cfg);
}

ProjectState remove_clips(const ProjectState& state, const std::vector<ClipId>& clip_ids, bool ripple,
                          const core::EditorConfig& cfg) {
    ProjectState next = state;
    bool changed = false;
    for(const auto& id : clip_ids) {
        auto loc = locate(next, id);
        if(!loc) continue;
        auto& track = next.tracks[loc->track_index];
        if(track.locked) continue;
        sort_clips(track);
        auto it = std::find_if(track.clips.begin(), track.clips.end(), [&](const Clip& c){ return c.id == id; });
        const Seconds duration = it->duration();
        size_t idx = static_cast<size_t>(it - track.clips.begin());
        track.clips.erase(it);
        if(ripple) {
            for(size_t i = idx; i < track.clips.size(); ++i) shift(track.clips[i], -duration);
        }
        changed = true;
    }
    if(!changed) return state;
    return finish(std::move(next), cfg);
}

ProjectState set_transition(const ProjectState& state, const ClipId& from_id, const ClipId& to_id,
                            Seconds duration, const core::EditorConfig& cfg) {
    if(from_id == to_id) return state;
    auto from = locate(state, from_id);
    auto to = locate(state, to_id);
    if(!from || !to) return state;
    if(from->track_index != to->track_index) {
        nle::log::warn("set_transition: " + from_id + " and " + to_id + " are on different tracks");
        return state;
    }
    if(state.tracks[from->track_index].locked) return state;
    const auto& clips = state.tracks[from->track_index].clips;
    if(!nearly_equal(clips[from->clip_index].end, clips[to->clip_index].start, cfg.adjacency_epsilon)) {
        nle::log::warn("set_transition: " + to_id + " does not start where " + from_id + " ends");
        return state;
    }

    ProjectState next = state;
    for(auto& c : next.tracks[from->track_index].clips) {
        if(c.id == from_id) {
            c.transition = Transition{TransitionType::Crossfade, clamp_transition_duration(duration, cfg), to_id};
        } else if(c.transition && c.transition->to_clip_id == to_id) {
            c.transition.reset();
        }
    }
    return finish(std::move(next), cfg);
}

ProjectState remove_transition(const ProjectState& state, const ClipId& clip_id, const core::EditorConfig& cfg) {
    auto loc = locate(state, clip_id);
    if(!loc || state.tracks[loc->track_index].locked) return state;
    if(!state.tracks[loc->track_index].clips[loc->clip_index].transition) return state;
    ProjectState next = state;
    next.tracks[loc->track_index].clips[loc->clip_index].transition.reset();
    return finish(std::move(next), cfg);
}

ProjectState update_caption(const ProjectState& state, const ClipId& clip_id, const CaptionPatch& patch,
                            const core::EditorConfig& cfg) {
    if(patch.empty()) return state;
    auto loc = locate(state, clip_id);
    if(!loc || state.tracks[loc->track_index].locked) return state;

    ProjectState next = state;
    Clip& clip = next.tracks[loc->track_index].clips[loc->clip_index];
    Caption cap = clip.caption.value_or(Caption{});
    if(patch.text) cap.text = *patch.text;
    if(patch.x) cap.x = *patch.x;
    if(patch.y) cap.y = *patch.y;
    if(patch.font_size) cap.font_size = std::max(1.0, *patch.font_size);
    if(patch.align) cap.align = *patch.align;
    if(patch.color) cap.color = *patch.color;
    if(patch.background) cap.background = *patch.background;
    if(patch.opacity) cap.opacity = std::clamp(*patch.opacity, 0.0, 1.0);
    if(patch.fade_in_ms) cap.fade_in_ms = std::max(0.0, *patch.fade_in_ms);
    if(patch.fade_out_ms) cap.fade_out_ms = std::max(0.0, *patch.fade_out_ms);
    clip.caption = std::move(cap);
    return finish(std::move(next), cfg);
}

ProjectState add_asset(const ProjectState& state, Asset asset) {
    if(asset.id.empty()) return state;
    auto it = state.assets.find(asset.id);
    if(it != state.assets.end() && it->second == asset) return state;
    ProjectState next = state;
    next.assets[asset.id] = std::move(asset);
    return next;
}

ProjectState remove_asset(const ProjectState& state, const AssetId& asset_id) {
    if(state.assets.find(asset_id) == state.assets.end()) return state;
    ProjectState next = state;
    next.assets.erase(asset_id);
    return next;
}

ProjectState attach_asset_metadata(const ProjectState& state, const AssetId& asset_id, const AssetMetadataPatch& patch) {
    if(state.assets.find(asset_id) == state.assets.end()) return state;
    ProjectState next = state;
    auto& meta = next.assets[asset_id].metadata;
    if(patch.width) meta.width = patch.width;
    if(patch.height) meta.height = patch.height;
    if(patch.aspect_ratio) meta.aspect_ratio = patch.aspect_ratio;
    if(patch.thumbnails) meta.thumbnails = *patch.thumbnails;
    if(patch.waveform) meta.waveform = *patch.waveform;
    for(const auto& [k, v] : patch.extra) meta.extra[k] = v;
    return next;
}

ProjectState set_aspect_ratio(const ProjectState& state, const std::string& aspect_ratio) {
    if(aspect_ratio.empty() || aspect_ratio == state.aspect_ratio) return state;
    ProjectState next = state;
    next.aspect_ratio = aspect_ratio;
    return next;
}

ProjectState set_track_muted(const ProjectState& state, const TrackId& track_id, bool muted) {
    auto ti = track_index(state, track_id);
    if(!ti || state.tracks[*ti].muted == muted) return state;
    ProjectState next = state;
    next.tracks[*ti].muted = muted;
    return next;
}

ProjectState set_track_locked(const ProjectState& state, const TrackId& track_id, bool locked) {
    auto ti = track_index(state, track_id);
    if(!ti || state.tracks[*ti].locked == locked) return state;
    ProjectState next = state;
    next.tracks[*ti].locked = locked;
    return next;
}

void reconcile_transitions(ProjectState& state, const core::EditorConfig& cfg) {
    for(auto& track : state.tracks) {
        std::set<ClipId> targeted;
        for(auto& c : track.clips) {
            if(!c.transition) continue;
            const auto& to_id = c.transition->to_clip_id;
            const Clip* target = nullptr;
            for(const auto& other : track.clips) if(other.id == to_id && other.id != c.id) target = &other;
            bool keep = target && nearly_equal(c.end, target->start, cfg.adjacency_epsilon)
                        && targeted.insert(to_id).second;
            if(!keep) {
                NLE_TL_DEBUG("reconcile_transitions: dropping " + c.id + " -> " + to_id);
                c.transition.reset();
            }
        }
    }
}

void auto_create_transitions(Track& track, const ClipId& clip_id, const core::EditorConfig& cfg) {
    auto it = std::find_if(track.clips.begin(), track.clips.end(), [&](const Clip& c){ return c.id == clip_id; });
    if(it == track.clips.end()) return;
    size_t idx = static_cast<size_t>(it - track.clips.begin());

    auto link = [&](size_t a, size_t b) {
        Clip& from = track.clips[a];
        const Clip& to = track.clips[b];
        if(from.transition) return;
        if(!nearly_equal(from.end, to.start, cfg.adjacency_epsilon)) return;
        if(incoming_transition_source(track, to.id)) return;
        from.transition = Transition{TransitionType::Crossfade,
                                     clamp_transition_duration(cfg.default_transition_duration, cfg), to.id};
        nle::log::debug("Auto crossfade " + from.id + " -> " + to.id);
    };

    if(idx > 0) link(idx - 1, idx);
    if(idx + 1 < track.clips.size()) link(idx, idx + 1);
}

} // namespace nle::timeline
