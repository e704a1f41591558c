#include "timeline/model.hpp"
#include <algorithm>
#include <sstream>

namespace nle::timeline {

const char* to_string(AssetKind kind) noexcept {
    switch(kind) {
        case AssetKind::Video: return "video";
        case AssetKind::Image: return "image";
        case AssetKind::Audio: return "audio";
        case AssetKind::Voiceover: return "voiceover";
    }
    return "video";
}

const char* to_string(TrackKind kind) noexcept {
    switch(kind) {
        case TrackKind::Video: return "video";
        case TrackKind::Audio: return "audio";
        case TrackKind::Overlay: return "overlay";
    }
    return "video";
}

const char* to_string(TextAlign align) noexcept {
    switch(align) {
        case TextAlign::Left: return "left";
        case TextAlign::Center: return "center";
        case TextAlign::Right: return "right";
    }
    return "center";
}

const char* to_string(TransitionType) noexcept { return "crossfade"; }

bool parse_asset_kind(const std::string& s, AssetKind& out) noexcept {
    if(s == "video") { out = AssetKind::Video; return true; }
    if(s == "image") { out = AssetKind::Image; return true; }
    if(s == "audio") { out = AssetKind::Audio; return true; }
    if(s == "voiceover") { out = AssetKind::Voiceover; return true; }
    return false;
}

bool parse_track_kind(const std::string& s, TrackKind& out) noexcept {
    if(s == "video") { out = TrackKind::Video; return true; }
    if(s == "audio") { out = TrackKind::Audio; return true; }
    if(s == "overlay") { out = TrackKind::Overlay; return true; }
    return false;
}

bool parse_text_align(const std::string& s, TextAlign& out) noexcept {
    if(s == "left") { out = TextAlign::Left; return true; }
    if(s == "center") { out = TextAlign::Center; return true; }
    if(s == "right") { out = TextAlign::Right; return true; }
    return false;
}

bool parse_transition_type(const std::string& s, TransitionType& out) noexcept {
    if(s == "crossfade") { out = TransitionType::Crossfade; return true; }
    return false;
}

bool CaptionPatch::empty() const {
    return !text && !x && !y && !font_size && !align && !color && !background
        && !opacity && !fade_in_ms && !fade_out_ms;
}

Seconds clip_duration(const Clip& clip) { return clip.duration(); }
Seconds source_duration(const Clip& clip) { return clip.source_duration(); }

bool is_valid(const Clip& clip, Seconds eps) {
    if(clip.id.empty() || clip.track_id.empty()) return false;
    if(!(clip.start < clip.end)) return false;
    if(!(clip.in_point < clip.out_point)) return false;
    if(clip.start < 0.0 || clip.in_point < 0.0) return false;
    return clip.duration() <= clip.source_duration() + eps;
}

bool overlaps(const Clip& a, const Clip& b, Seconds eps) {
    return a.start < b.end - eps && b.start < a.end - eps;
}

std::vector<Clip> sorted_clips(const Track& track) {
    std::vector<Clip> out = track.clips;
    std::stable_sort(out.begin(), out.end(), [](const Clip& a, const Clip& b){ return a.start < b.start; });
    return out;
}

void sort_clips(Track& track) {
    std::stable_sort(track.clips.begin(), track.clips.end(), [](const Clip& a, const Clip& b){ return a.start < b.start; });
}

bool track_is_sorted(const Track& track) {
    return std::is_sorted(track.clips.begin(), track.clips.end(),
                          [](const Clip& a, const Clip& b){ return a.start < b.start; });
}

Track* find_track(std::vector<Track>& tracks, const TrackId& id) {
    for(auto& t : tracks) if(t.id == id) return &t;
    return nullptr;
}

const Track* find_track(const std::vector<Track>& tracks, const TrackId& id) {
    for(const auto& t : tracks) if(t.id == id) return &t;
    return nullptr;
}

Clip* find_clip(std::vector<Track>& tracks, const ClipId& id) {
    for(auto& t : tracks) {
        for(auto& c : t.clips) if(c.id == id) return &c;
    }
    return nullptr;
}

const Clip* find_clip(const std::vector<Track>& tracks, const ClipId& id) {
    for(const auto& t : tracks) {
        for(const auto& c : t.clips) if(c.id == id) return &c;
    }
    return nullptr;
}

const Track* track_of(const std::vector<Track>& tracks, const ClipId& id) {
    for(const auto& t : tracks) {
        for(const auto& c : t.clips) if(c.id == id) return &t;
    }
    return nullptr;
}

const Asset* find_asset(const ProjectState& state, const AssetId& id) {
    auto it = state.assets.find(id);
    return it == state.assets.end() ? nullptr : &it->second;
}

TrackValidation validate_track(const Track& track, Seconds eps) {
    TrackValidation result;
    auto fail = [&](const std::string& msg) {
        result.ok = false;
        result.problems.push_back(track.id + ": " + msg);
    };

    if(!track_is_sorted(track)) fail("clips not sorted by start");

    for(const auto& c : track.clips) {
        if(!is_valid(c, eps)) {
            std::ostringstream os;
            os << "clip " << c.id << " invalid (start=" << c.start << " end=" << c.end
               << " in=" << c.in_point << " out=" << c.out_point << ")";
            fail(os.str());
        }
        if(c.track_id != track.id) fail("clip " + c.id + " claims track " + c.track_id);
        if(c.transition) {
            const Clip* target = nullptr;
            for(const auto& other : track.clips) if(other.id == c.transition->to_clip_id) target = &other;
            if(!target) {
                fail("clip " + c.id + " transition target " + c.transition->to_clip_id + " not on track");
            } else if(!nearly_equal(c.end, target->start, eps)) {
                fail("clip " + c.id + " transition target " + target->id + " not adjacent");
            }
        }
    }

    auto sorted = sorted_clips(track);
    for(size_t i = 1; i < sorted.size(); ++i) {
        const auto& a = sorted[i - 1];
        const auto& b = sorted[i];
        if(overlaps(a, b, eps)) fail("clips " + a.id + " and " + b.id + " overlap");
    }
    return result;
}

TrackValidation validate_project(const ProjectState& state, Seconds eps) {
    TrackValidation all;
    for(const auto& t : state.tracks) {
        auto r = validate_track(t, eps);
        if(!r.ok) {
            all.ok = false;
            all.problems.insert(all.problems.end(), r.problems.begin(), r.problems.end());
        }
    }
    return all;
}

Seconds timeline_duration(const std::vector<Track>& tracks) {
    Seconds d = 0.0;
    for(const auto& t : tracks) {
        for(const auto& c : t.clips) d = std::max(d, c.end);
    }
    return d;
}

} // namespace nle::timeline
