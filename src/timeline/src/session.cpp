#include "timeline/session.hpp"

namespace nle::timeline {

std::vector<Track> default_tracks() {
    std::vector<Track> tracks;
    tracks.push_back(Track{"track-video-1", TrackKind::Video, {}, false, false});
    tracks.push_back(Track{"track-audio-1", TrackKind::Audio, {}, false, false});
    tracks.push_back(Track{"track-overlay-1", TrackKind::Overlay, {}, false, false});
    return tracks;
}

EditorSession make_default_session() {
    EditorSession s;
    s.project.tracks = default_tracks();
    return s;
}

ClipId make_split_id(const ProjectState& project, const ClipId& base, uint64_t& counter) {
    while(true) {
        ClipId candidate = base + "-split-" + std::to_string(counter++);
        if(!find_clip(project.tracks, candidate)) return candidate;
    }
}

} // namespace nle::timeline
