#pragma once
#include "timeline/model.hpp"
#include <set>

namespace nle::timeline {

using Selection = std::set<ClipId>;

struct TransportState {
    Seconds playhead = 0.0;
    double zoom = 100.0;             // pixels per second
    bool is_playing = false;

    bool operator==(const TransportState&) const = default;
};

/**
 * @brief Everything one editor instance works on
 *
 * Passed explicitly to whoever needs it; nothing about a session is global,
 * so several can live side by side (tests, preview + export, etc).
 */
struct EditorSession {
    ProjectState project;
    Selection selection;
    TransportState transport;
    uint64_t next_split_index = 1;   // suffix source for "<id>-split-<n>"
};

// video / audio / overlay tracks with the stock ids
std::vector<Track> default_tracks();
EditorSession make_default_session();

// Fresh id for the right half of a split, unique within the project
ClipId make_split_id(const ProjectState& project, const ClipId& base, uint64_t& counter);

} // namespace nle::timeline
