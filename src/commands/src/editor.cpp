#include "commands/editor.hpp"
#include "core/log.hpp"
#include "core/profiling.hpp"
#include <algorithm>

namespace nle::commands {

Editor::Editor(const core::EditorConfig& cfg)
    : Editor(timeline::make_default_session(), cfg) {}

Editor::Editor(timeline::EditorSession session, const core::EditorConfig& cfg)
    : cfg_(cfg)
    , session_(std::move(session))
    , history_(cfg.history_limit)
    , transport_(cfg)
    , ripple_default_(cfg.default_ripple) {
    history_.set_merge_window(std::chrono::milliseconds(cfg_.merge_window_ms));
    history_.reset(session_.project);
    transport_.set_duration(timeline::timeline_duration(session_.project.tracks));
    if(session_.transport.playhead > 0.0) transport_.seek(session_.transport.playhead);
    transport_.set_zoom(session_.transport.zoom);
    session_.transport = transport_.state();
    transport_sync_id_ = transport_.add_listener([this](const playback::TransportEvent& ev){
        session_.transport.playhead = ev.playhead;
        session_.transport.is_playing = ev.is_playing;
        session_.transport.zoom = ev.zoom;
    });
}

Editor::~Editor() {
    transport_.remove_listener(transport_sync_id_);
}

bool Editor::execute(CommandPtr command) {
    if(!command) {
        nle::log::warn("Attempted to execute null command");
        return false;
    }
    NLE_PROFILE_SCOPE("editor.execute");
    timeline::ProjectState next = command->apply(session_.project, cfg_);
    if(next == session_.project) {
        nle::log::debug("Command had no effect: " + command->description());
        return false;
    }
    commit(std::move(next), command->description(), command->merge_key());
    return true;
}

void Editor::commit(timeline::ProjectState next, const std::string& description, const std::string& merge_key) {
    session_.project = std::move(next);
    history_.save(session_.project, description, merge_key);
    prune_selection();
    transport_.set_duration(timeline::timeline_duration(session_.project.tracks));
    notify_project();
}

void Editor::restore(timeline::ProjectState state) {
    session_.project = std::move(state);
    session_.selection.clear();
    transport_.set_duration(timeline::timeline_duration(session_.project.tracks));
    notify_project();
}

bool Editor::insert(timeline::Clip clip) {
    return execute(std::make_unique<InsertClipCommand>(std::move(clip)));
}

bool Editor::trim(const timeline::ClipId& clip_id, timeline::TrimSide side, Seconds new_point, std::optional<bool> ripple) {
    return execute(std::make_unique<TrimClipCommand>(clip_id, side, new_point, ripple.value_or(ripple_default_)));
}

bool Editor::split(const timeline::ClipId& clip_id, Seconds position) {
    uint64_t counter = session_.next_split_index;
    auto right_id = timeline::make_split_id(session_.project, clip_id, counter);
    if(!execute(std::make_unique<SplitClipCommand>(clip_id, position, right_id))) return false;
    session_.next_split_index = counter;
    return true;
}

bool Editor::move(const timeline::ClipId& clip_id, const timeline::TrackId& track_id, Seconds new_start, std::optional<bool> ripple) {
    return execute(std::make_unique<MoveClipCommand>(clip_id, track_id, new_start, ripple.value_or(ripple_default_)));
}

bool Editor::remove(const timeline::ClipId& clip_id, std::optional<bool> ripple) {
    return remove_many({clip_id}, ripple);
}

bool Editor::remove_many(const std::vector<timeline::ClipId>& clip_ids, std::optional<bool> ripple) {
    if(clip_ids.empty()) return false;
    return execute(std::make_unique<DeleteClipsCommand>(clip_ids, ripple.value_or(cfg_.default_delete_ripple)));
}

bool Editor::set_transition(const timeline::ClipId& from_id, const timeline::ClipId& to_id, Seconds duration) {
    return execute(std::make_unique<SetTransitionCommand>(from_id, to_id, duration));
}

bool Editor::remove_transition(const timeline::ClipId& clip_id) {
    return execute(std::make_unique<RemoveTransitionCommand>(clip_id));
}

bool Editor::update_caption(const timeline::ClipId& clip_id, const timeline::CaptionPatch& patch) {
    return execute(std::make_unique<UpdateCaptionCommand>(clip_id, patch));
}

bool Editor::add_asset(timeline::Asset asset) {
    return execute(std::make_unique<AddAssetCommand>(std::move(asset)));
}

bool Editor::remove_asset(const timeline::AssetId& asset_id) {
    return execute(std::make_unique<RemoveAssetCommand>(asset_id));
}

bool Editor::attach_asset_metadata(const timeline::AssetId& asset_id, const timeline::AssetMetadataPatch& patch) {
    auto next = timeline::attach_asset_metadata(session_.project, asset_id, patch);
    if(next == session_.project) return false;
    session_.project = std::move(next);
    history_.patch_all([&](timeline::ProjectState& snapshot){
        snapshot = timeline::attach_asset_metadata(snapshot, asset_id, patch);
    });
    notify_project();
    return true;
}

bool Editor::set_aspect_ratio(const std::string& aspect_ratio) {
    return execute(std::make_unique<SetAspectRatioCommand>(aspect_ratio));
}

bool Editor::set_track_muted(const timeline::TrackId& track_id, bool muted) {
    return execute(std::make_unique<SetTrackFlagCommand>(track_id, SetTrackFlagCommand::Flag::Muted, muted));
}

bool Editor::set_track_locked(const timeline::TrackId& track_id, bool locked) {
    return execute(std::make_unique<SetTrackFlagCommand>(track_id, SetTrackFlagCommand::Flag::Locked, locked));
}

void Editor::set_selection(const std::vector<timeline::ClipId>& clip_ids) {
    session_.selection.clear();
    for(const auto& id : clip_ids) {
        if(timeline::find_clip(session_.project.tracks, id)) session_.selection.insert(id);
    }
}

void Editor::add_to_selection(const timeline::ClipId& clip_id) {
    if(timeline::find_clip(session_.project.tracks, clip_id)) session_.selection.insert(clip_id);
}

void Editor::clear_selection() { session_.selection.clear(); }

void Editor::prune_selection() {
    for(auto it = session_.selection.begin(); it != session_.selection.end();) {
        if(timeline::find_clip(session_.project.tracks, *it)) ++it;
        else it = session_.selection.erase(it);
    }
}

void Editor::set_playhead(Seconds t) { transport_.seek(t); }
void Editor::set_zoom(double zoom) { transport_.set_zoom(zoom); }
void Editor::play() { transport_.play(); }
void Editor::pause() { transport_.pause(); }
void Editor::toggle_playback() { transport_.toggle(); }
void Editor::nudge_playhead(int steps) { transport_.nudge(steps); }
void Editor::zoom_in() { transport_.zoom_in(); }
void Editor::zoom_out() { transport_.zoom_out(); }

bool Editor::split_at_playhead() {
    const Seconds t = transport_.playhead();
    const timeline::Clip* target = nullptr;
    for(const auto& track : session_.project.tracks) {
        for(const auto& c : track.clips) {
            if(!(c.start < t && t < c.end)) continue;
            if(session_.selection.count(c.id)) { target = &c; break; }
            if(!target) target = &c;
        }
        if(target && session_.selection.count(target->id)) break;
    }
    if(!target) return false;
    return split(target->id, t);
}

bool Editor::delete_selection(std::optional<bool> ripple) {
    if(session_.selection.empty()) return false;
    std::vector<timeline::ClipId> ids(session_.selection.begin(), session_.selection.end());
    return remove_many(ids, ripple);
}

bool Editor::undo() {
    auto state = history_.undo();
    if(!state) return false;
    restore(std::move(*state));
    return true;
}

bool Editor::redo() {
    auto state = history_.redo();
    if(!state) return false;
    restore(std::move(*state));
    return true;
}

void Editor::load_project(timeline::ProjectState state, std::optional<Seconds> playhead, std::optional<double> zoom) {
    transport_.pause();
    history_.reset(state);
    session_.next_split_index = 1;
    restore(std::move(state));
    if(playhead) transport_.seek(*playhead);
    if(zoom) transport_.set_zoom(*zoom);
    nle::log::info("Loaded project with " + std::to_string(session_.project.tracks.size()) + " tracks and "
                   + std::to_string(session_.project.assets.size()) + " assets");
}

Editor::ListenerId Editor::add_project_listener(ProjectListener listener) {
    if(!listener) return 0;
    ListenerId id = next_listener_id_++;
    listeners_.push_back(ListenerEntry{id, std::move(listener)});
    return id;
}

bool Editor::remove_project_listener(ListenerId id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(), [&](const ListenerEntry& e){ return e.id == id; });
    if(it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

void Editor::notify_project() {
    auto copy = listeners_;
    for(auto& e : copy) e.fn(session_.project);
}

} // namespace nle::commands
