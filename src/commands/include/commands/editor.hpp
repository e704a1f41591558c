#pragma once
#include "commands/edit_commands.hpp"
#include "commands/history.hpp"
#include "playback/transport.hpp"
#include "timeline/session.hpp"
#include <functional>
#include <optional>

namespace nle::commands {

/**
 * @brief Public editing surface for one editor session
 *
 * Owns the session value, its history and its transport clock. Every edit runs
 * through a Command; a result equal to the current state is treated as a no-op
 * and adds no history step.
 */
class Editor {
public:
    using ProjectListener = std::function<void(const timeline::ProjectState&)>;
    using ListenerId = uint64_t;

    explicit Editor(const core::EditorConfig& cfg = {});
    explicit Editor(timeline::EditorSession session, const core::EditorConfig& cfg = {});
    ~Editor();
    Editor(const Editor&) = delete;
    Editor& operator=(const Editor&) = delete;

    const timeline::EditorSession& session() const { return session_; }
    const timeline::ProjectState& project() const { return session_.project; }
    const core::EditorConfig& config() const { return cfg_; }
    playback::TransportClock& transport() { return transport_; }
    const playback::TransportClock& transport() const { return transport_; }
    const CommandHistory& history() const { return history_; }

    // Applies and commits a command; false when it changed nothing
    bool execute(CommandPtr command);

    // Clip edits. An explicit ripple argument overrides the session default.
    bool insert(timeline::Clip clip);
    bool trim(const timeline::ClipId& clip_id, timeline::TrimSide side, Seconds new_point,
              std::optional<bool> ripple = std::nullopt);
    bool split(const timeline::ClipId& clip_id, Seconds position);
    bool move(const timeline::ClipId& clip_id, const timeline::TrackId& track_id, Seconds new_start,
              std::optional<bool> ripple = std::nullopt);
    bool remove(const timeline::ClipId& clip_id, std::optional<bool> ripple = std::nullopt);
    bool remove_many(const std::vector<timeline::ClipId>& clip_ids, std::optional<bool> ripple = std::nullopt);
    bool set_transition(const timeline::ClipId& from_id, const timeline::ClipId& to_id, Seconds duration);
    bool remove_transition(const timeline::ClipId& clip_id);
    bool update_caption(const timeline::ClipId& clip_id, const timeline::CaptionPatch& patch);

    // Project level
    bool add_asset(timeline::Asset asset);
    bool remove_asset(const timeline::AssetId& asset_id);
    // Not an undo step; applied to every history snapshot that knows the asset
    bool attach_asset_metadata(const timeline::AssetId& asset_id, const timeline::AssetMetadataPatch& patch);
    bool set_aspect_ratio(const std::string& aspect_ratio);
    bool set_track_muted(const timeline::TrackId& track_id, bool muted);
    bool set_track_locked(const timeline::TrackId& track_id, bool locked);

    // Selection (transient, never in history)
    void set_selection(const std::vector<timeline::ClipId>& clip_ids);
    void add_to_selection(const timeline::ClipId& clip_id);
    void clear_selection();
    const timeline::Selection& selection() const { return session_.selection; }

    // Transport shortcuts
    void set_playhead(Seconds t);
    void set_zoom(double zoom);
    void play();
    void pause();
    void toggle_playback();
    void nudge_playhead(int steps);
    void zoom_in();
    void zoom_out();

    // Splits the selected clip under the playhead, or the first clip under it
    bool split_at_playhead();
    bool delete_selection(std::optional<bool> ripple = std::nullopt);

    bool undo();
    bool redo();
    bool can_undo() const { return history_.can_undo(); }
    bool can_redo() const { return history_.can_redo(); }

    // Replaces the whole model, clears history and selection
    void load_project(timeline::ProjectState state, std::optional<Seconds> playhead = std::nullopt,
                      std::optional<double> zoom = std::nullopt);
    timeline::ProjectState export_project() const { return session_.project; }

    void set_ripple_default(bool ripple) { ripple_default_ = ripple; }
    bool ripple_default() const { return ripple_default_; }

    // Called after every committed change of the project (edits, undo/redo, load)
    ListenerId add_project_listener(ProjectListener listener);
    bool remove_project_listener(ListenerId id);

private:
    void commit(timeline::ProjectState next, const std::string& description, const std::string& merge_key);
    void restore(timeline::ProjectState state);
    void notify_project();
    void prune_selection();

    core::EditorConfig cfg_;
    timeline::EditorSession session_;
    CommandHistory history_;
    playback::TransportClock transport_;
    playback::TransportClock::CallbackId transport_sync_id_ = 0;
    bool ripple_default_;

    struct ListenerEntry { ListenerId id; ProjectListener fn; };
    std::vector<ListenerEntry> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace nle::commands
