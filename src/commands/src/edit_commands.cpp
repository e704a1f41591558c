#include "commands/edit_commands.hpp"
#include <sstream>

namespace nle::commands {

using timeline::ProjectState;

InsertClipCommand::InsertClipCommand(timeline::Clip clip) : clip_(std::move(clip)) {}

ProjectState InsertClipCommand::apply(const ProjectState& state, const core::EditorConfig& cfg) const {
    return timeline::insert_clip(state, clip_, cfg);
}

std::string InsertClipCommand::description() const { return "Insert clip " + clip_.id; }

TrimClipCommand::TrimClipCommand(timeline::ClipId clip_id, timeline::TrimSide side, Seconds new_point, bool ripple)
    : clip_id_(std::move(clip_id)), side_(side), new_point_(new_point), ripple_(ripple) {}

ProjectState TrimClipCommand::apply(const ProjectState& state, const core::EditorConfig& cfg) const {
    return timeline::trim_clip(state, clip_id_, side_, new_point_, ripple_, cfg);
}

std::string TrimClipCommand::description() const {
    std::ostringstream os;
    os << (ripple_ ? "Ripple trim " : "Trim ") << (side_ == timeline::TrimSide::Left ? "start" : "end")
       << " of " << clip_id_;
    return os.str();
}

std::string TrimClipCommand::merge_key() const {
    return "trim:" + clip_id_ + (side_ == timeline::TrimSide::Left ? ":l" : ":r");
}

SplitClipCommand::SplitClipCommand(timeline::ClipId clip_id, Seconds position, timeline::ClipId right_id)
    : clip_id_(std::move(clip_id)), position_(position), right_id_(std::move(right_id)) {}

ProjectState SplitClipCommand::apply(const ProjectState& state, const core::EditorConfig& cfg) const {
    return timeline::split_clip(state, clip_id_, position_, right_id_, cfg);
}

std::string SplitClipCommand::description() const { return "Split " + clip_id_ + " at " + format_time(position_); }

MoveClipCommand::MoveClipCommand(timeline::ClipId clip_id, timeline::TrackId track_id, Seconds new_start, bool ripple)
    : clip_id_(std::move(clip_id)), track_id_(std::move(track_id)), new_start_(new_start), ripple_(ripple) {}

ProjectState MoveClipCommand::apply(const ProjectState& state, const core::EditorConfig& cfg) const {
    return timeline::move_clip(state, clip_id_, track_id_, new_start_, ripple_, cfg);
}

std::string MoveClipCommand::description() const { return "Move " + clip_id_ + " to " + track_id_; }

std::string MoveClipCommand::merge_key() const { return "move:" + clip_id_; }

DeleteClipsCommand::DeleteClipsCommand(std::vector<timeline::ClipId> clip_ids, bool ripple)
    : clip_ids_(std::move(clip_ids)), ripple_(ripple) {}

ProjectState DeleteClipsCommand::apply(const ProjectState& state, const core::EditorConfig& cfg) const {
    return timeline::remove_clips(state, clip_ids_, ripple_, cfg);
}

std::string DeleteClipsCommand::description() const {
    std::string what = clip_ids_.size() == 1 ? clip_ids_.front() : std::to_string(clip_ids_.size()) + " clips";
    return (ripple_ ? "Ripple delete " : "Delete ") + what;
}

SetTransitionCommand::SetTransitionCommand(timeline::ClipId from_id, timeline::ClipId to_id, Seconds duration)
    : from_id_(std::move(from_id)), to_id_(std::move(to_id)), duration_(duration) {}

ProjectState SetTransitionCommand::apply(const ProjectState& state, const core::EditorConfig& cfg) const {
    return timeline::set_transition(state, from_id_, to_id_, duration_, cfg);
}

std::string SetTransitionCommand::description() const { return "Crossfade " + from_id_ + " -> " + to_id_; }

RemoveTransitionCommand::RemoveTransitionCommand(timeline::ClipId clip_id) : clip_id_(std::move(clip_id)) {}

ProjectState RemoveTransitionCommand::apply(const ProjectState& state, const core::EditorConfig& cfg) const {
    return timeline::remove_transition(state, clip_id_, cfg);
}

std::string RemoveTransitionCommand::description() const { return "Remove transition from " + clip_id_; }

UpdateCaptionCommand::UpdateCaptionCommand(timeline::ClipId clip_id, timeline::CaptionPatch patch)
    : clip_id_(std::move(clip_id)), patch_(std::move(patch)) {}

ProjectState UpdateCaptionCommand::apply(const ProjectState& state, const core::EditorConfig& cfg) const {
    return timeline::update_caption(state, clip_id_, patch_, cfg);
}

std::string UpdateCaptionCommand::description() const { return "Edit caption " + clip_id_; }

std::string UpdateCaptionCommand::merge_key() const { return "caption:" + clip_id_; }

AddAssetCommand::AddAssetCommand(timeline::Asset asset) : asset_(std::move(asset)) {}

ProjectState AddAssetCommand::apply(const ProjectState& state, const core::EditorConfig&) const {
    return timeline::add_asset(state, asset_);
}

std::string AddAssetCommand::description() const { return "Add asset " + asset_.id; }

RemoveAssetCommand::RemoveAssetCommand(timeline::AssetId asset_id) : asset_id_(std::move(asset_id)) {}

ProjectState RemoveAssetCommand::apply(const ProjectState& state, const core::EditorConfig&) const {
    return timeline::remove_asset(state, asset_id_);
}

std::string RemoveAssetCommand::description() const { return "Remove asset " + asset_id_; }

SetAspectRatioCommand::SetAspectRatioCommand(std::string aspect_ratio) : aspect_ratio_(std::move(aspect_ratio)) {}

ProjectState SetAspectRatioCommand::apply(const ProjectState& state, const core::EditorConfig&) const {
    return timeline::set_aspect_ratio(state, aspect_ratio_);
}

std::string SetAspectRatioCommand::description() const { return "Aspect ratio " + aspect_ratio_; }

SetTrackFlagCommand::SetTrackFlagCommand(timeline::TrackId track_id, Flag flag, bool value)
    : track_id_(std::move(track_id)), flag_(flag), value_(value) {}

ProjectState SetTrackFlagCommand::apply(const ProjectState& state, const core::EditorConfig&) const {
    return flag_ == Flag::Muted ? timeline::set_track_muted(state, track_id_, value_)
                                : timeline::set_track_locked(state, track_id_, value_);
}

std::string SetTrackFlagCommand::description() const {
    if(flag_ == Flag::Muted) return (value_ ? "Mute " : "Unmute ") + track_id_;
    return (value_ ? "Lock " : "Unlock ") + track_id_;
}

MacroCommand::MacroCommand(std::string description) : description_(std::move(description)) {}

void MacroCommand::add(CommandPtr command) {
    if(command) commands_.push_back(std::move(command));
}

ProjectState MacroCommand::apply(const ProjectState& state, const core::EditorConfig& cfg) const {
    ProjectState current = state;
    for(const auto& c : commands_) current = c->apply(current, cfg);
    return current;
}

} // namespace nle::commands
