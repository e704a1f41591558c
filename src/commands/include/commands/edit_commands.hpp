#pragma once
#include "commands/command.hpp"
#include "timeline/edit_ops.hpp"
#include <vector>

namespace nle::commands {

/**
 * @brief Place a new clip on its track
 */
class InsertClipCommand : public Command {
public:
    explicit InsertClipCommand(timeline::Clip clip);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
private:
    timeline::Clip clip_;
};

/**
 * @brief Move the in or out point of a clip
 */
class TrimClipCommand : public Command {
public:
    TrimClipCommand(timeline::ClipId clip_id, timeline::TrimSide side, Seconds new_point, bool ripple);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
    std::string merge_key() const override;
private:
    timeline::ClipId clip_id_;
    timeline::TrimSide side_;
    Seconds new_point_;
    bool ripple_;
};

class SplitClipCommand : public Command {
public:
    SplitClipCommand(timeline::ClipId clip_id, Seconds position, timeline::ClipId right_id);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
private:
    timeline::ClipId clip_id_;
    Seconds position_;
    timeline::ClipId right_id_;
};

/**
 * @brief Reposition a clip, possibly onto another track
 */
class MoveClipCommand : public Command {
public:
    MoveClipCommand(timeline::ClipId clip_id, timeline::TrackId track_id, Seconds new_start, bool ripple);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
    std::string merge_key() const override;
private:
    timeline::ClipId clip_id_;
    timeline::TrackId track_id_;
    Seconds new_start_;
    bool ripple_;
};

class DeleteClipsCommand : public Command {
public:
    DeleteClipsCommand(std::vector<timeline::ClipId> clip_ids, bool ripple);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
private:
    std::vector<timeline::ClipId> clip_ids_;
    bool ripple_;
};

class SetTransitionCommand : public Command {
public:
    SetTransitionCommand(timeline::ClipId from_id, timeline::ClipId to_id, Seconds duration);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
private:
    timeline::ClipId from_id_;
    timeline::ClipId to_id_;
    Seconds duration_;
};

class RemoveTransitionCommand : public Command {
public:
    explicit RemoveTransitionCommand(timeline::ClipId clip_id);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
private:
    timeline::ClipId clip_id_;
};

class UpdateCaptionCommand : public Command {
public:
    UpdateCaptionCommand(timeline::ClipId clip_id, timeline::CaptionPatch patch);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
    std::string merge_key() const override;
private:
    timeline::ClipId clip_id_;
    timeline::CaptionPatch patch_;
};

class AddAssetCommand : public Command {
public:
    explicit AddAssetCommand(timeline::Asset asset);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
private:
    timeline::Asset asset_;
};

class RemoveAssetCommand : public Command {
public:
    explicit RemoveAssetCommand(timeline::AssetId asset_id);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
private:
    timeline::AssetId asset_id_;
};

class SetAspectRatioCommand : public Command {
public:
    explicit SetAspectRatioCommand(std::string aspect_ratio);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
private:
    std::string aspect_ratio_;
};

/**
 * @brief Toggle a track's mute or lock flag
 */
class SetTrackFlagCommand : public Command {
public:
    enum class Flag { Muted, Locked };
    SetTrackFlagCommand(timeline::TrackId track_id, Flag flag, bool value);
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override;
private:
    timeline::TrackId track_id_;
    Flag flag_;
    bool value_;
};

/**
 * @brief Several commands committed as a single history step
 */
class MacroCommand : public Command {
public:
    explicit MacroCommand(std::string description);
    void add(CommandPtr command);
    bool empty() const { return commands_.empty(); }
    timeline::ProjectState apply(const timeline::ProjectState& state, const core::EditorConfig& cfg) const override;
    std::string description() const override { return description_; }
private:
    std::string description_;
    std::vector<CommandPtr> commands_;
};

} // namespace nle::commands
