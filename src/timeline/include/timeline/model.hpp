#pragma once
#include "core/time.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nle::timeline {

using ClipId = std::string;
using TrackId = std::string;
using AssetId = std::string;

enum class AssetKind { Video, Image, Audio, Voiceover };
enum class TrackKind { Video, Audio, Overlay };
enum class TextAlign { Left, Center, Right };
enum class TransitionType { Crossfade };

const char* to_string(AssetKind kind) noexcept;
const char* to_string(TrackKind kind) noexcept;
const char* to_string(TextAlign align) noexcept;
const char* to_string(TransitionType type) noexcept;

bool parse_asset_kind(const std::string& s, AssetKind& out) noexcept;
bool parse_track_kind(const std::string& s, TrackKind& out) noexcept;
bool parse_text_align(const std::string& s, TextAlign& out) noexcept;
bool parse_transition_type(const std::string& s, TransitionType& out) noexcept;

// Derived data attached after import (probe results, thumbnails, waveform peaks)
struct AssetMetadata {
    std::optional<int> width;
    std::optional<int> height;
    std::optional<std::string> aspect_ratio;
    std::vector<std::string> thumbnails;
    std::vector<float> waveform;                 // normalized 0..1 peaks
    std::map<std::string, std::string> extra;

    bool operator==(const AssetMetadata&) const = default;
};

struct Asset {
    AssetId id;
    std::string url;
    AssetKind kind = AssetKind::Video;
    std::optional<Seconds> duration;             // absent for stills
    int64_t created_at = 0;                      // ms since epoch
    AssetMetadata metadata;

    bool has_audio() const { return kind == AssetKind::Audio || kind == AssetKind::Voiceover; }
    bool operator==(const Asset&) const = default;
};

struct Caption {
    std::string text;
    double x = 0.5;                              // normalized frame position
    double y = 0.8;
    double font_size = 48.0;
    TextAlign align = TextAlign::Center;
    std::string color = "#ffffff";
    std::string background = "rgba(0,0,0,0.4)";
    double opacity = 1.0;
    double fade_in_ms = 150.0;
    double fade_out_ms = 150.0;

    bool operator==(const Caption&) const = default;
};

// Partial caption update; unset fields are left alone
struct CaptionPatch {
    std::optional<std::string> text;
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> font_size;
    std::optional<TextAlign> align;
    std::optional<std::string> color;
    std::optional<std::string> background;
    std::optional<double> opacity;
    std::optional<double> fade_in_ms;
    std::optional<double> fade_out_ms;

    bool empty() const;
};

// Crossfade owned by the outgoing ("from") clip
struct Transition {
    TransitionType type = TransitionType::Crossfade;
    Seconds duration = 0.5;
    ClipId to_clip_id;

    bool operator==(const Transition&) const = default;
};

struct Clip {
    ClipId id;
    std::optional<AssetId> asset_id;             // absent for captions
    TrackId track_id;
    Seconds start = 0.0;                         // timeline position
    Seconds end = 0.0;
    Seconds in_point = 0.0;                      // source window
    Seconds out_point = 0.0;
    std::optional<Caption> caption;
    std::optional<Transition> transition;

    Seconds duration() const { return end - start; }
    Seconds source_duration() const { return out_point - in_point; }
    bool is_caption() const { return caption.has_value() && !asset_id.has_value(); }
    bool contains(Seconds t) const { return t >= start && t < end; }

    bool operator==(const Clip&) const = default;
};

struct Track {
    TrackId id;
    TrackKind kind = TrackKind::Video;
    std::vector<Clip> clips;                     // ascending by start
    bool locked = false;
    bool muted = false;

    bool operator==(const Track&) const = default;
};

// Unit of undo/redo. Selection, playhead and zoom live outside it.
struct ProjectState {
    std::map<AssetId, Asset> assets;
    std::vector<Track> tracks;
    std::string aspect_ratio = "16:9";

    bool operator==(const ProjectState&) const = default;
};

Seconds clip_duration(const Clip& clip);
Seconds source_duration(const Clip& clip);

// start < end, in_point < out_point and timeline span within the source span
bool is_valid(const Clip& clip, Seconds eps = TIME_EPSILON);

// True overlap only; touching boundaries within eps do not count
bool overlaps(const Clip& a, const Clip& b, Seconds eps = TIME_EPSILON);

// Stable sort by start
std::vector<Clip> sorted_clips(const Track& track);
void sort_clips(Track& track);
bool track_is_sorted(const Track& track);

Track* find_track(std::vector<Track>& tracks, const TrackId& id);
const Track* find_track(const std::vector<Track>& tracks, const TrackId& id);
Clip* find_clip(std::vector<Track>& tracks, const ClipId& id);
const Clip* find_clip(const std::vector<Track>& tracks, const ClipId& id);
// Track holding the clip, or nullptr
const Track* track_of(const std::vector<Track>& tracks, const ClipId& id);

const Asset* find_asset(const ProjectState& state, const AssetId& id);

struct TrackValidation {
    bool ok = true;
    std::vector<std::string> problems;
};

// Ordering, per-clip validity, overlap and transition adjacency
TrackValidation validate_track(const Track& track, Seconds eps = TIME_EPSILON);
TrackValidation validate_project(const ProjectState& state, Seconds eps = TIME_EPSILON);

// Latest clip end across all tracks (0 when empty)
Seconds timeline_duration(const std::vector<Track>& tracks);

} // namespace nle::timeline
