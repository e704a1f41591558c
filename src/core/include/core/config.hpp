#pragma once
#include "core/time.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace nle::core {

/**
 * @brief Tunables for the edit model, snapping and history
 */
struct EditorConfig {
    Seconds adjacency_epsilon = TIME_EPSILON;   ///< Tolerance for "flush" clip boundaries
    Seconds min_clip_duration = 0.05;           ///< Smallest duration a trim may produce
    Seconds default_transition_duration = 0.5;  ///< Auto-created crossfade length
    Seconds min_transition_duration = 0.25;
    Seconds max_transition_duration = 1.5;

    double snap_threshold_px = 4.0;             ///< Pixel distance under which a snap engages
    Seconds snap_grid_interval = 0.1;

    double min_zoom = 10.0;                     ///< Pixels per second
    double max_zoom = 1000.0;
    double default_zoom = 100.0;
    double zoom_step = 1.1;                     ///< Multiplier for zoom in (inverse-ish 0.9 for out)
    Seconds nudge_step = 1.0;                   ///< Playhead arrow-key step

    size_t history_limit = 50;                  ///< Max snapshots kept on each history stack
    uint32_t merge_window_ms = 0;               ///< Coalesce same-clip drags inside this window (0 = off)

    bool default_ripple = false;                ///< Global ripple toggle used when a call passes none
    bool default_delete_ripple = true;          ///< Ripple policy for direct and group deletes
};

/**
 * @brief Audio scheduling engine configuration
 */
struct AudioEngineConfig {
    uint32_t sample_rate = 48000;       ///< Context sample rate
    uint16_t channels = 2;              ///< Output channel count
    Seconds lookahead = 0.5;            ///< Clips starting within this window are scheduled ahead
    double fade_ms = 20.0;              ///< Click-avoidance fade at clip boundaries (10-50 ms)
    float master_volume = 1.0f;         ///< Global gain applied after every clip gain
    unsigned decode_threads = 2;        ///< Worker threads used for buffer decoding
};

struct ConfigLoadResult {
    bool success = false;
    std::string error;
    std::vector<std::string> unknown_keys;
};

// Parses "key = value" lines ('#' starts a comment). Returns false on unreadable input.
bool parse_key_values(const std::string& text, std::map<std::string, std::string>& out, std::string& error);

// Loaders start from the defaults, apply known keys and report unknown ones (logged as warnings).
ConfigLoadResult apply_editor_config(const std::map<std::string, std::string>& values, EditorConfig& cfg);
ConfigLoadResult apply_audio_config(const std::map<std::string, std::string>& values, AudioEngineConfig& cfg);

ConfigLoadResult load_editor_config(const std::string& path, EditorConfig& cfg);
ConfigLoadResult load_audio_config(const std::string& path, AudioEngineConfig& cfg);

} // namespace nle::core
