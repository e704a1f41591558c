#pragma once

#include "audio/audio_context.hpp"
#include "audio/buffer_cache.hpp"
#include "core/config.hpp"
#include "timeline/model.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nle::audio {

enum class SchedulerState { Idle, Scheduled, Playing, Stopped };

const char* to_string(SchedulerState state) noexcept;

/**
 * @brief Where a clip lands relative to the playhead
 *
 * start_delay = max(0, start - playhead),
 * buffer_offset = in_point + max(0, playhead - start),
 * play_duration = min(end - max(playhead, start), out_point - buffer_offset).
 */
struct ClipPlacement {
    Seconds start_delay = 0.0;
    Seconds buffer_offset = 0.0;
    Seconds play_duration = 0.0;
};

// nullopt when nothing of the clip is left to play
std::optional<ClipPlacement> compute_placement(const timeline::Clip& clip, Seconds playhead);

/**
 * @brief Gain automation for one clip in context time
 *
 * @param now Context time that corresponds to @p playhead
 * Default: click-avoidance fades of cfg.fade_ms at both ends. A clip with an
 * outgoing crossfade ramps to 0 over its transition window, starting at
 * 1 - progress when the playhead is already inside it. A crossfade target
 * scheduled before its incoming window has finished ramps from the progress to 1.
 */
GainEnvelope build_envelope(const timeline::Clip& clip, const timeline::Track& track, Seconds playhead,
                            Seconds now, const ClipPlacement& placement, const core::AudioEngineConfig& cfg);

struct ScheduledNode {
    NodeId node = 0;
    timeline::ClipId clip_id;
    timeline::TrackId track_id;
    Seconds context_start = 0.0;
    Seconds buffer_offset = 0.0;
    Seconds play_duration = 0.0;
    bool crossfade_in = false;
    bool crossfade_out = false;
};

struct SkippedClip {
    timeline::ClipId clip_id;
    std::string reason;
};

/**
 * @brief Turns the project and the transport position into scheduled buffer sources
 *
 * Owns the handles of every node it starts. Each reschedule() stops all of them
 * before scheduling anew, so no two passes ever overlap in the output. Clips whose
 * buffer is still decoding are skipped; once the decode lands the scheduler runs an
 * extend() pass at the clock-adjusted playhead if still playing.
 */
class AudioScheduler {
public:
    AudioScheduler(std::shared_ptr<AudioContext> context, std::shared_ptr<BufferCache> cache,
                   const core::AudioEngineConfig& cfg = {});
    ~AudioScheduler();
    AudioScheduler(const AudioScheduler&) = delete;
    AudioScheduler& operator=(const AudioScheduler&) = delete;

    void set_project(const timeline::ProjectState& project);
    void set_project(std::shared_ptr<const timeline::ProjectState> project);

    // Cancels every node, then (when playing) schedules the candidates at playhead
    void reschedule(Seconds playhead, bool is_playing);

    // Schedules candidates that entered the look-ahead window since the last pass,
    // without touching nodes already running. Placement follows the audio clock;
    // a caller playhead ahead of it only widens the look-ahead window.
    void extend(Seconds playhead);

    // Cancels every node; the context stays open
    void stop_all();

    // stop_all() and release the context
    void shutdown();

    void set_master_volume(float volume);
    float master_volume() const;

    SchedulerState state() const;
    std::vector<ScheduledNode> active_nodes() const;
    std::vector<SkippedClip> last_skipped() const;
    uint64_t pass_count() const;

    // Playhead implied by the audio clock since the last pass
    Seconds clock_playhead() const;

private:
    struct PassResult {
        std::vector<std::string> to_request;
    };

    void cancel_all_locked();
    PassResult schedule_locked(Seconds playhead, Seconds horizon, bool extend_only);
    void request_buffers(const std::vector<std::string>& urls);
    void on_buffer_ready(const std::string& url, AudioError error);
    Seconds clock_playhead_locked() const;

    std::shared_ptr<AudioContext> context_;
    std::shared_ptr<BufferCache> cache_;
    core::AudioEngineConfig cfg_;
    BufferCache::CallbackId ready_listener_ = 0;

    mutable std::mutex mutex_;
    std::shared_ptr<const timeline::ProjectState> project_;
    std::vector<ScheduledNode> nodes_;
    std::set<timeline::ClipId> scheduled_clips_;   // clips handled since the last full pass
    std::set<std::string> awaited_urls_;
    std::vector<SkippedClip> skipped_;
    std::set<timeline::ClipId> reported_;          // skips already logged since the last full pass
    SchedulerState state_ = SchedulerState::Idle;
    bool is_playing_ = false;
    Seconds anchor_playhead_ = 0.0;
    Seconds anchor_context_time_ = 0.0;
    uint64_t passes_ = 0;
    bool shut_down_ = false;
};

} // namespace nle::audio
