#pragma once

#include "audio/audio_context.hpp"
#include <mutex>
#include <vector>

namespace nle::audio {

/**
 * @brief Software mixer implementing AudioContext
 *
 * render() pulls interleaved float frames; the clock advances by exactly the
 * rendered frames, so a device callback (or a test) drives time. Buffers at a
 * different rate are resampled linearly. Thread-safe.
 */
class OfflineAudioContext : public AudioContext {
public:
    explicit OfflineAudioContext(uint32_t sample_rate = 48000, uint16_t channels = 2);
    ~OfflineAudioContext() override;

    Seconds current_time() const override;
    uint32_t sample_rate() const override { return sample_rate_; }
    uint16_t channels() const override { return channels_; }

    AudioError start_source(SourceRequest request, NodeId& id) override;
    AudioError stop_source(NodeId id) override;

    void set_master_gain(float gain) override;
    float master_gain() const override;

    AudioError resume() override;
    AudioError close() override;
    bool is_closed() const override;
    bool is_running() const;

    size_t active_source_count() const override;

    /**
     * @brief Mix frame_count frames into out (interleaved, channels() wide)
     *
     * A suspended or closed context writes silence and keeps its clock.
     */
    AudioError render(float* out, size_t frame_count);
    std::vector<float> render(size_t frame_count);

    struct SourceInfo {
        NodeId id = 0;
        std::string clip_id;
        Seconds when = 0.0;
        Seconds offset = 0.0;
        Seconds duration = 0.0;
        float gain_at_start = 1.0f;
    };
    // Active sources in scheduling order
    std::vector<SourceInfo> sources() const;
    uint64_t total_started() const;
    uint64_t total_stopped() const;

private:
    struct Source {
        NodeId id = 0;
        SourceRequest request;
    };

    void mix_source(const Source& src, float* out, size_t frame_count, uint64_t first_frame) const;

    const uint32_t sample_rate_;
    const uint16_t channels_;
    mutable std::mutex mutex_;
    std::vector<Source> sources_;
    uint64_t rendered_frames_ = 0;
    float master_gain_ = 1.0f;
    bool running_ = false;
    bool closed_ = false;
    NodeId next_id_ = 1;
    uint64_t total_started_ = 0;
    uint64_t total_stopped_ = 0;
};

} // namespace nle::audio
