#include "audio/offline_audio_context.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include <algorithm>
#include <cmath>

namespace nle::audio {

OfflineAudioContext::OfflineAudioContext(uint32_t sample_rate, uint16_t channels)
    : sample_rate_(sample_rate ? sample_rate : 48000)
    , channels_(channels ? channels : 2) {
    nle::log::debug("OfflineAudioContext created: " + std::to_string(sample_rate_) + "Hz, "
                    + std::to_string(channels_) + " channels");
}

OfflineAudioContext::~OfflineAudioContext() {
    close();
}

Seconds OfflineAudioContext::current_time() const {
    std::scoped_lock lk(mutex_);
    return static_cast<Seconds>(rendered_frames_) / sample_rate_;
}

AudioError OfflineAudioContext::start_source(SourceRequest request, NodeId& id) {
    if(!request.buffer || request.buffer->empty() || request.buffer->sample_rate == 0) {
        return AudioError::InvalidArgument;
    }
    if(!(request.duration > 0.0) || request.offset < 0.0 || !std::isfinite(request.when)) {
        return AudioError::InvalidArgument;
    }
    std::scoped_lock lk(mutex_);
    if(closed_) return AudioError::ContextClosed;
    id = next_id_++;
    sources_.push_back(Source{id, std::move(request)});
    ++total_started_;
    NLE_AUDIO_DEBUG_LOG("start_source " + std::to_string(id) + " clip=" + sources_.back().request.clip_id);
    return AudioError::None;
}

AudioError OfflineAudioContext::stop_source(NodeId id) {
    std::scoped_lock lk(mutex_);
    if(closed_) return AudioError::ContextClosed;
    auto it = std::find_if(sources_.begin(), sources_.end(), [&](const Source& s){ return s.id == id; });
    if(it == sources_.end()) return AudioError::UnknownNode;
    sources_.erase(it);
    ++total_stopped_;
    return AudioError::None;
}

void OfflineAudioContext::set_master_gain(float gain) {
    std::scoped_lock lk(mutex_);
    master_gain_ = std::max(0.0f, gain);
}

float OfflineAudioContext::master_gain() const {
    std::scoped_lock lk(mutex_);
    return master_gain_;
}

AudioError OfflineAudioContext::resume() {
    std::scoped_lock lk(mutex_);
    if(closed_) return AudioError::ContextClosed;
    running_ = true;
    return AudioError::None;
}

AudioError OfflineAudioContext::close() {
    std::scoped_lock lk(mutex_);
    if(closed_) return AudioError::None;
    total_stopped_ += sources_.size();
    sources_.clear();
    running_ = false;
    closed_ = true;
    return AudioError::None;
}

bool OfflineAudioContext::is_closed() const {
    std::scoped_lock lk(mutex_);
    return closed_;
}

bool OfflineAudioContext::is_running() const {
    std::scoped_lock lk(mutex_);
    return running_;
}

size_t OfflineAudioContext::active_source_count() const {
    std::scoped_lock lk(mutex_);
    return sources_.size();
}

AudioError OfflineAudioContext::render(float* out, size_t frame_count) {
    if(!out) return AudioError::InvalidArgument;
    std::fill(out, out + frame_count * channels_, 0.0f);
    std::scoped_lock lk(mutex_);
    if(closed_) return AudioError::ContextClosed;
    if(!running_) return AudioError::None;

    const uint64_t first = rendered_frames_;
    for(const auto& src : sources_) mix_source(src, out, frame_count, first);
    rendered_frames_ += frame_count;

    // Drop sources whose material has fully played ("ended")
    const Seconds now = static_cast<Seconds>(rendered_frames_) / sample_rate_;
    sources_.erase(std::remove_if(sources_.begin(), sources_.end(), [&](const Source& s){
        return s.request.when + s.request.duration <= now;
    }), sources_.end());
    return AudioError::None;
}

std::vector<float> OfflineAudioContext::render(size_t frame_count) {
    std::vector<float> out(frame_count * channels_, 0.0f);
    AudioError err = render(out.data(), frame_count);
    if(err != AudioError::None) nle::log::warn(std::string("OfflineAudioContext::render: ") + to_string(err));
    return out;
}

void OfflineAudioContext::mix_source(const Source& src, float* out, size_t frame_count, uint64_t first_frame) const {
    const auto& req = src.request;
    const AudioBuffer& buf = *req.buffer;
    const Seconds stop = req.when + req.duration;
    const size_t buf_frames = buf.frame_count();

    for(size_t i = 0; i < frame_count; ++i) {
        const Seconds t = static_cast<Seconds>(first_frame + i) / sample_rate_;
        if(t < req.when || t >= stop) continue;
        const double pos = (req.offset + (t - req.when)) * buf.sample_rate;
        const size_t i0 = static_cast<size_t>(pos);
        if(i0 >= buf_frames) continue;
        const size_t i1 = std::min(i0 + 1, buf_frames - 1);
        const float frac = static_cast<float>(pos - static_cast<double>(i0));
        const float gain = req.envelope.value_at(t) * master_gain_;
        for(uint16_t c = 0; c < channels_; ++c) {
            float a = buf.sample(i0, c);
            float b = buf.sample(i1, c);
            out[i * channels_ + c] += (a + (b - a) * frac) * gain;
        }
    }
}

std::vector<OfflineAudioContext::SourceInfo> OfflineAudioContext::sources() const {
    std::scoped_lock lk(mutex_);
    std::vector<SourceInfo> out;
    out.reserve(sources_.size());
    for(const auto& s : sources_) {
        out.push_back(SourceInfo{s.id, s.request.clip_id, s.request.when, s.request.offset, s.request.duration,
                                 s.request.envelope.value_at(s.request.when)});
    }
    return out;
}

uint64_t OfflineAudioContext::total_started() const {
    std::scoped_lock lk(mutex_);
    return total_started_;
}

uint64_t OfflineAudioContext::total_stopped() const {
    std::scoped_lock lk(mutex_);
    return total_stopped_;
}

} // namespace nle::audio
