#include "audio/scheduler.hpp"
#include "timeline/transition.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include "core/profiling.hpp"
#include <algorithm>

namespace nle::audio {

namespace {

constexpr Seconds MIN_PLAY_DURATION = 1e-6;

struct CrossfadeRoles {
    const timeline::Clip* incoming_from = nullptr;   // set while the incoming window is unfinished
    bool outgoing = false;
};

CrossfadeRoles crossfade_roles(const timeline::Clip& clip, const timeline::Track& track, Seconds playhead) {
    CrossfadeRoles roles;
    if(const timeline::Clip* from = timeline::incoming_transition_source(track, clip.id)) {
        if(playhead < from->end) roles.incoming_from = from;
    }
    if(clip.transition && clip.transition->duration > 0.0) {
        for(const auto& c : track.clips) {
            if(c.id == clip.transition->to_clip_id) { roles.outgoing = true; break; }
        }
    }
    return roles;
}

// Playhead inside the transition window of a clip's outgoing crossfade
bool inside_incoming_window(const timeline::Clip& from, Seconds playhead) {
    auto w = timeline::transition_window(from);
    return w && playhead >= w->start && playhead < w->end;
}

} // namespace

const char* to_string(SchedulerState state) noexcept {
    switch(state) {
        case SchedulerState::Idle: return "idle";
        case SchedulerState::Scheduled: return "scheduled";
        case SchedulerState::Playing: return "playing";
        case SchedulerState::Stopped: return "stopped";
    }
    return "idle";
}

std::optional<ClipPlacement> compute_placement(const timeline::Clip& clip, Seconds playhead) {
    ClipPlacement p;
    p.start_delay = std::max(0.0, clip.start - playhead);
    p.buffer_offset = clip.in_point + std::max(0.0, playhead - clip.start);
    p.play_duration = std::min(clip.end - std::max(playhead, clip.start), clip.out_point - p.buffer_offset);
    if(p.play_duration <= MIN_PLAY_DURATION) return std::nullopt;
    return p;
}

GainEnvelope build_envelope(const timeline::Clip& clip, const timeline::Track& track, Seconds playhead,
                            Seconds now, const ClipPlacement& placement, const core::AudioEngineConfig& cfg) {
    GainEnvelope env(1.0f);
    const Seconds ctx_start = now + placement.start_delay;
    const Seconds ctx_stop = ctx_start + placement.play_duration;
    const Seconds fade = std::max(0.0, cfg.fade_ms) / 1000.0;
    auto ctx_of = [&](Seconds t) { return now + (t - playhead); };
    const auto roles = crossfade_roles(clip, track, playhead);

    // Already inside the outgoing window: ramp from the current progress to silence
    if(roles.outgoing) {
        auto w = timeline::transition_window(clip);
        if(w && playhead >= w->start) {
            double p = timeline::clamp_progress(timeline::crossfade_progress(clip, playhead));
            env.set_value_at(static_cast<float>(1.0 - p), ctx_start);
            env.linear_ramp_to(0.0f, std::min(ctx_of(w->end), ctx_stop));
            return env;
        }
    }

    if(roles.incoming_from) {
        const Seconds d = roles.incoming_from->transition->duration;
        double p = timeline::clamp_progress(timeline::crossfade_progress(*roles.incoming_from, playhead));
        env.set_value_at(static_cast<float>(p), ctx_start);
        env.linear_ramp_to(1.0f, ctx_start + d * (1.0 - p));
    } else {
        const Seconds into = std::max(0.0, playhead - clip.start);
        if(fade > 0.0 && into < fade) {
            env.set_value_at(static_cast<float>(into / fade), ctx_start);
            env.linear_ramp_to(1.0f, ctx_start + (fade - into));
        } else {
            env.set_value_at(1.0f, ctx_start);
        }
    }

    if(roles.outgoing) {
        auto w = timeline::transition_window(clip);
        env.linear_ramp_to(1.0f, ctx_of(w->start));
        env.linear_ramp_to(0.0f, std::min(ctx_of(w->end), ctx_stop));
    } else if(fade > 0.0) {
        if(placement.play_duration > fade) env.linear_ramp_to(1.0f, ctx_stop - fade);
        env.linear_ramp_to(0.0f, ctx_stop);
    }
    return env;
}

AudioScheduler::AudioScheduler(std::shared_ptr<AudioContext> context, std::shared_ptr<BufferCache> cache,
                               const core::AudioEngineConfig& cfg)
    : context_(std::move(context))
    , cache_(std::move(cache))
    , cfg_(cfg)
    , project_(std::make_shared<const timeline::ProjectState>()) {
    if(context_) context_->set_master_gain(cfg_.master_volume);
    if(cache_) {
        ready_listener_ = cache_->add_ready_listener([this](const std::string& url, AudioError err){
            on_buffer_ready(url, err);
        });
    }
}

AudioScheduler::~AudioScheduler() {
    if(cache_) cache_->remove_ready_listener(ready_listener_);
    shutdown();
}

void AudioScheduler::set_project(const timeline::ProjectState& project) {
    set_project(std::make_shared<const timeline::ProjectState>(project));
}

void AudioScheduler::set_project(std::shared_ptr<const timeline::ProjectState> project) {
    if(!project) return;
    std::scoped_lock lk(mutex_);
    project_ = std::move(project);
}

void AudioScheduler::reschedule(Seconds playhead, bool is_playing) {
    NLE_PROFILE_SCOPE("audio.reschedule");
    PassResult result;
    {
        std::scoped_lock lk(mutex_);
        if(shut_down_ || !context_) return;
        cancel_all_locked();
        scheduled_clips_.clear();
        awaited_urls_.clear();
        skipped_.clear();
        reported_.clear();
        is_playing_ = is_playing;
        ++passes_;
        anchor_playhead_ = std::max(0.0, playhead);

        if(!is_playing) {
            if(state_ != SchedulerState::Idle) state_ = SchedulerState::Stopped;
            return;
        }
        AudioError err = context_->resume();
        if(err != AudioError::None) {
            nle::log::error(std::string("AudioScheduler: context resume failed: ") + to_string(err));
            state_ = SchedulerState::Stopped;
            is_playing_ = false;
            return;
        }
        anchor_context_time_ = context_->current_time();
        result = schedule_locked(anchor_playhead_, anchor_playhead_ + cfg_.lookahead, false);
    }
    request_buffers(result.to_request);
}

void AudioScheduler::extend(Seconds playhead) {
    PassResult result;
    {
        std::scoped_lock lk(mutex_);
        if(shut_down_ || !context_ || !is_playing_) return;
        const Seconds clock = clock_playhead_locked();
        result = schedule_locked(clock, std::max(clock, playhead) + cfg_.lookahead, true);
    }
    request_buffers(result.to_request);
}

void AudioScheduler::stop_all() {
    std::scoped_lock lk(mutex_);
    if(!context_) return;
    cancel_all_locked();
    scheduled_clips_.clear();
    awaited_urls_.clear();
    reported_.clear();
    is_playing_ = false;
    if(state_ != SchedulerState::Idle) state_ = SchedulerState::Stopped;
}

void AudioScheduler::shutdown() {
    stop_all();
    std::scoped_lock lk(mutex_);
    if(shut_down_) return;
    shut_down_ = true;
    state_ = SchedulerState::Stopped;
    if(context_) {
        AudioError err = context_->close();
        if(err != AudioError::None) nle::log::warn(std::string("AudioScheduler: context close failed: ") + to_string(err));
    }
    nle::log::debug("AudioScheduler shut down after " + std::to_string(passes_) + " passes");
}

void AudioScheduler::set_master_volume(float volume) {
    std::scoped_lock lk(mutex_);
    cfg_.master_volume = std::max(0.0f, volume);
    if(context_) context_->set_master_gain(cfg_.master_volume);
}

float AudioScheduler::master_volume() const {
    std::scoped_lock lk(mutex_);
    return cfg_.master_volume;
}

SchedulerState AudioScheduler::state() const {
    std::scoped_lock lk(mutex_);
    return state_;
}

std::vector<ScheduledNode> AudioScheduler::active_nodes() const {
    std::scoped_lock lk(mutex_);
    if(!context_) return {};
    const Seconds now = context_->current_time();
    std::vector<ScheduledNode> out;
    for(const auto& n : nodes_) {
        if(n.context_start + n.play_duration > now) out.push_back(n);
    }
    return out;
}

std::vector<SkippedClip> AudioScheduler::last_skipped() const {
    std::scoped_lock lk(mutex_);
    return skipped_;
}

uint64_t AudioScheduler::pass_count() const {
    std::scoped_lock lk(mutex_);
    return passes_;
}

Seconds AudioScheduler::clock_playhead() const {
    std::scoped_lock lk(mutex_);
    return clock_playhead_locked();
}

Seconds AudioScheduler::clock_playhead_locked() const {
    if(!is_playing_ || !context_) return anchor_playhead_;
    return anchor_playhead_ + std::max(0.0, context_->current_time() - anchor_context_time_);
}

void AudioScheduler::cancel_all_locked() {
    for(const auto& n : nodes_) {
        AudioError err = context_->stop_source(n.node);
        // nodes that already finished on their own are no longer known to the context
        if(err != AudioError::None && err != AudioError::UnknownNode) {
            nle::log::warn("AudioScheduler: failed to stop node for " + n.clip_id + ": " + to_string(err));
        }
    }
    NLE_AUDIO_DEBUG_LOG("AudioScheduler cancelled " + std::to_string(nodes_.size()) + " nodes");
    nodes_.clear();
}

AudioScheduler::PassResult AudioScheduler::schedule_locked(Seconds playhead, Seconds horizon, bool extend_only) {
    PassResult result;
    const Seconds now = context_->current_time();
    const timeline::ProjectState& project = *project_;
    skipped_.clear();
    auto skip = [&](const timeline::Clip& c, std::string reason) {
        NLE_AUDIO_DEBUG_LOG("AudioScheduler skip " + c.id + ": " + reason);
        skipped_.push_back(SkippedClip{c.id, std::move(reason)});
    };
    // Per-frame extend passes revisit the same broken clips; warn once per full pass
    auto warn_once = [&](const timeline::Clip& c, const std::string& msg) {
        if(reported_.insert(c.id).second) nle::log::warn(msg);
    };

    for(const auto& track : project.tracks) {
        if(track.muted) continue;
        for(const auto& clip : track.clips) {
            if(extend_only && scheduled_clips_.count(clip.id)) continue;
            if(!clip.asset_id || clip.is_caption()) continue;

            const bool active = playhead >= clip.start && playhead < clip.end;
            const bool upcoming = clip.start > playhead && clip.start <= horizon;
            const timeline::Clip* from = timeline::incoming_transition_source(track, clip.id);
            const bool crossfade_target = from && inside_incoming_window(*from, playhead);
            if(!active && !upcoming && !crossfade_target) continue;

            const timeline::Asset* asset = timeline::find_asset(project, *clip.asset_id);
            if(!asset) {
                warn_once(clip, "AudioScheduler: clip " + clip.id + " references missing asset " + *clip.asset_id);
                skip(clip, "missing asset");
                continue;
            }
            if(!asset->has_audio()) {
                skip(clip, std::string("asset kind ") + timeline::to_string(asset->kind) + " has no audio");
                continue;
            }
            auto placement = compute_placement(clip, playhead);
            if(!placement) {
                skip(clip, "nothing left to play");
                continue;
            }

            auto cache_state = cache_ ? cache_->state(asset->url) : BufferCache::State::Failed;
            if(cache_state == BufferCache::State::Failed) {
                AudioError err = cache_ ? cache_->error(asset->url) : AudioError::Unsupported;
                warn_once(clip, "AudioScheduler: skipping " + clip.id + ", decode failed: " + to_string(err));
                skip(clip, std::string("decode failed: ") + to_string(err));
                continue;
            }
            if(cache_state != BufferCache::State::Ready) {
                if(awaited_urls_.insert(asset->url).second && cache_state == BufferCache::State::Missing) {
                    result.to_request.push_back(asset->url);
                }
                skip(clip, "buffer not ready");
                continue;
            }
            auto buffer = cache_->get(asset->url);
            if(!buffer) {
                skip(clip, "buffer not ready");
                continue;
            }
            // Source material shorter than the clip's source window
            placement->play_duration = std::min(placement->play_duration, buffer->duration() - placement->buffer_offset);
            if(placement->play_duration <= MIN_PLAY_DURATION) {
                skip(clip, "offset beyond decoded buffer");
                continue;
            }

            const auto roles = crossfade_roles(clip, track, playhead);
            SourceRequest req;
            req.buffer = buffer;
            req.when = now + placement->start_delay;
            req.offset = placement->buffer_offset;
            req.duration = placement->play_duration;
            req.envelope = build_envelope(clip, track, playhead, now, *placement, cfg_);
            req.clip_id = clip.id;

            NodeId id = 0;
            AudioError err = context_->start_source(std::move(req), id);
            if(err != AudioError::None) {
                warn_once(clip, "AudioScheduler: failed to start " + clip.id + ": " + to_string(err));
                skip(clip, std::string("start failed: ") + to_string(err));
                continue;
            }
            nodes_.push_back(ScheduledNode{id, clip.id, track.id, now + placement->start_delay,
                                           placement->buffer_offset, placement->play_duration,
                                           roles.incoming_from != nullptr, roles.outgoing});
            scheduled_clips_.insert(clip.id);
        }
    }

    bool sounding = std::any_of(nodes_.begin(), nodes_.end(), [&](const ScheduledNode& n){
        return n.context_start <= now + MIN_PLAY_DURATION;
    });
    if(sounding) state_ = SchedulerState::Playing;
    else if(!extend_only || state_ != SchedulerState::Playing) state_ = SchedulerState::Scheduled;

    NLE_AUDIO_DEBUG_LOG("AudioScheduler pass at " + std::to_string(playhead) + ": " + std::to_string(nodes_.size())
                        + " nodes, " + std::to_string(skipped_.size()) + " skipped");
    return result;
}

void AudioScheduler::request_buffers(const std::vector<std::string>& urls) {
    if(!cache_) return;
    for(const auto& url : urls) {
        // may complete inline and call back into on_buffer_ready
        cache_->request(url);
    }
}

// A failed decode reruns the pass too, so the skip gets recorded
void AudioScheduler::on_buffer_ready(const std::string& url, AudioError) {
    Seconds playhead = 0.0;
    {
        std::scoped_lock lk(mutex_);
        if(shut_down_ || !is_playing_ || !awaited_urls_.count(url)) return;
        awaited_urls_.erase(url);
        playhead = clock_playhead_locked();
    }
    extend(playhead);
}

} // namespace nle::audio
