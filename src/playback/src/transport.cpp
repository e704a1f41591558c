#include "playback/transport.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cmath>

namespace nle::playback {

const char* to_string(TransportReason reason) noexcept {
    switch(reason) {
        case TransportReason::Seek: return "seek";
        case TransportReason::Play: return "play";
        case TransportReason::Pause: return "pause";
        case TransportReason::Advance: return "advance";
        case TransportReason::Zoom: return "zoom";
    }
    return "seek";
}

TransportClock::TransportClock(const core::EditorConfig& cfg) : cfg_(cfg) {
    state_.zoom = std::clamp(cfg_.default_zoom, cfg_.min_zoom, cfg_.max_zoom);
}

timeline::TransportState TransportClock::state() const {
    std::scoped_lock lk(mutex_);
    return state_;
}

Seconds TransportClock::playhead() const { std::scoped_lock lk(mutex_); return state_.playhead; }
double TransportClock::zoom() const { std::scoped_lock lk(mutex_); return state_.zoom; }
bool TransportClock::is_playing() const { std::scoped_lock lk(mutex_); return state_.is_playing; }

void TransportClock::set_duration(Seconds duration) {
    std::scoped_lock lk(mutex_);
    duration_ = std::max(0.0, duration);
}

Seconds TransportClock::duration() const { std::scoped_lock lk(mutex_); return duration_; }

void TransportClock::play() {
    {
        std::scoped_lock lk(mutex_);
        if(state_.is_playing) return;
        // restart from the top when parked at the end
        if(duration_ > 0.0 && state_.playhead >= duration_) state_.playhead = 0.0;
        state_.is_playing = true;
    }
    notify(TransportReason::Play);
}

void TransportClock::pause() {
    {
        std::scoped_lock lk(mutex_);
        if(!state_.is_playing) return;
        state_.is_playing = false;
    }
    notify(TransportReason::Pause);
}

void TransportClock::toggle() {
    if(is_playing()) pause(); else play();
}

void TransportClock::seek(Seconds t) {
    if(!std::isfinite(t)) {
        nle::log::warn("TransportClock::seek ignoring non-finite position");
        return;
    }
    {
        std::scoped_lock lk(mutex_);
        state_.playhead = std::max(0.0, t);
    }
    notify(TransportReason::Seek);
}

void TransportClock::nudge(int steps) {
    seek(playhead() + cfg_.nudge_step * steps);
}

void TransportClock::set_zoom(double zoom) {
    if(!std::isfinite(zoom)) return;
    {
        std::scoped_lock lk(mutex_);
        double z = std::clamp(zoom, cfg_.min_zoom, cfg_.max_zoom);
        if(z == state_.zoom) return;
        state_.zoom = z;
    }
    notify(TransportReason::Zoom);
}

void TransportClock::zoom_in() { set_zoom(zoom() * cfg_.zoom_step); }
void TransportClock::zoom_out() { set_zoom(zoom() * (2.0 - cfg_.zoom_step)); }

void TransportClock::advance(Seconds dt) {
    bool reached_end = false;
    {
        std::scoped_lock lk(mutex_);
        if(!state_.is_playing || dt <= 0.0) return;
        state_.playhead += dt;
        if(duration_ > 0.0 && state_.playhead >= duration_) {
            state_.playhead = duration_;
            state_.is_playing = false;
            reached_end = true;
        }
    }
    notify(reached_end ? TransportReason::Pause : TransportReason::Advance);
}

TransportClock::CallbackId TransportClock::add_listener(ChangeCallback cb) {
    if(!cb) return 0;
    std::scoped_lock lk(listeners_mutex_);
    CallbackId id = next_callback_id_++;
    listeners_.push_back(ListenerEntry{id, std::move(cb)});
    return id;
}

bool TransportClock::remove_listener(CallbackId id) {
    std::scoped_lock lk(listeners_mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(), [&](const ListenerEntry& e){ return e.id == id; });
    if(it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

void TransportClock::notify(TransportReason reason) {
    TransportEvent ev;
    {
        std::scoped_lock lk(mutex_);
        ev.playhead = state_.playhead;
        ev.is_playing = state_.is_playing;
        ev.zoom = state_.zoom;
    }
    ev.reason = reason;
    std::vector<ListenerEntry> copy;
    {
        std::scoped_lock lk(listeners_mutex_);
        copy = listeners_;
    }
    for(auto& e : copy) e.fn(ev);
}

} // namespace nle::playback
