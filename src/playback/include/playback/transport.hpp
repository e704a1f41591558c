#pragma once
#include "timeline/session.hpp"
#include "core/config.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

namespace nle::playback {

enum class TransportReason { Seek, Play, Pause, Advance, Zoom };

const char* to_string(TransportReason reason) noexcept;

struct TransportEvent {
    Seconds playhead = 0.0;
    bool is_playing = false;
    double zoom = 100.0;
    TransportReason reason = TransportReason::Seek;
};

/**
 * @brief Playhead, zoom and play state shared by the UI and the audio engine
 *
 * The render loop calls advance() once per frame while playing. Every change is
 * reported to the registered listeners after the internal lock is released.
 */
class TransportClock {
public:
    using ChangeCallback = std::function<void(const TransportEvent&)>;
    using CallbackId = uint64_t;

    explicit TransportClock(const core::EditorConfig& cfg = {});

    timeline::TransportState state() const;
    Seconds playhead() const;
    double zoom() const;
    bool is_playing() const;

    // Timeline end used by advance(); 0 disables the stop-at-end behaviour
    void set_duration(Seconds duration);
    Seconds duration() const;

    void play();
    void pause();
    void toggle();
    // Clamped to >= 0
    void seek(Seconds t);
    void nudge(int steps);
    void set_zoom(double zoom);
    void zoom_in();
    void zoom_out();

    // Moves the playhead by dt while playing; pauses at the end when a duration is set
    void advance(Seconds dt);

    CallbackId add_listener(ChangeCallback cb);
    bool remove_listener(CallbackId id);

private:
    void notify(TransportReason reason);

    core::EditorConfig cfg_;
    mutable std::mutex mutex_;
    timeline::TransportState state_;
    Seconds duration_ = 0.0;

    struct ListenerEntry { CallbackId id; ChangeCallback fn; };
    std::vector<ListenerEntry> listeners_;
    mutable std::mutex listeners_mutex_;
    std::atomic<CallbackId> next_callback_id_{1};
};

} // namespace nle::playback
