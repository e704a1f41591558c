#pragma once

#include "audio/buffer_decoder.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace nle::audio {

/**
 * @brief Decoded buffers keyed by asset URL
 *
 * Each URL is decoded at most once: successes and failures are both cached.
 * Decoding runs on the executor (the shared JobSystem by default); ready
 * listeners are called from that thread when a decode settles.
 */
class BufferCache {
public:
    enum class State { Missing, Pending, Ready, Failed };
    using Executor = std::function<void(std::function<void()>)>;
    using ReadyCallback = std::function<void(const std::string& url, AudioError error)>;
    using CallbackId = uint64_t;

    explicit BufferCache(std::shared_ptr<BufferDecoder> decoder, Executor executor = {});
    ~BufferCache();
    BufferCache(const BufferCache&) = delete;
    BufferCache& operator=(const BufferCache&) = delete;

    // Ready buffer or nullptr
    std::shared_ptr<const AudioBuffer> get(const std::string& url) const;
    State state(const std::string& url) const;
    AudioError error(const std::string& url) const;

    // Starts a decode for a Missing URL; returns the state after the call
    State request(const std::string& url);

    CallbackId add_ready_listener(ReadyCallback cb);
    bool remove_ready_listener(CallbackId id);

    size_t size() const;
    size_t pending_count() const;
    // Forgets settled entries (failed URLs may be retried afterwards)
    void clear();

private:
    struct Entry {
        State state = State::Missing;
        std::shared_ptr<const AudioBuffer> buffer;
        AudioError error = AudioError::None;
    };
    struct ListenerEntry { CallbackId id; ReadyCallback fn; };

    // Outlives the cache while decode jobs are in flight
    struct Shared {
        std::mutex mutex;
        std::map<std::string, Entry> entries;
        std::recursive_mutex callback_mutex;
        std::vector<ListenerEntry> listeners;
        CallbackId next_id = 1;
        bool alive = true;
    };

    static void complete(const std::shared_ptr<Shared>& shared, const std::string& url, DecodeResult result);

    std::shared_ptr<BufferDecoder> decoder_;
    Executor executor_;
    std::shared_ptr<Shared> shared_;
};

const char* to_string(BufferCache::State state) noexcept;

} // namespace nle::audio
