#include "audio/buffer_cache.hpp"
#include "core/job_system.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <exception>

namespace nle::audio {

const char* to_string(BufferCache::State state) noexcept {
    switch(state) {
        case BufferCache::State::Missing: return "missing";
        case BufferCache::State::Pending: return "pending";
        case BufferCache::State::Ready: return "ready";
        case BufferCache::State::Failed: return "failed";
    }
    return "missing";
}

BufferCache::BufferCache(std::shared_ptr<BufferDecoder> decoder, Executor executor)
    : decoder_(std::move(decoder))
    , executor_(std::move(executor))
    , shared_(std::make_shared<Shared>()) {
    if(!executor_) {
        executor_ = [](std::function<void()> job) { core::JobSystem::instance().enqueue(std::move(job)); };
    }
}

BufferCache::~BufferCache() {
    // Wait out any listener invocation, then detach in-flight jobs from us
    std::scoped_lock cb_lk(shared_->callback_mutex);
    std::scoped_lock lk(shared_->mutex);
    shared_->alive = false;
    shared_->listeners.clear();
}

std::shared_ptr<const AudioBuffer> BufferCache::get(const std::string& url) const {
    std::scoped_lock lk(shared_->mutex);
    auto it = shared_->entries.find(url);
    if(it == shared_->entries.end() || it->second.state != State::Ready) return nullptr;
    return it->second.buffer;
}

BufferCache::State BufferCache::state(const std::string& url) const {
    std::scoped_lock lk(shared_->mutex);
    auto it = shared_->entries.find(url);
    return it == shared_->entries.end() ? State::Missing : it->second.state;
}

AudioError BufferCache::error(const std::string& url) const {
    std::scoped_lock lk(shared_->mutex);
    auto it = shared_->entries.find(url);
    return it == shared_->entries.end() ? AudioError::None : it->second.error;
}

BufferCache::State BufferCache::request(const std::string& url) {
    {
        std::scoped_lock lk(shared_->mutex);
        auto& entry = shared_->entries[url];
        if(entry.state != State::Missing) return entry.state;
        entry.state = State::Pending;
    }
    if(!decoder_) {
        complete(shared_, url, DecodeResult{AudioError::Unsupported, nullptr, "no decoder configured"});
        return state(url);
    }

    std::weak_ptr<Shared> weak = shared_;
    auto decoder = decoder_;
    executor_([weak, decoder, url]() {
        DecodeResult result;
        try {
            result = decoder->decode(url);
        } catch(const std::exception& e) {
            result = DecodeResult{AudioError::DecodeFailed, nullptr, e.what()};
        }
        if(auto shared = weak.lock()) complete(shared, url, std::move(result));
    });
    return state(url);
}

void BufferCache::complete(const std::shared_ptr<Shared>& shared, const std::string& url, DecodeResult result) {
    std::scoped_lock cb_lk(shared->callback_mutex);
    AudioError err = AudioError::None;
    std::vector<ListenerEntry> listeners;
    {
        std::scoped_lock lk(shared->mutex);
        if(!shared->alive) return;
        auto& entry = shared->entries[url];
        if(result.ok()) {
            entry.state = State::Ready;
            entry.buffer = std::move(result.buffer);
            entry.error = AudioError::None;
        } else {
            err = result.error == AudioError::None ? AudioError::DecodeFailed : result.error;
            entry.state = State::Failed;
            entry.buffer.reset();
            entry.error = err;
        }
        listeners = shared->listeners;
    }
    if(err != AudioError::None) {
        nle::log::warn("Audio decode failed for " + url + ": " + to_string(err)
                       + (result.message.empty() ? std::string() : " (" + result.message + ")"));
    } else {
        nle::log::debug("Audio buffer ready: " + url);
    }
    for(auto& l : listeners) l.fn(url, err);
}

BufferCache::CallbackId BufferCache::add_ready_listener(ReadyCallback cb) {
    if(!cb) return 0;
    std::scoped_lock lk(shared_->mutex);
    CallbackId id = shared_->next_id++;
    shared_->listeners.push_back(ListenerEntry{id, std::move(cb)});
    return id;
}

bool BufferCache::remove_ready_listener(CallbackId id) {
    // Blocks while a listener is running on another thread
    std::scoped_lock cb_lk(shared_->callback_mutex);
    std::scoped_lock lk(shared_->mutex);
    auto& ls = shared_->listeners;
    auto it = std::find_if(ls.begin(), ls.end(), [&](const ListenerEntry& e){ return e.id == id; });
    if(it == ls.end()) return false;
    ls.erase(it);
    return true;
}

size_t BufferCache::size() const {
    std::scoped_lock lk(shared_->mutex);
    return static_cast<size_t>(std::count_if(shared_->entries.begin(), shared_->entries.end(),
        [](const auto& kv){ return kv.second.state == State::Ready; }));
}

size_t BufferCache::pending_count() const {
    std::scoped_lock lk(shared_->mutex);
    return static_cast<size_t>(std::count_if(shared_->entries.begin(), shared_->entries.end(),
        [](const auto& kv){ return kv.second.state == State::Pending; }));
}

void BufferCache::clear() {
    std::scoped_lock lk(shared_->mutex);
    for(auto it = shared_->entries.begin(); it != shared_->entries.end();) {
        if(it->second.state == State::Pending) ++it;
        else it = shared_->entries.erase(it);
    }
}

} // namespace nle::audio
