#pragma once
#include "commands/editor.hpp"
#include "audio/audio_context.hpp"
#include "audio/buffer_cache.hpp"
#include "audio/scheduler.hpp"
#include "core/config.hpp"
#include <memory>
#include <string>

namespace nle::app {

/**
 * @brief One editor session wired to the audio engine
 *
 * Owns the Editor, the decoded-buffer cache, the audio context and the scheduler.
 * Transport seeks, play and pause trigger a full reschedule; per-frame advances
 * only top up clips entering the look-ahead window; committed edits reschedule
 * while playing.
 */
class Application {
public:
    struct Options {
        core::EditorConfig editor;
        core::AudioEngineConfig audio;
        // Defaults: FFmpegBufferDecoder and OfflineAudioContext at the configured format
        std::shared_ptr<audio::BufferDecoder> decoder;
        std::shared_ptr<audio::AudioContext> context;
        // Defaults to the shared JobSystem
        audio::BufferCache::Executor executor;
        // Profiling summary written on shutdown when non-empty
        std::string profiling_path;
    };

    Application();
    explicit Application(Options options);
    ~Application();
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Project management
    bool new_project();
    bool open_project(const std::string& path);
    bool save_project(const std::string& path = "");
    void close_project();

    const std::string& project_path() const { return current_project_path_; }
    bool is_modified() const { return project_modified_; }

    // Render-loop step: advances the transport by dt seconds
    void tick(Seconds dt);

    commands::Editor& editor() { return *editor_; }
    const commands::Editor& editor() const { return *editor_; }
    audio::AudioScheduler& scheduler() { return *scheduler_; }
    audio::BufferCache& buffers() { return *cache_; }
    audio::AudioContext& audio_context() { return *context_; }

private:
    void setup_connections();
    void on_transport(const playback::TransportEvent& event);
    void on_project_modified(const timeline::ProjectState& project);

    Options options_;
    std::shared_ptr<audio::AudioContext> context_;
    std::shared_ptr<audio::BufferCache> cache_;
    std::unique_ptr<audio::AudioScheduler> scheduler_;
    std::unique_ptr<commands::Editor> editor_;
    playback::TransportClock::CallbackId transport_listener_ = 0;
    commands::Editor::ListenerId project_listener_ = 0;

    std::string current_project_path_;
    bool project_modified_ = false;
    bool loading_ = false;
};

} // namespace nle::app
