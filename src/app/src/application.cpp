#include "app/application.hpp"
#include "audio/ffmpeg_buffer_decoder.hpp"
#include "audio/offline_audio_context.hpp"
#include "core/job_system.hpp"
#include "core/log.hpp"
#include "core/profiling.hpp"
#include "persistence/project_serializer.hpp"

namespace nle::app {

Application::Application() : Application(Options{}) {}

Application::Application(Options options)
    : options_(std::move(options))
{
    const auto& acfg = options_.audio;
    context_ = options_.context ? options_.context
                                : std::make_shared<audio::OfflineAudioContext>(acfg.sample_rate, acfg.channels);
    auto decoder = options_.decoder ? options_.decoder
                                    : std::make_shared<audio::FFmpegBufferDecoder>(acfg.sample_rate, acfg.channels);
    if(!options_.executor && !core::JobSystem::instance().running()) {
        core::JobSystem::instance().start(acfg.decode_threads);
    }
    cache_ = std::make_shared<audio::BufferCache>(std::move(decoder), options_.executor);
    scheduler_ = std::make_unique<audio::AudioScheduler>(context_, cache_, acfg);
    editor_ = std::make_unique<commands::Editor>(options_.editor);

    setup_connections();
    scheduler_->set_project(editor_->project());
    nle::log::info("Application started");
}

Application::~Application() {
    nle::log::info("Application shutting down");
    if(editor_) {
        editor_->transport().remove_listener(transport_listener_);
        editor_->remove_project_listener(project_listener_);
    }
    if(scheduler_) scheduler_->shutdown();
    if(!options_.profiling_path.empty()) {
        if(!prof::Accumulator::instance().write_json(options_.profiling_path)) {
            nle::log::warn("Failed to write profiling report to " + options_.profiling_path);
        }
        prof::Accumulator::instance().log_summary();
    }
}

void Application::setup_connections() {
    transport_listener_ = editor_->transport().add_listener([this](const playback::TransportEvent& e){
        on_transport(e);
    });
    project_listener_ = editor_->add_project_listener([this](const timeline::ProjectState& p){
        on_project_modified(p);
    });
}

void Application::on_transport(const playback::TransportEvent& event) {
    switch(event.reason) {
        case playback::TransportReason::Seek:
        case playback::TransportReason::Play:
        case playback::TransportReason::Pause:
            scheduler_->reschedule(event.playhead, event.is_playing);
            break;
        case playback::TransportReason::Advance:
            scheduler_->extend(event.playhead);
            break;
        case playback::TransportReason::Zoom:
            break;
    }
}

void Application::on_project_modified(const timeline::ProjectState& project) {
    scheduler_->set_project(project);
    if(!loading_) project_modified_ = true;
    if(editor_->transport().is_playing()) {
        scheduler_->reschedule(editor_->transport().playhead(), true);
    }
}

void Application::tick(Seconds dt) {
    NLE_PROFILE_SCOPE("app.tick");
    editor_->transport().advance(dt);
}

bool Application::new_project() {
    close_project();
    loading_ = true;
    editor_->load_project(timeline::make_default_session().project, 0.0, options_.editor.default_zoom);
    loading_ = false;
    current_project_path_.clear();
    project_modified_ = false;
    nle::log::info("New project created");
    return true;
}

bool Application::open_project(const std::string& path) {
    nle::log::info("Open project requested: " + path);
    if(path.empty()) {
        nle::log::warn("Open project called with empty path");
        return false;
    }
    persistence::ProjectDocument doc;
    auto res = persistence::load_project_json(path, doc);
    if(!res.success) {
        // Current session is left untouched
        nle::log::error("Failed to load project: " + res.error);
        return false;
    }
    loading_ = true;
    editor_->load_project(std::move(doc.project), doc.playhead, doc.zoom);
    loading_ = false;
    current_project_path_ = path;
    project_modified_ = false;
    nle::log::info("Project loaded successfully");
    return true;
}

bool Application::save_project(const std::string& path) {
    std::string save_path = path.empty() ? current_project_path_ : path;
    if(save_path.empty()) {
        nle::log::warn("No save path specified");
        return false;
    }
    persistence::ProjectDocument doc;
    doc.project = editor_->export_project();
    doc.playhead = editor_->transport().playhead();
    doc.zoom = editor_->transport().zoom();
    auto res = persistence::save_project_json(doc, save_path);
    if(!res.success) {
        nle::log::error("Failed to save project: " + res.error);
        return false;
    }
    current_project_path_ = save_path;
    project_modified_ = false;
    nle::log::info("Project saved successfully");
    return true;
}

void Application::close_project() {
    editor_->pause();
    scheduler_->stop_all();
    current_project_path_.clear();
    project_modified_ = false;
}

} // namespace nle::app
