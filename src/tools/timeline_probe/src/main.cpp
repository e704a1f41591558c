#include "audio/buffer_cache.hpp"
#include "audio/buffer_decoder.hpp"
#include "audio/ffmpeg_buffer_decoder.hpp"
#include "audio/offline_audio_context.hpp"
#include "audio/scheduler.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "core/time.hpp"
#include "persistence/json.hpp"
#include "persistence/project_serializer.hpp"
#include "timeline/model.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <map>

namespace {

using namespace nle;
using persistence::json::Value;

void usage() {
    std::cout << "Usage: nle_timeline_probe [--json] [--synthetic] [--audio-config <file>] <project.json> [--at <seconds>]\n";
}

// Stand-in tones for every audio asset when real decoding is unavailable
std::shared_ptr<audio::BufferDecoder> make_synthetic_decoder(const timeline::ProjectState& project,
                                                             const core::AudioEngineConfig& cfg) {
    auto decoder = std::make_shared<audio::MemoryBufferDecoder>();
    std::map<std::string, Seconds> durations;
    for(const auto& [id, asset] : project.assets) {
        if(asset.has_audio()) durations[asset.url] = asset.duration.value_or(10.0);
    }
    decoder->set_fallback([durations, cfg](const std::string& url) {
        auto it = durations.find(url);
        if(it == durations.end()) return audio::DecodeResult{audio::AudioError::NotFound, nullptr, "unknown url"};
        auto buffer = std::make_shared<audio::AudioBuffer>(
            audio::AudioBuffer::sine(it->second, 440.0, 0.25f, cfg.sample_rate, cfg.channels));
        return audio::DecodeResult{audio::AudioError::None, std::move(buffer), {}};
    });
    return decoder;
}

float peak_of(const std::vector<float>& samples) {
    float peak = 0.0f;
    for(float s : samples) peak = std::max(peak, std::fabs(s));
    return peak;
}

} // namespace

int main(int argc, char** argv) {
    nle::log::info("nle_timeline_probe starting.");

    bool json = false;
    bool synthetic = false;
    std::string path;
    std::string audio_config_path;
    Seconds at = 0.0;
    for(int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if(a == "--json") { json = true; continue; }
        if(a == "--synthetic") { synthetic = true; continue; }
        if(a == "--audio-config") {
            if(i + 1 >= argc) { usage(); return 1; }
            audio_config_path = argv[++i];
            continue;
        }
        if(a == "--at") {
            if(i + 1 >= argc) { usage(); return 1; }
            char* end = nullptr;
            at = std::strtod(argv[++i], &end);
            if(!end || *end != '\0' || !std::isfinite(at) || at < 0.0) {
                std::cerr << "Invalid --at value: " << argv[i] << std::endl;
                return 1;
            }
            continue;
        }
        path = a; // last non-flag wins
    }
    if(path.empty()) { usage(); return 1; }

    persistence::ProjectDocument doc;
    auto loaded = persistence::load_project_json(path, doc);
    if(!loaded.success) {
        nle::log::error("Load failed: " + loaded.error);
        return 2;
    }
    const timeline::ProjectState& project = doc.project;
    auto report = timeline::validate_project(project);

    core::AudioEngineConfig cfg;
    if(!audio_config_path.empty()) {
        auto cfg_result = core::load_audio_config(audio_config_path, cfg);
        if(!cfg_result.success) {
            nle::log::error("Audio config: " + cfg_result.error);
            return 1;
        }
    }
#ifndef NLE_ENABLE_FFMPEG
    synthetic = true;
#endif
    std::shared_ptr<audio::BufferDecoder> decoder;
    if(synthetic) decoder = make_synthetic_decoder(project, cfg);
    else decoder = std::make_shared<audio::FFmpegBufferDecoder>(cfg.sample_rate, cfg.channels);

    auto context = std::make_shared<audio::OfflineAudioContext>(cfg.sample_rate, cfg.channels);
    auto cache = std::make_shared<audio::BufferCache>(decoder, [](std::function<void()> job){ job(); });
    audio::AudioScheduler scheduler(context, cache, cfg);
    scheduler.set_project(project);
    // First pass requests buffers; decodes complete inline and top up the schedule
    scheduler.reschedule(at, true);
    auto nodes = scheduler.active_nodes();
    auto skipped = scheduler.last_skipped();
    auto block = context->render(static_cast<size_t>(cfg.sample_rate / 10));
    float peak = peak_of(block);
    scheduler.shutdown();

    if(json) {
        Value root = Value::object();
        root.set("file", Value::string(path));
        root.set("version", Value::string(doc.version));
        root.set("aspectRatio", Value::string(project.aspect_ratio));
        root.set("duration", Value::number(timeline::timeline_duration(project.tracks)));
        root.set("valid", Value::boolean(report.ok));
        Value problems = Value::array();
        for(const auto& p : report.problems) problems.push(Value::string(p));
        root.set("problems", std::move(problems));
        Value tracks = Value::array();
        for(const auto& t : project.tracks) {
            Value tv = Value::object();
            tv.set("id", Value::string(t.id));
            tv.set("type", Value::string(timeline::to_string(t.kind)));
            tv.set("muted", Value::boolean(t.muted));
            tv.set("locked", Value::boolean(t.locked));
            Value clips = Value::array();
            for(const auto& c : t.clips) {
                Value cv = Value::object();
                cv.set("id", Value::string(c.id));
                cv.set("start", Value::number(c.start));
                cv.set("end", Value::number(c.end));
                cv.set("inPoint", Value::number(c.in_point));
                cv.set("outPoint", Value::number(c.out_point));
                if(c.transition) cv.set("transitionTo", Value::string(c.transition->to_clip_id));
                clips.push(std::move(cv));
            }
            tv.set("clips", std::move(clips));
            tracks.push(std::move(tv));
        }
        root.set("tracks", std::move(tracks));
        Value schedule = Value::object();
        schedule.set("playhead", Value::number(at));
        schedule.set("state", Value::string(audio::to_string(scheduler.state())));
        Value nv = Value::array();
        for(const auto& n : nodes) {
            Value o = Value::object();
            o.set("clipId", Value::string(n.clip_id));
            o.set("trackId", Value::string(n.track_id));
            o.set("startDelay", Value::number(n.context_start));
            o.set("bufferOffset", Value::number(n.buffer_offset));
            o.set("playDuration", Value::number(n.play_duration));
            o.set("crossfadeIn", Value::boolean(n.crossfade_in));
            o.set("crossfadeOut", Value::boolean(n.crossfade_out));
            nv.push(std::move(o));
        }
        schedule.set("nodes", std::move(nv));
        Value sv = Value::array();
        for(const auto& s : skipped) {
            Value o = Value::object();
            o.set("clipId", Value::string(s.clip_id));
            o.set("reason", Value::string(s.reason));
            sv.push(std::move(o));
        }
        schedule.set("skipped", std::move(sv));
        schedule.set("peak", Value::number(peak));
        root.set("schedule", std::move(schedule));
        std::cout << persistence::json::write(root, 2) << std::endl;
    } else {
        std::cout << "File: " << path << " (version " << doc.version << ")\n";
        std::cout << "Aspect ratio: " << project.aspect_ratio << "\n";
        std::cout << "Duration: " << format_time(timeline::timeline_duration(project.tracks)) << "\n";
        std::cout << "Assets: " << project.assets.size() << "\n";
        for(const auto& t : project.tracks) {
            std::cout << "  Track " << t.id << " [" << timeline::to_string(t.kind) << "]"
                      << (t.muted ? " muted" : "") << (t.locked ? " locked" : "") << "\n";
            for(const auto& c : t.clips) {
                std::cout << "    " << c.id << " " << format_timecode(c.start) << " - " << format_timecode(c.end)
                          << " src[" << c.in_point << ", " << c.out_point << "]";
                if(c.caption) std::cout << " caption \"" << c.caption->text << "\"";
                if(c.transition) std::cout << " -> " << c.transition->to_clip_id << " (" << c.transition->duration << "s)";
                std::cout << "\n";
            }
        }
        if(report.ok) std::cout << "Invariants: ok\n";
        for(const auto& p : report.problems) std::cout << "Invariant problem: " << p << "\n";

        std::cout << "Audio schedule at " << format_timecode(at) << " ("
                  << audio::to_string(scheduler.state()) << "):\n";
        for(const auto& n : nodes) {
            std::cout << "  " << n.clip_id << " delay=" << n.context_start << " offset=" << n.buffer_offset
                      << " duration=" << n.play_duration
                      << (n.crossfade_in ? " xfade-in" : "") << (n.crossfade_out ? " xfade-out" : "") << "\n";
        }
        for(const auto& s : skipped) std::cout << "  skipped " << s.clip_id << ": " << s.reason << "\n";
        std::cout << "Peak over first 100 ms: " << peak << "\n";
    }

    nle::log::info("Exiting timeline_probe.");
    return report.ok ? 0 : 3;
}
