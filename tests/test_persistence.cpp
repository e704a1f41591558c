#include <catch2/catch_test_macros.hpp>
#include "persistence/project_serializer.hpp"
#include "persistence/json.hpp"
#include "timeline/edit_ops.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>

using namespace nle::persistence;
using namespace nle::timeline;
using nle::test::approx;
using nle::test::make_clip;
using nle::test::clip_in;

static std::string write_temp(const std::string& name, const std::string& content){
    auto path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream ofs(path, std::ios::binary); ofs<<content; return path; }

namespace {

ProjectState sample_project() {
    ProjectState p = nle::test::base_project();
    p.aspect_ratio = "9:16";
    Asset music = nle::test::make_asset("music", AssetKind::Audio, 42.5);
    music.metadata.waveform = {0.0f, 0.25f, 1.0f};
    p.assets["music"] = music;
    Asset still = nle::test::make_asset("logo", AssetKind::Image, std::nullopt, "file:///tmp/logo.png");
    still.metadata.width = 640;
    still.metadata.height = 480;
    still.metadata.aspect_ratio = "4:3";
    still.metadata.thumbnails = {"data:image/png;base64,AAAA"};
    still.metadata.extra["codec"] = "png";
    p.assets["logo"] = still;

    p = insert_clip(p, make_clip("a", "track-video-1", 0, 5, 1.5));
    p = insert_clip(p, make_clip("b", "track-video-1", 5, 8, 10.0));
    p = set_transition(p, "a", "b", 0.75);
    p = insert_clip(p, make_clip("m", "track-audio-1", 0, 12.25, 0.0, std::nullopt, std::string("music")));

    Clip cap = make_clip("cap", "track-overlay-1", 1, 4, 0.0, std::nullopt, std::nullopt);
    cap.caption = Caption{};
    cap.caption->text = "Hello \"world\"\nline two";
    cap.caption->align = TextAlign::Left;
    cap.caption->font_size = 36.0;
    cap.caption->fade_in_ms = 0.0;
    p = insert_clip(p, cap);
    p = set_track_muted(p, "track-audio-1", true);
    p = set_track_locked(p, "track-overlay-1", true);
    return p;
}

} // namespace

TEST_CASE("project round trip preserves captions and transitions", "[persistence]") {
    ProjectDocument doc;
    doc.project = sample_project();
    doc.playhead = 3.5;
    doc.zoom = 150.0;
    doc.saved_at = 1700000000123;

    auto text = serialize_project(doc);
    ProjectDocument back;
    auto r = parse_project(text, back);
    REQUIRE(r.success);
    REQUIRE(r.error.empty());
    REQUIRE(back.project == doc.project);
    REQUIRE(back.version == "1.0.0");
    REQUIRE(back.playhead == 3.5);
    REQUIRE(back.zoom == 150.0);
    REQUIRE(back.saved_at == 1700000000123);

    const auto& a = clip_in(back.project, "a");
    REQUIRE(a.transition);
    REQUIRE(a.transition->to_clip_id == "b");
    REQUIRE(approx(a.transition->duration, 0.75));
    const auto& cap = *clip_in(back.project, "cap").caption;
    REQUIRE(cap.text == "Hello \"world\"\nline two");
    REQUIRE(cap.align == TextAlign::Left);
}

TEST_CASE("serialized projects use the documented field names", "[persistence]") {
    ProjectDocument doc;
    doc.project = sample_project();
    auto text = serialize_project(doc);
    for(const char* key : {"\"version\": \"1.0.0\"", "\"assetId\"", "\"trackId\"", "\"inPoint\"", "\"outPoint\"",
                           "\"transitionType\": \"crossfade\"", "\"transitionToClipId\": \"b\"", "\"type\": \"caption\"",
                           "\"fontSize\"", "\"fadeInMs\"", "\"bg\"", "\"aspectRatio\": \"9:16\"", "\"muted\": true",
                           "\"locked\": true", "\"savedAt\"", "\"createdAt\""}) {
        INFO(key);
        REQUIRE(text.find(key) != std::string::npos);
    }
    REQUIRE(text.find("\"playhead\"") == std::string::npos);
}

TEST_CASE("missing or unsupported versions are rejected", "[persistence]") {
    ProjectDocument out;
    out.project.aspect_ratio = "untouched";

    auto r = parse_project(R"({"assets": [], "tracks": [], "aspectRatio": "16:9"})", out);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error == "Invalid project file: missing version");

    r = parse_project(R"({"version": "2.0.0", "assets": [], "tracks": [], "aspectRatio": "16:9"})", out);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error == "Unsupported project version 2.0.0");
    REQUIRE(out.project.aspect_ratio == "untouched");

    r = parse_project(R"({"version": "1.4.2", "assets": [], "tracks": [], "aspectRatio": "1:1"})", out);
    REQUIRE(r.success);
    REQUIRE(out.version == "1.4.2");
    REQUIRE(out.project.aspect_ratio == "1:1");
}

TEST_CASE("missing required fields are reported", "[persistence]") {
    ProjectDocument out;
    auto r = parse_project(R"({"version": "1.0.0", "tracks": [], "aspectRatio": "16:9"})", out);
    REQUIRE(r.error == "Invalid project file: missing or invalid assets");
    r = parse_project(R"({"version": "1.0.0", "assets": [], "tracks": {}, "aspectRatio": "16:9"})", out);
    REQUIRE(r.error == "Invalid project file: missing or invalid tracks");
    r = parse_project(R"({"version": "1.0.0", "assets": [], "tracks": []})", out);
    REQUIRE(r.error == "Invalid project file: missing aspectRatio");

    r = parse_project(R"({"version": "1.0.0", "assets": [{"id": "x", "type": "audio"}], "tracks": [], "aspectRatio": "16:9"})", out);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error == "assets[0]: missing url");

    r = parse_project(R"({"version": "1.0.0", "assets": [], "tracks": [{"id": "t", "type": "subtitle"}], "aspectRatio": "16:9"})", out);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error.find("unknown track type") != std::string::npos);
}

TEST_CASE("malformed JSON is reported, not thrown", "[persistence]") {
    ProjectDocument out;
    auto r = parse_project("{\"version\": ", out);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error.rfind("Invalid JSON format: ", 0) == 0);
    r = parse_project("[]", out);
    REQUIRE_FALSE(r.success);
}

TEST_CASE("loaded clips are sorted and fall back to their track", "[persistence]") {
    const char* text = R"({
        "version": "1.0.0",
        "assets": [{"id": "v", "url": "file:///v.mp4", "type": "video", "duration": 30}],
        "tracks": [{"id": "t1", "type": "video", "clips": [
            {"id": "late", "assetId": "v", "start": 6, "end": 8, "inPoint": 0, "outPoint": 2},
            {"id": "early", "assetId": "v", "trackId": "elsewhere", "start": 0, "end": 3}
        ]}],
        "aspectRatio": "16:9"
    })";
    ProjectDocument out;
    auto r = parse_project(text, out);
    REQUIRE(r.success);
    const auto& track = out.project.tracks.at(0);
    REQUIRE(track.clips.front().id == "early");
    REQUIRE(track.clips.front().track_id == "t1");
    REQUIRE(approx(track.clips.front().out_point, 3.0));
    REQUIRE_FALSE(out.playhead.has_value());
}

TEST_CASE("projects save to and load from disk", "[persistence]") {
    ProjectDocument doc;
    doc.project = sample_project();
    auto path = (std::filesystem::temp_directory_path() / "nle_persistence_roundtrip.json").string();
    auto s = save_project_json(doc, path);
    REQUIRE(s.success);

    ProjectDocument back;
    auto l = load_project_json(path, back);
    REQUIRE(l.success);
    REQUIRE(back.project == doc.project);
    REQUIRE(back.saved_at > 0);

    auto missing = load_project_json(path + ".nope", back);
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.error == "Failed to open file");

    auto bad_path = write_temp("nle_persistence_bad.json", "{ not json");
    REQUIRE_FALSE(load_project_json(bad_path, back).success);
    REQUIRE(back.project == doc.project);
}

TEST_CASE("unknown metadata keys are kept", "[persistence]") {
    const char* text = R"({"version": "1.0.0", "aspectRatio": "16:9", "tracks": [],
        "assets": [{"id": "a", "url": "u", "type": "voiceover",
                    "metadata": {"width": 10, "codec": "aac", "bitrate": 128}}]})";
    ProjectDocument out;
    REQUIRE(parse_project(text, out).success);
    const auto& meta = out.project.assets.at("a").metadata;
    REQUIRE(meta.width == 10);
    REQUIRE(meta.extra.at("codec") == "aac");
    REQUIRE(meta.extra.at("bitrate") == "128");
    REQUIRE(out.project.assets.at("a").kind == AssetKind::Voiceover);
}

TEST_CASE("out of range timestamps load as zero", "[persistence]") {
    const char* text = R"({"version": "1.0.0", "aspectRatio": "16:9", "tracks": [], "savedAt": 1e400,
        "assets": [{"id": "a", "url": "u", "type": "audio", "createdAt": -1e30},
                   {"id": "b", "url": "v", "type": "audio", "createdAt": 1700000000000}]})";
    ProjectDocument out;
    auto r = parse_project(text, out);
    REQUIRE(r.success);
    REQUIRE(out.saved_at == 0);
    REQUIRE(out.project.assets.at("a").created_at == 0);
    REQUIRE(out.project.assets.at("b").created_at == 1700000000000);
}
